#pragma once
/*
================================================================================
Fragment 3.3 - Enclosure: Louvres + IP Rating
FILE: cpp/engine/enclosure/louvre.hpp

Purpose:
  - Effective free inlet area from a louvre grid, derated by the insect/finger
    mesh an IP rating forces over the openings.

Louvre count:
  cols * (2 * rows + 1)   bottom block of `rows`, top block of rows + 1

Grid bound:
  n cut-outs of size s with gap p fit a span L when n*s + (n-1)*p <= L,
  L = face size minus twice the edge margin. Vertically the 2*rows + 1
  rows share one span.
================================================================================
*/

#include "engine/core/settings.hpp"
#include "engine/enclosure/section.hpp"

namespace panelheat {

// True for IP first digit 4 and below.
bool ip_permits_openings(int ip_first_digit) noexcept;

// Open-area factor of the mesh; 0 where no openings are permitted.
double ip_open_area_factor(int ip_first_digit, const IpMeshTable& table = IpMeshTable{}) noexcept;

int louvre_count(const LouvreGrid& grid) noexcept;

double effective_inlet_area_cm2(const LouvreGrid& grid,
                                const LouvreDefinition& louvre,
                                int ip_first_digit,
                                const IpMeshTable& table = IpMeshTable{}) noexcept;

// Largest grid whose cut-outs fit a width x height face (m) inside the edge
// margin. Never smaller than 1 x 1.
LouvreGrid max_louvre_grid(double width_m, double height_m, const LouvreDefinition& louvre) noexcept;

// Effective inlet area of max_louvre_grid(); 0 where no openings are permitted.
double max_effective_inlet_area_cm2(double width_m, double height_m,
                                    const LouvreDefinition& louvre,
                                    int ip_first_digit,
                                    const IpMeshTable& table = IpMeshTable{}) noexcept;

// Inlet area the thermal model should use for this section's ventilation.
double resolve_inlet_area_cm2(const Ventilation& v, const VentilationSettings& vs) noexcept;

}  // namespace panelheat
