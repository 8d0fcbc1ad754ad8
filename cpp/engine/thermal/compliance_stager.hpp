#pragma once
/*
================================================================================
Fragment 4.5 - Thermal: Compliance Stager
FILE: cpp/engine/thermal/compliance_stager.hpp

Stages, in strict order (first terminal one wins):
  1. Infeasible by ambient   ambient + solar >= limit
  2. Base compliant          forward-model top temperature <= limit
  3. Material dissipation    sealed-enclosure inversion covers the full load
  4. Ventilation what-if     diagnostic only, never terminal
  5. Active cooling          size forced airflow for the residual power

Stage 3 always inverts the SEALED model (Fig. 3/4 or Fig. 7/8, x = 0.804),
even for a ventilated section: natural ventilation is not credited when
sizing what the enclosure sheet can reject. Either dissipation model is then
scaled by altitude_derating_factor().
================================================================================
*/

#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/enclosure/section.hpp"
#include "engine/thermal/thermal_result.hpp"
#include "engine/thermal/thermal_solver.hpp"

namespace panelheat::thermal {

// Stage 3 inversion: P such that c * k * d * P^x = allowed_rise. 0 if ill-posed.
double passive_capacity_annex_k(const SealedCoefficients& sc, double allowed_rise_K) noexcept;

// Stage 3 alternative: htc * Ae * allowed_rise. 0 if ill-posed.
double passive_capacity_wall(double htc_W_m2K, double ae_m2, double allowed_rise_K) noexcept;

class ComplianceStager {
 public:
  explicit ComplianceStager(const ThermalSolver& solver, LogSink& log = null_log_sink());

  // Geometry must come from resolve_geometry() for the same section.
  ThermalResult run(const EnclosureSection& section,
                    const SectionGeometry& geometry,
                    const ProjectSettings& settings) const;

 private:
  double passive_capacity(const SectionGeometry& g, int partitions,
                          const ProjectSettings& settings, double allowed_rise_K) const;

  const ThermalSolver& solver_;
  LogSink& log_;
};

}  // namespace panelheat::thermal
