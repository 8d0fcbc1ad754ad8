#pragma once
/*
================================================================================
Fragment 4.6 - Thermal: Engine Facade (one call per section)
FILE: cpp/engine/thermal/thermal_engine.hpp

Purpose:
  - Single entry point for hosts: layout snapshot + section index + project
    settings in, ThermalResult out.
  - Wires geometry resolution, forward model and compliance staging, and
    stamps each result with a deterministic input fingerprint.

Thread-safety:
  - evaluate() is const and touches no shared mutable state other than the
    injected sink. Sections may be evaluated concurrently.
================================================================================
*/

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/curves/curve_family_interpolator.hpp"
#include "engine/enclosure/section.hpp"
#include "engine/thermal/compliance_stager.hpp"
#include "engine/thermal/thermal_result.hpp"
#include "engine/thermal/thermal_solver.hpp"

namespace panelheat::thermal {

// Fingerprint of everything evaluate() reads for this section.
Hash64 hash_section_inputs(const Layout& layout, std::size_t index,
                           const ProjectSettings& settings, const std::string& curve_source);

class ThermalEngine {
 public:
  explicit ThermalEngine(std::shared_ptr<const curves::CurveFamilyInterpolator> curves,
                         LogSink& log = null_log_sink());

  ThermalEngine(const ThermalEngine&) = delete;
  ThermalEngine& operator=(const ThermalEngine&) = delete;

  // Validates the section and settings (throws PanelHeatError), then evaluates.
  ThermalResult evaluate(const Layout& layout, std::size_t index, const ProjectSettings& settings) const;

  // Every section in layout order.
  std::vector<ThermalResult> evaluate_all(const Layout& layout, const ProjectSettings& settings) const;

  const curves::CurveFamilyInterpolator& curves() const noexcept { return solver_.curves(); }

 private:
  ThermalResult evaluate_validated(const Layout& layout, std::size_t index,
                                   const ProjectSettings& settings) const;

  LogSink& log_;
  ThermalSolver solver_;
  ComplianceStager stager_;
};

}  // namespace panelheat::thermal
