#pragma once

/**
 * @file Phase.hpp
 * @brief Named positions of an optimization pipeline
 */

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace optiframe {

/**
 * @brief Pipeline phases, in execution order
 */
enum class Phase {
    Validate,   ///< Check input data invariants
    PreProcess, ///< Derive reduced/normalized data
    Build,      ///< Construct the problem model
    Solve,      ///< Run the solver
    Extract     ///< Turn the solved model into domain results
};

inline constexpr std::size_t kNumPhases = 5;

inline constexpr std::array<Phase, kNumPhases> kPhaseOrder{
    Phase::Validate, Phase::PreProcess, Phase::Build, Phase::Solve, Phase::Extract};

/// Position of a phase in kPhaseOrder
constexpr std::size_t PhaseIndex(Phase phase) { return static_cast<std::size_t>(phase); }

/// Step name used for a phase
[[nodiscard]] inline const char *PhaseName(Phase phase) {
    switch (phase) {
    case Phase::Validate:
        return "validation";
    case Phase::PreProcess:
        return "pre_processing";
    case Phase::Build:
        return "build";
    case Phase::Solve:
        return "solving";
    case Phase::Extract:
        return "solution_extraction";
    }
    return "unknown";
}

/// Phase with the given step name, if any
[[nodiscard]] inline std::optional<Phase> FindPhase(const std::string &name) {
    for (Phase phase : kPhaseOrder) {
        if (name == PhaseName(phase)) {
            return phase;
        }
    }
    return std::nullopt;
}

} // namespace optiframe
