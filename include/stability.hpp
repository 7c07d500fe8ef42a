#pragma once

#include <string>

namespace lbflow {

/// Outcome of a stability check on the macroscopic fields
enum class StabilityKind {
    Stable,
    NonPositiveDensity,     ///< rho <= 0 at a fluid node
    NonFinite,              ///< NaN / Inf population, density or velocity
    VelocityBound           ///< |u| / c_s above mach_limit for too long
};

inline const char* to_string(StabilityKind kind) {
    switch (kind) {
        case StabilityKind::Stable:             return "stable";
        case StabilityKind::NonPositiveDensity: return "non-positive density";
        case StabilityKind::NonFinite:          return "non-finite value";
        case StabilityKind::VelocityBound:      return "velocity bound exceeded";
    }
    return "unknown";
}

/// Last-known stability status
/// For a failure, (i, j) is the first offending fluid node in row-major
/// order and value is the offending quantity (density, or |u|/c_s).
struct StabilityReport {
    StabilityKind kind = StabilityKind::Stable;
    int i = -1;
    int j = -1;
    int step = 0;
    double value = 0.0;
    int count = 0;          ///< Offending nodes this step (VelocityBound)
    std::string message;

    bool ok() const { return kind == StabilityKind::Stable; }
};

} // namespace lbflow
