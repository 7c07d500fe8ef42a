#pragma once

/// @file lattice.hpp
/// @brief D2Q9 velocity set, weights and opposite-direction map
///
/// Direction numbering:
///
///   6   2   5
///     \ | /
///   3 - 0 - 1
///     / | \
///   7   4   8
///
/// Direction q points along (cx[q], cy[q]); opposite[q] points the reverse way.
/// The rest population (q = 0) is its own opposite.

namespace lbflow {
namespace d2q9 {

inline constexpr int Q = 9;
inline constexpr int DIM = 2;

inline constexpr int cx[Q] = {0, 1, 0, -1,  0, 1, -1, -1,  1};
inline constexpr int cy[Q] = {0, 0, 1,  0, -1, 1,  1, -1, -1};

inline constexpr int opposite[Q] = {0, 3, 4, 1, 2, 7, 8, 5, 6};

inline constexpr double w[Q] = {4.0 / 9.0,
                                1.0 / 9.0,  1.0 / 9.0,  1.0 / 9.0,  1.0 / 9.0,
                                1.0 / 36.0, 1.0 / 36.0, 1.0 / 36.0, 1.0 / 36.0};

/// Squared lattice speed of sound (c_s^2 = 1/3 in lattice units)
inline constexpr double cs2 = 1.0 / 3.0;

/// Lattice speed of sound
inline constexpr double cs = 0.57735026918962576451;

/// Directions whose x-component is +1 / -1 (unknown after streaming at the
/// west / east border respectively)
inline constexpr int east_pointing[3] = {1, 5, 8};
inline constexpr int west_pointing[3] = {3, 6, 7};

} // namespace d2q9
} // namespace lbflow
