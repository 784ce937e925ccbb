/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_CORE_CONFIG_H
#define TORUS_CORE_CONFIG_H

/**
 * @file TorusConfig.h
 * @brief Compile-time configuration for the torus triangulation library
 *
 * Settings can be overridden via CMake or compiler flags.
 */

#include <cstddef>

// ============================================================================
// Build Configuration Detection
// ============================================================================

#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define TORUS_DEBUG_MODE 1
#else
    #define TORUS_DEBUG_MODE 0
#endif

namespace torus {
namespace config {

/**
 * @brief Largest lattice dimension accepted by BoxComplex
 *
 * The orientation search is exponential in the number of cube diagonals;
 * anything above this is rejected up front. Override with -DTORUS_MAX_DIM=N.
 */
#ifndef TORUS_MAX_DIM
    constexpr int MAX_LATTICE_DIM = 6;
#else
    constexpr int MAX_LATTICE_DIM = TORUS_MAX_DIM;
#endif

/**
 * @brief Upper bound on orbit size before the closure is declared divergent
 *
 * Orbits are finite because the box has finitely many lattice points; the
 * bound only guards against generators that escape canonicalization.
 */
constexpr std::size_t MAX_ORBIT_SIZE = 1u << 20;

} // namespace config
} // namespace torus

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define TORUS_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define TORUS_UNLIKELY(x) (x)
#endif

#endif // TORUS_CORE_CONFIG_H
