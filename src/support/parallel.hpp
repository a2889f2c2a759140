// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallel loop macro for OpenMP or sequential execution
 *
 * Batch evaluation and trajectory sampling loops are independent per
 * point and are annotated with this macro instead of a raw pragma.
 *
 * Usage:
 *   GRIDFN_PRAGMA_PARALLEL_FOR_STATIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * Loops under the macro must write to disjoint output slots.
 */

#if defined(_OPENMP)
    #define GRIDFN_PRAGMA_PARALLEL_FOR_STATIC   _Pragma("omp parallel for schedule(static)")
#else
    // Sequential execution
    #define GRIDFN_PRAGMA_PARALLEL_FOR_STATIC
#endif
