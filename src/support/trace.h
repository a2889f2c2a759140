// SPDX-License-Identifier: MIT
/**
 * @file trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the gridfn library
 *
 * Zero-overhead tracing points that can be enabled at runtime with
 * bpftrace, systemtap or perf. When tracing is disabled (default), probes
 * compile to single NOP instructions.
 *
 * Example usage with bpftrace:
 *   # Every rejected query with its axis position and value
 *   sudo bpftrace -e 'usdt:./lib*.so:gridfn:out_of_range { printf("%d %f\n", arg1, arg2); }'
 *
 *   # Registry traffic
 *   sudo bpftrace -e 'usdt:./lib*.so:gridfn:registry_* { @[probe] = count(); }'
 */

#ifndef GRIDFN_TRACE_H
#define GRIDFN_TRACE_H

#include <stddef.h>

/**
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h.
 * Otherwise, define no-op macros for compatibility.
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#endif

#define GRIDFN_PROVIDER gridfn

/**
 * Module identifiers, passed as the first parameter to shared probes
 */
#define GRIDFN_MODULE_COORDINATES    1
#define GRIDFN_MODULE_BINDER         2
#define GRIDFN_MODULE_BUILDER        3
#define GRIDFN_MODULE_REGISTRY       4
#define GRIDFN_MODULE_FUNCTIONALIZE  5
#define GRIDFN_MODULE_FLYTHROUGH     6
#define GRIDFN_MODULE_SERIALIZATION  7
#define GRIDFN_MODULE_SPLINE         8

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (GRIDFN_MODULE_* constant)
 * @param param1: Module-specific size (e.g., number of axes, datasets, points)
 * @param param2: Module-specific size (e.g., dimensionality, method)
 */
#define GRIDFN_TRACE_ALGO_START(module_id, param1, param2) \
    DTRACE_PROBE3(GRIDFN_PROVIDER, algo_start, module_id, param1, param2)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param count: Number of items produced
 */
#define GRIDFN_TRACE_ALGO_COMPLETE(module_id, count) \
    DTRACE_PROBE2(GRIDFN_PROVIDER, algo_complete, module_id, count)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode as int
 * @param index: Offending position
 * @param value: Offending value
 */
#define GRIDFN_TRACE_VALIDATION_ERROR(module_id, error_code, index, value) \
    DTRACE_PROBE4(GRIDFN_PROVIDER, validation_error, module_id, error_code, index, value)

/**
 * Fired when a dataset shape disagrees with its axes
 * @param expected_rank: Number of axes
 * @param actual_rank: Rank of the supplied array
 * @param expected_size: Product of axis lengths
 * @param actual_size: Product of the supplied shape
 */
#define GRIDFN_TRACE_SHAPE_MISMATCH(expected_rank, actual_rank, expected_size, actual_size) \
    DTRACE_PROBE4(GRIDFN_PROVIDER, shape_mismatch, expected_rank, actual_rank, expected_size, actual_size)

/**
 * Fired when a query coordinate lies outside its axis under REJECT
 * @param axis_index: Argument position
 * @param value: Query coordinate
 * @param min: Axis minimum
 * @param max: Axis maximum
 */
#define GRIDFN_TRACE_OUT_OF_RANGE(axis_index, value, min, max) \
    DTRACE_PROBE4(GRIDFN_PROVIDER, out_of_range, axis_index, value, min, max)

/**
 * ============================================================================
 * Registry Probes
 * ============================================================================
 */

/**
 * Fired when a function is inserted
 * @param dims: Dimensionality of the inserted function
 * @param replaced: 1 if an entry with the same name was overwritten
 * @param size: Registry size after insertion
 */
#define GRIDFN_TRACE_REGISTRY_INSERT(dims, replaced, size) \
    DTRACE_PROBE3(GRIDFN_PROVIDER, registry_insert, dims, replaced, size)

/**
 * Fired when a lookup misses
 * @param size: Registry size at lookup time
 */
#define GRIDFN_TRACE_REGISTRY_MISS(size) \
    DTRACE_PROBE1(GRIDFN_PROVIDER, registry_miss, size)

/**
 * ============================================================================
 * Flythrough Probes
 * ============================================================================
 */

/**
 * Fired after sampling one function along a trajectory
 * @param n_points: Points requested
 * @param n_kept: Points inside the domain of every function so far
 */
#define GRIDFN_TRACE_FLYTHROUGH_PROGRESS(n_points, n_kept) \
    DTRACE_PROBE2(GRIDFN_PROVIDER, flythrough_progress, n_points, n_kept)

/**
 * ============================================================================
 * Serialization Probes
 * ============================================================================
 */

/**
 * Fired when reading or writing a file fails
 * @param error_code: SerializationErrorCode as int
 * @param row: Row being processed (0 if not applicable)
 */
#define GRIDFN_TRACE_SERIALIZATION_ERROR(error_code, row) \
    DTRACE_PROBE2(GRIDFN_PROVIDER, serialization_error, error_code, row)

#endif // GRIDFN_TRACE_H
