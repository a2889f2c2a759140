// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace gridfn {

/// Error codes for malformed axis, dataset or configuration input
enum class ValidationErrorCode {
    EmptyName,
    DuplicateAxisName,
    DuplicateDatasetName,
    DuplicateFunctionName,
    NotOneDimensional,
    InconsistentArray,
    InsufficientPoints,
    NonFiniteValue,
    UnsortedAxis,
    TooManyDimensions,
    UnknownAxis,
    ArgumentCountMismatch,
    UnboundAxis,
    RaggedTrajectory,
    InvalidCoordinateSystem,
    InvalidConfiguration,
    ShapeOverflow,
    UnitConflict
};

/// Detailed validation error
///
/// `name` identifies the offending axis, dataset or function (may be empty).
struct ValidationError {
    ValidationErrorCode code;
    std::string name;
    double value;  // The invalid value that was provided (0 if not applicable)
    size_t index;  // Position within an array or argument list (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    std::string name = {},
                    double value = 0.0,
                    size_t index = 0)
        : code(code), name(std::move(name)), value(value), index(index) {}
};

/// Dataset array shape does not match the ordered axis lengths
struct ShapeMismatchError {
    std::string dataset;
    std::vector<size_t> expected;
    std::vector<size_t> actual;
};

/// Unknown function name queried on a registry
struct NotFoundError {
    std::string name;
};

/// Coordinate outside [min, max] of its axis under the reject policy
struct OutOfRangeError {
    std::string axis;
    double value = 0.0;
    double min = 0.0;
    double max = 0.0;
};

/// Error codes for persistence failures
enum class SerializationErrorCode {
    FileExists,
    OpenFailed,
    WriteFailed,
    ReadFailed,
    SchemaMismatch,
    ChecksumMismatch,
    CorruptedData
};

struct SerializationError {
    SerializationErrorCode code;
    std::string detail;
};

/// Size product overflow (shape too large for size_t)
struct OverflowError {
    size_t operand_a = 0;
    size_t operand_b = 0;
};

/// Combined error type returned by the registry-level API
using GridError = std::variant<
    ValidationError,
    ShapeMismatchError,
    NotFoundError,
    OutOfRangeError,
    SerializationError
>;

/// Get error code as integer for diagnostics (-1 for code-less errors)
[[nodiscard]] int error_code(const GridError& error);

/// Human-readable one-line description
[[nodiscard]] std::string describe(const GridError& error);

std::ostream& operator<<(std::ostream& os, const ValidationError& err);
std::ostream& operator<<(std::ostream& os, const ShapeMismatchError& err);
std::ostream& operator<<(std::ostream& os, const NotFoundError& err);
std::ostream& operator<<(std::ostream& os, const OutOfRangeError& err);
std::ostream& operator<<(std::ostream& os, const SerializationError& err);
std::ostream& operator<<(std::ostream& os, const GridError& err);

}  // namespace gridfn
