// SPDX-License-Identifier: MIT
#pragma once

#include "src/flythrough/flythrough.hpp"
#include "src/grid/function_registry.hpp"
#include "src/support/error_types.hpp"

#include <expected>
#include <filesystem>

namespace gridfn {

enum class ParquetCompression {
    NONE,
    SNAPPY,
    ZSTD,
};

struct ParquetWriteOptions {
    ParquetCompression compression = ParquetCompression::ZSTD;
    bool overwrite = false;  ///< Replace an existing file instead of failing
};

/// Write every registered function (one row per function) to a Parquet file.
///
/// Each row stores name, unit, axes, samples, interpolation settings and
/// metadata; samples carry a CRC64 checksum. Fully restricted (0-D)
/// functions cannot be stored. Coordinates fixed by earlier restrictions
/// are not stored.
[[nodiscard]] std::expected<void, SerializationError>
write_parquet(const FunctionRegistry& registry,
              const std::filesystem::path& path,
              const ParquetWriteOptions& opts = {});

/// Rebuild a registry written by write_parquet(const FunctionRegistry&, ...).
[[nodiscard]] std::expected<FunctionRegistry, SerializationError>
read_parquet(const std::filesystem::path& path);

/// Write a flythrough result as columns time, c1, c2, c3, net_idx and one
/// column per variable. Units are stored as field and file metadata.
[[nodiscard]] std::expected<void, SerializationError>
write_parquet(const FlythroughResult& result,
              const std::filesystem::path& path,
              const ParquetWriteOptions& opts = {});

}  // namespace gridfn
