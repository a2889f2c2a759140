// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace gridfn {

/// CRC64-ECMA-182 checksum used to protect persisted sample values
///
/// Polynomial 0x42F0E1EBA9EA3693 processed LSB-first, initial value 0,
/// no final XOR.
class CRC64 {
public:
    /// Checksum of a double array (bitwise, so NaN payloads and -0.0 count)
    [[nodiscard]] static uint64_t compute(std::span<const double> values);

    /// Checksum of a string (axis names, units)
    [[nodiscard]] static uint64_t compute(std::string_view text);

    /// Continue a running checksum with more bytes
    [[nodiscard]] static uint64_t update(uint64_t crc, const uint8_t* data, size_t byte_count);

private:
    static constexpr uint64_t POLY = 0xC96C5795D7870F42ULL;
};

}  // namespace gridfn
