// SPDX-License-Identifier: MIT
#include "src/support/crc64.hpp"

#include <array>

namespace gridfn {

namespace {

constexpr std::array<uint64_t, 256> make_table(uint64_t poly) {
    std::array<uint64_t, 256> table{};
    for (size_t i = 0; i < 256; ++i) {
        uint64_t crc = i;
        for (size_t j = 0; j < 8; ++j) {
            crc = (crc & 1) ? (crc >> 1) ^ poly : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

}  // namespace

uint64_t CRC64::update(uint64_t crc, const uint8_t* data, size_t byte_count) {
    static constexpr auto table = make_table(POLY);
    for (size_t i = 0; i < byte_count; ++i) {
        const auto index = static_cast<uint8_t>(crc ^ data[i]);
        crc = (crc >> 8) ^ table[index];
    }
    return crc;
}

uint64_t CRC64::compute(std::span<const double> values) {
    return update(0, reinterpret_cast<const uint8_t*>(values.data()),
                  values.size_bytes());
}

uint64_t CRC64::compute(std::string_view text) {
    return update(0, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

}  // namespace gridfn
