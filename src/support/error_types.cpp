// SPDX-License-Identifier: MIT
#include "src/support/error_types.hpp"

#include <sstream>
#include <type_traits>

namespace gridfn {

namespace {

void write_shape(std::ostream& os, const std::vector<size_t>& shape) {
    os << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) os << ", ";
        os << shape[i];
    }
    if (shape.size() == 1) os << ",";
    os << ")";
}

}  // namespace

int error_code(const GridError& error) {
    return std::visit([](const auto& e) -> int {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ValidationError>) {
            return static_cast<int>(e.code);
        } else if constexpr (std::is_same_v<T, SerializationError>) {
            return static_cast<int>(e.code);
        } else {
            return -1;
        }
    }, error);
}

std::string describe(const GridError& error) {
    std::ostringstream oss;
    oss << error;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code);
    if (!err.name.empty()) {
        os << ", name=" << err.name;
    }
    os << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const ShapeMismatchError& err) {
    os << "ShapeMismatchError{dataset=" << err.dataset << ", expected=";
    write_shape(os, err.expected);
    os << ", actual=";
    write_shape(os, err.actual);
    os << "}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const NotFoundError& err) {
    os << "NotFoundError{name=" << err.name << "}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const OutOfRangeError& err) {
    os << "OutOfRangeError{axis=" << err.axis
       << ", value=" << err.value
       << ", range=[" << err.min << ", " << err.max << "]}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const SerializationError& err) {
    os << "SerializationError{code=" << static_cast<int>(err.code);
    if (!err.detail.empty()) {
        os << ", detail=" << err.detail;
    }
    os << "}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const GridError& err) {
    std::visit([&os](const auto& e) { os << e; }, err);
    return os;
}

}  // namespace gridfn
