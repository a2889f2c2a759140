// SPDX-License-Identifier: MIT
#include "src/flythrough/coordinate_system.hpp"

#include <cctype>
#include <optional>

namespace gridfn {

namespace {

constexpr std::array<CoordinateFrame, 9> kFrames = {
    CoordinateFrame::GDZ, CoordinateFrame::GEO, CoordinateFrame::GSM,
    CoordinateFrame::GSE, CoordinateFrame::SM,  CoordinateFrame::GEI,
    CoordinateFrame::MAG, CoordinateFrame::SPH, CoordinateFrame::RLL,
};

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<CoordinateFrame> parse_frame(std::string_view s) {
    for (auto frame : kFrames) {
        if (iequals(s, to_string(frame))) return frame;
    }
    return std::nullopt;
}

}  // namespace

std::string_view to_string(CoordinateFrame frame) noexcept {
    switch (frame) {
        case CoordinateFrame::GDZ: return "GDZ";
        case CoordinateFrame::GEO: return "GEO";
        case CoordinateFrame::GSM: return "GSM";
        case CoordinateFrame::GSE: return "GSE";
        case CoordinateFrame::SM:  return "SM";
        case CoordinateFrame::GEI: return "GEI";
        case CoordinateFrame::MAG: return "MAG";
        case CoordinateFrame::SPH: return "SPH";
        case CoordinateFrame::RLL: return "RLL";
    }
    return "GDZ";
}

std::string_view to_string(CoordinateGrid grid) noexcept {
    return grid == CoordinateGrid::CARTESIAN ? "car" : "sph";
}

std::string to_string(const CoordinateSystem& system) {
    std::string label(to_string(system.frame));
    label += '-';
    label += to_string(system.grid);
    return label;
}

std::expected<CoordinateSystem, ValidationError>
parse_coordinate_system(std::string_view label) {
    const auto dash = label.find('-');
    if (dash == std::string_view::npos) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidCoordinateSystem, std::string(label)));
    }

    const auto frame = parse_frame(label.substr(0, dash));
    const auto grid_label = label.substr(dash + 1);
    if (!frame.has_value()) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidCoordinateSystem, std::string(label)));
    }

    CoordinateSystem system{.frame = *frame};
    if (iequals(grid_label, "sph")) {
        system.grid = CoordinateGrid::SPHERICAL;
    } else if (iequals(grid_label, "car")) {
        system.grid = CoordinateGrid::CARTESIAN;
    } else {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidCoordinateSystem, std::string(label), 0.0, dash + 1));
    }
    return system;
}

std::array<std::string, 3> coordinate_units(const CoordinateSystem& system) {
    if (system.grid == CoordinateGrid::CARTESIAN) {
        return {"R_E", "R_E", "R_E"};
    }
    if (system.frame == CoordinateFrame::GDZ) {
        return {"deg", "deg", "km"};
    }
    return {"deg", "deg", "R_E"};
}

}  // namespace gridfn
