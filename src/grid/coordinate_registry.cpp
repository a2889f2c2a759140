// SPDX-License-Identifier: MIT
#include "src/grid/coordinate_registry.hpp"
#include "src/support/trace.h"

#include <cmath>
#include <unordered_set>

namespace gridfn {

namespace {

std::unexpected<ValidationError> reject(ValidationErrorCode code,
                                        const std::string& name,
                                        double value = 0.0,
                                        size_t index = 0) {
    GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_COORDINATES,
                                  static_cast<int>(code), index, value);
    return std::unexpected(ValidationError(code, name, value, index));
}

}  // namespace

std::expected<CoordinateRegistry, ValidationError>
CoordinateRegistry::create(std::vector<CoordinateSpec> specs) {
    GRIDFN_TRACE_ALGO_START(GRIDFN_MODULE_COORDINATES, specs.size(), 0);

    if (specs.empty()) {
        return reject(ValidationErrorCode::InvalidConfiguration, "");
    }

    std::unordered_set<std::string> seen;
    std::vector<std::shared_ptr<const CoordinateAxis>> axes;
    axes.reserve(specs.size());

    for (size_t a = 0; a < specs.size(); ++a) {
        auto& spec = specs[a];

        if (spec.name.empty()) {
            return reject(ValidationErrorCode::EmptyName, "", 0.0, a);
        }
        if (!seen.insert(spec.name).second) {
            return reject(ValidationErrorCode::DuplicateAxisName, spec.name, 0.0, a);
        }
        if (spec.data.rank() != 1) {
            return reject(ValidationErrorCode::NotOneDimensional, spec.name,
                          static_cast<double>(spec.data.rank()), a);
        }
        if (!spec.data.consistent()) {
            return reject(ValidationErrorCode::InconsistentArray, spec.name,
                          static_cast<double>(spec.data.data.size()), a);
        }

        const auto& v = spec.data.data;
        if (v.size() < 2) {
            return reject(ValidationErrorCode::InsufficientPoints, spec.name,
                          static_cast<double>(v.size()), a);
        }
        for (size_t i = 0; i < v.size(); ++i) {
            if (!std::isfinite(v[i])) {
                return reject(ValidationErrorCode::NonFiniteValue, spec.name, v[i], i);
            }
            if (i > 0 && v[i] <= v[i - 1]) {
                return reject(ValidationErrorCode::UnsortedAxis, spec.name, v[i], i);
            }
        }

        axes.push_back(std::make_shared<const CoordinateAxis>(CoordinateAxis{
            std::move(spec.name), std::move(spec.unit), std::move(spec.data.data)}));
    }

    GRIDFN_TRACE_ALGO_COMPLETE(GRIDFN_MODULE_COORDINATES, axes.size());
    return CoordinateRegistry(std::move(axes));
}

std::shared_ptr<const CoordinateAxis>
CoordinateRegistry::find(std::string_view name) const noexcept {
    for (const auto& axis : axes_) {
        if (axis->name == name) {
            return axis;
        }
    }
    return nullptr;
}

std::vector<size_t> CoordinateRegistry::shape() const {
    std::vector<size_t> s;
    s.reserve(axes_.size());
    for (const auto& axis : axes_) {
        s.push_back(axis->size());
    }
    return s;
}

}  // namespace gridfn
