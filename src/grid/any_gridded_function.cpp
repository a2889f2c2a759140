// SPDX-License-Identifier: MIT
#include "src/grid/any_gridded_function.hpp"
#include "src/support/parallel.hpp"

#include <cmath>
#include <limits>
#include <type_traits>

namespace gridfn {

namespace {

template <typename F>
constexpr size_t dims_of() {
    return std::decay_t<F>::kDimensions;
}

}  // namespace

const std::string& AnyGriddedFunction::name() const noexcept {
    return std::visit([](const auto& f) -> const std::string& { return f.name(); }, fn_);
}

const std::string& AnyGriddedFunction::unit() const noexcept {
    return std::visit([](const auto& f) -> const std::string& { return f.unit(); }, fn_);
}

const std::shared_ptr<FunctionMetadata>& AnyGriddedFunction::metadata() const noexcept {
    return std::visit([](const auto& f) -> const std::shared_ptr<FunctionMetadata>& {
        return f.metadata();
    }, fn_);
}

const InterpolationConfig& AnyGriddedFunction::config() const noexcept {
    return std::visit([](const auto& f) -> const InterpolationConfig& {
        return f.interpolant().config();
    }, fn_);
}

const std::vector<FixedCoordinate>& AnyGriddedFunction::fixed() const noexcept {
    return std::visit([](const auto& f) -> const std::vector<FixedCoordinate>& {
        return f.fixed();
    }, fn_);
}

std::vector<std::shared_ptr<const CoordinateAxis>> AnyGriddedFunction::axes() const {
    return std::visit([](const auto& f) {
        return std::vector<std::shared_ptr<const CoordinateAxis>>(f.axes().begin(), f.axes().end());
    }, fn_);
}

std::vector<std::string> AnyGriddedFunction::arg_names() const {
    std::vector<std::string> names;
    for (const auto& axis : axes()) {
        names.push_back(axis->name);
    }
    return names;
}

std::string AnyGriddedFunction::symbol() const {
    std::string s = name() + "(";
    const auto args = arg_names();
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) s += ", ";
        s += args[i];
    }
    s += ")";
    return s;
}

std::expected<double, GridError>
AnyGriddedFunction::eval(std::span<const double> coords) const {
    if (coords.size() != dimensions()) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::ArgumentCountMismatch, name(),
            static_cast<double>(coords.size()), dimensions()));
    }

    return std::visit([&coords](const auto& f) -> std::expected<double, GridError> {
        constexpr size_t N = dims_of<decltype(f)>();
        std::array<double, N> query{};
        for (size_t d = 0; d < N; ++d) {
            query[d] = coords[d];
        }
        auto result = f.eval(query);
        if (!result.has_value()) {
            return std::unexpected(result.error());
        }
        return result.value();
    }, fn_);
}

std::expected<double, GridError>
AnyGriddedFunction::eval(const std::map<std::string, double>& named) const {
    const auto args = arg_names();
    std::vector<double> coords(args.size());
    for (size_t d = 0; d < args.size(); ++d) {
        auto it = named.find(args[d]);
        if (it == named.end()) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnboundAxis, args[d], 0.0, d));
        }
        coords[d] = it->second;
    }
    for (const auto& [axis, value] : named) {
        bool known = false;
        for (const auto& a : args) {
            known = known || (a == axis);
        }
        if (!known) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnknownAxis, axis, value));
        }
    }
    return eval(coords);
}

std::expected<AnyGriddedFunction, GridError>
AnyGriddedFunction::restrict(std::string_view axis, double value) const {
    return std::visit([&](const auto& f) -> std::expected<AnyGriddedFunction, GridError> {
        constexpr size_t N = dims_of<decltype(f)>();
        if constexpr (N == 0) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnknownAxis, std::string(axis), value));
        } else {
            const auto dim = f.axis_index(axis);
            if (!dim.has_value()) {
                return std::unexpected(ValidationError(
                    ValidationErrorCode::UnknownAxis, std::string(axis), value));
            }
            auto reduced = f.restrict_at(dim.value(), value);
            if (!reduced.has_value()) {
                return std::unexpected(reduced.error());
            }
            return AnyGriddedFunction(std::move(reduced.value()));
        }
    }, fn_);
}

std::expected<AnyGriddedFunction, GridError>
AnyGriddedFunction::partial(const std::map<std::string, double>& fixed) const {
    for (const auto& [axis, value] : fixed) {
        bool known = false;
        for (const auto& a : arg_names()) {
            known = known || (a == axis);
        }
        if (!known) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnknownAxis, axis, value));
        }
    }

    AnyGriddedFunction current = *this;
    for (const auto& arg : arg_names()) {
        auto it = fixed.find(arg);
        if (it == fixed.end()) continue;
        auto next = current.restrict(arg, it->second);
        if (!next.has_value()) {
            return std::unexpected(next.error());
        }
        current = std::move(next.value());
    }
    return current;
}

std::optional<double> AnyGriddedFunction::scalar() const {
    const auto* f = get_if<0>();
    if (f == nullptr) {
        return std::nullopt;
    }
    auto v = f->eval({});
    if (!v.has_value()) {
        return std::nullopt;
    }
    return v.value();
}

std::expected<std::vector<double>, ValidationError>
AnyGriddedFunction::eval_batch(std::span<const double> points) const {
    const size_t dims = dimensions();
    if (dims == 0 || points.size() % dims != 0) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::ArgumentCountMismatch, name(),
            static_cast<double>(points.size()), dims));
    }

    const size_t n = points.size() / dims;
    std::vector<double> out(n, std::numeric_limits<double>::quiet_NaN());

    std::visit([&](const auto& f) {
        constexpr size_t N = dims_of<decltype(f)>();
        if constexpr (N > 0) {
            GRIDFN_PRAGMA_PARALLEL_FOR_STATIC
            for (size_t i = 0; i < n; ++i) {
                std::array<double, N> query;
                for (size_t d = 0; d < N; ++d) {
                    query[d] = points[i * N + d];
                }
                auto v = f.interpolant().eval(query);
                if (v.has_value()) {
                    out[i] = v.value();
                }
            }
        }
    }, fn_);

    return out;
}

}  // namespace gridfn
