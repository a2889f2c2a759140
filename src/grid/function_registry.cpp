// SPDX-License-Identifier: MIT
#include "src/grid/function_registry.hpp"
#include "src/support/trace.h"

#include <algorithm>
#include <set>
#include <utility>

namespace gridfn {

namespace {

constexpr const char* kLambda = "\xCE\xBB";  // λ

/// Widen `ranges` by the axes of `fn`; same-named axes must share a unit
std::expected<void, ValidationError>
merge_axes(const AnyGriddedFunction& fn, size_t fn_index,
           std::map<std::string, AxisRange>& ranges) {
    for (const auto& axis : fn.axes()) {
        auto [it, inserted] = ranges.try_emplace(
            axis->name, AxisRange{axis->min(), axis->max(), axis->unit});
        if (inserted) continue;
        if (it->second.unit != axis->unit) {
            GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_REGISTRY,
                static_cast<int>(ValidationErrorCode::UnitConflict), fn_index, 0.0);
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnitConflict, axis->name, 0.0, fn_index));
        }
        it->second.min = std::min(it->second.min, axis->min());
        it->second.max = std::max(it->second.max, axis->max());
    }
    return {};
}

}  // namespace

void FunctionRegistry::register_function(AnyGriddedFunction fn) {
    [[maybe_unused]] const size_t dims = fn.dimensions();
    std::string name = fn.name();
    [[maybe_unused]] const bool inserted = functions_.insert_or_assign(std::move(name), std::move(fn)).second;
    GRIDFN_TRACE_REGISTRY_INSERT(dims, inserted ? 0 : 1, functions_.size());
}

std::expected<void, ValidationError>
FunctionRegistry::register_batch(std::vector<AnyGriddedFunction> fns) {
    std::set<std::string> seen;
    for (size_t i = 0; i < fns.size(); ++i) {
        const auto& name = fns[i].name();
        if (name.empty()) {
            GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_REGISTRY,
                static_cast<int>(ValidationErrorCode::EmptyName), i, 0.0);
            return std::unexpected(ValidationError(ValidationErrorCode::EmptyName, {}, 0.0, i));
        }
        if (!seen.insert(name).second) {
            GRIDFN_TRACE_VALIDATION_ERROR(GRIDFN_MODULE_REGISTRY,
                static_cast<int>(ValidationErrorCode::DuplicateFunctionName), i, 0.0);
            return std::unexpected(ValidationError(
                ValidationErrorCode::DuplicateFunctionName, name, 0.0, i));
        }
    }

    for (auto& fn : fns) {
        register_function(std::move(fn));
    }
    return {};
}

std::expected<AnyGriddedFunction, NotFoundError>
FunctionRegistry::get(const std::string& name) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        GRIDFN_TRACE_REGISTRY_MISS(functions_.size());
        return std::unexpected(NotFoundError{name});
    }
    return it->second;
}

std::expected<std::shared_ptr<FunctionMetadata>, NotFoundError>
FunctionRegistry::get_metadata(const std::string& name) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        GRIDFN_TRACE_REGISTRY_MISS(functions_.size());
        return std::unexpected(NotFoundError{name});
    }
    return it->second.metadata();
}

std::vector<std::string> FunctionRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(functions_.size());
    for (const auto& [name, fn] : functions_) {
        out.push_back(name);
    }
    return out;
}

bool FunctionRegistry::erase(const std::string& name) {
    return functions_.erase(name) > 0;
}

std::vector<SummaryRow> FunctionRegistry::summary() const {
    std::vector<SummaryRow> rows;
    rows.reserve(functions_.size());
    for (const auto& [name, fn] : functions_) {
        const auto& meta = *fn.metadata();
        rows.push_back(SummaryRow{
            .symbol = fn.symbol(),
            .unit = meta.unit(),
            .lhs = name,
            .rhs = meta.equation().value_or(kLambda),
            .arg_units = meta.arg_units(),
        });
    }
    return rows;
}

std::expected<std::map<std::string, AxisRange>, GridError>
FunctionRegistry::coordinate_range(const std::vector<std::string>& names) const {
    std::vector<const AnyGriddedFunction*> selected;
    if (names.empty()) {
        for (const auto& [name, fn] : functions_) {
            selected.push_back(&fn);
        }
    } else {
        for (const auto& name : names) {
            auto it = functions_.find(name);
            if (it == functions_.end()) {
                GRIDFN_TRACE_REGISTRY_MISS(functions_.size());
                return std::unexpected(NotFoundError{name});
            }
            selected.push_back(&it->second);
        }
    }

    std::map<std::string, AxisRange> ranges;
    for (size_t i = 0; i < selected.size(); ++i) {
        auto merged = merge_axes(*selected[i], i, ranges);
        if (!merged.has_value()) {
            return std::unexpected(merged.error());
        }
    }
    return ranges;
}

}  // namespace gridfn
