// SPDX-License-Identifier: MIT
#pragma once

#include "src/grid/any_gridded_function.hpp"
#include "src/grid/coordinate_axis.hpp"
#include "src/grid/function_metadata.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gridfn {

/// One row of FunctionRegistry::summary()
struct SummaryRow {
    std::string symbol;              ///< "T(time, lon)"
    std::string unit;
    std::string lhs;                 ///< Function name
    std::string rhs;                 ///< Equation text, or "λ" when unset
    std::vector<ArgUnit> arg_units;  ///< Argument order
};

/// Name -> gridded function map that accumulates across calls
///
/// Functions built from different axis sets coexist; inserting a name that
/// is already present replaces the previous function. Not internally
/// synchronized: concurrent mutation requires external locking, while
/// functions handed out by get() are safe to evaluate from any thread.
class FunctionRegistry {
public:
    FunctionRegistry() = default;

    /// Insert or replace by name
    void register_function(AnyGriddedFunction fn);

    /// Insert several functions; nothing is inserted on failure
    ///
    /// Fails when a name is empty or appears twice in the batch.
    [[nodiscard]] std::expected<void, ValidationError>
    register_batch(std::vector<AnyGriddedFunction> fns);

    [[nodiscard]] std::expected<AnyGriddedFunction, NotFoundError>
    get(const std::string& name) const;

    /// Shared metadata record; edits are visible through every copy
    [[nodiscard]] std::expected<std::shared_ptr<FunctionMetadata>, NotFoundError>
    get_metadata(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const {
        return functions_.contains(name);
    }
    [[nodiscard]] size_t size() const noexcept { return functions_.size(); }
    [[nodiscard]] bool empty() const noexcept { return functions_.empty(); }

    /// Registered names in sorted order
    [[nodiscard]] std::vector<std::string> names() const;

    /// Remove a function; returns false when absent
    bool erase(const std::string& name);

    void clear() noexcept { functions_.clear(); }

    /// One row per function, sorted by name
    [[nodiscard]] std::vector<SummaryRow> summary() const;

    /// (min, max, unit) of every axis used by the named functions
    ///
    /// Axes with the same name in different functions are merged by
    /// widening the range. Fails with NotFoundError for an unknown name and
    /// with ValidationError (UnitConflict, index = position among the
    /// selected functions) when same-named axes disagree on the unit. An
    /// empty list selects every registered function.
    [[nodiscard]] std::expected<std::map<std::string, AxisRange>, GridError>
    coordinate_range(const std::vector<std::string>& names = {}) const;

    /// Iteration in name order
    [[nodiscard]] auto begin() const noexcept { return functions_.begin(); }
    [[nodiscard]] auto end() const noexcept { return functions_.end(); }

private:
    std::map<std::string, AnyGriddedFunction> functions_;
};

}  // namespace gridfn
