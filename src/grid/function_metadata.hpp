// SPDX-License-Identifier: MIT
#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gridfn {

/// (argument name, unit) pair in argument order
using ArgUnit = std::pair<std::string, std::string>;

/// Metadata record attached to a gridded function
///
/// `unit` and `arg_units` are fixed at construction. Everything else may be
/// edited after the function is registered; the record is shared, so edits
/// made through FunctionRegistry::get_metadata() are visible to every copy
/// of the function.
class FunctionMetadata {
public:
    FunctionMetadata(std::string unit, std::vector<ArgUnit> arg_units)
        : unit_(std::move(unit)), arg_units_(std::move(arg_units)) {}

    [[nodiscard]] const std::string& unit() const noexcept { return unit_; }
    [[nodiscard]] const std::vector<ArgUnit>& arg_units() const noexcept { return arg_units_; }

    /// Unit of a named argument, or nullopt
    [[nodiscard]] std::optional<std::string> arg_unit(const std::string& arg) const;

    [[nodiscard]] const std::optional<std::string>& citation() const noexcept { return citation_; }
    void set_citation(std::string citation) { citation_ = std::move(citation); }

    [[nodiscard]] const std::optional<std::string>& equation() const noexcept { return equation_; }
    void set_equation(std::string equation) { equation_ = std::move(equation); }

    [[nodiscard]] const std::optional<std::string>& description() const noexcept { return description_; }
    void set_description(std::string description) { description_ = std::move(description); }

    /// Free-form label of the physical frame, e.g. "GDZ-sph"; not validated
    [[nodiscard]] const std::optional<std::string>& coordinate_system() const noexcept {
        return coordinate_system_;
    }
    void set_coordinate_system(std::string label) { coordinate_system_ = std::move(label); }

    /// Arguments hidden from presentation layers
    [[nodiscard]] const std::vector<std::string>& hidden_args() const noexcept { return hidden_args_; }
    void set_hidden_args(std::vector<std::string> args) { hidden_args_ = std::move(args); }

    /// Open extension map for keys without a typed field
    [[nodiscard]] const std::map<std::string, std::string>& extra() const noexcept { return extra_; }
    void set_extra(const std::string& key, std::string value) { extra_[key] = std::move(value); }
    bool erase_extra(const std::string& key) { return extra_.erase(key) > 0; }

private:
    std::string unit_;
    std::vector<ArgUnit> arg_units_;
    std::optional<std::string> citation_;
    std::optional<std::string> equation_;
    std::optional<std::string> description_;
    std::optional<std::string> coordinate_system_;
    std::vector<std::string> hidden_args_;
    std::map<std::string, std::string> extra_;
};

inline std::optional<std::string> FunctionMetadata::arg_unit(const std::string& arg) const {
    for (const auto& [name, unit] : arg_units_) {
        if (name == arg) return unit;
    }
    return std::nullopt;
}

}  // namespace gridfn
