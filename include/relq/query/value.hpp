#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace relq::query {

using Value = std::variant<std::monostate, std::int64_t, double, bool, std::string>;

// Column name -> value. Ordered so that rendering and comparisons are stable.
using Row = std::map<std::string, Value>;

using KeyTuple = std::vector<Value>;

[[nodiscard]] bool is_null(const Value& value) noexcept;

// Total order over values: null < bool < numeric < string. Integers and
// doubles compare numerically with each other.
[[nodiscard]] int compare_values(const Value& lhs, const Value& rhs) noexcept;
[[nodiscard]] bool values_equal(const Value& lhs, const Value& rhs) noexcept;

[[nodiscard]] std::string to_string(const Value& value);
[[nodiscard]] std::string to_string(const Row& row);

// Extracts columns in order; missing columns project as null.
[[nodiscard]] KeyTuple project(const Row& row, const std::vector<std::string>& columns);
[[nodiscard]] bool has_null(const KeyTuple& key) noexcept;

struct KeyTupleLess final {
    [[nodiscard]] bool operator()(const KeyTuple& lhs, const KeyTuple& rhs) const noexcept;
};

}  // namespace relq::query
