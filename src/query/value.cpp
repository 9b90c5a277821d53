#include "relq/query/value.hpp"

#include <algorithm>
#include <sstream>

namespace relq::query {

namespace {

int rank(const Value& value) noexcept
{
    if (std::holds_alternative<std::monostate>(value)) {
        return 0;
    }
    if (std::holds_alternative<bool>(value)) {
        return 1;
    }
    if (std::holds_alternative<std::string>(value)) {
        return 3;
    }
    return 2;
}

double as_double(const Value& value) noexcept
{
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*integer);
    }
    if (const auto* real = std::get_if<double>(&value)) {
        return *real;
    }
    return 0.0;
}

template <typename T>
int three_way(const T& lhs, const T& rhs) noexcept
{
    if (lhs < rhs) {
        return -1;
    }
    if (rhs < lhs) {
        return 1;
    }
    return 0;
}

}  // namespace

bool is_null(const Value& value) noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

int compare_values(const Value& lhs, const Value& rhs) noexcept
{
    const auto lhs_rank = rank(lhs);
    const auto rhs_rank = rank(rhs);
    if (lhs_rank != rhs_rank) {
        return lhs_rank < rhs_rank ? -1 : 1;
    }

    switch (lhs_rank) {
    case 0:
        return 0;
    case 1:
        return three_way(std::get<bool>(lhs), std::get<bool>(rhs));
    case 3:
        return three_way(std::get<std::string>(lhs), std::get<std::string>(rhs));
    default:
        break;
    }

    const auto* lhs_int = std::get_if<std::int64_t>(&lhs);
    const auto* rhs_int = std::get_if<std::int64_t>(&rhs);
    if (lhs_int != nullptr && rhs_int != nullptr) {
        return three_way(*lhs_int, *rhs_int);
    }
    return three_way(as_double(lhs), as_double(rhs));
}

bool values_equal(const Value& lhs, const Value& rhs) noexcept
{
    return compare_values(lhs, rhs) == 0;
}

std::string to_string(const Value& value)
{
    if (std::holds_alternative<std::monostate>(value)) {
        return "null";
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*integer);
    }
    if (const auto* real = std::get_if<double>(&value)) {
        std::ostringstream stream;
        stream << *real;
        return stream.str();
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    return std::get<std::string>(value);
}

std::string to_string(const Row& row)
{
    std::string text{"{"};
    bool first = true;
    for (const auto& [column, value] : row) {
        if (!first) {
            text.append(", ");
        }
        first = false;
        text.append(column);
        text.push_back('=');
        text.append(to_string(value));
    }
    text.push_back('}');
    return text;
}

KeyTuple project(const Row& row, const std::vector<std::string>& columns)
{
    KeyTuple key;
    key.reserve(columns.size());
    for (const auto& column : columns) {
        const auto it = row.find(column);
        key.push_back(it == row.end() ? Value{} : it->second);
    }
    return key;
}

bool has_null(const KeyTuple& key) noexcept
{
    return std::any_of(key.begin(), key.end(), [](const Value& value) { return is_null(value); });
}

bool KeyTupleLess::operator()(const KeyTuple& lhs, const KeyTuple& rhs) const noexcept
{
    const auto count = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0U; i < count; ++i) {
        const auto order = compare_values(lhs[i], rhs[i]);
        if (order != 0) {
            return order < 0;
        }
    }
    return lhs.size() < rhs.size();
}

}  // namespace relq::query
