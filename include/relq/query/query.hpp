#pragma once

#include "relq/query/predicate.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace relq::query {

enum class SortDirection {
    Ascending,
    Descending
};

struct OrderTerm final {
    std::string column{};
    SortDirection direction = SortDirection::Ascending;
};

// Single-table read handed to the transaction executor. `where` must be free
// of relation terms; the relation filter translator lowers them first.
struct Query final {
    std::string table{};
    PredicatePtr where{};
    std::vector<OrderTerm> order_by{};
    std::optional<std::size_t> take{};
    std::size_t skip = 0U;
};

[[nodiscard]] std::string describe(const Query& query);

}  // namespace relq::query
