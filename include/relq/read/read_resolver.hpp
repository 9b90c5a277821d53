#pragma once

#include "relq/core/query_context.hpp"
#include "relq/query/predicate.hpp"
#include "relq/query/query.hpp"
#include "relq/read/read_spec.hpp"
#include "relq/schema/schema_model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relq::read {

struct RootFetch final {
    std::string model{};
    query::PredicatePtr where{};
    std::vector<query::OrderTerm> order_by{};
    std::optional<std::size_t> take{};
    std::size_t skip = 0U;
    bool single = false;

    static RootFetch find_many(std::string model, query::PredicatePtr where = {});
    static RootFetch find_unique(std::string model, const schema::UniqueSelector& selector);
};

struct ResultRecord;

struct RelationResult final {
    std::string relation{};
    bool many = false;
    // Single relations hold at most one record.
    std::vector<ResultRecord> records{};
};

struct ResultRecord final {
    query::Row fields{};
    std::vector<RelationResult> relations{};

    [[nodiscard]] const RelationResult* find(std::string_view relation) const noexcept;
    // nullptr when the related row is absent. Throws std::out_of_range when
    // the relation was not included.
    [[nodiscard]] const ResultRecord* one(std::string_view relation) const;
    [[nodiscard]] const std::vector<ResultRecord>& many(std::string_view relation) const;
};

struct ReadResult final {
    std::vector<ResultRecord> records{};
    std::size_t queries_issued = 0U;
    std::size_t levels = 0U;
    std::vector<std::string> diagnostics{};
};

// Fetches the root rows, then one batched query per included relation and
// level (two for join-table relations). Levels run strictly in sequence.
[[nodiscard]] ReadResult resolve_read(const QueryContext& context, const RootFetch& root, const ReadSpec& spec);

}  // namespace relq::read
