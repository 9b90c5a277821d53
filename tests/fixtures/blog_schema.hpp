#pragma once

#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"
#include "relq/core/query_context.hpp"
#include "relq/query/value.hpp"
#include "relq/schema/schema_model.hpp"
#include "relq/txn/memory_executor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relq::testing {

inline query::Value int_value(std::int64_t value)
{
    return query::Value{value};
}

inline query::Value text(const char* value)
{
    return query::Value{std::string{value}};
}

inline query::Row id_selector(std::int64_t id)
{
    return query::Row{{"id", int_value(id)}};
}

// User 1:1 Profile (Profile.userId required), User 1:n Post (Post.authorId
// optional), Post n:m Category through _CategoryToPost.
schema::SchemaModel make_blog_schema();

// Team.captain -> Player (one-to-one, Team.captainId) and Player.team -> Team
// (one-to-many, Player.teamId required). captainId is nullable only when
// captain_optional is set.
schema::SchemaModel make_team_schema(bool captain_optional);

// Users 1 a@x.io and 2 b@x.io; Profile 1 owned by user 2; posts 1 (user 2),
// 2 (no author) and 3 (user 1); categories 1 news and 2 tech linked as
// post 1 {news, tech} and post 3 {tech}.
void seed_blog(txn::MemoryExecutor& executor);

[[nodiscard]] std::optional<query::Row> find_row(const txn::MemoryExecutor& executor,
                                                 const std::string& table,
                                                 const std::string& column,
                                                 const query::Value& value);

struct BlogStoreOptions final {
    bool seed = true;
    bool reverse_scan_order = false;
    ReadOptions read_options{};
    WriteOptions write_options{};
};

// Schema, store and telemetry wired into one context.
class BlogStore final {
public:
    BlogStore();
    explicit BlogStore(BlogStoreOptions options);

    BlogStore(const BlogStore&) = delete;
    BlogStore& operator=(const BlogStore&) = delete;

    [[nodiscard]] const schema::SchemaModel& schema() const noexcept { return schema_; }
    [[nodiscard]] txn::MemoryExecutor& executor() noexcept { return executor_; }
    [[nodiscard]] EngineTelemetry& telemetry() noexcept { return telemetry_; }
    [[nodiscard]] const QueryContext& context() const noexcept { return context_; }

private:
    schema::SchemaModel schema_;
    txn::MemoryExecutor executor_;
    EngineTelemetry telemetry_{};
    QueryContext context_;
};

template <typename Fn>
std::optional<QueryError> capture_query_error(Fn&& fn)
{
    try {
        std::forward<Fn>(fn)();
    } catch (const QueryError& error) {
        return error;
    }
    return std::nullopt;
}

}  // namespace relq::testing
