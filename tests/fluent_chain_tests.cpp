#include "relq/chain/fluent_chain.hpp"

#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"

#include "fixtures/blog_schema.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using relq::query::Predicate;
using relq::testing::BlogStore;
using relq::testing::capture_query_error;
using relq::testing::id_selector;
using relq::testing::int_value;
using relq::testing::text;

namespace relq::chain {

namespace {

FluentChain user_by_email(const char* email)
{
    FluentChain chain{};
    chain.model = "User";
    chain.root = {{"email", text(email)}};
    return chain;
}

std::vector<std::int64_t> ids(const ChainResult& result)
{
    std::vector<std::int64_t> values;
    for (const auto& row : result.rows) {
        values.push_back(std::get<std::int64_t>(row.at("id")));
    }
    return values;
}

}  // namespace

TEST_CASE("Chain ending in a list relation returns the related rows")
{
    BlogStore store;
    const auto result = resolve_chain(store.context(), user_by_email("a@x.io").then("posts"));

    CHECK(result.many);
    CHECK(ids(result) == std::vector<std::int64_t>{3});
    CHECK(result.queries_issued == 2U);
    REQUIRE(result.diagnostics.size() == 2U);
    CHECK(result.diagnostics[0] == "root User matched 1 row(s)");
    CHECK(result.diagnostics[1] == "Post fetch returned 1 row(s)");
    CHECK(store.telemetry().snapshot().chains_resolved == 1U);
}

TEST_CASE("Chain through single relations returns at most one row")
{
    BlogStore store;

    FluentChain post{};
    post.model = "Post";
    post.root = id_selector(1);
    const auto author = resolve_chain(store.context(), post.then("author"));
    CHECK_FALSE(author.many);
    REQUIRE(author.rows.size() == 1U);
    CHECK(query::values_equal(author.rows.front().at("email"), text("b@x.io")));

    const auto missing = resolve_chain(store.context(), user_by_email("a@x.io").then("profile"));
    CHECK_FALSE(missing.many);
    CHECK(missing.rows.empty());

    const auto round_trip = resolve_chain(store.context(), user_by_email("b@x.io").then("profile").then("user"));
    REQUIRE(round_trip.rows.size() == 1U);
    CHECK(query::values_equal(round_trip.rows.front().at("id"), int_value(2)));
}

TEST_CASE("Chain may traverse single steps before a final list")
{
    BlogStore store;

    FluentChain chain{};
    chain.model = "Profile";
    chain.root = {{"userId", int_value(2)}};
    chain.then("user").then("posts");

    const auto result = resolve_chain(store.context(), chain);
    CHECK(result.many);
    CHECK(ids(result) == std::vector<std::int64_t>{1});
}

TEST_CASE("Final list step honours filter, order and window")
{
    BlogStore store;

    FluentChain chain{};
    chain.model = "Category";
    chain.root = {{"name", text("tech")}};
    ChainStep posts{};
    posts.relation = "posts";
    posts.where = Predicate::is_not_null("title");
    posts.order_by = {query::OrderTerm{"title", query::SortDirection::Descending}};
    posts.take = 1U;
    chain.steps.push_back(posts);

    const auto result = resolve_chain(store.context(), chain);
    REQUIRE(result.rows.size() == 1U);
    CHECK(query::values_equal(result.rows.front().at("title"), text("Notes")));

    chain.steps.front().where = Predicate::equals("title", text("Hello"));
    chain.steps.front().take.reset();
    CHECK(ids(resolve_chain(store.context(), chain)) == std::vector<std::int64_t>{1});
}

TEST_CASE("Chain continuing past a list step is rejected before any query")
{
    BlogStore store;

    const auto error = capture_query_error(
        [&] { (void)resolve_chain(store.context(), user_by_email("a@x.io").then("posts").then("author")); });

    REQUIRE(error.has_value());
    CHECK(error->code() == make_error_code(RelqErrc::ChainCardinality));
    CHECK(error->path() == std::vector<std::string>{"User", "posts", "author"});
    CHECK(store.executor().counters().queries == 0U);
    CHECK(store.executor().counters().begins == 0U);
    CHECK(store.telemetry().snapshot().chains_rejected == 1U);
}

TEST_CASE("Relation arguments are only accepted on a final list step")
{
    BlogStore store;

    FluentChain chain{};
    chain.model = "Post";
    chain.root = id_selector(1);
    chain.then("author", Predicate::equals("name", text("Bo")));

    const auto error = capture_query_error([&] { (void)compile_chain(store.schema(), chain); });
    REQUIRE(error.has_value());
    CHECK(error->code() == make_error_code(RelqErrc::ChainCardinality));
    CHECK_THAT(error->what(), ContainsSubstring("Post.author"));
}

TEST_CASE("Chain roots must be unique locators")
{
    BlogStore store;

    FluentChain chain{};
    chain.model = "User";
    chain.root = {{"name", text("Ada")}};
    chain.then("posts");

    const auto invalid = capture_query_error([&] { (void)resolve_chain(store.context(), chain); });
    REQUIRE(invalid.has_value());
    CHECK(invalid->code() == make_error_code(RelqErrc::InvalidSelector));

    chain.root = {{"email", text("a@x.io")}};
    chain.steps.front().relation = "comments";
    const auto unknown = capture_query_error([&] { (void)resolve_chain(store.context(), chain); });
    REQUIRE(unknown.has_value());
    CHECK(unknown->code() == make_error_code(RelqErrc::UnknownRelation));
    CHECK(unknown->path() == std::vector<std::string>{"User", "comments"});
}

TEST_CASE("Missing chain root yields an empty result")
{
    BlogStore store;
    const auto result = resolve_chain(store.context(), user_by_email("nobody@x.io").then("posts"));

    CHECK(result.many);
    CHECK(result.rows.empty());
    CHECK(result.queries_issued == 1U);
    CHECK(result.diagnostics.front() == "root User matched 0 row(s)");
}

TEST_CASE("Empty chain returns the root row itself")
{
    BlogStore store;
    const auto result = resolve_chain(store.context(), user_by_email("b@x.io"));

    CHECK_FALSE(result.many);
    REQUIRE(result.rows.size() == 1U);
    CHECK(query::values_equal(result.rows.front().at("name"), text("Bo")));
    CHECK(result.queries_issued == 1U);
}

TEST_CASE("explain_chain renders the compiled queries deterministically")
{
    BlogStore store;
    const auto chain = user_by_email("a@x.io").then("posts");

    const auto first = explain_chain(compile_chain(store.schema(), chain));
    const auto second = explain_chain(compile_chain(store.schema(), chain));
    CHECK(first == second);
    CHECK(first
          == "root: select from User where email = a@x.io take 1\n"
             "step 1: User.posts -> Post (many)\n"
             "target: select from Post where (authorId) in (select id from User where email = a@x.io)\n");
}

}  // namespace relq::chain
