#include "relq/read/read_resolver.hpp"

#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"
#include "relq/read/fetch_plan.hpp"

#include "fixtures/blog_schema.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using relq::query::Predicate;
using relq::testing::BlogStore;
using relq::testing::BlogStoreOptions;
using relq::testing::capture_query_error;
using relq::testing::int_value;
using relq::testing::text;

namespace relq::read {

namespace {

std::int64_t id_of(const ResultRecord& record)
{
    return std::get<std::int64_t>(record.fields.at("id"));
}

std::vector<std::int64_t> sorted_ids(const std::vector<ResultRecord>& records)
{
    std::vector<std::int64_t> ids;
    for (const auto& record : records) {
        ids.push_back(id_of(record));
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

ReadSpec include_tree()
{
    ReadSpec posts;
    posts.include("categories");
    ReadSpec spec;
    spec.include("posts", std::move(posts));
    spec.include("profile");
    return spec;
}

// user id -> (post id -> sorted category ids)
using Shape = std::map<std::int64_t, std::map<std::int64_t, std::vector<std::int64_t>>>;

Shape shape_of(const ReadResult& result)
{
    Shape shape;
    for (const auto& user : result.records) {
        auto& posts = shape[id_of(user)];
        for (const auto& post : user.many("posts")) {
            posts[id_of(post)] = sorted_ids(post.many("categories"));
        }
    }
    return shape;
}

}  // namespace

TEST_CASE("Include tree resolves nested relations level by level")
{
    BlogStore store;
    const auto result = resolve_read(store.context(), RootFetch::find_unique("User", {{"email", text("b@x.io")}}), include_tree());

    REQUIRE(result.records.size() == 1U);
    const auto& user = result.records.front();
    CHECK(id_of(user) == 2);

    const auto& posts = user.many("posts");
    REQUIRE(posts.size() == 1U);
    CHECK(query::values_equal(posts.front().fields.at("title"), text("Hello")));
    CHECK(sorted_ids(posts.front().many("categories")) == std::vector<std::int64_t>{1, 2});

    const auto* profile = user.one("profile");
    REQUIRE(profile != nullptr);
    CHECK(query::values_equal(profile->fields.at("bio"), text("storage nerd")));

    // Root, posts, profile, then links and categories for the join table.
    CHECK(result.queries_issued == 5U);
    CHECK(result.levels == 3U);
}

TEST_CASE("Each relation is fetched with one batched query per level")
{
    BlogStore store;
    const auto result = resolve_read(store.context(), RootFetch::find_many("User"), include_tree());

    CHECK(result.queries_issued == 5U);
    CHECK(store.executor().counters().queries == 5U);
    CHECK(store.executor().counters().begins == 1U);

    const auto shape = shape_of(result);
    REQUIRE(shape.size() == 2U);
    CHECK(shape.at(1) == std::map<std::int64_t, std::vector<std::int64_t>>{{3, {2}}});
    CHECK(shape.at(2) == std::map<std::int64_t, std::vector<std::int64_t>>{{1, {1, 2}}});

    const auto& ada = id_of(result.records.front()) == 1 ? result.records.front() : result.records.back();
    CHECK(ada.one("profile") == nullptr);
}

TEST_CASE("Parent-owned keys skip parents without a link")
{
    BlogStore store;

    ReadSpec spec;
    spec.include("author");
    const auto result = resolve_read(store.context(), RootFetch::find_many("Post"), spec);

    REQUIRE(result.records.size() == 3U);
    std::map<std::int64_t, std::int64_t> author_of;
    for (const auto& post : result.records) {
        const auto* author = post.one("author");
        author_of[id_of(post)] = author == nullptr ? 0 : id_of(*author);
    }
    CHECK(author_of == std::map<std::int64_t, std::int64_t>{{1, 2}, {2, 0}, {3, 1}});
    CHECK(result.queries_issued == 2U);

    const auto draft = resolve_read(store.context(), RootFetch::find_many("Post", Predicate::equals("id", int_value(2))), spec);
    CHECK(draft.queries_issued == 1U);
    CHECK_THAT(draft.diagnostics.back(), ContainsSubstring("no parent keys, fetch skipped"));
    REQUIRE(draft.records.size() == 1U);
    CHECK(draft.records.front().one("author") == nullptr);
}

TEST_CASE("List includes apply filter, order and window per parent")
{
    BlogStore store;

    IncludeEntry latest{};
    latest.relation = "posts";
    latest.order_by = {query::OrderTerm{"title", query::SortDirection::Descending}};
    latest.take = 1U;
    ReadSpec spec;
    spec.include(latest);

    const auto result = resolve_read(store.context(), RootFetch::find_many("Category"), spec);
    std::map<std::int64_t, std::vector<std::int64_t>> posts_of;
    for (const auto& category : result.records) {
        posts_of[id_of(category)] = sorted_ids(category.many("posts"));
    }
    CHECK(posts_of == std::map<std::int64_t, std::vector<std::int64_t>>{{1, {1}}, {2, {3}}});

    IncludeEntry hello{};
    hello.relation = "posts";
    hello.where = Predicate::equals("title", text("Hello"));
    ReadSpec filtered;
    filtered.include(hello);
    const auto users = resolve_read(store.context(), RootFetch::find_many("User"), filtered);
    for (const auto& user : users.records) {
        CHECK(sorted_ids(user.many("posts")) == (id_of(user) == 2 ? std::vector<std::int64_t>{1} : std::vector<std::int64_t>{}));
    }
}

TEST_CASE("Root filters may carry relation conditions")
{
    BlogStore store;

    const auto root = RootFetch::find_many(
        "User",
        Predicate::related("posts", query::RelationQuantifier::Some, Predicate::equals("title", text("Notes"))));
    const auto result = resolve_read(store.context(), root, ReadSpec{});

    CHECK(sorted_ids(result.records) == std::vector<std::int64_t>{1});
    CHECK(result.levels == 1U);
}

TEST_CASE("Reads do not depend on storage scan order")
{
    BlogStore forward;
    BlogStoreOptions options{};
    options.reverse_scan_order = true;
    BlogStore reversed{options};

    const auto expected = shape_of(resolve_read(forward.context(), RootFetch::find_many("User"), include_tree()));
    const auto actual = shape_of(resolve_read(reversed.context(), RootFetch::find_many("User"), include_tree()));
    CHECK(actual == expected);
}

TEST_CASE("Parallel sibling fetches produce the same records")
{
    BlogStore sequential;
    BlogStoreOptions options{};
    options.read_options.parallel_relations = true;
    BlogStore parallel{options};

    const auto expected = resolve_read(sequential.context(), RootFetch::find_many("User"), include_tree());
    const auto actual = resolve_read(parallel.context(), RootFetch::find_many("User"), include_tree());

    CHECK(shape_of(actual) == shape_of(expected));
    CHECK(actual.queries_issued == expected.queries_issued);
    CHECK(actual.diagnostics == expected.diagnostics);
}

TEST_CASE("Relations that were not included are absent")
{
    BlogStore store;
    ReadSpec spec;
    spec.include("profile");
    const auto result = resolve_read(store.context(), RootFetch::find_unique("User", {{"id", int_value(2)}}), spec);

    REQUIRE(result.records.size() == 1U);
    const auto& user = result.records.front();
    CHECK(user.find("posts") == nullptr);
    CHECK_THROWS_AS(user.many("posts"), std::out_of_range);
    CHECK(user.find("profile") != nullptr);
}

TEST_CASE("Invalid include trees are rejected before reading")
{
    BlogStore store;

    SECTION("unknown relation")
    {
        ReadSpec nested;
        nested.include("comments");
        ReadSpec spec;
        spec.include("posts", nested);
        const auto error = capture_query_error([&] { (void)resolve_read(store.context(), RootFetch::find_many("User"), spec); });
        REQUIRE(error.has_value());
        CHECK(error->code() == make_error_code(RelqErrc::UnknownRelation));
        CHECK(error->path() == std::vector<std::string>{"User", "posts", "comments"});
    }

    SECTION("relation included twice")
    {
        ReadSpec spec;
        spec.include("posts").include("posts");
        const auto error = capture_query_error([&] { (void)compile_fetch_plan(store.schema(), "User", spec); });
        REQUIRE(error.has_value());
        CHECK(error->code() == make_error_code(RelqErrc::MalformedDirective));
    }

    SECTION("arguments on a single relation")
    {
        IncludeEntry author{};
        author.relation = "author";
        author.take = 1U;
        ReadSpec spec;
        spec.include(author);
        const auto error = capture_query_error([&] { (void)compile_fetch_plan(store.schema(), "Post", spec); });
        REQUIRE(error.has_value());
        CHECK(error->code() == make_error_code(RelqErrc::InvalidFilter));
    }

    SECTION("unknown order column")
    {
        IncludeEntry posts{};
        posts.relation = "posts";
        posts.order_by = {query::OrderTerm{"published", query::SortDirection::Ascending}};
        ReadSpec spec;
        spec.include(posts);
        const auto error = capture_query_error([&] { (void)compile_fetch_plan(store.schema(), "User", spec); });
        REQUIRE(error.has_value());
        CHECK(error->code() == make_error_code(RelqErrc::UnknownField));
        CHECK(error->path() == std::vector<std::string>{"User", "posts", "published"});
    }

    CHECK(store.executor().counters().queries == 0U);
}

TEST_CASE("Fetch plans lay out steps breadth first")
{
    BlogStore store;
    const auto plan = compile_fetch_plan(store.schema(), "User", include_tree());

    REQUIRE(plan.steps.size() == 3U);
    CHECK(plan.depth == 2U);
    CHECK(plan.steps[2].parent_step == std::optional<std::size_t>{0U});
    CHECK(explain_fetch_plan(plan)
          == "level 0: User\n"
             "level 1: User.posts -> Post [child-owns-key, many]\n"
             "level 1: User.profile -> Profile [child-owns-key, single]\n"
             "level 2: User.posts.categories -> Category [join-table, many] parent #0\n");
}

TEST_CASE("Reads are recorded in engine telemetry")
{
    BlogStore store;
    (void)resolve_read(store.context(), RootFetch::find_many("User"), include_tree());

    const auto snapshot = store.telemetry().snapshot();
    CHECK(snapshot.reads_resolved == 1U);
    CHECK(snapshot.read_levels == 3U);
    CHECK(snapshot.batched_fetches == 4U);
}

}  // namespace relq::read
