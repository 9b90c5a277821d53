#include "relq/write/plan_runner.hpp"

#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"
#include "relq/core/query_context.hpp"
#include "relq/txn/memory_executor.hpp"

#include "fixtures/blog_schema.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using relq::query::Predicate;
using relq::testing::BlogStore;
using relq::testing::BlogStoreOptions;
using relq::testing::capture_query_error;
using relq::testing::find_row;
using relq::testing::id_selector;
using relq::testing::int_value;
using relq::testing::make_team_schema;
using relq::testing::text;

namespace relq::write {

namespace {

WritePayload payload()
{
    return WritePayload{};
}

bool inserts_into(const txn::StorageCommand& command, const char* table)
{
    const auto* insert = std::get_if<txn::InsertRow>(&command);
    return insert != nullptr && insert->table == table;
}

bool is_linked(BlogStore& store, std::int64_t category, std::int64_t post)
{
    for (const auto& row : store.executor().rows("_CategoryToPost")) {
        if (query::values_equal(row.at("A"), int_value(category)) && query::values_equal(row.at("B"), int_value(post))) {
            return true;
        }
    }
    return false;
}

query::Value author_of(BlogStore& store, std::int64_t post)
{
    const auto row = find_row(store.executor(), "Post", "id", int_value(post));
    REQUIRE(row.has_value());
    return row->at("authorId");
}

WriteRequest nested_user_create()
{
    return WriteRequest::create(
        "User",
        payload()
            .set("email", "c@x.io")
            .with(relation("profile", CreateDirective{payload().set("bio", "hi")}))
            .with(relation("posts",
                           std::vector<WriteDirective>{
                               CreateDirective{payload().set("title", "T1")},
                               CreateDirective{payload().set("title", "T2").with(
                                   relation("categories", ConnectDirective{{{"name", text("tech")}}}))},
                           })));
}

WriteRequest connect_or_create_rust()
{
    return WriteRequest::update(
        "Post",
        id_selector(2),
        payload().with(relation("categories", ConnectOrCreateDirective{{{"name", text("rust")}}, payload().set("name", "rust")})));
}

QueryError write_error(BlogStore& store, const WriteRequest& request)
{
    const auto error = capture_query_error([&] { (void)execute_write(store.context(), request); });
    REQUIRE(error.has_value());
    return *error;
}

}  // namespace

TEST_CASE("Nested create commits the whole tree in one transaction")
{
    BlogStore store;
    const auto result = execute_write(store.context(), nested_user_create());

    REQUIRE(result.row.has_value());
    CHECK(query::values_equal(result.row->at("id"), int_value(3)));
    CHECK(query::values_equal(result.row->at("email"), text("c@x.io")));
    CHECK(result.operations_executed == 6U);
    CHECK(result.attempts == 1U);

    const auto profile = find_row(store.executor(), "Profile", "bio", text("hi"));
    REQUIRE(profile.has_value());
    CHECK(query::values_equal(profile->at("userId"), int_value(3)));

    const auto t2 = find_row(store.executor(), "Post", "title", text("T2"));
    REQUIRE(t2.has_value());
    CHECK(query::values_equal(t2->at("authorId"), int_value(3)));
    CHECK(is_linked(store, 2, std::get<std::int64_t>(t2->at("id"))));
    CHECK(store.executor().row_count("Post") == 5U);

    CHECK(store.executor().counters().begins == 1U);
    CHECK(store.executor().counters().commits == 1U);

    const auto snapshot = store.telemetry().snapshot();
    CHECK(snapshot.write_plans_attempted == 1U);
    CHECK(snapshot.write_plans_succeeded == 1U);
    CHECK(snapshot.operations_executed == 6U);
}

TEST_CASE("Missing connect target aborts without partial writes")
{
    BlogStore store;
    const auto error = write_error(
        store,
        WriteRequest::create("Post", payload().set("title", "Orphan").with(relation("categories", ConnectDirective{{{"name", text("missing")}}}))));

    CHECK(error.code() == make_error_code(RelqErrc::TransactionAborted));
    CHECK(error.cause() == make_error_code(RelqErrc::UniqueTargetNotFound));
    CHECK(error.is(RelqErrc::UniqueTargetNotFound));
    CHECK(error.path() == std::vector<std::string>{"Post", "categories[0]"});
    CHECK(error.operation_index() == 1U);
    CHECK_THAT(error.what(), ContainsSubstring("#1 Lookup Category"));

    CHECK_FALSE(find_row(store.executor(), "Post", "title", text("Orphan")).has_value());
    CHECK(store.executor().row_count("Post") == 3U);
    CHECK(store.executor().active_transactions() == 0U);

    const auto snapshot = store.telemetry().snapshot();
    CHECK(snapshot.write_plans_failed == 1U);
    CHECK(snapshot.rollbacks == 1U);
}

TEST_CASE("Owned foreign key connects to an existing row")
{
    BlogStore store;
    const auto result = execute_write(
        store.context(),
        WriteRequest::create("Profile", payload().set("bio", "new").with(relation("user", ConnectDirective{{{"email", text("a@x.io")}}}))));

    REQUIRE(result.row.has_value());
    CHECK(query::values_equal(result.row->at("userId"), int_value(1)));
    CHECK(store.executor().row_count("Profile") == 2U);
}

TEST_CASE("Connecting a required one-to-one that is already taken fails")
{
    BlogStore store;
    const auto error = write_error(
        store,
        WriteRequest::create("Profile", payload().set("bio", "new").with(relation("user", ConnectDirective{{{"email", text("b@x.io")}}}))));

    CHECK(error.code() == make_error_code(RelqErrc::TransactionAborted));
    CHECK(error.is(RelqErrc::CardinalityViolation));
    CHECK(error.path() == std::vector<std::string>{"Profile", "user"});
    CHECK(store.executor().row_count("Profile") == 1U);
}

TEST_CASE("One-to-one connect moves the row to its new owner")
{
    BlogStore store;
    (void)execute_write(store.context(),
                        WriteRequest::update("Profile", id_selector(1), payload().with(relation("user", ConnectDirective{{{"email", text("a@x.io")}}}))));

    const auto profile = find_row(store.executor(), "Profile", "id", int_value(1));
    REQUIRE(profile.has_value());
    CHECK(query::values_equal(profile->at("userId"), int_value(1)));
}

TEST_CASE("Foreign key cycle with an optional side is written in three steps")
{
    const auto schema = make_team_schema(true);
    txn::MemoryExecutor executor{txn::MemoryExecutor::Config{&schema}};
    EngineTelemetry telemetry;
    QueryContextConfig config{};
    config.schema = &schema;
    config.executor = &executor;
    config.telemetry = &telemetry;
    const QueryContext context{config};

    const auto request = WriteRequest::create(
        "Team",
        payload().set("name", "Red").with(relation(
            "captain",
            CreateDirective{payload().set("name", "Pat").with(relation("team", ConnectDirective{{{"name", text("Red")}}}))})));

    const auto result = execute_write(context, request);
    CHECK(result.operations_executed == 3U);
    REQUIRE(result.diagnostics.size() == 1U);
    CHECK(result.diagnostics.front() == "deferred Team foreign key (captainId) until r2 exists");

    REQUIRE(result.row.has_value());
    CHECK(query::values_equal(result.row->at("captainId"), int_value(1)));
    const auto player = find_row(executor, "Player", "name", text("Pat"));
    REQUIRE(player.has_value());
    CHECK(query::values_equal(player->at("teamId"), int_value(1)));
}

TEST_CASE("Unplannable cycles never reach storage")
{
    const auto schema = make_team_schema(false);
    txn::MemoryExecutor executor{txn::MemoryExecutor::Config{&schema}};
    EngineTelemetry telemetry;
    QueryContextConfig config{};
    config.schema = &schema;
    config.executor = &executor;
    config.telemetry = &telemetry;
    const QueryContext context{config};

    const auto request = WriteRequest::create(
        "Team",
        payload().set("name", "Red").with(relation(
            "captain",
            CreateDirective{payload().set("name", "Pat").with(relation("team", ConnectDirective{{{"name", text("Red")}}}))})));

    const auto error = capture_query_error([&] { (void)execute_write(context, request); });
    REQUIRE(error.has_value());
    CHECK(error->code() == make_error_code(RelqErrc::ConstraintCycle));
    CHECK(executor.counters().begins == 0U);
    CHECK(executor.counters().commands == 0U);
    CHECK(telemetry.snapshot().write_plans_failed == 1U);
}

TEST_CASE("Upsert updates a linked row and creates a missing one")
{
    BlogStore store;
    const auto upsert = [](const char* email) {
        return WriteRequest::update(
            "User",
            {{"email", text(email)}},
            payload().with(relation("profile", UpsertDirective{std::nullopt, payload().set("bio", "new"), payload().set("bio", "updated")})));
    };

    const auto updated = execute_write(store.context(), upsert("b@x.io"));
    CHECK(updated.operations_executed == 3U);
    const auto existing = find_row(store.executor(), "Profile", "id", int_value(1));
    REQUIRE(existing.has_value());
    CHECK(query::values_equal(existing->at("bio"), text("updated")));

    const auto created = execute_write(store.context(), upsert("a@x.io"));
    CHECK(created.operations_executed == 4U);
    const auto fresh = find_row(store.executor(), "Profile", "userId", int_value(1));
    REQUIRE(fresh.has_value());
    CHECK(query::values_equal(fresh->at("bio"), text("new")));
    CHECK(store.executor().row_count("Profile") == 2U);
}

TEST_CASE("Set replaces the related rows of a list relation")
{
    BlogStore store;
    (void)execute_write(store.context(), WriteRequest::update("User", id_selector(2), payload().with(relation("posts", SetDirective{{id_selector(3)}}))));

    CHECK(query::is_null(author_of(store, 1)));
    CHECK(query::values_equal(author_of(store, 3), int_value(2)));
    CHECK(query::is_null(author_of(store, 2)));
}

TEST_CASE("Set keeps listed members and unlinks the rest")
{
    BlogStore store;
    (void)execute_write(store.context(),
                        WriteRequest::update("User", id_selector(1), payload().with(relation("posts", SetDirective{{id_selector(1), id_selector(2)}}))));

    CHECK(query::values_equal(author_of(store, 1), int_value(1)));
    CHECK(query::values_equal(author_of(store, 2), int_value(1)));
    CHECK(query::is_null(author_of(store, 3)));
    CHECK(store.executor().row_count("Post") == 3U);
}

TEST_CASE("Set on a many-to-many relation rewrites the join rows")
{
    BlogStore store;
    (void)execute_write(store.context(),
                        WriteRequest::update("Post", id_selector(1), payload().with(relation("categories", SetDirective{{query::Row{{"name", text("news")}}}}))));

    CHECK(is_linked(store, 1, 1));
    CHECK_FALSE(is_linked(store, 2, 1));
    CHECK(is_linked(store, 2, 3));
    CHECK(store.executor().row_count("_CategoryToPost") == 2U);
    CHECK(store.executor().row_count("Category") == 2U);
}

TEST_CASE("Set cannot orphan rows whose foreign key is required")
{
    const auto schema = make_team_schema(true);
    txn::MemoryExecutor executor{txn::MemoryExecutor::Config{&schema}};
    REQUIRE_FALSE(executor.seed("Team", {{"id", int_value(1)}, {"name", text("Red")}, {"captainId", query::Value{}}}));
    REQUIRE_FALSE(executor.seed("Player", {{"id", int_value(1)}, {"name", text("Pat")}, {"teamId", int_value(1)}}));
    EngineTelemetry telemetry;
    QueryContextConfig config{};
    config.schema = &schema;
    config.executor = &executor;
    config.telemetry = &telemetry;
    const QueryContext context{config};

    const auto error = capture_query_error(
        [&] { (void)execute_write(context, WriteRequest::update("Team", id_selector(1), payload().with(relation("players", SetDirective{})))); });
    REQUIRE(error.has_value());
    CHECK(error->code() == make_error_code(RelqErrc::TransactionAborted));
    CHECK(error->cause() == make_error_code(RelqErrc::CardinalityViolation));
    CHECK_THAT(error->what(), ContainsSubstring("'Team.players' would orphan Player rows"));

    CHECK(executor.row_count("Player") == 1U);
    const auto player = find_row(executor, "Player", "id", int_value(1));
    REQUIRE(player.has_value());
    CHECK(query::values_equal(player->at("teamId"), int_value(1)));
}

TEST_CASE("Replacing membership of a key-holding relation aborts the plan")
{
    BlogStore store;

    WritePlan plan{};
    plan.root_model = "Post";
    plan.root = RowRef{1U};
    plan.rows = {LogicalRow{"Post", {"Post"}}};

    PlanOperation lookup{};
    lookup.kind = PlanOperationKind::Lookup;
    lookup.table = "Post";
    lookup.row = RowRef{1U};
    lookup.selector = id_selector(1);
    lookup.path = {"Post"};

    PlanOperation replace{};
    replace.kind = PlanOperationKind::ReplaceMembership;
    replace.table = "Post";
    replace.row = RowRef{1U};
    replace.relation = &store.schema().relation("Post", "author");
    replace.path = {"Post", "author"};

    plan.operations = {lookup, replace};

    const auto error = capture_query_error([&] { (void)run_write_plan(store.context(), plan); });
    REQUIRE(error.has_value());
    CHECK(error->code() == make_error_code(RelqErrc::TransactionAborted));
    CHECK(error->cause() == make_error_code(RelqErrc::MalformedDirective));
    CHECK(error->operation_index() == 1U);
    CHECK(query::values_equal(author_of(store, 1), int_value(2)));
}

TEST_CASE("Disconnect removes links without deleting rows")
{
    BlogStore store;

    SECTION("many-to-many")
    {
        (void)execute_write(store.context(),
                            WriteRequest::update("Post", id_selector(1), payload().with(relation("categories", DisconnectDirective{{{"name", text("tech")}}}))));
        CHECK_FALSE(is_linked(store, 2, 1));
        CHECK(is_linked(store, 1, 1));
        CHECK(store.executor().row_count("Category") == 2U);
    }

    SECTION("owned foreign key")
    {
        (void)execute_write(store.context(), WriteRequest::update("Post", id_selector(1), payload().with(relation("author", DisconnectDirective{}))));
        CHECK(query::is_null(author_of(store, 1)));
        CHECK(store.executor().row_count("User") == 2U);
    }

    SECTION("row that is not linked")
    {
        const auto error = write_error(
            store,
            WriteRequest::update("Post", id_selector(2), payload().with(relation("categories", DisconnectDirective{{{"name", text("news")}}}))));
        CHECK(error.is(RelqErrc::UniqueTargetNotFound));
        CHECK(store.executor().row_count("_CategoryToPost") == 3U);
    }
}

TEST_CASE("Nested delete removes the row and its join links")
{
    BlogStore store;
    (void)execute_write(store.context(),
                        WriteRequest::update("Post", id_selector(1), payload().with(relation("categories", DeleteDirective{{{"name", text("news")}}}))));

    CHECK_FALSE(find_row(store.executor(), "Category", "name", text("news")).has_value());
    CHECK_FALSE(is_linked(store, 1, 1));
    CHECK(is_linked(store, 2, 1));
    CHECK(store.executor().row_count("_CategoryToPost") == 2U);
}

TEST_CASE("Deleting a referenced user nulls optional foreign keys")
{
    BlogStore store;
    (void)execute_write(store.context(), WriteRequest::update("Post", id_selector(3), payload().with(relation("author", DeleteDirective{}))));

    CHECK_FALSE(find_row(store.executor(), "User", "id", int_value(1)).has_value());
    CHECK(query::is_null(author_of(store, 3)));
}

TEST_CASE("connectOrCreate is idempotent")
{
    BlogStore store;

    const auto first = execute_write(store.context(), connect_or_create_rust());
    const auto rust = find_row(store.executor(), "Category", "name", text("rust"));
    REQUIRE(rust.has_value());
    const auto rust_id = std::get<std::int64_t>(rust->at("id"));
    CHECK(is_linked(store, rust_id, 2));
    CHECK(first.operations_executed == 4U);

    const auto second = execute_write(store.context(), connect_or_create_rust());
    CHECK(second.operations_executed == 3U);
    CHECK(store.executor().row_count("Category") == 3U);
    CHECK(store.executor().row_count("_CategoryToPost") == 4U);
}

TEST_CASE("Concurrent create during connectOrCreate is retried as connect")
{
    BlogStore store;
    bool raced = false;
    store.executor().set_command_hook([&](std::size_t, const txn::StorageCommand& command) -> std::error_code {
        if (!raced && inserts_into(command, "Category")) {
            raced = true;
            return store.executor().seed("Category", {{"name", text("rust")}});
        }
        return {};
    });

    const auto result = execute_write(store.context(), connect_or_create_rust());
    CHECK(raced);
    CHECK(result.attempts == 2U);
    REQUIRE_FALSE(result.diagnostics.empty());
    CHECK(result.diagnostics.back() == "unique conflict at #2; retrying as connect");

    CHECK(store.executor().row_count("Category") == 3U);
    const auto rust = find_row(store.executor(), "Category", "name", text("rust"));
    REQUIRE(rust.has_value());
    CHECK(is_linked(store, std::get<std::int64_t>(rust->at("id")), 2));

    const auto snapshot = store.telemetry().snapshot();
    CHECK(snapshot.conflict_retries == 1U);
    CHECK(snapshot.rollbacks == 1U);
    CHECK(snapshot.write_plans_succeeded == 1U);
}

TEST_CASE("Repeated unique conflicts abort after one retry")
{
    BlogStore store;
    store.executor().set_command_hook([](std::size_t, const txn::StorageCommand& command) -> std::error_code {
        if (inserts_into(command, "Category")) {
            return make_error_code(StorageErrc::UniqueViolation);
        }
        return {};
    });

    const auto error = write_error(store, connect_or_create_rust());
    CHECK(error.code() == make_error_code(RelqErrc::TransactionAborted));
    CHECK(error.cause() == make_error_code(StorageErrc::UniqueViolation));
    CHECK(error.operation_index() == 2U);

    const auto snapshot = store.telemetry().snapshot();
    CHECK(snapshot.conflict_retries == 1U);
    CHECK(snapshot.rollbacks == 2U);
    CHECK(snapshot.write_plans_failed == 1U);
    CHECK(store.executor().row_count("Category") == 2U);
}

TEST_CASE("Conflict retry can be disabled")
{
    BlogStoreOptions options{};
    options.write_options.retry_conflicts_as_connect = false;
    BlogStore store{options};
    store.executor().set_command_hook([&](std::size_t, const txn::StorageCommand& command) -> std::error_code {
        if (inserts_into(command, "Category") && store.executor().row_count("Category") == 2U) {
            return store.executor().seed("Category", {{"name", text("rust")}});
        }
        return {};
    });

    const auto error = write_error(store, connect_or_create_rust());
    CHECK(error.cause() == make_error_code(StorageErrc::UniqueViolation));
    CHECK(store.telemetry().snapshot().conflict_retries == 0U);
    CHECK(store.executor().counters().begins == 1U);
}

TEST_CASE("Injected storage fault rolls back every earlier operation")
{
    BlogStore store;
    store.executor().set_command_hook([](std::size_t index, const txn::StorageCommand&) -> std::error_code {
        if (index == 2U) {
            return make_error_code(StorageErrc::InjectedFault);
        }
        return {};
    });

    const auto error = write_error(store, nested_user_create());
    CHECK(error.cause() == make_error_code(StorageErrc::InjectedFault));
    CHECK(error.operation_index() == 2U);
    CHECK(error.path() == std::vector<std::string>{"User", "posts[0]"});

    CHECK(store.executor().row_count("User") == 2U);
    CHECK(store.executor().row_count("Profile") == 1U);
    CHECK(store.executor().row_count("Post") == 3U);
    CHECK(store.executor().row_count("_CategoryToPost") == 3U);
    CHECK(store.executor().active_transactions() == 0U);
}

TEST_CASE("Invalid disconnects are rejected before any transaction")
{
    BlogStore store;

    const auto profile = write_error(store, WriteRequest::update("User", id_selector(2), payload().with(relation("profile", DisconnectDirective{}))));
    CHECK(profile.code() == make_error_code(RelqErrc::CardinalityViolation));

    const auto user = write_error(store, WriteRequest::update("Profile", id_selector(1), payload().with(relation("user", DeleteDirective{}))));
    CHECK(user.code() == make_error_code(RelqErrc::CardinalityViolation));

    CHECK(store.executor().counters().begins == 0U);
    CHECK(store.telemetry().snapshot().write_plans_failed == 2U);
}

TEST_CASE("Bulk directives touch only the parent's related rows")
{
    BlogStore store;

    SECTION("updateMany")
    {
        (void)execute_write(store.context(),
                            WriteRequest::update("User",
                                                 id_selector(2),
                                                 payload().with(relation("posts",
                                                                         UpdateManyDirective{Predicate::is_not_null("title"),
                                                                                             payload().set("title", "Hi")}))));
        const auto hello = find_row(store.executor(), "Post", "id", int_value(1));
        REQUIRE(hello.has_value());
        CHECK(query::values_equal(hello->at("title"), text("Hi")));
        const auto notes = find_row(store.executor(), "Post", "id", int_value(3));
        REQUIRE(notes.has_value());
        CHECK(query::values_equal(notes->at("title"), text("Notes")));
    }

    SECTION("deleteMany through a join table")
    {
        (void)execute_write(store.context(),
                            WriteRequest::update("Category",
                                                 {{"name", text("tech")}},
                                                 payload().with(relation("posts", DeleteManyDirective{Predicate::equals("title", text("Notes"))}))));
        CHECK_FALSE(find_row(store.executor(), "Post", "id", int_value(3)).has_value());
        CHECK(store.executor().row_count("Post") == 2U);
        CHECK(store.executor().row_count("_CategoryToPost") == 2U);
    }
}

TEST_CASE("Connect to a row created in the same request links it once")
{
    BlogStore store;
    (void)execute_write(store.context(),
                        WriteRequest::create("Category",
                                             payload().set("name", "rust").with(relation(
                                                 "posts",
                                                 CreateDirective{payload().set("title", "R").with(
                                                     relation("categories", ConnectDirective{{{"name", text("rust")}}}))}))));

    CHECK(store.executor().row_count("Category") == 3U);
    CHECK(store.executor().row_count("_CategoryToPost") == 4U);
    const auto post = find_row(store.executor(), "Post", "title", text("R"));
    REQUIRE(post.has_value());
    CHECK(is_linked(store, 3, std::get<std::int64_t>(post->at("id"))));
}

}  // namespace relq::write
