#include "relq/tools/json_formatter.hpp"

#include "relq/read/read_spec.hpp"

#include "fixtures/blog_schema.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using relq::testing::BlogStore;
using relq::testing::int_value;
using relq::testing::text;

namespace relq::tools {

TEST_CASE("Rows format as JSON objects in column order")
{
    const query::Row row{{"id", int_value(1)},
                         {"name", query::Value{}},
                         {"bio", text("says \"hi\"\n")},
                         {"active", query::Value{true}}};
    CHECK(format_row_json(row) == R"({"active":true,"bio":"says \"hi\"\n","id":1,"name":null})");
    CHECK(format_row_json({}) == "{}");
}

TEST_CASE("Telemetry JSON carries every counter")
{
    EngineTelemetrySnapshot snapshot{};
    snapshot.write_plans_attempted = 3U;
    snapshot.conflict_retries = 1U;
    const auto json = format_telemetry_json(snapshot);
    CHECK_THAT(json, StartsWith(R"({"write_plans_attempted":3,)"));
    CHECK_THAT(json, ContainsSubstring(R"("conflict_retries":1)"));
    CHECK_THAT(json, ContainsSubstring(R"("batched_fetches":0})"));
}

TEST_CASE("Write results format with the root row")
{
    write::WriteResult result{};
    result.row = query::Row{{"id", int_value(7)}};
    result.operations_executed = 2U;
    result.attempts = 1U;
    result.diagnostics = {"deferred"};
    CHECK(format_write_result_json(result) == R"({"row":{"id":7},"operations_executed":2,"attempts":1,"diagnostics":["deferred"]})");

    result.row.reset();
    CHECK_THAT(format_write_result_json(result), StartsWith(R"({"row":null,)"));
}

TEST_CASE("Read results nest included relations as keys")
{
    BlogStore store;
    read::ReadSpec spec;
    spec.include("profile");
    const auto result = read::resolve_read(store.context(), read::RootFetch::find_unique("User", {{"id", int_value(1)}}), spec);

    const auto json = format_read_result_json(result);
    CHECK_THAT(json, StartsWith(R"({"records":[{"email":"a@x.io","id":1,"name":"Ada","profile":null}],)"));
    CHECK_THAT(json, ContainsSubstring(R"("levels":2)"));
}

TEST_CASE("Chain results format their rows")
{
    chain::ChainResult result{};
    result.many = true;
    result.rows = {query::Row{{"id", int_value(3)}}};
    result.queries_issued = 2U;
    CHECK(format_chain_result_json(result) == R"({"many":true,"rows":[{"id":3}],"queries_issued":2,"diagnostics":[]})");
}

TEST_CASE("Errors format with code, path and cause")
{
    const QueryError error{make_error_code(RelqErrc::TransactionAborted),
                           "#2 Insert Category: injected fault",
                           {"Post", "categories[0]"},
                           make_error_code(StorageErrc::InjectedFault),
                           2U};
    const auto json = format_error_json(error);
    CHECK_THAT(json, StartsWith(R"({"code":"transaction aborted","message":"#2 Insert Category: injected fault)"));
    CHECK_THAT(json, ContainsSubstring(R"("path":["Post","categories[0]"])"));
    CHECK_THAT(json, ContainsSubstring(R"("cause":"relq.storage: injected fault")"));
    CHECK_THAT(json, ContainsSubstring(R"("operation_index":2})"));

    const QueryError plain{make_error_code(RelqErrc::UnknownModel), "unknown model 'Comment'"};
    CHECK_THAT(format_error_json(plain), ContainsSubstring(R"("cause":null,"operation_index":null})"));
}

}  // namespace relq::tools
