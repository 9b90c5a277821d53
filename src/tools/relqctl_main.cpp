#include "relq/chain/fluent_chain.hpp"
#include "relq/core/engine_telemetry.hpp"
#include "relq/core/errors.hpp"
#include "relq/core/query_context.hpp"
#include "relq/read/fetch_plan.hpp"
#include "relq/read/read_resolver.hpp"
#include "relq/schema/schema_model.hpp"
#include "relq/tools/json_formatter.hpp"
#include "relq/txn/memory_executor.hpp"
#include "relq/write/plan_printer.hpp"
#include "relq/write/plan_runner.hpp"
#include "relq/write/write_planner.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using relq::query::Row;
using relq::query::Value;

namespace {

enum class OutputFormat {
    Json,
    Text
};

struct Scenario final {
    const char* name;
    const char* summary;
};

constexpr Scenario kScenarios[] = {
    {"nested-create", "create a User with a nested Profile"},
    {"connect-missing", "connect a Profile that does not exist (fails, nothing committed)"},
    {"chain-past-list", "traverse posts twice from one user (rejected before any query)"},
    {"set-posts", "replace a user's posts with ids 1 and 2"},
    {"include-tree", "read users with posts and their categories"},
    {"connect-or-create", "attach categories to a post, creating the missing one"},
};

relq::schema::ScalarField id_field()
{
    relq::schema::ScalarField field{};
    field.name = "id";
    field.type = relq::schema::ScalarType::Int;
    field.is_id = true;
    field.autoincrement = true;
    return field;
}

relq::schema::ScalarField column(std::string name, relq::schema::ScalarType type, bool nullable = false, bool unique = false)
{
    relq::schema::ScalarField field{};
    field.name = std::move(name);
    field.type = type;
    field.nullable = nullable;
    field.unique = unique;
    return field;
}

relq::schema::SchemaModel make_demo_schema()
{
    using relq::schema::ScalarType;

    relq::schema::SchemaBuilder builder;
    builder.add_model("User", {id_field(), column("email", ScalarType::String, false, true), column("name", ScalarType::String, true)});
    builder.add_model("Profile", {id_field(), column("bio", ScalarType::String), column("userId", ScalarType::Int)});
    builder.add_model("Post", {id_field(), column("title", ScalarType::String), column("authorId", ScalarType::Int, true)});
    builder.add_model("Category", {id_field(), column("name", ScalarType::String, false, true)});

    relq::schema::RelationDeclaration profile{};
    profile.owner_model = "Profile";
    profile.owner_field = "user";
    profile.foreign_key_columns = {"userId"};
    profile.target_model = "User";
    profile.target_field = "profile";
    builder.add_one_to_one(std::move(profile));

    relq::schema::RelationDeclaration posts{};
    posts.owner_model = "Post";
    posts.owner_field = "author";
    posts.foreign_key_columns = {"authorId"};
    posts.target_model = "User";
    posts.target_field = "posts";
    builder.add_one_to_many(std::move(posts));

    relq::schema::ManyToManyDeclaration categories{};
    categories.model_a = "Post";
    categories.field_a = "categories";
    categories.model_b = "Category";
    categories.field_b = "posts";
    builder.add_many_to_many(std::move(categories));

    return builder.build();
}

// Owns everything a QueryContext points at.
class DemoEnvironment final {
public:
    explicit DemoEnvironment(bool parallel_reads)
        : schema_{make_demo_schema()}
        , executor_{relq::txn::MemoryExecutor::Config{&schema_, false}}
        , context_{make_config(parallel_reads)}
    {
        seed("User", {{"id", std::int64_t{1}}, {"email", std::string{"a@x.io"}}, {"name", std::string{"Ada"}}});
        seed("User", {{"id", std::int64_t{2}}, {"email", std::string{"b@x.io"}}, {"name", std::string{"Bo"}}});
        seed("Profile", {{"id", std::int64_t{1}}, {"bio", std::string{"writes about storage"}}, {"userId", std::int64_t{2}}});
        seed("Post", {{"id", std::int64_t{1}}, {"title", std::string{"Hello"}}, {"authorId", std::int64_t{2}}});
        seed("Post", {{"id", std::int64_t{2}}, {"title", std::string{"Draft"}}, {"authorId", Value{}}});
        seed("Post", {{"id", std::int64_t{3}}, {"title", std::string{"Notes"}}, {"authorId", std::int64_t{1}}});
        seed("Category", {{"id", std::int64_t{1}}, {"name", std::string{"news"}}});
        seed("Category", {{"id", std::int64_t{2}}, {"name", std::string{"tech"}}});

        const auto& link_table = schema_.relation("Post", "categories").join_table;
        seed(link_table, {{"A", std::int64_t{1}}, {"B", std::int64_t{1}}});
        seed(link_table, {{"A", std::int64_t{2}}, {"B", std::int64_t{1}}});
        seed(link_table, {{"A", std::int64_t{2}}, {"B", std::int64_t{3}}});
        executor_.clear_logs();
    }

    DemoEnvironment(const DemoEnvironment&) = delete;
    DemoEnvironment& operator=(const DemoEnvironment&) = delete;

    [[nodiscard]] const relq::schema::SchemaModel& schema() const noexcept { return schema_; }
    [[nodiscard]] const relq::QueryContext& context() const noexcept { return context_; }
    [[nodiscard]] relq::EngineTelemetry& telemetry() noexcept { return telemetry_; }
    [[nodiscard]] relq::txn::MemoryExecutor& executor() noexcept { return executor_; }

private:
    relq::QueryContextConfig make_config(bool parallel_reads)
    {
        relq::QueryContextConfig config{};
        config.schema = &schema_;
        config.executor = &executor_;
        config.telemetry = &telemetry_;
        config.read_options.parallel_relations = parallel_reads;
        return config;
    }

    void seed(const std::string& table, Row row)
    {
        if (auto ec = executor_.seed(table, std::move(row))) {
            throw std::runtime_error("failed to seed " + table + ": " + ec.message());
        }
    }

    relq::schema::SchemaModel schema_;
    relq::txn::MemoryExecutor executor_;
    relq::EngineTelemetry telemetry_{};
    relq::QueryContext context_;
};

bool is_known_scenario(std::string_view name)
{
    for (const auto& scenario : kScenarios) {
        if (name == scenario.name) {
            return true;
        }
    }
    return false;
}

std::optional<relq::write::WriteRequest> scenario_write(std::string_view name)
{
    using namespace relq::write;

    if (name == "nested-create") {
        auto profile = WritePayload{};
        profile.set("bio", "hi");
        auto user = WritePayload{};
        user.set("email", "c@x.io").with(relation("profile", CreateDirective{profile}));
        return WriteRequest::create("User", user);
    }
    if (name == "connect-missing") {
        auto user = WritePayload{};
        user.with(relation("profile", ConnectDirective{{{"id", std::int64_t{5}}}}));
        return WriteRequest::update("User", {{"email", std::string{"a@x.io"}}}, user);
    }
    if (name == "set-posts") {
        SetDirective set{};
        set.members = {{{"id", std::int64_t{1}}}, {{"id", std::int64_t{2}}}};
        auto user = WritePayload{};
        user.with(relation("posts", set));
        return WriteRequest::update("User", {{"email", std::string{"a@x.io"}}}, user);
    }
    if (name == "connect-or-create") {
        auto tech = WritePayload{};
        tech.set("name", "tech");
        auto science = WritePayload{};
        science.set("name", "science");
        auto post = WritePayload{};
        post.with(relation("categories",
                           std::vector<WriteDirective>{
                               ConnectOrCreateDirective{{{"name", std::string{"tech"}}}, tech},
                               ConnectOrCreateDirective{{{"name", std::string{"science"}}}, science},
                           }));
        return WriteRequest::update("Post", {{"id", std::int64_t{2}}}, post);
    }
    return std::nullopt;
}

relq::read::ReadSpec include_tree_spec()
{
    relq::read::ReadSpec categories;
    categories.include("categories");
    relq::read::ReadSpec spec;
    spec.include("posts", categories);
    return spec;
}

relq::chain::FluentChain chain_past_list()
{
    relq::chain::FluentChain chain{};
    chain.model = "User";
    chain.root = {{"email", std::string{"a@x.io"}}};
    chain.then("posts").then("posts");
    return chain;
}

std::string error_text(const relq::QueryError& error)
{
    std::ostringstream stream;
    stream << "error: " << error.what();
    if (error.cause()) {
        stream << " (cause: " << error.cause().category().name() << ": " << error.cause().message() << ")";
    }
    return stream.str();
}

std::string explain_scenario(const relq::schema::SchemaModel& schema, std::string_view name)
{
    try {
        if (auto request = scenario_write(name)) {
            return relq::write::explain_write_plan(relq::write::plan_write(schema, *request));
        }
        if (name == "include-tree") {
            return relq::read::explain_fetch_plan(relq::read::compile_fetch_plan(schema, "User", include_tree_spec()));
        }
        if (name == "chain-past-list") {
            return relq::chain::explain_chain(relq::chain::compile_chain(schema, chain_past_list()));
        }
    } catch (const relq::QueryError& error) {
        return error_text(error);
    }
    throw std::runtime_error("unknown scenario: " + std::string{name});
}

std::string run_scenario(DemoEnvironment& environment, std::string_view name, OutputFormat format)
{
    const auto& context = environment.context();
    std::string result;
    try {
        if (auto request = scenario_write(name)) {
            const auto written = relq::write::execute_write(context, *request);
            result = format == OutputFormat::Json ? relq::tools::format_write_result_json(written)
                                                  : (written.row ? relq::tools::format_row_json(*written.row) : "no row");
        } else if (name == "include-tree") {
            const auto read = relq::read::resolve_read(context, relq::read::RootFetch::find_many("User"), include_tree_spec());
            result = relq::tools::format_read_result_json(read);
        } else if (name == "chain-past-list") {
            result = relq::tools::format_chain_result_json(relq::chain::resolve_chain(context, chain_past_list()));
        } else {
            throw std::runtime_error("unknown scenario: " + std::string{name});
        }
    } catch (const relq::QueryError& error) {
        result = format == OutputFormat::Json ? relq::tools::format_error_json(error) : error_text(error);
    }

    if (format == OutputFormat::Json) {
        return "{\"scenario\":\"" + std::string{name} + "\",\"result\":" + result + "}";
    }
    return std::string{name} + ": " + result;
}

void run_scenarios(const std::string& selected, OutputFormat format, bool parallel_reads, std::ostream& out)
{
    if (selected != "all" && !is_known_scenario(selected)) {
        throw std::runtime_error("unknown scenario: " + selected);
    }
    DemoEnvironment environment{parallel_reads};
    for (const auto& scenario : kScenarios) {
        if (selected == "all" || selected == scenario.name) {
            out << run_scenario(environment, scenario.name, format) << '\n';
        }
    }
    if (format == OutputFormat::Json) {
        out << relq::tools::format_telemetry_json(environment.telemetry().snapshot()) << '\n';
    }
}

std::string join_columns(const std::vector<std::string>& columns)
{
    std::string joined;
    for (const auto& column : columns) {
        if (!joined.empty()) {
            joined.append(", ");
        }
        joined.append(column);
    }
    return joined;
}

void print_schema(const relq::schema::SchemaModel& schema, std::ostream& out)
{
    for (const auto& table : schema.tables()) {
        out << (table.join_table ? "join table " : "model ") << table.name << '\n';
        for (const auto& field : table.fields) {
            out << "  " << field.name << (field.is_id ? " id" : "") << (field.unique ? " unique" : "")
                << (field.nullable ? " nullable" : "") << '\n';
        }
        for (const auto& relation : table.relations) {
            out << "  " << relation.name << " -> " << relation.target << (relation.is_list() ? "[]" : "")
                << " (" << relq::schema::to_string(relation.cardinality) << ")" << '\n';
        }
    }
    for (const auto& key : schema.foreign_keys()) {
        out << "fk " << key.table << "(" << join_columns(key.columns) << ") -> " << key.referenced_table << "("
            << join_columns(key.referenced_columns) << ")" << (key.nullable ? " nullable" : "") << '\n';
    }
}

void write_output(const std::string& text, const std::optional<std::filesystem::path>& output_path)
{
    if (!output_path) {
        std::cout << text;
        return;
    }
    std::ofstream file{*output_path, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        throw std::runtime_error("failed to open output file: " + output_path->string());
    }
    file << text;
}

std::string trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    return std::string{text.substr(start, end - start)};
}

std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::istringstream stream{std::string{text}};
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

void print_repl_help()
{
    std::cout << "Commands:" << '\n';
    std::cout << "  scenarios                 List demo scenarios" << '\n';
    std::cout << "  run <scenario> [json]     Run a scenario against the session's store" << '\n';
    std::cout << "  explain <scenario>        Print the plan of a scenario" << '\n';
    std::cout << "  telemetry                 Print engine counters as JSON" << '\n';
    std::cout << "  commands                  Print the storage commands issued so far" << '\n';
    std::cout << "  help                      Show this help" << '\n';
    std::cout << "  quit | exit               Leave the shell" << '\n';
}

void run_repl(bool parallel_reads)
{
    DemoEnvironment environment{parallel_reads};
    replxx::Replxx repl;
    while (true) {
        const char* line = repl.input("relq> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto command = trim(line);
        if (command.empty()) {
            continue;
        }
        repl.history_add(command);
        const auto tokens = split_tokens(command);
        const auto& verb = tokens.front();

        if (verb == "quit" || verb == "exit") {
            break;
        }
        if (verb == "help") {
            print_repl_help();
            continue;
        }
        if (verb == "scenarios") {
            for (const auto& scenario : kScenarios) {
                std::cout << "  " << scenario.name << "  " << scenario.summary << '\n';
            }
            continue;
        }
        if (verb == "telemetry") {
            std::cout << relq::tools::format_telemetry_json(environment.telemetry().snapshot()) << '\n';
            continue;
        }
        if (verb == "commands") {
            for (const auto& entry : environment.executor().command_log()) {
                std::cout << "  " << entry << '\n';
            }
            continue;
        }
        if ((verb == "run" || verb == "explain") && tokens.size() >= 2U) {
            const auto& name = tokens[1];
            if (!is_known_scenario(name)) {
                std::cout << "unknown scenario: " << name << '\n';
                continue;
            }
            if (verb == "explain") {
                std::cout << explain_scenario(environment.schema(), name);
                continue;
            }
            const auto format = tokens.size() >= 3U && tokens[2] == "json" ? OutputFormat::Json : OutputFormat::Text;
            std::cout << run_scenario(environment, name, format) << '\n';
            continue;
        }

        std::cout << "unrecognised command. Type 'help' for assistance." << '\n';
    }
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Tooling for the relq relation query engine"};
    app.require_subcommand(1);

    std::string schema_output_path;
    auto* schema = app.add_subcommand("schema", "Print the demo schema catalog");
    schema->add_option("-o,--output", schema_output_path, "Write output to a file instead of stdout");
    schema->callback([&]() {
        std::ostringstream text;
        print_schema(make_demo_schema(), text);
        std::optional<std::filesystem::path> output_path;
        if (!schema_output_path.empty()) {
            output_path = std::filesystem::path(schema_output_path);
        }
        write_output(text.str(), output_path);
    });

    std::string explain_scenario_name = "nested-create";
    auto* explain = app.add_subcommand("explain", "Print the plan of a demo scenario without running it");
    explain->add_option("-s,--scenario", explain_scenario_name, "Scenario name");
    explain->callback([&]() {
        if (!is_known_scenario(explain_scenario_name)) {
            throw std::runtime_error("unknown scenario: " + explain_scenario_name);
        }
        std::cout << explain_scenario(make_demo_schema(), explain_scenario_name);
    });

    std::string run_scenario_name = "all";
    std::string run_format = "text";
    std::string run_output_path;
    bool run_parallel_reads = false;
    auto* run = app.add_subcommand("run", "Run demo scenarios against a seeded in-memory store");
    run->add_option("-s,--scenario", run_scenario_name, "Scenario name or 'all'");
    run->add_option("-f,--format", run_format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    run->add_option("-o,--output", run_output_path, "Write output to a file instead of stdout");
    run->add_flag("--parallel-reads", run_parallel_reads, "Fetch sibling relations concurrently");
    run->callback([&]() {
        std::ostringstream text;
        run_scenarios(run_scenario_name, run_format == "json" ? OutputFormat::Json : OutputFormat::Text, run_parallel_reads, text);
        std::optional<std::filesystem::path> output_path;
        if (!run_output_path.empty()) {
            output_path = std::filesystem::path(run_output_path);
        }
        write_output(text.str(), output_path);
    });

    bool repl_parallel_reads = false;
    auto* repl = app.add_subcommand("repl", "Start an interactive shell over the demo store");
    repl->add_flag("--parallel-reads", repl_parallel_reads, "Fetch sibling relations concurrently");
    repl->callback([&]() {
        run_repl(repl_parallel_reads);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
