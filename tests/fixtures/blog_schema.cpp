#include "fixtures/blog_schema.hpp"

#include <stdexcept>

namespace relq::testing {

namespace {

schema::ScalarField id_field()
{
    schema::ScalarField field{};
    field.name = "id";
    field.type = schema::ScalarType::Int;
    field.is_id = true;
    field.autoincrement = true;
    return field;
}

schema::ScalarField field(std::string name, schema::ScalarType type, bool nullable = false, bool unique = false)
{
    schema::ScalarField result{};
    result.name = std::move(name);
    result.type = type;
    result.nullable = nullable;
    result.unique = unique;
    return result;
}

void seed(txn::MemoryExecutor& executor, const std::string& table, query::Row row)
{
    if (auto ec = executor.seed(table, std::move(row))) {
        throw std::runtime_error("seeding " + table + " failed: " + ec.message());
    }
}

QueryContextConfig make_config(const schema::SchemaModel* schema,
                               txn::TransactionExecutor* executor,
                               EngineTelemetry* telemetry,
                               const BlogStoreOptions& options)
{
    QueryContextConfig config{};
    config.schema = schema;
    config.executor = executor;
    config.telemetry = telemetry;
    config.read_options = options.read_options;
    config.write_options = options.write_options;
    return config;
}

}  // namespace

schema::SchemaModel make_blog_schema()
{
    using schema::ScalarType;

    schema::SchemaBuilder builder;
    builder.add_model("User", {id_field(), field("email", ScalarType::String, false, true), field("name", ScalarType::String, true)});
    builder.add_model("Profile", {id_field(), field("bio", ScalarType::String), field("userId", ScalarType::Int)});
    builder.add_model("Post", {id_field(), field("title", ScalarType::String), field("authorId", ScalarType::Int, true)});
    builder.add_model("Category", {id_field(), field("name", ScalarType::String, false, true)});

    schema::RelationDeclaration profile{};
    profile.owner_model = "Profile";
    profile.owner_field = "user";
    profile.foreign_key_columns = {"userId"};
    profile.target_model = "User";
    profile.target_field = "profile";
    builder.add_one_to_one(std::move(profile));

    schema::RelationDeclaration posts{};
    posts.owner_model = "Post";
    posts.owner_field = "author";
    posts.foreign_key_columns = {"authorId"};
    posts.target_model = "User";
    posts.target_field = "posts";
    builder.add_one_to_many(std::move(posts));

    schema::ManyToManyDeclaration categories{};
    categories.model_a = "Post";
    categories.field_a = "categories";
    categories.model_b = "Category";
    categories.field_b = "posts";
    builder.add_many_to_many(std::move(categories));

    return builder.build();
}

schema::SchemaModel make_team_schema(bool captain_optional)
{
    using schema::ScalarType;

    schema::SchemaBuilder builder;
    builder.add_model("Team", {id_field(), field("name", ScalarType::String, false, true), field("captainId", ScalarType::Int, captain_optional)});
    builder.add_model("Player", {id_field(), field("name", ScalarType::String, false, true), field("teamId", ScalarType::Int)});

    schema::RelationDeclaration captain{};
    captain.owner_model = "Team";
    captain.owner_field = "captain";
    captain.foreign_key_columns = {"captainId"};
    captain.target_model = "Player";
    captain.target_field = "captainOf";
    builder.add_one_to_one(std::move(captain));

    schema::RelationDeclaration roster{};
    roster.owner_model = "Player";
    roster.owner_field = "team";
    roster.foreign_key_columns = {"teamId"};
    roster.target_model = "Team";
    roster.target_field = "players";
    builder.add_one_to_many(std::move(roster));

    return builder.build();
}

void seed_blog(txn::MemoryExecutor& executor)
{
    seed(executor, "User", {{"id", int_value(1)}, {"email", text("a@x.io")}, {"name", text("Ada")}});
    seed(executor, "User", {{"id", int_value(2)}, {"email", text("b@x.io")}, {"name", text("Bo")}});
    seed(executor, "Profile", {{"id", int_value(1)}, {"bio", text("storage nerd")}, {"userId", int_value(2)}});
    seed(executor, "Post", {{"id", int_value(1)}, {"title", text("Hello")}, {"authorId", int_value(2)}});
    seed(executor, "Post", {{"id", int_value(2)}, {"title", text("Draft")}, {"authorId", query::Value{}}});
    seed(executor, "Post", {{"id", int_value(3)}, {"title", text("Notes")}, {"authorId", int_value(1)}});
    seed(executor, "Category", {{"id", int_value(1)}, {"name", text("news")}});
    seed(executor, "Category", {{"id", int_value(2)}, {"name", text("tech")}});
    // A is Category.id, B is Post.id.
    seed(executor, "_CategoryToPost", {{"A", int_value(1)}, {"B", int_value(1)}});
    seed(executor, "_CategoryToPost", {{"A", int_value(2)}, {"B", int_value(1)}});
    seed(executor, "_CategoryToPost", {{"A", int_value(2)}, {"B", int_value(3)}});
    executor.clear_logs();
}

std::optional<query::Row> find_row(const txn::MemoryExecutor& executor,
                                   const std::string& table,
                                   const std::string& column,
                                   const query::Value& value)
{
    for (const auto& row : executor.rows(table)) {
        const auto it = row.find(column);
        if (it != row.end() && query::values_equal(it->second, value)) {
            return row;
        }
    }
    return std::nullopt;
}

BlogStore::BlogStore()
    : BlogStore(BlogStoreOptions{})
{
}

BlogStore::BlogStore(BlogStoreOptions options)
    : schema_{make_blog_schema()}
    , executor_{txn::MemoryExecutor::Config{&schema_, options.reverse_scan_order}}
    , context_{make_config(&schema_, &executor_, &telemetry_, options)}
{
    if (options.seed) {
        seed_blog(executor_);
    }
}

}  // namespace relq::testing
