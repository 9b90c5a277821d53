#include "relq/tools/json_formatter.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace {

void append_json_string(std::string& out, const std::string& text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

void append_json_value(std::string& out, const relq::query::Value& value)
{
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                out.append("null");
            } else if constexpr (std::is_same_v<T, bool>) {
                out.append(v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                out.append(std::to_string(v));
            } else if constexpr (std::is_same_v<T, double>) {
                std::ostringstream stream;
                stream << std::setprecision(15) << v;
                out.append(stream.str());
            } else {
                append_json_string(out, v);
            }
        },
        value);
}

void append_json_row(std::string& out, const relq::query::Row& row)
{
    out.push_back('{');
    bool first = true;
    for (const auto& [column, value] : row) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        append_json_string(out, column);
        out.push_back(':');
        append_json_value(out, value);
    }
    out.push_back('}');
}

void append_json_strings(std::string& out, const std::vector<std::string>& values)
{
    out.push_back('[');
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0U) {
            out.push_back(',');
        }
        append_json_string(out, values[i]);
    }
    out.push_back(']');
}

// Relation results are emitted as extra keys next to the scalar fields:
// arrays for list relations, an object or null for single ones.
void append_json_record(std::string& out, const relq::read::ResultRecord& record)
{
    out.push_back('{');
    bool first = true;
    auto append_key = [&](const std::string& name) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        append_json_string(out, name);
        out.push_back(':');
    };

    for (const auto& [column, value] : record.fields) {
        append_key(column);
        append_json_value(out, value);
    }
    for (const auto& relation : record.relations) {
        append_key(relation.relation);
        if (!relation.many) {
            if (relation.records.empty()) {
                out.append("null");
            } else {
                append_json_record(out, relation.records.front());
            }
            continue;
        }
        out.push_back('[');
        for (std::size_t i = 0; i < relation.records.size(); ++i) {
            if (i > 0U) {
                out.push_back(',');
            }
            append_json_record(out, relation.records[i]);
        }
        out.push_back(']');
    }
    out.push_back('}');
}

class JsonObject final {
public:
    JsonObject() { json_.push_back('{'); }

    std::string& field(const char* name)
    {
        if (!first_) {
            json_.push_back(',');
        }
        first_ = false;
        json_.push_back('"');
        json_.append(name);
        json_.push_back('"');
        json_.push_back(':');
        return json_;
    }

    void number(const char* name, std::uint64_t value) { field(name).append(std::to_string(value)); }

    std::string finish()
    {
        json_.push_back('}');
        return std::move(json_);
    }

private:
    std::string json_{};
    bool first_ = true;
};

}  // namespace

namespace relq::tools {

std::string format_row_json(const query::Row& row)
{
    std::string json;
    append_json_row(json, row);
    return json;
}

std::string format_telemetry_json(const EngineTelemetrySnapshot& snapshot)
{
    JsonObject object;
    object.number("write_plans_attempted", snapshot.write_plans_attempted);
    object.number("write_plans_succeeded", snapshot.write_plans_succeeded);
    object.number("write_plans_failed", snapshot.write_plans_failed);
    object.number("operations_executed", snapshot.operations_executed);
    object.number("conflict_retries", snapshot.conflict_retries);
    object.number("rollbacks", snapshot.rollbacks);
    object.number("chains_resolved", snapshot.chains_resolved);
    object.number("chains_rejected", snapshot.chains_rejected);
    object.number("reads_resolved", snapshot.reads_resolved);
    object.number("read_levels", snapshot.read_levels);
    object.number("batched_fetches", snapshot.batched_fetches);
    return object.finish();
}

std::string format_write_result_json(const write::WriteResult& result)
{
    JsonObject object;
    auto& row = object.field("row");
    if (result.row.has_value()) {
        append_json_row(row, *result.row);
    } else {
        row.append("null");
    }
    object.number("operations_executed", result.operations_executed);
    object.number("attempts", result.attempts);
    append_json_strings(object.field("diagnostics"), result.diagnostics);
    return object.finish();
}

std::string format_read_result_json(const read::ReadResult& result)
{
    JsonObject object;
    auto& records = object.field("records");
    records.push_back('[');
    for (std::size_t i = 0; i < result.records.size(); ++i) {
        if (i > 0U) {
            records.push_back(',');
        }
        append_json_record(records, result.records[i]);
    }
    records.push_back(']');
    object.number("queries_issued", result.queries_issued);
    object.number("levels", result.levels);
    append_json_strings(object.field("diagnostics"), result.diagnostics);
    return object.finish();
}

std::string format_chain_result_json(const chain::ChainResult& result)
{
    JsonObject object;
    object.field("many").append(result.many ? "true" : "false");
    auto& rows = object.field("rows");
    rows.push_back('[');
    for (std::size_t i = 0; i < result.rows.size(); ++i) {
        if (i > 0U) {
            rows.push_back(',');
        }
        append_json_row(rows, result.rows[i]);
    }
    rows.push_back(']');
    object.number("queries_issued", result.queries_issued);
    append_json_strings(object.field("diagnostics"), result.diagnostics);
    return object.finish();
}

std::string format_error_json(const QueryError& error)
{
    JsonObject object;
    append_json_string(object.field("code"), error.code().message());
    append_json_string(object.field("message"), error.what());
    append_json_strings(object.field("path"), error.path());
    auto& cause = object.field("cause");
    if (error.cause()) {
        append_json_string(cause, std::string{error.cause().category().name()} + ": " + error.cause().message());
    } else {
        cause.append("null");
    }
    auto& index = object.field("operation_index");
    if (error.operation_index() == QueryError::npos) {
        index.append("null");
    } else {
        index.append(std::to_string(error.operation_index()));
    }
    return object.finish();
}

}  // namespace relq::tools
