#include "relq/core/errors.hpp"

#include <utility>

namespace relq {

namespace {

class RelqErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "relq";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<RelqErrc>(condition)) {
        case RelqErrc::Success:
            return "success";
        case RelqErrc::UniqueTargetNotFound:
            return "unique target not found";
        case RelqErrc::CardinalityViolation:
            return "relation cardinality violated";
        case RelqErrc::ChainCardinality:
            return "fluent chain continues past a many-cardinality step";
        case RelqErrc::ConstraintCycle:
            return "required foreign key cycle cannot be ordered";
        case RelqErrc::TransactionAborted:
            return "transaction aborted";
        case RelqErrc::UnknownModel:
            return "unknown model";
        case RelqErrc::UnknownRelation:
            return "unknown relation field";
        case RelqErrc::UnknownField:
            return "unknown scalar field";
        case RelqErrc::InvalidSelector:
            return "selector does not address a unique constraint";
        case RelqErrc::InvalidFilter:
            return "invalid relation filter";
        case RelqErrc::MalformedDirective:
            return "malformed write directive";
        default:
            return "unknown relq error";
        }
    }
};

class SchemaErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "relq.schema";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<SchemaErrc>(condition)) {
        case SchemaErrc::Success:
            return "success";
        case SchemaErrc::DuplicateModel:
            return "duplicate model";
        case SchemaErrc::DuplicateField:
            return "duplicate field";
        case SchemaErrc::DuplicateRelation:
            return "duplicate relation field";
        case SchemaErrc::UnknownModel:
            return "relation references unknown model";
        case SchemaErrc::UnknownField:
            return "relation references unknown column";
        case SchemaErrc::MissingPrimaryKey:
            return "model has no primary key";
        case SchemaErrc::ForeignKeyArityMismatch:
            return "foreign key column count does not match referenced columns";
        case SchemaErrc::ReferencedColumnsNotUnique:
            return "foreign key references a non-unique column set";
        case SchemaErrc::MixedForeignKeyNullability:
            return "foreign key mixes nullable and required columns";
        default:
            return "unknown schema error";
        }
    }
};

class StorageErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "relq.storage";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<StorageErrc>(condition)) {
        case StorageErrc::Success:
            return "success";
        case StorageErrc::UniqueViolation:
            return "unique constraint violated";
        case StorageErrc::ForeignKeyViolation:
            return "foreign key constraint violated";
        case StorageErrc::NotNullViolation:
            return "not-null constraint violated";
        case StorageErrc::TypeMismatch:
            return "value type does not match column type";
        case StorageErrc::UnknownTable:
            return "unknown table";
        case StorageErrc::UnknownColumn:
            return "unknown column";
        case StorageErrc::UnsupportedPredicate:
            return "predicate contains untranslated relation conditions";
        case StorageErrc::TransactionNotActive:
            return "transaction not active";
        case StorageErrc::InjectedFault:
            return "injected fault";
        default:
            return "unknown storage error";
        }
    }
};

const RelqErrorCategory kRelqCategory{};
const SchemaErrorCategory kSchemaCategory{};
const StorageErrorCategory kStorageCategory{};

std::string decorate(const std::string& message, const std::vector<std::string>& path)
{
    if (path.empty()) {
        return message;
    }
    return message + " (at " + join_path(path) + ")";
}

}  // namespace

const std::error_category& relq_error_category() noexcept
{
    return kRelqCategory;
}

const std::error_category& schema_error_category() noexcept
{
    return kSchemaCategory;
}

const std::error_category& storage_error_category() noexcept
{
    return kStorageCategory;
}

std::error_code make_error_code(RelqErrc value) noexcept
{
    return {static_cast<int>(value), relq_error_category()};
}

std::error_code make_error_code(SchemaErrc value) noexcept
{
    return {static_cast<int>(value), schema_error_category()};
}

std::error_code make_error_code(StorageErrc value) noexcept
{
    return {static_cast<int>(value), storage_error_category()};
}

QueryError::QueryError(std::error_code code,
                       const std::string& message,
                       std::vector<std::string> path,
                       std::error_code cause,
                       std::size_t operation_index)
    : std::system_error{code, decorate(message, path)}
    , path_{std::move(path)}
    , cause_{cause}
    , operation_index_{operation_index}
{
}

std::string QueryError::path_string() const
{
    return join_path(path_);
}

bool QueryError::is(RelqErrc value) const noexcept
{
    const auto expected = make_error_code(value);
    return code() == expected || cause_ == expected;
}

SchemaError::SchemaError(SchemaErrc code, const std::string& message)
    : std::system_error{make_error_code(code), message}
{
}

std::string join_path(const std::vector<std::string>& path)
{
    std::string joined;
    for (const auto& segment : path) {
        if (!joined.empty()) {
            joined.push_back('.');
        }
        joined.append(segment);
    }
    return joined;
}

}  // namespace relq
