#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace relq {

enum class RelqErrc {
    Success = 0,
    UniqueTargetNotFound,
    CardinalityViolation,
    ChainCardinality,
    ConstraintCycle,
    TransactionAborted,
    UnknownModel,
    UnknownRelation,
    UnknownField,
    InvalidSelector,
    InvalidFilter,
    MalformedDirective
};

enum class SchemaErrc {
    Success = 0,
    DuplicateModel,
    DuplicateField,
    DuplicateRelation,
    UnknownModel,
    UnknownField,
    MissingPrimaryKey,
    ForeignKeyArityMismatch,
    ReferencedColumnsNotUnique,
    MixedForeignKeyNullability
};

enum class StorageErrc {
    Success = 0,
    UniqueViolation,
    ForeignKeyViolation,
    NotNullViolation,
    TypeMismatch,
    UnknownTable,
    UnknownColumn,
    UnsupportedPredicate,
    TransactionNotActive,
    InjectedFault
};

const std::error_category& relq_error_category() noexcept;
const std::error_category& schema_error_category() noexcept;
const std::error_category& storage_error_category() noexcept;

std::error_code make_error_code(RelqErrc value) noexcept;
std::error_code make_error_code(SchemaErrc value) noexcept;
std::error_code make_error_code(StorageErrc value) noexcept;

// Domain failure raised by the planners and resolvers. The path names the
// relation-field chain of the directive (or include/chain step) that failed.
class QueryError final : public std::system_error {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    QueryError(std::error_code code,
               const std::string& message,
               std::vector<std::string> path = {},
               std::error_code cause = {},
               std::size_t operation_index = npos);

    [[nodiscard]] const std::vector<std::string>& path() const noexcept { return path_; }
    [[nodiscard]] std::string path_string() const;
    [[nodiscard]] std::error_code cause() const noexcept { return cause_; }
    [[nodiscard]] std::size_t operation_index() const noexcept { return operation_index_; }

    // True when either the error itself or its wrapped cause carries value.
    [[nodiscard]] bool is(RelqErrc value) const noexcept;

private:
    std::vector<std::string> path_{};
    std::error_code cause_{};
    std::size_t operation_index_ = npos;
};

class SchemaError final : public std::system_error {
public:
    SchemaError(SchemaErrc code, const std::string& message);
};

[[nodiscard]] std::string join_path(const std::vector<std::string>& path);

}  // namespace relq

namespace std {

template <>
struct is_error_code_enum<relq::RelqErrc> : true_type {
};

template <>
struct is_error_code_enum<relq::SchemaErrc> : true_type {
};

template <>
struct is_error_code_enum<relq::StorageErrc> : true_type {
};

}  // namespace std
