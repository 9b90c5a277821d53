#pragma once

#include "relq/schema/schema_model.hpp"
#include "relq/write/write_directive.hpp"
#include "relq/write/write_plan.hpp"

namespace relq::write {

// Compiles a nested write into an ordered plan without touching storage.
// Throws QueryError with UnknownModel, UnknownRelation, UnknownField,
// InvalidSelector, MalformedDirective, CardinalityViolation or ConstraintCycle.
[[nodiscard]] WritePlan plan_write(const schema::SchemaModel& schema, const WriteRequest& request);

}  // namespace relq::write
