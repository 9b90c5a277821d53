#include "relq/write/write_directive.hpp"

#include <utility>

namespace relq::write {

WritePayload& WritePayload::set(std::string column, query::Value value)
{
    values[std::move(column)] = std::move(value);
    return *this;
}

WritePayload& WritePayload::set(std::string column, const char* value)
{
    values[std::move(column)] = query::Value{std::string{value}};
    return *this;
}

WritePayload& WritePayload::with(RelationWrite relation)
{
    for (auto& existing : relations) {
        if (existing.relation == relation.relation) {
            for (auto& directive : relation.directives) {
                existing.directives.push_back(std::move(directive));
            }
            return *this;
        }
    }
    relations.push_back(std::move(relation));
    return *this;
}

RelationWrite& RelationWrite::add(WriteDirective directive)
{
    directives.push_back(std::move(directive));
    return *this;
}

WriteRequest WriteRequest::create(std::string model, WritePayload data)
{
    WriteRequest request{};
    request.kind = WriteKind::Create;
    request.model = std::move(model);
    request.data = std::move(data);
    return request;
}

WriteRequest WriteRequest::update(std::string model, schema::UniqueSelector where, WritePayload data)
{
    WriteRequest request{};
    request.kind = WriteKind::Update;
    request.model = std::move(model);
    request.where = std::move(where);
    request.data = std::move(data);
    return request;
}

RelationWrite relation(std::string name, WriteDirective directive)
{
    RelationWrite write{};
    write.relation = std::move(name);
    write.directives.push_back(std::move(directive));
    return write;
}

RelationWrite relation(std::string name, std::vector<WriteDirective> directives)
{
    RelationWrite write{};
    write.relation = std::move(name);
    write.directives = std::move(directives);
    return write;
}

DirectiveKind directive_kind(const WriteDirective& directive) noexcept
{
    return static_cast<DirectiveKind>(directive.index());
}

const char* directive_name(DirectiveKind kind) noexcept
{
    switch (kind) {
    case DirectiveKind::Create:
        return "create";
    case DirectiveKind::Connect:
        return "connect";
    case DirectiveKind::ConnectOrCreate:
        return "connectOrCreate";
    case DirectiveKind::Update:
        return "update";
    case DirectiveKind::Upsert:
        return "upsert";
    case DirectiveKind::Delete:
        return "delete";
    case DirectiveKind::Disconnect:
        return "disconnect";
    case DirectiveKind::Set:
        return "set";
    case DirectiveKind::UpdateMany:
        return "updateMany";
    case DirectiveKind::DeleteMany:
        return "deleteMany";
    }
    return "unknown";
}

}  // namespace relq::write
