// schema.cpp — agent record validation against the configured space

#include "abm/core/schema.hpp"
#include "abm/core/errors.hpp"
#include "abm/core/log.hpp"

#include <sstream>
#include <string>

namespace abm {
namespace core {

const char* to_string(FieldType t) noexcept {
    switch (t) {
        case FieldType::integer:     return "integer";
        case FieldType::floating:    return "floating";
        case FieldType::int_tuple:   return "integer tuple";
        case FieldType::float_tuple: return "float tuple";
        case FieldType::other:       return "other";
    }
    return "?";
}

namespace {

std::string describe(const FieldInfo& f) {
    std::ostringstream os;
    os << to_string(f.type);
    if (f.dims > 0) os << "[" << f.dims << "]";
    return os.str();
}

[[noreturn]] void fail(const AgentSchema& s, const std::string& what) {
    throw SchemaError("agent type `" + s.type_name + "`: " + what);
}

const FieldInfo* field_named(const AgentSchema& s, const std::string& name) {
    for (const auto& f : s.fields) if (f.name == name) return &f;
    return nullptr;
}

void check_pos(const AgentSchema& s, const spaces::SpaceDescriptor& space) {
    if (s.fields.size() < 2 || s.fields[1].name != "pos")
        fail(s, "second field must be `pos` when using a space");

    const FieldInfo& pos = s.fields[1];
    switch (space.kind) {
        case spaces::SpaceKind::graph:
            if (pos.type != FieldType::integer)
                fail(s, "`pos` must be an integer vertex when using a graph space (got " + describe(pos) + ")");
            break;
        case spaces::SpaceKind::grid:
            if (pos.type != FieldType::int_tuple || pos.dims != space.dims)
                fail(s, "`pos` must be an integer tuple of size " + std::to_string(space.dims) +
                        " when using a grid space (got " + describe(pos) + ")");
            break;
        case spaces::SpaceKind::continuous:
            if (pos.type != FieldType::float_tuple || pos.dims != space.dims)
                fail(s, "`pos` must be a float tuple of size " + std::to_string(space.dims) +
                        " when using a continuous space (got " + describe(pos) + ")");
            break;
        case spaces::SpaceKind::none:
            break;
    }
}

} // namespace

void validate_schema(const AgentSchema& s, const spaces::SpaceDescriptor& space, bool warn) {
    if (warn && !s.assignable) {
        log_warn("agent type `" + s.type_name +
                 "` is not mutable in place, and most library functions assume that it is");
    }

    if (s.fields.empty() || s.fields[0].name != "id")
        fail(s, "first field must be `id` (and should be an integer)");
    if (s.fields[0].type != FieldType::integer)
        fail(s, "`id` field must be an integer (got " + describe(s.fields[0]) + ")");

    if (space.kind == spaces::SpaceKind::none) return;
    check_pos(s, space);

    if (space.kind == spaces::SpaceKind::continuous && warn) {
        if (const FieldInfo* vel = field_named(s, "vel")) {
            if (vel->type != FieldType::float_tuple || vel->dims != space.dims) {
                log_warn("agent type `" + s.type_name + "`: `vel` should be a float tuple of size " +
                         std::to_string(space.dims) + " when using a continuous space (got " +
                         describe(*vel) + ")");
            }
        }
    }
}

void validate_schemas(const std::vector<AgentSchema>& schemas,
                      const spaces::SpaceDescriptor& space, bool warn, bool is_union) {
    if (warn && is_union) {
        std::string names;
        for (const auto& s : schemas) names += (names.empty() ? "`" : ", `") + s.type_name + "`";
        log_warn("agent type is a union of " + std::to_string(schemas.size()) + " types (" + names +
                 "); each is validated on its own, and code that needs one concrete type must use "
                 "agent_as<T>() or std::visit. Pass warn = false to silence this.");
    }
    for (const auto& s : schemas) validate_schema(s, space, warn);
}

} // namespace core
} // namespace abm
