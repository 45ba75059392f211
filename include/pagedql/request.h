#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/request.h — Requested field, arguments and selection set
// ═══════════════════════════════════════════════════════════════════
//
//  A Field is the parsed form of one query field:
//
//    Books(where: {title: {LIKE: "%War%"}}, page: {start: 1, limit: 10}) {
//        records { id title }
//        total
//        pages
//    }
//
//  Arguments keep the order they were written in. Fields are treated
//  as immutable values: helpers return derived copies.
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <utility>

namespace pagedql {

struct Argument {
    std::string name;
    nlohmann::json value;

    bool operator==(const Argument& other) const {
        return name == other.name && value == other.value;
    }
};

struct Field {
    std::string name;
    std::string alias;
    std::vector<Argument> arguments;
    std::vector<Field> selections;

    // Key the field's result is stored under
    const std::string& responseKey() const { return alias.empty() ? name : alias; }

    // ── Direct child selection by name (no recursion) ──
    const Field* selection(const std::string& childName) const {
        for (auto& child : selections) {
            if (child.name == childName) return &child;
        }
        return nullptr;
    }

    // ── First argument with the given name ──
    const Argument* argument(const std::string& argName) const {
        for (auto& arg : arguments) {
            if (arg.name == argName) return &arg;
        }
        return nullptr;
    }

    // ── Copy of this field without the named argument ──
    Field withoutArgument(const std::string& argName) const {
        Field copy;
        copy.name = name;
        copy.alias = alias;
        copy.selections = selections;
        copy.arguments.reserve(arguments.size());
        for (auto& arg : arguments) {
            if (arg.name != argName) copy.arguments.push_back(arg);
        }
        return copy;
    }
};

} // namespace pagedql
