// ═══════════════════════════════════════════════════════════════════
//  src/graphql.cpp — Schema execution over paged query resolvers
// ═══════════════════════════════════════════════════════════════════

#include "pagedql/graphql.h"
#include "pagedql/console.h"
#include <stdexcept>

namespace pagedql::graphql {

nlohmann::ordered_json errorJson(const std::string& message, const std::string& classification,
                                 const std::string& path) {
    nlohmann::ordered_json err = {{"message", message}};
    if (!path.empty()) {
        err["path"] = nlohmann::ordered_json::array({path});
    }
    err["extensions"] = {{"classification", classification}};
    return err;
}

Schema& Schema::query(const std::string& name, std::shared_ptr<QueryResolver> resolver) {
    if (!resolver) {
        throw std::invalid_argument("Schema::query('" + name + "') requires a resolver");
    }
    resolvers_[name] = std::move(resolver);
    return *this;
}

std::shared_ptr<QueryResolver> Schema::resolver(const std::string& name) const {
    auto it = resolvers_.find(name);
    return it == resolvers_.end() ? nullptr : it->second;
}

nlohmann::ordered_json Schema::execute(const std::string& queryStr, QueryBackend& session,
                                       const nlohmann::json& variables) const {
    ParsedQuery parsed;
    try {
        parsed = parse(queryStr, variables);
    } catch (const ParseError& e) {
        return nlohmann::ordered_json{
            {"data", nullptr},
            {"errors", nlohmann::ordered_json::array({
                errorJson(std::string("Parse error: ") + e.what(), e.kindName())
            })}
        };
    }

    nlohmann::ordered_json data = nlohmann::ordered_json::object();
    nlohmann::ordered_json errors = nlohmann::ordered_json::array();

    if (parsed.operationType != "query") {
        errors.push_back(errorJson("Operation '" + parsed.operationType + "' is not supported",
                                   "ValidationError"));
    } else {
        for (auto& field : parsed.selections) {
            const std::string& key = field.responseKey();
            auto resolver = this->resolver(field.name);
            if (!resolver) {
                errors.push_back(errorJson("Cannot query field '" + field.name + "' on type 'query'",
                                           "ValidationError", key));
                continue;
            }

            console::time("query " + key);
            try {
                data[key] = resolver->resolveJson(field, session);
                console::timeEnd("query " + key);
            } catch (const Error& e) {
                console::timeEnd("query " + key);
                console::warn("query", key, "failed:", e.kindName(), e.what());
                errors.push_back(errorJson(e.what(), e.kindName(), key));
                data[key] = nullptr;
            }
        }
    }

    nlohmann::ordered_json response = {{"data", data}};
    if (!errors.empty()) {
        response["errors"] = errors;
    }
    return response;
}

} // namespace pagedql::graphql
