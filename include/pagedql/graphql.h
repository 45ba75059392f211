#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/graphql.h — GraphQL request parsing and paged query schema
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    graphql::Schema schema;
//    schema.query("Books", std::make_shared<QueryResolver>(bookType, config, where, field));
//
//    db::SqliteBackend session(database, config);
//    auto response = schema.execute(R"({
//        Books(where: {title: {LIKE: "%War%"}}, page: {start: 1, limit: 10}) {
//            records { id title }
//            total
//            pages
//        }
//    })", session);
//
//  response = {"data": {"Books": {"records": [...], "total": 12, "pages": 2}}}
//
// ═══════════════════════════════════════════════════════════════════

#include "backend.h"
#include "errors.h"
#include "request.h"
#include "resolver.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace pagedql::graphql {

struct ParsedQuery {
    std::string operationType; // "query" or "mutation"
    std::string operationName;
    std::vector<Field> selections;
};

namespace detail {

class GraphQLParser {
public:
    explicit GraphQLParser(const std::string& source,
                           const nlohmann::json& variables = nlohmann::json::object())
        : source_(source), variables_(variables), pos_(0) {}

    ParsedQuery parse() {
        ParsedQuery result;
        skipWhitespace();

        // Parse operation type
        if (peek() == '{') {
            result.operationType = "query";
        } else {
            auto keyword = parseIdentifier();
            if (keyword == "query") {
                result.operationType = "query";
            } else if (keyword == "mutation") {
                result.operationType = "mutation";
            } else {
                throw ParseError("Expected 'query' or 'mutation', got '" + keyword + "'");
            }

            skipWhitespace();

            // Optional operation name
            if (peek() != '{' && peek() != '(') {
                result.operationName = parseIdentifier();
                skipWhitespace();
            }

            // Variable definitions carry types only; values come from the request
            if (peek() == '(') {
                skipBalanced('(', ')');
                skipWhitespace();
            }
        }

        result.selections = parseSelectionSet();
        skipWhitespace();
        if (pos_ < source_.size()) {
            throw ParseError("Unexpected trailing input at position " + std::to_string(pos_));
        }
        return result;
    }

private:
    std::string source_;
    nlohmann::json variables_;
    std::size_t pos_;

    char peek() const {
        return pos_ < source_.size() ? source_[pos_] : '\0';
    }

    char advance() {
        return pos_ < source_.size() ? source_[pos_++] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < source_.size()) {
            char c = source_[pos_];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
                pos_++;
            } else if (c == '#') {
                while (pos_ < source_.size() && source_[pos_] != '\n') pos_++;
            } else {
                break;
            }
        }
    }

    void expect(char c) {
        skipWhitespace();
        if (advance() != c) {
            throw ParseError(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    void skipBalanced(char open, char close) {
        expect(open);
        int depth = 1;
        while (depth > 0 && pos_ < source_.size()) {
            char c = advance();
            if (c == open) depth++;
            if (c == close) depth--;
        }
        if (depth > 0) {
            throw ParseError(std::string("Unbalanced '") + open + "'");
        }
    }

    bool isIdentChar(char c) const {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_';
    }

    std::string parseIdentifier() {
        skipWhitespace();
        std::string result;
        while (pos_ < source_.size() && isIdentChar(source_[pos_])) {
            result += source_[pos_++];
        }
        if (result.empty()) {
            throw ParseError("Expected identifier at position " + std::to_string(pos_));
        }
        return result;
    }

    nlohmann::json parseValue() {
        skipWhitespace();
        char c = peek();

        if (c == '"') {
            return parseString();
        } else if (c == '-' || (c >= '0' && c <= '9')) {
            return parseNumber();
        } else if (c == '{') {
            return parseObjectValue();
        } else if (c == '[') {
            return parseArrayValue();
        } else if (c == '$') {
            return parseVariable();
        }

        // true / false / null, otherwise an enum value
        auto ident = parseIdentifier();
        if (ident == "true") return true;
        if (ident == "false") return false;
        if (ident == "null") return nullptr;
        return nlohmann::json(ident);
    }

    nlohmann::json parseVariable() {
        expect('$');
        auto name = parseIdentifier();
        auto it = variables_.find(name);
        if (it == variables_.end()) {
            throw ParseError("Variable '$" + name + "' is not defined");
        }
        return *it;
    }

    std::string parseString() {
        expect('"');
        std::string result;
        while (peek() != '"' && peek() != '\0') {
            if (peek() == '\\') {
                advance();
                char esc = advance();
                switch (esc) {
                    case 'n': result += '\n'; break;
                    case 't': result += '\t'; break;
                    case '"': result += '"'; break;
                    case '\\': result += '\\'; break;
                    default: result += esc; break;
                }
            } else {
                result += advance();
            }
        }
        expect('"');
        return result;
    }

    nlohmann::json parseNumber() {
        skipWhitespace();
        std::string numStr;
        bool isFloat = false;
        if (peek() == '-') numStr += advance();
        while (peek() >= '0' && peek() <= '9') numStr += advance();
        if (peek() == '.') {
            isFloat = true;
            numStr += advance();
            while (peek() >= '0' && peek() <= '9') numStr += advance();
        }
        if (numStr.find_first_of("0123456789") == std::string::npos) {
            throw ParseError("Invalid number at position " + std::to_string(pos_));
        }
        try {
            return isFloat ? nlohmann::json(std::stod(numStr))
                           : nlohmann::json(static_cast<int64_t>(std::stoll(numStr)));
        } catch (const std::out_of_range&) {
            throw ParseError("Number out of range: " + numStr);
        } catch (const std::invalid_argument&) {
            throw ParseError("Invalid number: " + numStr);
        }
    }

    nlohmann::json parseObjectValue() {
        expect('{');
        nlohmann::json obj = nlohmann::json::object();
        skipWhitespace();
        while (peek() != '}') {
            if (peek() == '\0') throw ParseError("Unterminated object value");
            auto key = parseIdentifier();
            expect(':');
            obj[key] = parseValue();
            skipWhitespace();
        }
        expect('}');
        return obj;
    }

    nlohmann::json parseArrayValue() {
        expect('[');
        nlohmann::json arr = nlohmann::json::array();
        skipWhitespace();
        while (peek() != ']') {
            if (peek() == '\0') throw ParseError("Unterminated list value");
            arr.push_back(parseValue());
            skipWhitespace();
        }
        expect(']');
        return arr;
    }

    std::vector<Argument> parseArguments() {
        expect('(');
        std::vector<Argument> args;
        skipWhitespace();
        while (peek() != ')') {
            if (peek() == '\0') throw ParseError("Unterminated argument list");
            Argument arg;
            arg.name = parseIdentifier();
            expect(':');
            arg.value = parseValue();
            args.push_back(std::move(arg));
            skipWhitespace();
        }
        expect(')');
        return args;
    }

    Field parseField() {
        Field field;
        auto nameOrAlias = parseIdentifier();
        skipWhitespace();

        // Check for alias (alias: fieldName)
        if (peek() == ':') {
            advance();
            field.alias = nameOrAlias;
            field.name = parseIdentifier();
            skipWhitespace();
        } else {
            field.name = nameOrAlias;
        }

        if (peek() == '(') {
            field.arguments = parseArguments();
        }

        skipWhitespace();

        // Parse nested selection set
        if (peek() == '{') {
            field.selections = parseSelectionSet();
        }

        return field;
    }

    std::vector<Field> parseSelectionSet() {
        expect('{');
        std::vector<Field> selections;
        skipWhitespace();

        while (peek() != '}' && peek() != '\0') {
            selections.push_back(parseField());
            skipWhitespace();
        }

        expect('}');
        return selections;
    }
};

} // namespace detail

inline ParsedQuery parse(const std::string& source,
                         const nlohmann::json& variables = nlohmann::json::object()) {
    return detail::GraphQLParser(source, variables).parse();
}

// ═══════════════════════════════════════════
//  class Schema
//  One QueryResolver per top-level query field.
// ═══════════════════════════════════════════
class Schema {
public:
    Schema& query(const std::string& name, std::shared_ptr<QueryResolver> resolver);

    std::shared_ptr<QueryResolver> resolver(const std::string& name) const;

    // ── Execute request text against one backend session ──
    //  Never throws for request-level failures: they are reported in
    //  "errors" with extensions.classification set to the error kind.
    nlohmann::ordered_json execute(const std::string& queryStr, QueryBackend& session,
                                   const nlohmann::json& variables = nlohmann::json::object()) const;

private:
    std::unordered_map<std::string, std::shared_ptr<QueryResolver>> resolvers_;
};

// { "message": ..., "path": [...], "extensions": { "classification": ... } }
nlohmann::ordered_json errorJson(const std::string& message, const std::string& classification,
                                 const std::string& path = "");

} // namespace pagedql::graphql
