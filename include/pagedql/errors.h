#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/errors.h — Error kinds surfaced to callers
// ═══════════════════════════════════════════════════════════════════
//
//  Every failure leaves the resolver as a pagedql::Error subclass so
//  the caller can render a specific error instead of an empty page:
//
//    try { resolver.resolve(field, session); }
//    catch (const pagedql::ArgumentError& e)  { ... e.key() ... }
//    catch (const pagedql::PredicateError& e) { ... }
//    catch (const pagedql::BackendError& e)   { ... }
//
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>

namespace pagedql {

enum class ErrorKind {
    Argument,
    Predicate,
    Backend,
    Parse,
    Config,
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Argument:  return "ArgumentError";
        case ErrorKind::Predicate: return "PredicateError";
        case ErrorKind::Backend:   return "BackendError";
        case ErrorKind::Parse:     return "ParseError";
        case ErrorKind::Config:    return "ConfigError";
    }
    return "Error";
}

// ── Base class ──
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    const char* kindName() const noexcept { return toString(kind_); }

private:
    ErrorKind kind_;
};

// ── Malformed request argument (pagination window, distinct flag, config key) ──
class ArgumentError : public Error {
public:
    ArgumentError(std::string argument, std::string key, const std::string& message)
        : Error(ErrorKind::Argument, message),
          argument_(std::move(argument)), key_(std::move(key)) {}

    // Name of the argument that was rejected, e.g. "page"
    const std::string& argument() const noexcept { return argument_; }
    // Offending sub-key, e.g. "limit"; empty when the whole argument is bad
    const std::string& key() const noexcept { return key_; }

private:
    std::string argument_;
    std::string key_;
};

// ── Filter compiler rejected an argument ──
class PredicateError : public Error {
public:
    PredicateError(std::string path, const std::string& message)
        : Error(ErrorKind::Predicate, message), path_(std::move(path)) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

// ── Query backend failed to prepare or execute ──
class BackendError : public Error {
public:
    explicit BackendError(const std::string& message)
        : Error(ErrorKind::Backend, message) {}
};

// ── Request text could not be parsed ──
class ParseError : public Error {
public:
    explicit ParseError(const std::string& message)
        : Error(ErrorKind::Parse, message) {}
};

} // namespace pagedql
