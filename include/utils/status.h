#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace quanta {

enum class ErrorKind {
    None,
    Lexical,        // unrecognized character, unterminated literal/comment
    Syntax,         // grammar violation
    Schema,         // unknown bucket/record/attribute, duplicate definitions
    Type,           // operator/operand type mismatch
    Engine,         // wrapped backend failure
    Transaction,    // prepare/commit failure, unknown transaction
    Timeout
};

const char* errorKindName(ErrorKind kind);

/// Result of an operation. Carries enough context to be surfaced to the caller verbatim:
/// position for lexical/syntax/type errors, record/attribute for schema errors, engine for
/// engine errors.
struct Status {
    bool ok = true;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    size_t position = 0;
    std::string record;
    std::string attribute;
    std::string engine;

    static Status OK() { return {}; }

    static Status LexicalError(size_t position, char unexpected, std::string msg = "");
    static Status SyntaxError(size_t position, const std::string& expected, const std::string& found);
    static Status SchemaError(std::string record, std::string attribute, std::string msg);
    static Status TypeError(size_t position, std::string msg);
    static Status EngineError(std::string engine, std::string msg);
    static Status TransactionError(std::string msg);
    static Status TimeoutError(std::string msg);

    std::string toString() const;
    nlohmann::json toJSON() const;
};

/// Carries a Status across the internals of a pipeline stage; converted back to a
/// returned Status at the stage boundary.
class StatusError : public std::runtime_error {
public:
    explicit StatusError(Status status)
        : std::runtime_error(status.message), status_(std::move(status)) {}

    const Status& status() const { return status_; }

private:
    Status status_;
};

} // namespace quanta
