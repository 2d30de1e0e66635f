#include "utils/status.h"

namespace quanta {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Lexical: return "LexicalError";
        case ErrorKind::Syntax: return "SyntaxError";
        case ErrorKind::Schema: return "SchemaError";
        case ErrorKind::Type: return "TypeError";
        case ErrorKind::Engine: return "EngineError";
        case ErrorKind::Transaction: return "TransactionError";
        case ErrorKind::Timeout: return "TimeoutError";
    }
    return "None";
}

Status Status::LexicalError(size_t position, char unexpected, std::string msg) {
    Status s;
    s.ok = false;
    s.kind = ErrorKind::Lexical;
    s.position = position;
    if (msg.empty()) {
        msg = unexpected == '\0' ? std::string("unexpected end of input")
                                 : "unexpected character '" + std::string(1, unexpected) + "'";
    }
    s.message = std::move(msg);
    return s;
}

Status Status::SyntaxError(size_t position, const std::string& expected, const std::string& found) {
    Status s;
    s.ok = false;
    s.kind = ErrorKind::Syntax;
    s.position = position;
    s.message = "expected " + expected + " but found " + (found.empty() ? "end of input" : "'" + found + "'");
    return s;
}

Status Status::SchemaError(std::string record, std::string attribute, std::string msg) {
    Status s;
    s.ok = false;
    s.kind = ErrorKind::Schema;
    s.record = std::move(record);
    s.attribute = std::move(attribute);
    s.message = std::move(msg);
    return s;
}

Status Status::TypeError(size_t position, std::string msg) {
    Status s;
    s.ok = false;
    s.kind = ErrorKind::Type;
    s.position = position;
    s.message = std::move(msg);
    return s;
}

Status Status::EngineError(std::string engine, std::string msg) {
    Status s;
    s.ok = false;
    s.kind = ErrorKind::Engine;
    s.engine = std::move(engine);
    s.message = std::move(msg);
    return s;
}

Status Status::TransactionError(std::string msg) {
    Status s;
    s.ok = false;
    s.kind = ErrorKind::Transaction;
    s.message = std::move(msg);
    return s;
}

Status Status::TimeoutError(std::string msg) {
    Status s;
    s.ok = false;
    s.kind = ErrorKind::Timeout;
    s.message = std::move(msg);
    return s;
}

std::string Status::toString() const {
    if (ok) return "OK";
    std::string result = std::string(errorKindName(kind)) + ": " + message;
    switch (kind) {
        case ErrorKind::Lexical:
        case ErrorKind::Syntax:
        case ErrorKind::Type:
            result += " (at position " + std::to_string(position) + ")";
            break;
        case ErrorKind::Schema:
            if (!record.empty()) {
                result += " (record '" + record + "'";
                if (!attribute.empty()) result += ", attribute '" + attribute + "'";
                result += ")";
            }
            break;
        case ErrorKind::Engine:
            result += " (engine '" + engine + "')";
            break;
        default:
            break;
    }
    return result;
}

nlohmann::json Status::toJSON() const {
    nlohmann::json j = {{"kind", errorKindName(kind)}, {"message", message}};
    switch (kind) {
        case ErrorKind::Lexical:
        case ErrorKind::Syntax:
        case ErrorKind::Type:
            j["position"] = position;
            break;
        case ErrorKind::Schema:
            if (!record.empty()) j["record"] = record;
            if (!attribute.empty()) j["attribute"] = attribute;
            break;
        case ErrorKind::Engine:
            j["engine"] = engine;
            break;
        default:
            break;
    }
    return j;
}

} // namespace quanta
