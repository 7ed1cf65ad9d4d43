#include <comicinfo/core/result.hpp>
#include <comicinfo/core/strings.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace comicinfo {

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------
Error Error::Parse(std::string message) {
    Error e;
    e.kind = ErrorKind::Parse;
    e.message = std::move(message);
    return e;
}

Error Error::File(std::string message) {
    Error e;
    e.kind = ErrorKind::File;
    e.message = std::move(message);
    return e;
}

Error Error::InvalidEnum(std::string field, std::string value,
                         std::vector<std::string> valid_values) {
    Error e;
    e.kind = ErrorKind::InvalidEnum;
    e.field = std::move(field);
    e.value = std::move(value);
    e.valid_values = std::move(valid_values);
    return e;
}

Error Error::Range(std::string field, std::string value,
                   std::string min, std::string max) {
    Error e;
    e.kind = ErrorKind::Range;
    e.field = std::move(field);
    e.value = std::move(value);
    e.min = std::move(min);
    e.max = std::move(max);
    return e;
}

Error Error::TypeCoercion(std::string field, std::string value,
                          std::string expected_type) {
    Error e;
    e.kind = ErrorKind::TypeCoercion;
    e.field = std::move(field);
    e.value = std::move(value);
    e.expected_type = std::move(expected_type);
    return e;
}

Error Error::Schema(std::string message) {
    Error e;
    e.kind = ErrorKind::Schema;
    e.message = std::move(message);
    return e;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------
std::string Error::KindName() const {
    switch (kind) {
        case ErrorKind::Parse:        return "parse";
        case ErrorKind::File:         return "file";
        case ErrorKind::InvalidEnum:  return "invalid_enum";
        case ErrorKind::Range:        return "range";
        case ErrorKind::TypeCoercion: return "type_coercion";
        case ErrorKind::Schema:       return "schema";
    }
    return "parse";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    switch (kind) {
        case ErrorKind::Parse:
            oss << "Parse error: " << message;
            break;
        case ErrorKind::File:
            oss << "File error: " << message;
            break;
        case ErrorKind::InvalidEnum:
            oss << "Invalid value '" << value << "' for field '" << field
                << "'. Valid values are: " << strings::Join(valid_values, ", ");
            break;
        case ErrorKind::Range:
            oss << "Value '" << value << "' for field '" << field
                << "' is out of range (" << min << ".." << max << ")";
            break;
        case ErrorKind::TypeCoercion:
            oss << "Cannot convert value '" << value << "' for field '" << field
                << "' to " << expected_type;
            break;
        case ErrorKind::Schema:
            oss << "Schema error: " << message;
            break;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["kind"] = KindName();
    body["message"] = ToString();
    switch (kind) {
        case ErrorKind::Parse:
        case ErrorKind::File:
        case ErrorKind::Schema:
            break;
        case ErrorKind::InvalidEnum:
            body["field"] = field;
            body["value"] = value;
            body["valid_values"] = valid_values;
            break;
        case ErrorKind::Range:
            body["field"] = field;
            body["value"] = value;
            body["min"] = min;
            body["max"] = max;
            break;
        case ErrorKind::TypeCoercion:
            body["field"] = field;
            body["value"] = value;
            body["expected_type"] = expected_type;
            break;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace comicinfo
