#pragma once

#include <cstddef>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace promptgate {

class Json;

// Thrown by Json::parse_exact for a number the double representation would
// change when written back out.
class JsonPrecisionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

class Json {
public:
    using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;

    Json() : m_value(nullptr) {}
    Json(std::nullptr_t) : m_value(nullptr) {}
    Json(bool b) : m_value(b) {}
    Json(double d) : m_value(d) {}
    Json(int i) : m_value(static_cast<double>(i)) {}
    Json(std::string s) : m_value(std::move(s)) {}
    Json(const char* s) : m_value(std::string(s)) {}
    Json(JsonArray arr) : m_value(std::move(arr)) {}
    Json(JsonObject obj) : m_value(std::move(obj)) {}

    const Value& value() const noexcept { return m_value; }
    Value& value() noexcept { return m_value; }

    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(m_value); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(m_value); }
    bool is_number() const noexcept { return std::holds_alternative<double>(m_value); }
    bool is_object() const noexcept { return std::holds_alternative<JsonObject>(m_value); }
    bool is_array() const noexcept { return std::holds_alternative<JsonArray>(m_value); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(m_value); }

    bool as_bool() const { return std::get<bool>(m_value); }
    double as_number() const { return std::get<double>(m_value); }
    const JsonObject& as_object() const { return std::get<JsonObject>(m_value); }
    const JsonArray& as_array() const { return std::get<JsonArray>(m_value); }
    const std::string& as_string() const { return std::get<std::string>(m_value); }

    JsonObject& as_object() { return std::get<JsonObject>(m_value); }
    JsonArray& as_array() { return std::get<JsonArray>(m_value); }
    std::string& as_string() { return std::get<std::string>(m_value); }

    bool operator==(const Json& other) const { return m_value == other.m_value; }
    bool operator!=(const Json& other) const { return !(*this == other); }

    // Compact, key-sorted output. Integral numbers are written without a
    // fraction and non-ASCII text is kept as raw UTF-8.
    std::string dump() const {
        std::ostringstream oss;
        dump_internal(oss);
        return oss.str();
    }

    static constexpr std::size_t kMaxDepth = 512;

    static Json parse(std::string_view text);
    // Like parse, but every number must survive dump() with its decimal
    // value intact; throws JsonPrecisionError otherwise.
    static Json parse_exact(std::string_view text);

private:
    Value m_value;

    void dump_internal(std::ostringstream& oss) const;
    static void dump_string(std::ostringstream& oss, const std::string& text);
    static void dump_number(std::ostringstream& oss, double value);
    static void skip_ws(std::string_view text, std::size_t& pos);
    static Json parse_document(std::string_view text, bool exact);
    static Json parse_value(std::string_view text, std::size_t& pos, std::size_t depth, bool exact);
    static Json parse_number(std::string_view text, std::size_t& pos, bool exact);
    static Json parse_string(std::string_view text, std::size_t& pos);
    static Json parse_array(std::string_view text, std::size_t& pos, std::size_t depth, bool exact);
    static Json parse_object(std::string_view text, std::size_t& pos, std::size_t depth, bool exact);
};

} // namespace promptgate
