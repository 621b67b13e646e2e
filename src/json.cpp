#include "../include/promptgate/json.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <stdexcept>
#include <type_traits>

namespace promptgate {

namespace {

void append_utf8(std::uint32_t code, std::string& out) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

std::uint32_t read_hex4(std::string_view text, std::size_t& pos) {
    if (pos + 4 > text.size()) {
        throw std::runtime_error("invalid unicode escape");
    }
    std::uint32_t code = 0;
    for (int i = 0; i < 4; ++i) {
        const char h = text[pos++];
        code <<= 4;
        if (h >= '0' && h <= '9') {
            code |= static_cast<std::uint32_t>(h - '0');
        } else if (h >= 'a' && h <= 'f') {
            code |= static_cast<std::uint32_t>(h - 'a' + 10);
        } else if (h >= 'A' && h <= 'F') {
            code |= static_cast<std::uint32_t>(h - 'A' + 10);
        } else {
            throw std::runtime_error("invalid unicode escape");
        }
    }
    return code;
}

// Sign, significant digits without leading or trailing zeros, and the
// decimal exponent of the last digit, so "1.50e1" and "15" compare equal.
struct Decimal {
    bool negative = false;
    std::string digits;
    long exponent = 0;

    bool operator==(const Decimal& other) const {
        return negative == other.negative && digits == other.digits && exponent == other.exponent;
    }
};

Decimal normalize_decimal(std::string_view lexeme) {
    Decimal result;
    std::size_t pos = 0;
    if (pos < lexeme.size() && (lexeme[pos] == '-' || lexeme[pos] == '+')) {
        result.negative = lexeme[pos] == '-';
        ++pos;
    }
    long fraction_digits = 0;
    bool in_fraction = false;
    for (; pos < lexeme.size(); ++pos) {
        const char c = lexeme[pos];
        if (c == '.') {
            in_fraction = true;
        } else if (c >= '0' && c <= '9') {
            result.digits.push_back(c);
            if (in_fraction) {
                ++fraction_digits;
            }
        } else {
            break;
        }
    }
    long exponent = 0;
    if (pos < lexeme.size() && (lexeme[pos] == 'e' || lexeme[pos] == 'E')) {
        try {
            exponent = std::stol(std::string(lexeme.substr(pos + 1)));
        } catch (const std::out_of_range&) {
            throw JsonPrecisionError("exponent out of range: " + std::string(lexeme));
        }
    }
    result.exponent = exponent - fraction_digits;

    const auto first = result.digits.find_first_not_of('0');
    if (first == std::string::npos) {
        result = Decimal{};
        return result;
    }
    result.digits.erase(0, first);
    while (result.digits.back() == '0') {
        result.digits.pop_back();
        ++result.exponent;
    }
    return result;
}

} // namespace

void Json::dump_string(std::ostringstream& oss, const std::string& text) {
    oss << '"';
    for (char c : text) {
        switch (c) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b"; break;
        case '\f': oss << "\\f"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec
                    << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
}

void Json::dump_number(std::ostringstream& oss, double value) {
    if (!std::isfinite(value)) {
        oss << "null";
        return;
    }
    if (std::trunc(value) == value && std::fabs(value) < 1e15) {
        oss << static_cast<long long>(value);
        return;
    }
    // Shortest of 15 or 17 significant digits that still round-trips.
    std::ostringstream candidate;
    candidate << std::setprecision(15) << value;
    if (std::stod(candidate.str()) != value) {
        candidate.str(std::string());
        candidate << std::setprecision(17) << value;
    }
    oss << candidate.str();
}

void Json::dump_internal(std::ostringstream& oss) const {
    std::visit([
                   &oss](const auto& value) {
                       using T = std::decay_t<decltype(value)>;
                       if constexpr (std::is_same_v<T, std::nullptr_t>) {
                           oss << "null";
                       } else if constexpr (std::is_same_v<T, bool>) {
                           oss << (value ? "true" : "false");
                       } else if constexpr (std::is_same_v<T, double>) {
                           dump_number(oss, value);
                       } else if constexpr (std::is_same_v<T, std::string>) {
                           dump_string(oss, value);
                       } else if constexpr (std::is_same_v<T, JsonArray>) {
                           oss << '[';
                           bool first = true;
                           for (const auto& item : value) {
                               if (!first) {
                                   oss << ',';
                               }
                               first = false;
                               item.dump_internal(oss);
                           }
                           oss << ']';
                       } else if constexpr (std::is_same_v<T, JsonObject>) {
                           oss << '{';
                           bool first = true;
                           for (const auto& [key, val] : value) {
                               if (!first) {
                                   oss << ',';
                               }
                               first = false;
                               dump_string(oss, key);
                               oss << ':';
                               val.dump_internal(oss);
                           }
                           oss << '}';
                       }
                   },
               m_value);
}

void Json::skip_ws(std::string_view text, std::size_t& pos) {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
        ++pos;
    }
}

Json Json::parse(std::string_view text) {
    return parse_document(text, false);
}

Json Json::parse_exact(std::string_view text) {
    return parse_document(text, true);
}

Json Json::parse_document(std::string_view text, bool exact) {
    std::size_t pos = 0;
    skip_ws(text, pos);
    Json value = parse_value(text, pos, 0, exact);
    skip_ws(text, pos);
    if (pos != text.size()) {
        throw std::runtime_error("unexpected trailing characters in JSON");
    }
    return value;
}

Json Json::parse_value(std::string_view text, std::size_t& pos, std::size_t depth, bool exact) {
    skip_ws(text, pos);
    if (pos >= text.size()) {
        throw std::runtime_error("unexpected end of JSON");
    }
    const char c = text[pos];
    if (c == '"') {
        return parse_string(text, pos);
    }
    if (c == '[' || c == '{') {
        if (depth >= kMaxDepth) {
            throw std::runtime_error("JSON nesting too deep");
        }
        return c == '[' ? parse_array(text, pos, depth + 1, exact) : parse_object(text, pos, depth + 1, exact);
    }
    if ((c >= '0' && c <= '9') || c == '-') {
        return parse_number(text, pos, exact);
    }
    if (text.substr(pos, 4) == "true") {
        pos += 4;
        return Json(true);
    }
    if (text.substr(pos, 5) == "false") {
        pos += 5;
        return Json(false);
    }
    if (text.substr(pos, 4) == "null") {
        pos += 4;
        return Json(nullptr);
    }
    throw std::runtime_error("invalid JSON token");
}

Json Json::parse_number(std::string_view text, std::size_t& pos, bool exact) {
    const std::size_t start = pos;
    auto is_digit = [&](std::size_t at) { return at < text.size() && text[at] >= '0' && text[at] <= '9'; };
    if (text[pos] == '-') {
        ++pos;
    }
    if (!is_digit(pos)) {
        throw std::runtime_error("invalid number");
    }
    while (is_digit(pos)) {
        ++pos;
    }
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        if (!is_digit(pos)) {
            throw std::runtime_error("invalid number");
        }
        while (is_digit(pos)) {
            ++pos;
        }
    }
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            ++pos;
        }
        if (!is_digit(pos)) {
            throw std::runtime_error("invalid number");
        }
        while (is_digit(pos)) {
            ++pos;
        }
    }
    const std::string_view lexeme = text.substr(start, pos - start);
    double value = 0.0;
    try {
        value = std::stod(std::string(lexeme));
    } catch (const std::out_of_range&) {
        if (exact) {
            throw JsonPrecisionError("number out of range: " + std::string(lexeme));
        }
        throw std::runtime_error("number out of range");
    }
    if (exact) {
        std::ostringstream written;
        dump_number(written, value);
        if (!(normalize_decimal(written.str()) == normalize_decimal(lexeme))) {
            throw JsonPrecisionError("number " + std::string(lexeme) + " does not survive as " + written.str());
        }
    }
    return Json(value);
}

Json Json::parse_string(std::string_view text, std::size_t& pos) {
    if (pos >= text.size() || text[pos] != '"') {
        throw std::runtime_error("expected string");
    }
    ++pos;
    std::string result;
    while (true) {
        if (pos >= text.size()) {
            throw std::runtime_error("unterminated string");
        }
        const char c = text[pos++];
        if (c == '"') {
            break;
        }
        if (c != '\\') {
            result.push_back(c);
            continue;
        }
        if (pos >= text.size()) {
            throw std::runtime_error("invalid escape");
        }
        const char esc = text[pos++];
        switch (esc) {
        case '"': result.push_back('"'); break;
        case '\\': result.push_back('\\'); break;
        case '/': result.push_back('/'); break;
        case 'b': result.push_back('\b'); break;
        case 'f': result.push_back('\f'); break;
        case 'n': result.push_back('\n'); break;
        case 'r': result.push_back('\r'); break;
        case 't': result.push_back('\t'); break;
        case 'u': {
            std::uint32_t code = read_hex4(text, pos);
            if (code >= 0xD800 && code <= 0xDBFF) {
                if (pos + 6 > text.size() || text[pos] != '\\' || text[pos + 1] != 'u') {
                    throw std::runtime_error("unpaired surrogate in unicode escape");
                }
                pos += 2;
                const std::uint32_t low = read_hex4(text, pos);
                if (low < 0xDC00 || low > 0xDFFF) {
                    throw std::runtime_error("unpaired surrogate in unicode escape");
                }
                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            } else if (code >= 0xDC00 && code <= 0xDFFF) {
                throw std::runtime_error("unpaired surrogate in unicode escape");
            }
            append_utf8(code, result);
            break;
        }
        default:
            throw std::runtime_error("invalid escape");
        }
    }
    return Json(std::move(result));
}

Json Json::parse_array(std::string_view text, std::size_t& pos, std::size_t depth, bool exact) {
    if (text[pos] != '[') {
        throw std::runtime_error("expected array");
    }
    ++pos;
    JsonArray arr;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == ']') {
        ++pos;
        return Json(std::move(arr));
    }
    while (true) {
        arr.emplace_back(parse_value(text, pos, depth, exact));
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == ']') {
            ++pos;
            break;
        }
        throw std::runtime_error("expected comma or closing bracket");
    }
    return Json(std::move(arr));
}

Json Json::parse_object(std::string_view text, std::size_t& pos, std::size_t depth, bool exact) {
    if (text[pos] != '{') {
        throw std::runtime_error("expected object");
    }
    ++pos;
    JsonObject obj;
    skip_ws(text, pos);
    if (pos < text.size() && text[pos] == '}') {
        ++pos;
        return Json(std::move(obj));
    }
    while (true) {
        skip_ws(text, pos);
        Json key = parse_string(text, pos);
        skip_ws(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            throw std::runtime_error("expected colon");
        }
        ++pos;
        obj[key.as_string()] = parse_value(text, pos, depth, exact);
        skip_ws(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            ++pos;
            break;
        }
        throw std::runtime_error("expected comma or closing brace");
    }
    return Json(std::move(obj));
}

} // namespace promptgate
