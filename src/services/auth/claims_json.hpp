#pragma once

/// @file claims_json.hpp
/// @brief Minimal JSON for token headers and payloads (no external dependency).
///
/// Only flat objects whose members are strings, integers or booleans are
/// produced or accepted. Anything else (nesting, arrays, null, fractions,
/// duplicate keys, trailing bytes) is rejected as malformed.

#include "cas/service/auth_types.hpp"

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cas::service::detail {

using JsonObject = std::map<std::string, ClaimValue>;

/// Quote and escape a string for JSON output.
inline std::string jsonQuote(std::string_view s) {
    static constexpr char hexDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hexDigits[(c >> 4) & 0x0F]);
                    out.push_back(hexDigits[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

/// Serialize one member value.
inline std::string jsonValue(const ClaimValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return jsonQuote(*s);
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    return std::get<bool>(value) ? "true" : "false";
}

/// Recursive-descent reader for a single flat JSON object.
class FlatObjectReader {
public:
    explicit FlatObjectReader(std::string_view text) : text_(text) {}

    std::optional<JsonObject> read() {
        JsonObject object;
        skipSpace();
        if (!consume('{')) {
            return std::nullopt;
        }
        skipSpace();
        if (consume('}')) {
            return finish(std::move(object));
        }
        while (true) {
            skipSpace();
            auto key = readString();
            if (!key) {
                return std::nullopt;
            }
            skipSpace();
            if (!consume(':')) {
                return std::nullopt;
            }
            skipSpace();
            auto value = readValue();
            if (!value) {
                return std::nullopt;
            }
            if (!object.emplace(std::move(*key), std::move(*value)).second) {
                return std::nullopt;  // duplicate member
            }
            skipSpace();
            if (consume('}')) {
                return finish(std::move(object));
            }
            if (!consume(',')) {
                return std::nullopt;
            }
        }
    }

private:
    std::optional<JsonObject> finish(JsonObject object) {
        skipSpace();
        if (pos_ != text_.size()) {
            return std::nullopt;
        }
        return object;
    }

    void skipSpace() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consumeWord(std::string_view word) {
        if (text_.substr(pos_, word.size()) == word) {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    std::optional<ClaimValue> readValue() {
        if (pos_ >= text_.size()) {
            return std::nullopt;
        }
        char c = text_[pos_];
        if (c == '"') {
            auto s = readString();
            if (!s) {
                return std::nullopt;
            }
            return ClaimValue{std::move(*s)};
        }
        if (consumeWord("true")) {
            return ClaimValue{true};
        }
        if (consumeWord("false")) {
            return ClaimValue{false};
        }
        if (c == '-' || (c >= '0' && c <= '9')) {
            return readInteger();
        }
        return std::nullopt;
    }

    std::optional<ClaimValue> readInteger() {
        auto start = pos_;
        if (text_[pos_] == '-') {
            ++pos_;
        }
        auto digitsStart = pos_;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            ++pos_;
        }
        auto digits = pos_ - digitsStart;
        if (digits == 0 || (digits > 1 && text_[digitsStart] == '0')) {
            return std::nullopt;
        }
        if (pos_ < text_.size() &&
            (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            return std::nullopt;  // fractions are not claim values
        }
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + start, text_.data() + pos_, value);
        if (ec != std::errc{} || ptr != text_.data() + pos_) {
            return std::nullopt;
        }
        return ClaimValue{value};
    }

    std::optional<uint32_t> readHex4() {
        if (pos_ + 4 > text_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || ptr != text_.data() + pos_ + 4) {
            return std::nullopt;
        }
        pos_ += 4;
        return value;
    }

    static void appendUtf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::optional<std::string> readString() {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    auto cp = readHex4();
                    if (!cp) {
                        return std::nullopt;
                    }
                    if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                        // High surrogate: a low surrogate must follow.
                        if (!consumeWord("\\u")) {
                            return std::nullopt;
                        }
                        auto low = readHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                            return std::nullopt;
                        }
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                        return std::nullopt;
                    }
                    appendUtf8(out, *cp);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;  // unterminated
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

/// Parse a flat JSON object. nullopt if the text is not one.
inline std::optional<JsonObject> parseFlatObject(std::string_view text) {
    return FlatObjectReader(text).read();
}

}  // namespace cas::service::detail
