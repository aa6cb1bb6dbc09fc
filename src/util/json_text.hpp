#ifndef PIIRELAY_UTIL_JSON_TEXT_HPP
#define PIIRELAY_UTIL_JSON_TEXT_HPP

#include <string>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>
#include <cstdint>

/**
 * @file json_text.hpp
 * @brief Small JSON string helpers for the chat-completions wire format.
 *
 * DESIGN GOALS:
 *   - Escape text for embedding in a JSON request body.
 *   - Pull string fields out of response objects such as
 *       {"choices":[{"delta":{"content":"Hel"}}]}
 *     without a full JSON parser. Lookups are by key, optionally after an
 *     anchor key ("delta", "message", "error") so nesting is followed loosely.
 *   - Decode escapes completely, including \uXXXX surrogate pairs, to UTF-8.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piirelay::util::json;
 *
 *   std::string body = "{\"content\":\"" + escapeString(prompt) + "\"}";
 *   std::string piece;
 *   if (findStringField(chunk, "content", piece, findKey(chunk, "delta"))) {
 *       // piece holds the decoded text
 *   }
 *   @endcode
 */

namespace piirelay {
namespace util {
namespace json {

/**
 * @brief Escape characters for a JSON string literal (without the quotes).
 */
inline std::string escapeString(const std::string &in)
{
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

inline void appendUtf8(std::string &out, uint32_t cp)
{
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

inline uint32_t parseHex4(const std::string &json, size_t pos)
{
    if (pos + 4 > json.size()) {
        throw std::runtime_error("json: truncated \\u escape");
    }
    uint32_t value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        const char c = json[i];
        value <<= 4;
        if (c >= '0' && c <= '9')      value |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
        else throw std::runtime_error("json: bad hex digit in \\u escape");
    }
    return value;
}

/**
 * @brief Decode the string literal whose opening quote is at json[quotePos].
 * @param out Receives the decoded text.
 * @return Position just past the closing quote.
 * @throw std::runtime_error on an unterminated literal or a bad escape.
 */
inline size_t readString(const std::string &json, size_t quotePos, std::string &out)
{
    if (quotePos >= json.size() || json[quotePos] != '"') {
        throw std::runtime_error("json: expected '\"' at " + std::to_string(quotePos));
    }
    out.clear();
    size_t i = quotePos + 1;
    while (i < json.size()) {
        const char c = json[i];
        if (c == '"') {
            return i + 1;
        }
        if (c != '\\') {
            out.push_back(c);
            ++i;
            continue;
        }
        if (i + 1 >= json.size()) {
            break;
        }
        const char esc = json[i + 1];
        i += 2;
        switch (esc) {
        case '"':  out.push_back('"');  break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/');  break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case 'u': {
            uint32_t cp = parseHex4(json, i);
            i += 4;
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                // High surrogate: combine with the following \uDC00..\uDFFF.
                if (i + 6 <= json.size() && json[i] == '\\' && json[i + 1] == 'u') {
                    const uint32_t low = parseHex4(json, i + 2);
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        i += 6;
                    } else {
                        cp = 0xFFFD;
                    }
                } else {
                    cp = 0xFFFD;
                }
            } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                cp = 0xFFFD;
            }
            appendUtf8(out, cp);
            break;
        }
        default:
            throw std::runtime_error(std::string("json: unknown escape \\") + esc);
        }
    }
    throw std::runtime_error("json: unterminated string literal");
}

/**
 * @brief Position of the value that follows "key": at or after from, or npos.
 */
inline size_t findKey(const std::string &json, const std::string &key, size_t from = 0)
{
    if (from == std::string::npos) {
        return std::string::npos;
    }
    const std::string quoted = "\"" + key + "\"";
    size_t pos = json.find(quoted, from);
    while (pos != std::string::npos) {
        size_t i = pos + quoted.size();
        while (i < json.size() && std::isspace(static_cast<unsigned char>(json[i]))) i++;
        if (i < json.size() && json[i] == ':') {
            ++i;
            while (i < json.size() && std::isspace(static_cast<unsigned char>(json[i]))) i++;
            return i;
        }
        // The text was a string value, not a key; keep looking.
        pos = json.find(quoted, pos + 1);
    }
    return std::string::npos;
}

/**
 * @brief Read the string value of key (first occurrence at or after from).
 * @return false if the key is absent or its value is not a string (e.g. null).
 */
inline bool findStringField(const std::string &json, const std::string &key,
                            std::string &out, size_t from = 0)
{
    const size_t valuePos = findKey(json, key, from);
    if (valuePos == std::string::npos || valuePos >= json.size() || json[valuePos] != '"') {
        return false;
    }
    readString(json, valuePos, out);
    return true;
}

} // namespace json
} // namespace util
} // namespace piirelay

#endif // PIIRELAY_UTIL_JSON_TEXT_HPP
