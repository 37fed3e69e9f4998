#include "util/toml.hpp"
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <set>
#include <vector>

namespace bastion::util {

using json = nlohmann::json;

namespace {

class TomlParser {
public:
    explicit TomlParser(const std::string& text) : text_(text) {}

    json parse() {
        json root = json::object();
        json* table = &root;

        while (true) {
            skip_blank();
            if (eof()) break;

            if (peek() == '[') {
                table = parse_table_header(root);
            } else {
                parse_key_value(*table);
            }
            expect_line_end();
        }
        return root;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    size_t line_ = 1;
    std::set<std::string> defined_tables_;

    bool eof() const { return pos_ >= text_.size(); }

    char peek(size_t offset = 0) const {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
    }

    bool starts_with(const char* literal) const {
        return text_.compare(pos_, std::char_traits<char>::length(literal), literal) == 0;
    }

    char advance() {
        char c = text_[pos_++];
        if (c == '\n') ++line_;
        return c;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw TomlError(message, line_);
    }

    void skip_spaces() {
        while (!eof() && (peek() == ' ' || peek() == '\t')) ++pos_;
    }

    void skip_comment() {
        if (peek() != '#') return;
        while (!eof() && peek() != '\n') ++pos_;
    }

    // Whitespace, newlines and comments
    void skip_blank() {
        while (!eof()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                advance();
            } else if (c == '#') {
                skip_comment();
            } else {
                break;
            }
        }
    }

    void expect_line_end() {
        skip_spaces();
        skip_comment();
        if (eof()) return;
        if (peek() == '\r' && peek(1) == '\n') ++pos_;
        if (peek() == '\n') {
            advance();
            return;
        }
        fail(std::string("unexpected character '") + peek() + "' after value");
    }

    // ------------------------------------------------------------------------
    // Tables and keys
    // ------------------------------------------------------------------------

    json* parse_table_header(json& root) {
        ++pos_;  // '['
        if (peek() == '[') {
            fail("arrays of tables are not supported");
        }

        auto path = parse_key_path();
        skip_spaces();
        if (peek() != ']') {
            fail("expected ']' to close table header");
        }
        ++pos_;

        std::string joined;
        for (const auto& part : path) {
            joined += (joined.empty() ? "" : ".") + part;
        }
        if (!defined_tables_.insert(joined).second) {
            fail("table [" + joined + "] defined twice");
        }

        json* node = &root;
        for (const auto& part : path) {
            json& child = (*node)[part];
            if (child.is_null()) {
                child = json::object();
            } else if (!child.is_object()) {
                fail("key '" + part + "' is not a table");
            }
            node = &child;
        }
        return node;
    }

    std::vector<std::string> parse_key_path() {
        std::vector<std::string> parts;
        while (true) {
            skip_spaces();
            parts.push_back(parse_key());
            skip_spaces();
            if (peek() == '.') {
                ++pos_;
                continue;
            }
            return parts;
        }
    }

    std::string parse_key() {
        if (peek() == '"') return parse_basic_string();
        if (peek() == '\'') return parse_literal_string();

        std::string key;
        while (!eof()) {
            unsigned char c = static_cast<unsigned char>(peek());
            if (!std::isalnum(c) && c != '_' && c != '-') break;
            key += static_cast<char>(c);
            ++pos_;
        }
        if (key.empty()) {
            fail("expected a key");
        }
        return key;
    }

    void parse_key_value(json& table) {
        auto path = parse_key_path();
        skip_spaces();
        if (peek() != '=') {
            fail("expected '=' after key '" + path.back() + "'");
        }
        ++pos_;
        skip_spaces();

        json value = parse_value();

        json* node = &table;
        for (size_t i = 0; i + 1 < path.size(); ++i) {
            json& child = (*node)[path[i]];
            if (child.is_null()) {
                child = json::object();
            } else if (!child.is_object()) {
                fail("key '" + path[i] + "' is not a table");
            }
            node = &child;
        }

        if (node->contains(path.back())) {
            fail("duplicate key '" + path.back() + "'");
        }
        (*node)[path.back()] = std::move(value);
    }

    // ------------------------------------------------------------------------
    // Values
    // ------------------------------------------------------------------------

    json parse_value() {
        if (eof()) fail("expected a value");

        char c = peek();
        if (c == '"') {
            return starts_with("\"\"\"") ? json(parse_multiline_basic()) : json(parse_basic_string());
        }
        if (c == '\'') {
            return starts_with("'''") ? json(parse_multiline_literal()) : json(parse_literal_string());
        }
        if (c == '[') return parse_array();
        if (c == '{') return parse_inline_table();
        if (starts_with("true")) {
            pos_ += 4;
            return true;
        }
        if (starts_with("false")) {
            pos_ += 5;
            return false;
        }
        return parse_number();
    }

    json parse_array() {
        ++pos_;  // '['
        json array = json::array();
        while (true) {
            skip_blank();
            if (eof()) fail("unterminated array");
            if (peek() == ']') {
                ++pos_;
                return array;
            }

            array.push_back(parse_value());

            skip_blank();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                return array;
            }
            fail("expected ',' or ']' in array");
        }
    }

    json parse_inline_table() {
        ++pos_;  // '{'
        json table = json::object();
        skip_spaces();
        if (peek() == '}') {
            ++pos_;
            return table;
        }
        while (true) {
            skip_spaces();
            parse_key_value(table);
            skip_spaces();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                return table;
            }
            fail("expected ',' or '}' in inline table");
        }
    }

    json parse_number() {
        std::string token;
        while (!eof()) {
            unsigned char c = static_cast<unsigned char>(peek());
            if (!std::isalnum(c) && c != '+' && c != '-' && c != '.' && c != '_') break;
            if (c != '_') token += static_cast<char>(c);
            ++pos_;
        }
        if (token.empty()) {
            fail(std::string("unexpected character '") + peek() + "'");
        }

        bool is_float = token.find_first_of(".eE") != std::string::npos;
        errno = 0;
        char* end = nullptr;

        if (is_float) {
            double value = std::strtod(token.c_str(), &end);
            if (end != token.c_str() + token.size() || errno == ERANGE) {
                fail("invalid float '" + token + "'");
            }
            return value;
        }

        long long value = std::strtoll(token.c_str(), &end, 10);
        if (end != token.c_str() + token.size() || errno == ERANGE) {
            fail("invalid value '" + token + "'");
        }
        return static_cast<int64_t>(value);
    }

    // ------------------------------------------------------------------------
    // Strings
    // ------------------------------------------------------------------------

    std::string parse_basic_string() {
        ++pos_;  // opening quote
        std::string out;
        while (true) {
            if (eof()) fail("unterminated string");
            char c = text_[pos_++];
            if (c == '"') return out;
            if (c == '\n') fail("newline in single-line string");
            if (c == '\\') {
                out += parse_escape();
            } else {
                out += c;
            }
        }
    }

    std::string parse_literal_string() {
        ++pos_;
        std::string out;
        while (true) {
            if (eof()) fail("unterminated string");
            char c = text_[pos_++];
            if (c == '\'') return out;
            if (c == '\n') fail("newline in single-line string");
            out += c;
        }
    }

    std::string parse_multiline_basic() {
        pos_ += 3;
        skip_leading_newline();

        std::string out;
        while (true) {
            if (eof()) fail("unterminated multi-line string");
            if (starts_with("\"\"\"")) {
                size_t quotes = 0;
                while (peek(quotes) == '"' && quotes < 5) ++quotes;
                out.append(quotes - 3, '"');
                pos_ += quotes;
                return out;
            }

            char c = advance();
            if (c != '\\') {
                out += c;
                continue;
            }

            // A backslash at end of line trims the newline and leading whitespace
            size_t save = pos_;
            skip_spaces();
            if (peek() == '\n' || (peek() == '\r' && peek(1) == '\n')) {
                while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) advance();
                continue;
            }
            pos_ = save;
            out += parse_escape();
        }
    }

    std::string parse_multiline_literal() {
        pos_ += 3;
        skip_leading_newline();

        std::string out;
        while (true) {
            if (eof()) fail("unterminated multi-line string");
            if (starts_with("'''")) {
                size_t quotes = 0;
                while (peek(quotes) == '\'' && quotes < 5) ++quotes;
                out.append(quotes - 3, '\'');
                pos_ += quotes;
                return out;
            }
            out += advance();
        }
    }

    void skip_leading_newline() {
        if (peek() == '\r' && peek(1) == '\n') ++pos_;
        if (peek() == '\n') advance();
    }

    std::string parse_escape() {
        if (eof()) fail("unterminated escape sequence");
        char e = text_[pos_++];
        switch (e) {
            case 'n':  return "\n";
            case 't':  return "\t";
            case 'r':  return "\r";
            case 'b':  return "\b";
            case 'f':  return "\f";
            case '"':  return "\"";
            case '\\': return "\\";
            case 'u':  return parse_unicode(4);
            case 'U':  return parse_unicode(8);
            default:
                fail(std::string("invalid escape '\\") + e + "'");
        }
    }

    std::string parse_unicode(size_t digits) {
        if (pos_ + digits > text_.size()) fail("truncated unicode escape");

        uint32_t cp = 0;
        for (size_t i = 0; i < digits; ++i) {
            char c = text_[pos_++];
            cp <<= 4;
            if (c >= '0' && c <= '9') cp |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= static_cast<uint32_t>(c - 'A' + 10);
            else fail("invalid unicode escape");
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            fail("unicode escape is not a scalar value");
        }

        std::string out;
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        return out;
    }
};

} // namespace

json parse_toml(const std::string& text) {
    return TomlParser(text).parse();
}

} // namespace bastion::util
