#include "util/sanitize.hpp"
#include <cctype>
#include <cstdint>
#include <cstring>

namespace bastion::util {

namespace {

// Length of the UTF-8 sequence starting at text[i], or 0 if it is invalid
size_t utf8_sequence_length(const std::string& text, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(text[k]); };
    unsigned char lead = byte(i);

    size_t len = 0;
    uint32_t min_cp = 0;
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) { len = 2; min_cp = 0x80; }
    else if ((lead & 0xF0) == 0xE0) { len = 3; min_cp = 0x800; }
    else if ((lead & 0xF8) == 0xF0) { len = 4; min_cp = 0x10000; }
    else return 0;

    if (i + len > text.size()) return 0;

    uint32_t cp = lead & (0xFF >> (len + 1));
    for (size_t k = 1; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Case-insensitive match of word at text[i]
bool word_at(const std::string& text, size_t i, const char* word) {
    for (size_t k = 0; word[k] != '\0'; ++k) {
        if (i + k >= text.size() ||
            std::tolower(static_cast<unsigned char>(text[i + k])) != word[k]) {
            return false;
        }
    }
    return true;
}

size_t skip_spaces(const std::string& text, size_t i) {
    while (i < text.size() && is_space(text[i])) ++i;
    return i;
}

// End of a secret value: stops at whitespace or any of stops
size_t value_end(const std::string& text, size_t i, const char* stops) {
    while (i < text.size() && !is_space(text[i]) && std::strchr(stops, text[i]) == nullptr) ++i;
    return i;
}

// "bearer <token>"; returns the length through the token, or 0
size_t match_bearer(const std::string& text, size_t i) {
    if (!word_at(text, i, "bearer") || i + 6 >= text.size() || !is_space(text[i + 6])) {
        return 0;
    }
    size_t start = skip_spaces(text, i + 6);
    size_t end = value_end(text, start, ",;");
    return end > start ? end - i : 0;
}

// Credential key names ahead of ':' or '='; returns the key length, or 0
size_t match_keyword(const std::string& text, size_t i) {
    static const char* const joined[][2] = {{"api", "key"}, {"access", "token"}};
    for (const auto& pair : joined) {
        if (!word_at(text, i, pair[0])) continue;
        size_t j = i + std::strlen(pair[0]);
        if (j < text.size() && (text[j] == '_' || text[j] == '-')) ++j;
        if (word_at(text, j, pair[1])) {
            return j + std::strlen(pair[1]) - i;
        }
    }
    static const char* const plain[] = {"token", "secret", "password", "passwd", "authorization"};
    for (const char* word : plain) {
        if (word_at(text, i, word)) {
            return std::strlen(word);
        }
    }
    return 0;
}

// Provider-issued keys (sk-..., xoxb-..., ghp_...) at a word start
size_t match_provider_key(const std::string& text, size_t i) {
    if (i > 0 && is_word(text[i - 1])) {
        return 0;
    }
    static const char* const prefixes[] = {"sk", "xoxb", "xoxp", "xoxa", "ghp", "gho"};
    for (const char* prefix : prefixes) {
        size_t n = std::strlen(prefix);
        if (text.compare(i, n, prefix) != 0) continue;
        size_t j = i + n;
        if (j >= text.size() || (text[j] != '-' && text[j] != '_')) continue;
        size_t end = ++j;
        while (end < text.size() &&
               (std::isalnum(static_cast<unsigned char>(text[end])) || text[end] == '_' || text[end] == '-')) {
            ++end;
        }
        if (end - j >= 12) {
            return end - i;
        }
    }
    return 0;
}

} // namespace

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    size_t end = max_bytes;
    // Back up over continuation bytes so the cut lands on a boundary
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

std::string to_valid_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8_sequence_length(text, i);
        if (len == 0) {
            out += "\xEF\xBF\xBD";
            ++i;
        } else {
            out.append(text, i, len);
            i += len;
        }
    }
    return out;
}

std::string redact_secrets(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (size_t len = match_bearer(text, i)) {
            out.append(text, i, 6);
            out += " [REDACTED]";
            i += len;
            continue;
        }
        if (size_t k = match_keyword(text, i)) {
            size_t j = skip_spaces(text, i + k);
            if (j < text.size() && (text[j] == ':' || text[j] == '=')) {
                j = skip_spaces(text, j + 1);
                // "Authorization: Bearer x" is left to the bearer rule
                if (match_bearer(text, j) == 0) {
                    size_t end = value_end(text, j, ",;&");
                    if (end > j) {
                        out.append(text, i, j - i);
                        out += "[REDACTED]";
                        i = end;
                        continue;
                    }
                }
                out.append(text, i, j - i);
                i = j;
                continue;
            }
        }
        if (size_t len = match_provider_key(text, i)) {
            out += "[REDACTED]";
            i += len;
            continue;
        }
        out += text[i++];
    }
    return out;
}

std::string sanitize_detail(const std::string& text, size_t max_bytes) {
    // Nothing past a few times the cap can reach the output
    std::string out = redact_secrets(to_valid_utf8(truncate_utf8(text, max_bytes * 4)));
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            c = ' ';
        }
    }
    return truncate_utf8(out, max_bytes);
}

std::string sanitize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : to_valid_utf8(name)) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 0x20 && uc != 0x7F) {
            out += c;
        }
    }
    return truncate_utf8(out, 64);
}

} // namespace bastion::util
