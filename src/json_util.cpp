#include "json_util.hpp"
#include <cctype>
#include <cstdio>

namespace projsync {
namespace json {

namespace {

// Small strict reader for the flat documents written by this application.
class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }
    }

    bool at_end() {
        skip_ws();
        return pos_ >= text_.size();
    }

    bool peek(char c) {
        skip_ws();
        return pos_ < text_.size() && text_[pos_] == c;
    }

    bool consume(char c) {
        if (!peek(c)) return false;
        pos_++;
        return true;
    }

    bool read_string(std::string& out) {
        if (!consume('"')) return false;
        out.clear();
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return false;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) return false;
            char e = text_[pos_++];
            switch (e) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':
                    if (!read_unicode_escape(out)) return false;
                    break;
                default:
                    return false;
            }
        }
        return false;  // unterminated
    }

    // Numbers, true, false and null are returned verbatim
    bool read_literal(std::string& out) {
        skip_ws();
        size_t start = pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.') {
                pos_++;
            } else {
                break;
            }
        }
        out = text_.substr(start, pos_ - start);
        if (out.empty()) return false;
        if (out == "true" || out == "false" || out == "null") return true;

        // Validate number shape loosely: digits with optional sign, fraction, exponent
        bool digit_seen = false;
        for (char c : out) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                digit_seen = true;
            } else if (c != '-' && c != '+' && c != '.' && c != 'e' && c != 'E') {
                return false;
            }
        }
        return digit_seen;
    }

    bool read_scalar(std::string& out) {
        if (peek('"')) return read_string(out);
        if (peek('{') || peek('[')) return false;
        return read_literal(out);
    }

    bool read_flat_object(FlatObject& out) {
        if (!consume('{')) return false;
        if (consume('}')) return true;
        while (true) {
            std::string key;
            std::string value;
            if (!read_string(key)) return false;
            if (!consume(':')) return false;
            if (!read_scalar(value)) return false;
            out[key] = value;
            if (consume(',')) continue;
            return consume('}');
        }
    }

private:
    bool read_unicode_escape(std::string& out) {
        if (pos_ + 4 > text_.size()) return false;
        unsigned int code = 0;
        for (int i = 0; i < 4; i++) {
            char h = text_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned int>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned int>(h - 'A' + 10);
            else return false;
        }
        // Encode the BMP code point as UTF-8 (surrogate pairs are not produced by our writer)
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
        return true;
    }

    const std::string& text_;
    size_t pos_ = 0;
};

} // namespace

std::string escape(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

bool parse_flat_object(const std::string& text, FlatObject& out) {
    Cursor cursor(text);
    FlatObject parsed;
    if (!cursor.read_flat_object(parsed)) return false;
    if (!cursor.at_end()) return false;
    out = std::move(parsed);
    return true;
}

bool parse_object_array(const std::string& text, const std::string& array_key,
                        std::vector<FlatObject>& out) {
    Cursor cursor(text);
    std::vector<FlatObject> parsed;
    bool array_found = false;

    if (!cursor.consume('{')) return false;
    if (!cursor.consume('}')) {
        while (true) {
            std::string key;
            if (!cursor.read_string(key)) return false;
            if (!cursor.consume(':')) return false;

            if (key == array_key) {
                if (!cursor.consume('[')) return false;
                if (!cursor.consume(']')) {
                    while (true) {
                        FlatObject element;
                        if (!cursor.read_flat_object(element)) return false;
                        parsed.push_back(std::move(element));
                        if (cursor.consume(',')) continue;
                        if (!cursor.consume(']')) return false;
                        break;
                    }
                }
                array_found = true;
            } else {
                std::string ignored;
                if (!cursor.read_scalar(ignored)) return false;
            }

            if (cursor.consume(',')) continue;
            if (!cursor.consume('}')) return false;
            break;
        }
    }

    if (!cursor.at_end() || !array_found) return false;
    out = std::move(parsed);
    return true;
}

} // namespace json
} // namespace projsync
