#include "io/json_reader.hpp"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace solcat {

// ─────────────────────────────────────────────────────────────
// JsonValue
// ─────────────────────────────────────────────────────────────

const char* JsonValue::kind_name(Kind kind) {
    switch (kind) {
        case Kind::NIL:    return "null";
        case Kind::BOOL:   return "bool";
        case Kind::NUMBER: return "number";
        case Kind::STRING: return "string";
        case Kind::ARRAY:  return "array";
        case Kind::OBJECT: return "object";
    }
    return "unknown";
}

static std::runtime_error kind_mismatch(JsonValue::Kind want, JsonValue::Kind got) {
    return std::runtime_error(std::string("Expected JSON ") + JsonValue::kind_name(want) +
                              ", got " + JsonValue::kind_name(got));
}

bool JsonValue::as_bool() const {
    if (!is_bool()) throw kind_mismatch(Kind::BOOL, kind_);
    return bool_;
}

double JsonValue::as_number() const {
    if (!is_number()) throw kind_mismatch(Kind::NUMBER, kind_);
    return number_;
}

const std::string& JsonValue::as_string() const {
    if (!is_string()) throw kind_mismatch(Kind::STRING, kind_);
    return string_;
}

static const JsonValue& nil_value() {
    static const JsonValue nil;
    return nil;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    auto it = object_.find(key);
    return it == object_.end() ? nil_value() : it->second;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    return index < array_.size() ? array_[index] : nil_value();
}

bool JsonValue::has(const std::string& key) const {
    return object_.find(key) != object_.end();
}

size_t JsonValue::size() const {
    if (is_array()) return array_.size();
    if (is_object()) return object_.size();
    return 0;
}

// ─────────────────────────────────────────────────────────────
// Parser
// ─────────────────────────────────────────────────────────────

namespace {

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    JsonValue document() {
        JsonValue root = value();
        skip_space();
        if (!at_end()) fail("unexpected text after the document");
        return root;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    [[noreturn]] void fail(const std::string& what) const {
        size_t line = 1, column = 1;
        for (size_t k = 0; k < pos_ && k < text_.size(); k++) {
            if (text_[k] == '\n') {
                line++;
                column = 1;
            } else {
                column++;
            }
        }
        std::ostringstream oss;
        oss << "JSON error at line " << line << ", column " << column << ": " << what;
        throw std::runtime_error(oss.str());
    }

    void skip_space() {
        while (!at_end() && std::strchr(" \t\r\n", text_[pos_]) != nullptr) pos_++;
    }

    void require(char c) {
        if (peek() != c) fail(std::string("expected '") + c + "'");
        pos_++;
    }

    bool accept_word(const char* word) {
        size_t n = std::strlen(word);
        if (text_.compare(pos_, n, word) != 0) return false;
        pos_ += n;
        return true;
    }

    JsonValue value() {
        skip_space();
        char c = peek();
        switch (c) {
            case '{': return object();
            case '[': return array();
            case '"': return JsonValue(string());
            default: break;
        }
        if (c == '-' || (c >= '0' && c <= '9')) return number();
        if (accept_word("true"))  return JsonValue(true);
        if (accept_word("false")) return JsonValue(false);
        if (accept_word("null"))  return JsonValue();
        if (at_end()) fail("unexpected end of input");
        fail(std::string("unexpected character '") + c + "'");
    }

    JsonValue object() {
        require('{');
        JsonValue::Object members;

        skip_space();
        if (peek() == '}') {
            pos_++;
            return JsonValue(std::move(members));
        }
        for (;;) {
            skip_space();
            std::string key = string();
            skip_space();
            require(':');
            members[key] = value();

            skip_space();
            if (peek() == ',') {
                pos_++;
                continue;
            }
            require('}');
            return JsonValue(std::move(members));
        }
    }

    JsonValue array() {
        require('[');
        JsonValue::Array elements;

        skip_space();
        if (peek() == ']') {
            pos_++;
            return JsonValue(std::move(elements));
        }
        for (;;) {
            elements.push_back(value());

            skip_space();
            if (peek() == ',') {
                pos_++;
                continue;
            }
            require(']');
            return JsonValue(std::move(elements));
        }
    }

    std::string string() {
        require('"');
        std::string out;
        for (;;) {
            if (at_end()) fail("unterminated string");
            char c = text_[pos_++];
            if (c == '"') return out;
            if (c != '\\') {
                out += c;
                continue;
            }

            if (at_end()) fail("unterminated string");
            char esc = text_[pos_++];
            switch (esc) {
                case '"': case '\\': case '/': out += esc; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': code_point(out); break;
                default:  fail(std::string("bad escape '\\") + esc + "'");
            }
        }
    }

    // \uXXXX as UTF-8 (basic multilingual plane)
    void code_point(std::string& out) {
        if (pos_ + 4 > text_.size()) fail("short \\u escape");
        std::string hex = text_.substr(pos_, 4);
        char* end = nullptr;
        unsigned long cp = std::strtoul(hex.c_str(), &end, 16);
        if (end != hex.c_str() + 4) fail("bad \\u escape");
        pos_ += 4;

        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    JsonValue number() {
        const char* begin = text_.c_str() + pos_;
        char* end = nullptr;
        double d = std::strtod(begin, &end);
        if (end == begin) fail("malformed number");
        pos_ += static_cast<size_t>(end - begin);
        return JsonValue(d);
    }
};

}  // anonymous namespace

// ─────────────────────────────────────────────────────────────
// JsonReader
// ─────────────────────────────────────────────────────────────

JsonValue JsonReader::parse(const std::string& text) {
    return Parser(text).document();
}

JsonValue JsonReader::parse_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return parse(buffer.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

} // namespace solcat
