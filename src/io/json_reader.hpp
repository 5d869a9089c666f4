/**
 * JSON Reader
 *
 * Parses catalog, batch and config files into a JsonValue tree. Object
 * members are held in a std::map, so walking a parsed partition file
 * visits ids in a fixed order. Lookups never throw: a missing member or
 * out-of-range index yields a null value, and the typed as_*() accessors
 * are where a wrong type surfaces as an error.
 *
 * Usage:
 *   JsonValue root = JsonReader::parse_file("asteroids.json");
 *   for (const auto& [id, body] : root.as_object()) {
 *       double radius = body["radius"].get_number();
 *   }
 */

#ifndef SOLCAT_JSON_READER_HPP
#define SOLCAT_JSON_READER_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace solcat {

class JsonValue {
public:
    enum class Kind { NIL, BOOL, NUMBER, STRING, ARRAY, OBJECT };

    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    JsonValue() = default;
    explicit JsonValue(bool b) : kind_(Kind::BOOL), bool_(b) {}
    explicit JsonValue(double d) : kind_(Kind::NUMBER), number_(d) {}
    explicit JsonValue(std::string s) : kind_(Kind::STRING), string_(std::move(s)) {}
    explicit JsonValue(Array a) : kind_(Kind::ARRAY), array_(std::move(a)) {}
    explicit JsonValue(Object o) : kind_(Kind::OBJECT), object_(std::move(o)) {}

    Kind kind() const { return kind_; }
    bool is_bool()   const { return kind_ == Kind::BOOL; }
    bool is_number() const { return kind_ == Kind::NUMBER; }
    bool is_string() const { return kind_ == Kind::STRING; }
    bool is_array()  const { return kind_ == Kind::ARRAY; }
    bool is_object() const { return kind_ == Kind::OBJECT; }

    // @throws std::runtime_error if the value has another kind
    bool as_bool() const;
    double as_number() const;
    const std::string& as_string() const;

    double get_number(double fallback = 0.0) const {
        return is_number() ? number_ : fallback;
    }
    std::string get_string(const std::string& fallback = "") const {
        return is_string() ? string_ : fallback;
    }

    // Empty unless the value is an array / object
    const Array& as_array() const { return array_; }
    const Object& as_object() const { return object_; }

    const JsonValue& operator[](const std::string& key) const;
    const JsonValue& operator[](size_t index) const;
    bool has(const std::string& key) const;

    // Elements of an array or members of an object, 0 otherwise
    size_t size() const;

    static const char* kind_name(Kind kind);

private:
    Kind kind_ = Kind::NIL;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    Array array_;
    Object object_;
};

class JsonReader {
public:
    /**
     * @brief Parse a complete JSON document
     * @throws std::runtime_error with line and column on malformed input
     */
    static JsonValue parse(const std::string& text);

    /**
     * @brief Read and parse a file
     * @throws std::runtime_error prefixed with the file name
     */
    static JsonValue parse_file(const std::string& path);
};

} // namespace solcat

#endif // SOLCAT_JSON_READER_HPP
