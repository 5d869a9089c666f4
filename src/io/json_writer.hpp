/**
 * JSON Writer (header-only)
 *
 * Streams catalog JSON. Objects and arrays of records are laid out one
 * member per line; numeric rows (state vectors, rotation axes) stay on a
 * single line so a partition file reads as one record per line.
 * Doubles use max_digits10 and come back bit-identical when re-read.
 *
 * Usage:
 *   JsonWriter w(file);
 *   w.begin_object();
 *     w.key("399").begin_object();
 *       w.kv("name", "Earth");
 *       w.key("state_vectors").begin_array();
 *         w.row({2451545.0, x, y, z, vx, vy, vz});
 *       w.end_array();
 *     w.end_object();
 *   w.end_object();
 */

#ifndef SOLCAT_JSON_WRITER_HPP
#define SOLCAT_JSON_WRITER_HPP

#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

namespace solcat {

class JsonWriter {
public:
    // indent 0 writes the whole document on one line
    explicit JsonWriter(std::ostream& os, int indent = 2)
        : os_(os), indent_(indent) {
        os_.precision(std::numeric_limits<double>::max_digits10);
    }

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object()   { return close('}'); }
    JsonWriter& begin_array()  { return open('['); }
    JsonWriter& end_array()    { return close(']'); }

    JsonWriter& key(const std::string& k) {
        next_item();
        quoted(k);
        os_ << (indent_ > 0 ? ": " : ":");
        after_key_ = true;
        return *this;
    }

    JsonWriter& value(const std::string& s) {
        next_item();
        quoted(s);
        return *this;
    }

    JsonWriter& value(const char* s) { return value(std::string(s)); }

    JsonWriter& value(double d) {
        next_item();
        number(d);
        return *this;
    }

    // Numeric array written inline: [a, b, c]
    JsonWriter& row(std::initializer_list<double> values) {
        next_item();
        os_ << '[';
        const char* sep = "";
        for (double d : values) {
            os_ << sep;
            number(d);
            sep = indent_ > 0 ? ", " : ",";
        }
        os_ << ']';
        return *this;
    }

    template <typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

private:
    std::ostream& os_;
    int indent_;
    std::vector<int> items_;   // Members written so far, per open scope
    bool after_key_ = false;

    JsonWriter& open(char bracket) {
        next_item();
        os_ << bracket;
        items_.push_back(0);
        return *this;
    }

    JsonWriter& close(char bracket) {
        int written = items_.empty() ? 0 : items_.back();
        if (!items_.empty()) items_.pop_back();
        if (written > 0) line_break();
        os_ << bracket;
        return *this;
    }

    // Comma and line break ahead of a new member; nothing right after a key
    void next_item() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (items_.empty()) return;
        if (items_.back()++ > 0) os_ << ',';
        line_break();
    }

    void line_break() {
        if (indent_ <= 0) return;
        os_ << '\n' << std::string(items_.size() * indent_, ' ');
    }

    void number(double d) {
        if (std::isfinite(d)) {
            os_ << d;
        } else {
            os_ << "null";
        }
    }

    void quoted(const std::string& s) {
        os_ << '"';
        for (char c : s) {
            unsigned char u = static_cast<unsigned char>(c);
            if (c == '"' || c == '\\') {
                os_ << '\\' << c;
            } else if (c == '\n') {
                os_ << "\\n";
            } else if (c == '\t') {
                os_ << "\\t";
            } else if (u < 0x20) {
                char esc[8];
                std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(u));
                os_ << esc;
            } else {
                os_ << c;
            }
        }
        os_ << '"';
    }
};

} // namespace solcat

#endif // SOLCAT_JSON_WRITER_HPP
