#include "ferry/net/json.hpp"

#include <cstdio>

namespace ferry::net {
    void json_escape_into(std::string_view in, std::string* out) {
        for (char ch : in) {
            const unsigned char c = static_cast<unsigned char>(ch);
            switch (c) {
                case '"': out->append("\\\""); break;
                case '\\': out->append("\\\\"); break;
                case '\n': out->append("\\n"); break;
                case '\r': out->append("\\r"); break;
                case '\t': out->append("\\t"); break;
                case '\b': out->append("\\b"); break;
                case '\f': out->append("\\f"); break;
                default:
                    if (c < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                        out->append(buf);
                    } else {
                        out->push_back(ch);
                    }
            }
        }
    }

    void JsonWriter::before_value() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (!first_.empty()) {
            if (!first_.back()) {
                out_.push_back(',');
            }
            first_.back() = false;
        }
    }

    JsonWriter& JsonWriter::begin_object() {
        before_value();
        out_.push_back('{');
        first_.push_back(true);
        return *this;
    }

    JsonWriter& JsonWriter::end_object() {
        out_.push_back('}');
        first_.pop_back();
        return *this;
    }

    JsonWriter& JsonWriter::begin_array() {
        before_value();
        out_.push_back('[');
        first_.push_back(true);
        return *this;
    }

    JsonWriter& JsonWriter::end_array() {
        out_.push_back(']');
        first_.pop_back();
        return *this;
    }

    JsonWriter& JsonWriter::key(std::string_view name) {
        before_value();
        out_.push_back('"');
        json_escape_into(name, &out_);
        out_.append("\":");
        after_key_ = true;
        return *this;
    }

    JsonWriter& JsonWriter::value(std::string_view v) {
        before_value();
        out_.push_back('"');
        json_escape_into(v, &out_);
        out_.push_back('"');
        return *this;
    }

    JsonWriter& JsonWriter::value(const char* v) {
        if (v == nullptr) {
            return null();
        }
        return value(std::string_view{v});
    }

    JsonWriter& JsonWriter::value(ferry::core::u64 v) {
        before_value();
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%llu", static_cast<unsigned long long>(v));
        out_.append(buf);
        return *this;
    }

    JsonWriter& JsonWriter::value(ferry::core::i64 v) {
        before_value();
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(v));
        out_.append(buf);
        return *this;
    }

    JsonWriter& JsonWriter::value(ferry::core::u32 v) {
        return value(static_cast<ferry::core::u64>(v));
    }

    JsonWriter& JsonWriter::value(bool v) {
        before_value();
        out_.append(v ? "true" : "false");
        return *this;
    }

    JsonWriter& JsonWriter::null() {
        before_value();
        out_.append("null");
        return *this;
    }
} // namespace ferry::net
