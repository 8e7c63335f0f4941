#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ferry/core/types.hpp"

namespace ferry::net {
    // Append-only JSON builder for response bodies.
    class JsonWriter {
    public:
        JsonWriter& begin_object();
        JsonWriter& end_object();
        JsonWriter& begin_array();
        JsonWriter& end_array();
        JsonWriter& key(std::string_view name);

        JsonWriter& value(std::string_view v);
        JsonWriter& value(const char* v);
        JsonWriter& value(ferry::core::u64 v);
        JsonWriter& value(ferry::core::i64 v);
        JsonWriter& value(ferry::core::u32 v);
        JsonWriter& value(bool v);
        JsonWriter& null();

        template <typename T>
        JsonWriter& field(std::string_view name, T v) {
            key(name);
            return value(v);
        }

        [[nodiscard]] const std::string& str() const noexcept { return out_; }
        [[nodiscard]] std::string take() { return std::move(out_); }

    private:
        void before_value();

        std::string out_;
        std::vector<bool> first_;
        bool after_key_{false};
    };

    void json_escape_into(std::string_view in, std::string* out);
} // namespace ferry::net
