#include <string>

#include <gtest/gtest.h>

#include "ferry/net/json.hpp"

using ferry::net::JsonWriter;

TEST(JsonWriter, NestedObjectsAndArrays) {
    JsonWriter w;
    w.begin_object()
        .field("success", true)
        .field("count", ferry::core::u64{3})
        .field("delta", ferry::core::i64{-2})
        .key("items").begin_array()
            .value("a")
            .begin_object().field("n", ferry::core::u32{1}).end_object()
            .null()
        .end_array()
    .end_object();
    EXPECT_EQ(w.str(), "{\"success\":true,\"count\":3,\"delta\":-2,\"items\":[\"a\",{\"n\":1},null]}");
}

TEST(JsonWriter, EscapesStrings) {
    JsonWriter w;
    w.begin_object().field("name", "say \"hi\"\n\\ \x01").end_object();
    EXPECT_EQ(w.str(), "{\"name\":\"say \\\"hi\\\"\\n\\\\ \\u0001\"}");
}

TEST(JsonWriter, EmptyContainers) {
    JsonWriter w;
    w.begin_object().key("files").begin_array().end_array().end_object();
    EXPECT_EQ(w.take(), "{\"files\":[]}");
}
