#include <array>
#include <cstddef>
#include <cstdio>
#include <string>

#include <gtest/gtest.h>

#include "ferry/storage/hashing.hpp"
#include "test_support.hpp"

static void expect_hash_eq(const ferry::core::Hash256& got, const std::array<unsigned char, 32>& exp) {
    for (size_t i = 0; i < 32; ++i) {
        EXPECT_EQ(got.b[i], static_cast<ferry::core::u8>(exp[i])) << "byte " << i;
    }
}

TEST(StorageHashing, EmptyVector) {
    ferry::core::Hash256 out{};
    const ferry::core::Status s = ferry::storage::hash_compute({nullptr, 0}, &out);
    EXPECT_EQ(s.code, ferry::core::StatusCode::Ok);

    // BLAKE3("") 32-byte output
    const std::array<unsigned char, 32> expected = {
        0xaf, 0x13, 0x49, 0xb9, 0xf5, 0xf9, 0xa1, 0xa6,
        0xa0, 0x40, 0x4d, 0xea, 0x36, 0xdc, 0xc9, 0x49,
        0x9b, 0xcb, 0x25, 0xc9, 0xad, 0xc1, 0x12, 0xb7,
        0xcc, 0x9a, 0x93, 0xca, 0xe4, 0x1f, 0x32, 0x62,
    };

    expect_hash_eq(out, expected);
}

TEST(StorageHashing, DeterministicAndDifferent) {
    const unsigned char abc[] = {'a', 'b', 'c'};
    const unsigned char abd[] = {'a', 'b', 'd'};

    ferry::core::Hash256 h1{};
    ferry::core::Hash256 h2{};
    ferry::core::Hash256 h3{};

    EXPECT_EQ(ferry::storage::hash_compute({reinterpret_cast<const ferry::storage::u8*>(abc), 3}, &h1).code,
              ferry::core::StatusCode::Ok);
    EXPECT_EQ(ferry::storage::hash_compute({reinterpret_cast<const ferry::storage::u8*>(abc), 3}, &h2).code,
              ferry::core::StatusCode::Ok);
    EXPECT_EQ(ferry::storage::hash_compute({reinterpret_cast<const ferry::storage::u8*>(abd), 3}, &h3).code,
              ferry::core::StatusCode::Ok);

    EXPECT_EQ(h1.b, h2.b);
    EXPECT_NE(h1.b, h3.b);
}


TEST(StorageHashing, InvalidWhenOutNull) {
    const ferry::core::Status s = ferry::storage::hash_compute({nullptr, 0}, nullptr);
    EXPECT_EQ(s.domain, ferry::core::StatusDomain::Storage);
    EXPECT_EQ(s.code, ferry::core::StatusCode::Invalid);
}

TEST(StorageHashing, InvalidWhenDataNullButLenNonZero) {
    ferry::core::Hash256 out{};
    const ferry::core::Status s = ferry::storage::hash_compute({nullptr, 1}, &out);
    EXPECT_EQ(s.domain, ferry::core::StatusDomain::Storage);
    EXPECT_EQ(s.code, ferry::core::StatusCode::Invalid);
}

TEST(StorageHashing, FileHashMatchesBufferHash) {
    ferry::test::TempDir dir;
    const auto data = ferry::test::pattern_bytes(10000, 3);
    const std::string path = dir.sub("blob.bin");
    std::FILE* f = std::fopen(path.c_str(), "wb");
    ASSERT_NE(f, nullptr);
    ASSERT_EQ(std::fwrite(data.data(), 1, data.size(), f), data.size());
    std::fclose(f);

    ferry::core::Hash256 from_buffer{};
    ferry::core::Hash256 from_file{};
    ferry::core::u64 size = 0;
    ASSERT_TRUE(ferry::core::is_ok(ferry::storage::hash_compute(ferry::test::view(data), &from_buffer)));
    ASSERT_TRUE(ferry::core::is_ok(ferry::storage::hash_file(path.c_str(), &from_file, &size)));
    EXPECT_EQ(from_buffer, from_file);
    EXPECT_EQ(size, data.size());

    const std::string hex = ferry::storage::hash_to_hex(from_file);
    ASSERT_EQ(hex.size(), 64u);
    for (char c : hex) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
    EXPECT_FALSE(ferry::storage::hash_is_zero(from_file));
}

TEST(StorageHashing, MissingFileIsNotFound) {
    ferry::core::Hash256 out{};
    const ferry::core::Status s = ferry::storage::hash_file("/nonexistent/ferry/file", &out, nullptr);
    EXPECT_EQ(s.code, ferry::core::StatusCode::NotFound);
}
