#pragma once
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <random>
#include "common/db.hpp"

namespace gridlite::test {

    inline Bytes to_bytes(std::string_view s) {
        return Bytes(s.begin(), s.end());
    }

    inline std::string to_str(const Bytes& b) {
        return std::string(b.begin(), b.end());
    }

    // Deterministic pseudo-random payload
    inline std::string pattern(size_t n, uint32_t seed = 42) {
        std::mt19937 rng(seed);
        std::string s(n, '\0');
        for (auto& c : s) c = static_cast<char>(rng() & 0xFF);
        return s;
    }

    class StoreTest : public ::testing::Test {
    protected:
        void SetUp() override {
            ASSERT_TRUE(db.open(":memory:"));
        }

        Database db;
    };

} // namespace gridlite::test
