#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <kreuzberg/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace kreuzberg::test {

// Base fixture owning a scratch directory
class KreuzbergTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / generateTestId();
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    std::filesystem::path writeFile(std::string_view name, std::string_view content) {
        auto path = testDir / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();
        if (!file)
            throw std::runtime_error("Failed to create test file");
        return path;
    }

    static std::vector<std::byte> generateRandomBytes(size_t size) {
        static std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<std::byte> data;
        data.reserve(size);
        for (size_t i = 0; i < size; ++i)
            data.push_back(static_cast<std::byte>(dist(rng)));
        return data;
    }

protected:
    std::filesystem::path testDir;

private:
    static std::string generateTestId() {
        static std::mt19937_64 rng{std::random_device{}()};
        auto now = std::chrono::system_clock::now().time_since_epoch().count();
        return "kreuzberg_test_" + std::to_string(now) + "_" + std::to_string(rng());
    }
};

inline ByteSpan asBytes(std::string_view text) {
    return ByteSpan(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

MATCHER_P(HasErrorCode, code, "Result has expected error code") {
    return !arg.has_value() && arg.error().code == code;
}

struct TestVectors {
    static constexpr std::string_view EMPTY_SHA256 =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    static constexpr std::string_view ABC_SHA256 =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

    static constexpr std::string_view HELLO_WORLD_SHA256 =
        "a591a6d40bf420404a011733cfb7b190d62c65bf0bcda32b57b277d9ad9f146e";
};

} // namespace kreuzberg::test
