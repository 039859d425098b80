#include "test_helpers.h"
#include <gtest/gtest.h>
#include <kreuzberg/config/embedding_presets.h>
#include <kreuzberg/config/server_config.h>

#include <cstdlib>

using namespace kreuzberg;
using namespace kreuzberg::config;
using namespace kreuzberg::test;

class ServerConfigTest : public KreuzbergTest {
protected:
    void SetUp() override {
        KreuzbergTest::SetUp();
        clearEnv();
    }

    void TearDown() override {
        clearEnv();
        KreuzbergTest::TearDown();
    }

    static void clearEnv() {
        for (const char* name : {"KREUZBERG_HOST", "KREUZBERG_PORT", "KREUZBERG_CORS_ORIGINS",
                                 "KREUZBERG_MAX_REQUEST_BODY_BYTES",
                                 "KREUZBERG_MAX_MULTIPART_FIELD_BYTES"})
            ::unsetenv(name);
    }
};

TEST_F(ServerConfigTest, DefaultsWithoutFile) {
    auto cfg = ServerConfig::load();
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value(), ServerConfig{});
    EXPECT_EQ(cfg.value().listenAddress(), "127.0.0.1:8000");
}

TEST_F(ServerConfigTest, ReadsServerSectionFromToml) {
    auto path = writeFile("kreuzberg.toml", R"([server]
host = "0.0.0.0"
port = 9000
cors_origins = ["https://a.example", "https://b.example"]
max_request_body_bytes = 1048576
)");
    auto cfg = ServerConfig::load(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().host, "0.0.0.0");
    EXPECT_EQ(cfg.value().port, 9000);
    EXPECT_EQ(cfg.value().cors_origins.size(), 2u);
    EXPECT_EQ(cfg.value().max_request_body_bytes, 1048576u);
}

TEST_F(ServerConfigTest, CorsOriginsAcceptCommaList) {
    auto cfg = ServerConfig::fromJson({{"cors_origins", "https://a.example, https://b.example"}});
    ASSERT_TRUE(cfg);
    ASSERT_EQ(cfg.value().cors_origins.size(), 2u);
    EXPECT_EQ(cfg.value().cors_origins[1], "https://b.example");
}

TEST_F(ServerConfigTest, EnvironmentOverridesFile) {
    auto path = writeFile("server.yaml", "server:\n  host: filehost\n  port: 7000\n");
    ::setenv("KREUZBERG_PORT", "7100", 1);
    ::setenv("KREUZBERG_CORS_ORIGINS", "*", 1);

    auto cfg = ServerConfig::load(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().host, "filehost");
    EXPECT_EQ(cfg.value().port, 7100);
    ASSERT_EQ(cfg.value().cors_origins.size(), 1u);
    EXPECT_EQ(cfg.value().cors_origins[0], "*");
}

TEST_F(ServerConfigTest, BadEnvironmentNumbersAreRejected) {
    ::setenv("KREUZBERG_PORT", "99999", 1);
    EXPECT_THAT(ServerConfig::load(), HasErrorCode(ErrorCode::ValidationError));

    ::setenv("KREUZBERG_PORT", "8080", 1);
    ::setenv("KREUZBERG_MAX_REQUEST_BODY_BYTES", "-5", 1);
    EXPECT_THAT(ServerConfig::load(), HasErrorCode(ErrorCode::ValidationError));
}

TEST_F(ServerConfigTest, PortOutOfRangeInFile) {
    EXPECT_THAT(ServerConfig::fromJson({{"server", {{"port", 70000}}}}),
                HasErrorCode(ErrorCode::ValidationError));
}

TEST_F(ServerConfigTest, NegativeOrFractionalNumbersInFile) {
    EXPECT_THAT(ServerConfig::fromJson({{"server", {{"max_request_body_bytes", -1}}}}),
                HasErrorCode(ErrorCode::ValidationError));
    EXPECT_THAT(ServerConfig::fromJson({{"server", {{"max_multipart_field_bytes", 1.5}}}}),
                HasErrorCode(ErrorCode::ValidationError));
    EXPECT_THAT(ServerConfig::fromJson({{"server", {{"port", 8080.5}}}}),
                HasErrorCode(ErrorCode::ValidationError));
}

TEST_F(ServerConfigTest, ZeroLimitsFailValidation) {
    ServerConfig cfg;
    cfg.max_multipart_field_bytes = 0;
    EXPECT_THAT(cfg.validate(), HasErrorCode(ErrorCode::ValidationError));
}

TEST(EmbeddingPresetTest, BuiltInPresets) {
    const auto& presets = embeddingPresets();
    ASSERT_EQ(presets.size(), 4u);

    const auto* balanced = findEmbeddingPreset("balanced");
    ASSERT_NE(balanced, nullptr);
    EXPECT_EQ(balanced->chunk_size, 1024);
    EXPECT_EQ(balanced->dimensions, 768);

    EXPECT_EQ(findEmbeddingPreset("Balanced"), nullptr);
    EXPECT_EQ(findEmbeddingPreset("nope"), nullptr);
}

TEST(EmbeddingPresetTest, PresetOverlapFitsChunk) {
    for (const auto& preset : embeddingPresets())
        EXPECT_LT(preset.overlap, preset.chunk_size) << preset.name;
}
