#include <gtest/gtest.h>
#include <kreuzberg/core/error_state.h>

#include <nlohmann/json.hpp>

#include <string>
#include <thread>

using namespace kreuzberg;
using namespace kreuzberg::core;

class ErrorStateTest : public ::testing::Test {
protected:
    void SetUp() override { ErrorState::clear(); }
    void TearDown() override { ErrorState::clear(); }
};

TEST_F(ErrorStateTest, ClearedSlotReportsSuccess) {
    EXPECT_EQ(ErrorState::code(), ErrorCode::Success);
    EXPECT_EQ(ErrorState::message(), nullptr);
    EXPECT_FALSE(ErrorState::details().isPanic);
}

TEST_F(ErrorStateTest, SetRecordsMessageAndCode) {
    ErrorState::set({ErrorCode::IoError, "file not found: /nope"}, "kreuzberg_extract_file_sync");

    EXPECT_EQ(ErrorState::code(), ErrorCode::IoError);
    ASSERT_NE(ErrorState::message(), nullptr);
    EXPECT_STREQ(ErrorState::message(), "file not found: /nope");

    auto details = ErrorState::details();
    EXPECT_EQ(details.sourceFunction, "kreuzberg_extract_file_sync");
    EXPECT_FALSE(details.isPanic);
}

TEST_F(ErrorStateTest, InternalCodesCollapseOntoAbiCodes) {
    ErrorState::set({ErrorCode::ValidationError, "chunk overlap too large"});
    EXPECT_EQ(ErrorState::code(), ErrorCode::InvalidArgument);

    ErrorState::set({ErrorCode::PluginError, "callback failed"});
    EXPECT_EQ(ErrorState::code(), ErrorCode::GenericError);

    ErrorState::set({ErrorCode::UnsupportedFormat, "no extractor"});
    EXPECT_EQ(ErrorState::code(), ErrorCode::MissingDependency);

    ErrorState::set({ErrorCode::NotFound, "missing"});
    EXPECT_EQ(ErrorState::code(), ErrorCode::IoError);
}

TEST_F(ErrorStateTest, EmptyMessageFallsBackToCodeName) {
    ErrorState::set(Error{ErrorCode::OcrError, ""});
    ASSERT_NE(ErrorState::message(), nullptr);
    EXPECT_STREQ(ErrorState::message(), "OCR error");
}

TEST_F(ErrorStateTest, PanicCapturesContext) {
    ErrorState::setPanic("boom", "kreuzberg_extract_bytes_sync", "ffi_extraction.cpp", 42);

    EXPECT_EQ(ErrorState::code(), ErrorCode::Panic);
    auto details = ErrorState::details();
    EXPECT_TRUE(details.isPanic);
    EXPECT_EQ(details.lineNumber, 42u);
    EXPECT_EQ(details.sourceFile, "ffi_extraction.cpp");

    auto ctx = ErrorState::panicContext();
    ASSERT_TRUE(ctx.has_value());
    auto parsed = nlohmann::json::parse(ctx->toJson());
    EXPECT_EQ(parsed["message"], "boom");
    EXPECT_EQ(parsed["function"], "kreuzberg_extract_bytes_sync");
    EXPECT_EQ(parsed["line"], 42);
    EXPECT_GT(parsed["timestamp_ms"].get<std::uint64_t>(), 0u);
}

TEST_F(ErrorStateTest, PanicContextSurvivesClear) {
    ErrorState::setPanic("boom", "fn", "file.cpp", 1);
    ErrorState::clear();

    EXPECT_EQ(ErrorState::code(), ErrorCode::Success);
    EXPECT_TRUE(ErrorState::panicContext().has_value());
}

TEST_F(ErrorStateTest, ContextInfoIsResetBySet) {
    ErrorState::set({ErrorCode::IoError, "unreadable"});
    ErrorState::setContextInfo("/tmp/doc.pdf");
    EXPECT_EQ(ErrorState::details().contextInfo, "/tmp/doc.pdf");

    ErrorState::set({ErrorCode::ParsingError, "bad"});
    EXPECT_TRUE(ErrorState::details().contextInfo.empty());
}

TEST_F(ErrorStateTest, SlotsAreThreadLocal) {
    ErrorState::set({ErrorCode::IoError, "main thread"});

    ErrorCode seen = ErrorCode::GenericError;
    const char* seenMessage = "unset";
    std::thread worker([&] {
        seen = ErrorState::code();
        seenMessage = ErrorState::message();
        ErrorState::set({ErrorCode::ParsingError, "worker"});
    });
    worker.join();

    EXPECT_EQ(seen, ErrorCode::Success);
    EXPECT_EQ(seenMessage, nullptr);
    EXPECT_EQ(ErrorState::code(), ErrorCode::IoError);
    EXPECT_STREQ(ErrorState::message(), "main thread");
}
