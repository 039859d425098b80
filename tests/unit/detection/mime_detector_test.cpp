#include "test_helpers.h"
#include <gtest/gtest.h>
#include <kreuzberg/detection/mime_detector.h>

using namespace kreuzberg;
using namespace kreuzberg::detection;
using namespace kreuzberg::test;

class MimeDetectorTest : public KreuzbergTest {
protected:
    void SetUp() override {
        KreuzbergTest::SetUp();
        // Built-in table only, so results do not depend on the local magic database
        MimeDetectorConfig config;
        config.useLibMagic = false;
        ASSERT_TRUE(MimeDetector::instance().initialize(config));
    }

    void TearDown() override {
        ASSERT_TRUE(MimeDetector::instance().initialize());
        KreuzbergTest::TearDown();
    }

    static ByteVector bytes(std::initializer_list<int> values) {
        ByteVector out;
        for (int v : values)
            out.push_back(static_cast<std::uint8_t>(v));
        return out;
    }
};

TEST_F(MimeDetectorTest, DetectsMagicNumbers) {
    auto& detector = MimeDetector::instance();
    EXPECT_EQ(detector.detectFromBuffer(bytes({0xFF, 0xD8, 0xFF, 0xE0})).mimeType, "image/jpeg");
    EXPECT_EQ(detector.detectFromBuffer(bytes({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A}))
                  .mimeType,
              "image/png");
    EXPECT_EQ(detector.detectFromBuffer(asBytes("%PDF-1.7\n")).mimeType, "application/pdf");
    EXPECT_EQ(detector.detectFromBuffer(bytes({0x1F, 0x8B, 0x08})).mimeType, "application/gzip");
}

TEST_F(MimeDetectorTest, TextHeuristics) {
    auto& detector = MimeDetector::instance();
    EXPECT_EQ(detector.detectFromBuffer(asBytes(R"({"a": [1, 2]})")).mimeType,
              "application/json");
    EXPECT_EQ(detector.detectFromBuffer(asBytes("<!DOCTYPE html><html></html>")).mimeType,
              "text/html");
    EXPECT_EQ(detector.detectFromBuffer(asBytes("<?xml version=\"1.0\"?><svg/>")).mimeType,
              "image/svg+xml");
    EXPECT_EQ(detector.detectFromBuffer(asBytes("<?xml version=\"1.0\"?><root/>")).mimeType,
              "application/xml");
    EXPECT_EQ(detector.detectFromBuffer(asBytes("Just some words.\n")).mimeType, "text/plain");
}

TEST_F(MimeDetectorTest, InvalidJsonFallsThroughToText) {
    auto sig = MimeDetector::instance().detectFromBuffer(asBytes("{ not json"));
    EXPECT_EQ(sig.mimeType, "text/plain");
    EXPECT_FALSE(sig.isBinary);
}

TEST_F(MimeDetectorTest, UnknownBinaryIsOctetStream) {
    auto sig = MimeDetector::instance().detectFromBuffer(bytes({0x00, 0x01, 0x02, 0x03, 0x04}));
    EXPECT_EQ(sig.mimeType, kOctetStream);
    EXPECT_TRUE(sig.isBinary);
    EXPECT_LT(sig.confidence, 0.5f);
}

TEST_F(MimeDetectorTest, CacheCountsHits) {
    auto& detector = MimeDetector::instance();
    detector.clearCache();
    auto before = detector.getCacheStats();

    detector.detectFromBuffer(asBytes("%PDF-1.4"));
    detector.detectFromBuffer(asBytes("%PDF-1.4"));

    auto after = detector.getCacheStats();
    EXPECT_EQ(after.hits - before.hits, 1u);
    EXPECT_EQ(after.entries, 1u);
}

TEST_F(MimeDetectorTest, CacheDistinguishesBuffersWithSharedPrefix) {
    auto& detector = MimeDetector::instance();
    detector.clearCache();

    const std::string prefix = "<?xml version=\"1.0\"?><!-- shared leading comment -->";
    const std::string svg = prefix + "<svg/>";
    const std::string doc = prefix + "<doc/>";
    ASSERT_EQ(svg.size(), doc.size());

    EXPECT_EQ(detector.detectFromBuffer(asBytes(svg)).mimeType, "image/svg+xml");
    EXPECT_EQ(detector.detectFromBuffer(asBytes(doc)).mimeType, "application/xml");
    EXPECT_EQ(detector.detectFromBuffer(asBytes(svg)).mimeType, "image/svg+xml");
    EXPECT_EQ(detector.getCacheStats().entries, 2u);

    const std::string arrayJson = R"([1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14])";
    const std::string brokenJson = R"([1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14})";
    ASSERT_EQ(arrayJson.size(), brokenJson.size());
    EXPECT_EQ(detector.detectFromBuffer(asBytes(arrayJson)).mimeType, "application/json");
    EXPECT_EQ(detector.detectFromBuffer(asBytes(brokenJson)).mimeType, "text/plain");
}

TEST_F(MimeDetectorTest, CustomPattern) {
    MagicPattern pattern;
    pattern.patternHex = "4B5A4247";
    pattern.mimeType = "application/x-kzbg";
    pattern.description = "Test container";
    ASSERT_TRUE(MimeDetector::instance().addPattern(pattern));

    auto sig = MimeDetector::instance().detectFromBuffer(asBytes("KZBG payload"));
    EXPECT_EQ(sig.mimeType, "application/x-kzbg");
}

TEST_F(MimeDetectorTest, RejectsInvalidPatterns) {
    MagicPattern noMime;
    noMime.patternHex = "AABB";
    EXPECT_THAT(MimeDetector::instance().addPattern(noMime),
                HasErrorCode(ErrorCode::InvalidArgument));

    MagicPattern badHex;
    badHex.patternHex = "ABC";
    badHex.mimeType = "application/x-bad";
    EXPECT_THAT(MimeDetector::instance().addPattern(badHex),
                HasErrorCode(ErrorCode::InvalidArgument));
}

TEST_F(MimeDetectorTest, FileSignatureBeatsExtension) {
    auto path = writeFile("report.txt", "%PDF-1.5\nbinary follows");
    auto sig = MimeDetector::instance().detectFromFile(path);
    ASSERT_TRUE(sig);
    EXPECT_EQ(sig.value().mimeType, "application/pdf");
}

TEST_F(MimeDetectorTest, ExtensionBeatsTextGuess) {
    auto path = writeFile("notes.md", "# Title\n\nBody text.\n");
    auto sig = MimeDetector::instance().detectFromFile(path);
    ASSERT_TRUE(sig);
    EXPECT_EQ(sig.value().mimeType, "text/markdown");
}

TEST_F(MimeDetectorTest, ZipContainerRefinedByExtension) {
    std::string zip("PK\x03\x04", 4);
    zip += std::string(32, '\0');
    auto path = writeFile("letter.docx", zip);
    auto sig = MimeDetector::instance().detectFromFile(path);
    ASSERT_TRUE(sig);
    EXPECT_EQ(sig.value().mimeType,
              "application/vnd.openxmlformats-officedocument.wordprocessingml.document");
    EXPECT_EQ(sig.value().category, "document");
}

TEST_F(MimeDetectorTest, MissingFileAndDirectory) {
    EXPECT_THAT(MimeDetector::instance().detectFromFile(testDir / "absent.pdf"),
                HasErrorCode(ErrorCode::NotFound));
    EXPECT_THAT(MimeDetector::instance().detectFromFile(testDir),
                HasErrorCode(ErrorCode::IoError));
}

TEST(MimeTablesTest, ExtensionLookup) {
    EXPECT_EQ(MimeDetector::mimeFromExtension("pdf"), "application/pdf");
    EXPECT_EQ(MimeDetector::mimeFromExtension(".PDF"), "application/pdf");
    EXPECT_EQ(MimeDetector::mimeFromExtension("yml"), "application/x-yaml");
    EXPECT_FALSE(MimeDetector::mimeFromExtension("").has_value());
    EXPECT_FALSE(MimeDetector::mimeFromExtension("nope").has_value());
}

TEST(MimeTablesTest, ExtensionsForMimeAreSorted) {
    auto exts = MimeDetector::extensionsForMime("image/jpeg");
    ASSERT_EQ(exts.size(), 2u);
    EXPECT_EQ(exts[0], "jpeg");
    EXPECT_EQ(exts[1], "jpg");
    EXPECT_TRUE(MimeDetector::extensionsForMime("application/x-unknown").empty());
}

TEST(MimeTablesTest, NormalizeMime) {
    EXPECT_EQ(MimeDetector::normalizeMime("APPLICATION/PDF"), "application/pdf");
    EXPECT_EQ(MimeDetector::normalizeMime("text/plain; charset=utf-8"), "text/plain");
    EXPECT_EQ(MimeDetector::normalizeMime("image/x-custom"), "image/x-custom");
    EXPECT_FALSE(MimeDetector::normalizeMime("application/x-unknown").has_value());
    EXPECT_FALSE(MimeDetector::normalizeMime("").has_value());
    EXPECT_TRUE(MimeDetector::isSupportedMime("text/html"));
    EXPECT_FALSE(MimeDetector::isSupportedMime("video/mp4"));
}

TEST(MimeTablesTest, Categories) {
    EXPECT_EQ(MimeDetector::category("image/png"), "image");
    EXPECT_EQ(MimeDetector::category("image/svg+xml"), "image");
    EXPECT_EQ(MimeDetector::category("application/pdf"), "document");
    EXPECT_EQ(MimeDetector::category("application/zip"), "archive");
    EXPECT_EQ(MimeDetector::category("text/markdown"), "text");
    EXPECT_EQ(MimeDetector::category("application/json"), "text");
    EXPECT_EQ(MimeDetector::category("application/x-whatever"), "binary");
    EXPECT_TRUE(MimeDetector::isTextMime("application/json"));
    EXPECT_FALSE(MimeDetector::isTextMime("application/pdf"));
}

TEST(MimeTablesTest, HexHelpers) {
    ByteVector data = {0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(MimeDetector::bytesToHex(data), "deadbeef");
    EXPECT_EQ(MimeDetector::bytesToHex(data, 2), "dead");

    auto parsed = MimeDetector::hexToBytes("DEadbeef");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value(), data);
    EXPECT_FALSE(MimeDetector::hexToBytes("zz"));
}

TEST(MimeTablesTest, Utf8AndBinaryChecks) {
    EXPECT_TRUE(isValidUtf8(asBytes("plain ascii")));
    EXPECT_TRUE(isValidUtf8(asBytes("gr\xC3\xBC\xC3\x9F")));
    EXPECT_FALSE(isValidUtf8(asBytes("\xC3\x28")));
    EXPECT_FALSE(isValidUtf8(asBytes("\xED\xA0\x80"))); // surrogate
    EXPECT_FALSE(isBinaryData(asBytes("hello\nworld\n")));
    std::string withNul("abc\0def", 7);
    EXPECT_TRUE(isBinaryData(asBytes(withNul)));
}

TEST(MimeTablesTest, ExtensionOnlyDetection) {
    EXPECT_EQ(detectMimeTypeFromExtension("doc.xlsx", false).value(),
              "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet");
    EXPECT_THAT(detectMimeTypeFromExtension("README", false),
                HasErrorCode(ErrorCode::ValidationError));
    EXPECT_THAT(detectMimeTypeFromExtension("a.unknownext", false),
                HasErrorCode(ErrorCode::UnsupportedFormat));
    EXPECT_THAT(detectMimeTypeFromExtension("/definitely/missing.pdf", true),
                HasErrorCode(ErrorCode::NotFound));
}
