// ═══════════════════════════════════════════════════════════════════
//  test_handler.cpp — Tests for the download handler
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <lanserve/handler.h>
#include <lanserve/testing.h>
#include "archive_reader.h"

#include <filesystem>
#include <fstream>

using namespace lanserve;
namespace fs = std::filesystem;

namespace {

// Provider whose body fails after `good` bytes
class FailingProvider : public content::ContentProvider {
public:
    explicit FailingProvider(std::string good) : good_(std::move(good)) {}

    std::string filename() const override { return "broken.bin"; }
    std::string contentType() const override { return "application/octet-stream"; }
    std::optional<std::uint64_t> contentLength() const override { return 100; }

    void writeTo(io::Writer& out) const override {
        if (!good_.empty()) out.write(good_);
        throw std::runtime_error("disk read failed");
    }

private:
    std::string good_;
};

} // namespace

class HandlerTest : public ::testing::Test {
protected:
    fs::path base;

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        base = fs::temp_directory_path() / ("lanserve_handler_" + std::string(info->name()));
        fs::remove_all(base);
        fs::create_directories(base / "testdir" / "subdir");
        std::ofstream(base / "hello.txt", std::ios::binary) << "Hello, World!";
        std::ofstream(base / "testdir" / "file1.txt", std::ios::binary) << "file one";
        std::ofstream(base / "testdir" / "subdir" / "file2.txt", std::ios::binary) << "file two";
    }

    void TearDown() override {
        fs::remove_all(base);
    }

    std::shared_ptr<const content::ContentProvider> provider(const std::string& name,
                                                             archive::Kind kind = archive::Kind::TarGz) {
        auto spec = content::ContentSpec::fromPath((base / name).string(), kind);
        return content::makeProvider(spec);
    }
};

TEST_F(HandlerTest, ServesSingleFileAndReachesLimit) {
    auto life = std::make_shared<lifecycle::Lifecycle>(1);
    DownloadHandler handler(provider("hello.txt"), life);

    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    auto req = lanserve::testing::createRequest();
    handler(req, res);

    EXPECT_EQ(out.status, 200);
    EXPECT_EQ(out.contentLength, 13u);
    EXPECT_NE(out.header("Content-Disposition").find("hello.txt"), std::string::npos);
    EXPECT_EQ(out.header("Content-Type"), "text/plain; charset=utf-8");
    EXPECT_EQ(out.body, "Hello, World!");
    EXPECT_TRUE(out.finished);

    EXPECT_TRUE(life->signal.raised());
    EXPECT_EQ(life->signal.trigger(), lifecycle::Trigger::LimitReached);
    EXPECT_EQ(life->active.count(), 0u);
}

TEST_F(HandlerTest, AnyMethodAndPathGetTheContent) {
    auto life = std::make_shared<lifecycle::Lifecycle>(0);
    DownloadHandler handler(provider("hello.txt"), life);

    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    auto req = lanserve::testing::createRequest("POST", "/some/other/path?x=1");
    handler(req, res);

    EXPECT_EQ(out.status, 200);
    EXPECT_EQ(out.body, "Hello, World!");
    EXPECT_EQ(life->limit.completed(), 1u);
    EXPECT_FALSE(life->signal.raised());
}

TEST_F(HandlerTest, DirectoryIsStreamedAsArchiveWithoutLength) {
    auto life = std::make_shared<lifecycle::Lifecycle>(0);
    DownloadHandler handler(provider("testdir", archive::Kind::TarGz), life);

    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    auto req = lanserve::testing::createRequest();
    handler(req, res);

    EXPECT_EQ(out.status, 200);
    EXPECT_FALSE(out.contentLength.has_value());
    EXPECT_EQ(out.header("Content-Type"), "application/gzip");
    EXPECT_EQ(out.header("Content-Disposition"), "attachment; filename=\"testdir.tar.gz\"");

    auto entries = test::readTar(test::gunzip(out.body));
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].name, "testdir");
    EXPECT_EQ(entries[1].name, "testdir/file1.txt");
    EXPECT_EQ(entries[2].name, "testdir/subdir");
    EXPECT_EQ(entries[3].name, "testdir/subdir/file2.txt");
}

TEST_F(HandlerTest, FailureBeforeFirstByteSends500AndDoesNotCount) {
    auto life = std::make_shared<lifecycle::Lifecycle>(1);
    DownloadHandler handler(std::make_shared<FailingProvider>(""), life);

    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    auto req = lanserve::testing::createRequest();
    handler(req, res);

    EXPECT_EQ(out.status, 500);
    EXPECT_EQ(out.body, "Internal Server Error");
    EXPECT_EQ(out.header("Content-Disposition"), "");
    EXPECT_EQ(life->limit.completed(), 0u);
    EXPECT_FALSE(life->signal.raised());
    EXPECT_EQ(life->active.count(), 0u);
}

TEST_F(HandlerTest, FailureMidStreamAbandonsResponse) {
    auto life = std::make_shared<lifecycle::Lifecycle>(1);
    DownloadHandler handler(std::make_shared<FailingProvider>("partial"), life);

    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    auto req = lanserve::testing::createRequest();
    handler(req, res);

    EXPECT_EQ(out.status, 200);
    EXPECT_EQ(out.body, "partial");
    EXPECT_FALSE(out.finished);
    EXPECT_FALSE(res.finished());
    EXPECT_EQ(life->limit.completed(), 0u);
    EXPECT_EQ(life->active.count(), 0u);
}

TEST_F(HandlerTest, ClientDisconnectDoesNotCount) {
    std::string big(100000, 'b');
    std::ofstream(base / "big.bin", std::ios::binary) << big;

    auto life = std::make_shared<lifecycle::Lifecycle>(1);
    DownloadHandler handler(provider("big.bin"), life);

    lanserve::testing::CaptureWriter out;
    out.failAfter = 40000;
    http::Response res(out);
    auto req = lanserve::testing::createRequest();
    handler(req, res);

    EXPECT_LT(out.body.size(), big.size());
    EXPECT_EQ(life->limit.completed(), 0u);
    EXPECT_FALSE(life->signal.raised());
}

TEST_F(HandlerTest, FileGrownSinceStartupIsNotOverSentOrCounted) {
    auto life = std::make_shared<lifecycle::Lifecycle>(1);
    DownloadHandler handler(provider("hello.txt"), life);
    std::ofstream(base / "hello.txt", std::ios::binary | std::ios::app) << " appended after start";

    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    auto req = lanserve::testing::createRequest();
    handler(req, res);

    EXPECT_LE(out.body.size(), 13u);
    EXPECT_EQ(out.body.find("appended"), std::string::npos);
    EXPECT_FALSE(res.finished());
    EXPECT_EQ(life->limit.completed(), 0u);
    EXPECT_FALSE(life->signal.raised());
    EXPECT_EQ(life->active.count(), 0u);
}

TEST_F(HandlerTest, FileShrunkSinceStartupIsNotCounted) {
    auto life = std::make_shared<lifecycle::Lifecycle>(1);
    DownloadHandler handler(provider("hello.txt"), life);
    std::ofstream(base / "hello.txt", std::ios::binary | std::ios::trunc) << "Hello";

    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    auto req = lanserve::testing::createRequest();
    handler(req, res);

    EXPECT_EQ(out.status, 200);
    EXPECT_EQ(out.contentLength, 13u);
    EXPECT_EQ(out.body, "Hello");
    EXPECT_FALSE(out.finished);
    EXPECT_EQ(life->limit.completed(), 0u);
    EXPECT_FALSE(life->signal.raised());
}

TEST_F(HandlerTest, ActiveCountIsHeldDuringTransfer) {
    auto life = std::make_shared<lifecycle::Lifecycle>(0);

    class ActiveCountProvider : public content::ContentProvider {
    public:
        explicit ActiveCountProvider(lifecycle::Lifecycle& life) : life_(life) {}
        std::string filename() const override { return "active.txt"; }
        std::string contentType() const override { return "text/plain"; }
        std::optional<std::uint64_t> contentLength() const override { return std::nullopt; }
        void writeTo(io::Writer& out) const override {
            out.write(std::to_string(life_.active.count()));
        }
    private:
        lifecycle::Lifecycle& life_;
    };

    DownloadHandler handler(std::make_shared<ActiveCountProvider>(*life), life);
    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    auto req = lanserve::testing::createRequest();
    handler(req, res);

    EXPECT_EQ(out.body, "1");
    EXPECT_EQ(life->active.count(), 0u);
}

TEST(ContentDispositionTest, EscapesQuotesAndBackslashes) {
    EXPECT_EQ(contentDisposition("plain.txt"), "attachment; filename=\"plain.txt\"");
    EXPECT_EQ(contentDisposition("say \"hi\".txt"), "attachment; filename=\"say \\\"hi\\\".txt\"");
    EXPECT_EQ(contentDisposition("a\\b"), "attachment; filename=\"a\\\\b\"");
}

// ── Response framing through the capture writer ──

TEST(ResponseTest, HeadersAreSentLazilyOnFirstWrite) {
    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    res.status(201).set("X-Test", "1");
    EXPECT_FALSE(res.headersSent());
    EXPECT_FALSE(out.headWritten);

    res.write("abc");
    EXPECT_TRUE(res.headersSent());
    EXPECT_EQ(out.status, 201);
    EXPECT_EQ(out.header("X-Test"), "1");
    EXPECT_EQ(res.bytesWritten(), 3u);
}

TEST(ResponseTest, EndWithoutBodyStillSendsHeaders) {
    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    res.length(0);
    res.end();
    EXPECT_TRUE(out.headWritten);
    EXPECT_TRUE(out.finished);
    EXPECT_EQ(out.contentLength, 0u);
}

TEST(ResponseTest, WriteAfterEndThrows) {
    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    res.send("done");
    EXPECT_THROW(res.write("more"), std::logic_error);
}

TEST(ResponseTest, WritePastDeclaredLengthThrowsAndSendsNothing) {
    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    res.length(4);
    res.write("abc");
    EXPECT_THROW(res.write("de"), std::runtime_error);
    EXPECT_EQ(out.body, "abc");
    EXPECT_EQ(res.bytesWritten(), 3u);

    res.write("d");
    res.end();
    EXPECT_TRUE(out.finished);
}

TEST(ResponseTest, EndBeforeDeclaredLengthThrows) {
    lanserve::testing::CaptureWriter out;
    http::Response res(out);
    res.length(10);
    res.write("short");
    EXPECT_THROW(res.end(), std::runtime_error);
    EXPECT_FALSE(res.finished());
    EXPECT_FALSE(out.finished);
}

TEST(RequestTest, HeaderLookupIsCaseInsensitiveWithNonAsciiNames) {
    auto req = lanserve::testing::createRequest("GET", "/", {{"X-Caf\xC3\xA9-Tag", "yes"}});
    EXPECT_EQ(req.header("x-caf\xC3\xA9-tag"), "yes");
    EXPECT_EQ(req.header("X-CAF\xC3\xA9-TAG"), "yes");
    EXPECT_EQ(req.header("X-Caf\xC3\x89-Tag"), "");
}
