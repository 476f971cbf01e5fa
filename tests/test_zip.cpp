// ═══════════════════════════════════════════════════════════════════
//  test_zip.cpp — Tests for the streaming zip encoder
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <lanserve/zip.h>
#include "archive_reader.h"

using namespace lanserve;

TEST(ZipTest, DeflatedFileRoundTrip) {
    std::string content(5000, 'z');

    io::StringWriter out;
    zip::Writer zw(out);
    zw.createEntry({"dir/", zip::Method::Store, 0755, 1700000000});
    zw.createEntry({"dir/file.txt", zip::Method::Deflate, 0644, 1700000000});
    zw.write(content);
    zw.close();

    auto entries = test::readZip(out.str());
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].name, "dir/");
    EXPECT_EQ(entries[0].method, 0);
    EXPECT_EQ(entries[0].content, "");

    EXPECT_EQ(entries[1].name, "dir/file.txt");
    EXPECT_EQ(entries[1].method, 8);
    EXPECT_EQ(entries[1].content, content);
    EXPECT_EQ(entries[1].crc, compress::crc32(0, content.data(), content.size()));
}

TEST(ZipTest, StoredFileRoundTrip) {
    io::StringWriter out;
    zip::Writer zw(out);
    zw.createEntry({"plain.bin", zip::Method::Store});
    zw.write("raw bytes");
    zw.close();

    auto entries = test::readZip(out.str());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].method, 0);
    EXPECT_EQ(entries[0].content, "raw bytes");
}

TEST(ZipTest, EmptyFile) {
    io::StringWriter out;
    zip::Writer zw(out);
    zw.createEntry({"empty.txt"});
    zw.close();

    auto entries = test::readZip(out.str());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].content, "");
    EXPECT_EQ(entries[0].crc, 0u);
}

TEST(ZipTest, DirectoryAttributesMarkDirectory) {
    io::StringWriter out;
    zip::Writer zw(out);
    zw.createEntry({"folder/", zip::Method::Store, 0755});
    zw.close();

    auto entries = test::readZip(out.str());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].externalAttrs & 0x10u, 0x10u);
    EXPECT_EQ((entries[0].externalAttrs >> 16) & 0170000u, 0040000u);
}

TEST(ZipTest, EmptyArchiveIsJustEndRecord) {
    io::StringWriter out;
    zip::Writer zw(out);
    zw.close();

    EXPECT_EQ(out.str().size(), 22u);
    EXPECT_TRUE(test::readZip(out.str()).empty());
}

TEST(ZipTest, WriteAfterCloseThrows) {
    io::StringWriter out;
    zip::Writer zw(out);
    zw.close();
    EXPECT_THROW(zw.createEntry({"late.txt"}), std::exception);
}
