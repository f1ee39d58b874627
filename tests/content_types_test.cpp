#include <gtest/gtest.h>

#include "dash/content_types.h"

using dash::ContentTypeTable;

TEST(ContentTypeTable, DashManifest) {
    auto table = ContentTypeTable::default_table();
    EXPECT_EQ(table.lookup("/test_data/bunny/stream.mpd"), "application/dash+xml");
}

TEST(ContentTypeTable, DefaultEntries) {
    auto table = ContentTypeTable::default_table();
    EXPECT_EQ(table.lookup("/offline.manifest"), "text/cache-manifest");
    EXPECT_EQ(table.lookup("/index.html"), "text/html");
    EXPECT_EQ(table.lookup("/poster.png"), "image/png");
    EXPECT_EQ(table.lookup("/poster.jpg"), "image/jpg");
    EXPECT_EQ(table.lookup("/poster.jpeg"), "image/jpeg");
    EXPECT_EQ(table.lookup("/logo.svg"), "image/svg+xml");
    EXPECT_EQ(table.lookup("/style.css"), "text/css");
    EXPECT_EQ(table.lookup("/player.js"), "application/x-javascript");
    EXPECT_EQ(table.size(), 10u);
}

TEST(ContentTypeTable, UnknownExtensionUsesFallback) {
    auto table = ContentTypeTable::default_table();
    EXPECT_EQ(table.lookup("/test_data/bunny/chunk-1.m4s"), "application/octet-stream");
    EXPECT_EQ(table.lookup("/notes.txt"), "application/octet-stream");
    EXPECT_EQ(table.lookup("/trailing."), "application/octet-stream");
}

TEST(ContentTypeTable, ExtensionlessFile) {
    auto table = ContentTypeTable::default_table();
    EXPECT_EQ(table.lookup("/test_data/bunny/init"), "application/octet-stream");
    EXPECT_EQ(table.lookup("README"), "application/octet-stream");
}

TEST(ContentTypeTable, DotsInDirectoriesAreIgnored) {
    auto table = ContentTypeTable::default_table();
    EXPECT_EQ(table.lookup("/assets.html/segment"), "application/octet-stream");
    EXPECT_EQ(table.lookup("./site/index.html"), "text/html");
}

TEST(ContentTypeTable, LeadingDotIsNotAnExtension) {
    EXPECT_EQ(ContentTypeTable::extension_of("/.css"), "");
    EXPECT_EQ(ContentTypeTable::extension_of("/..mpd"), "");
    EXPECT_EQ(ContentTypeTable::extension_of("/.hidden.css"), ".css");
    EXPECT_EQ(ContentTypeTable::extension_of("/archive.tar.gz"), ".gz");
}

TEST(ContentTypeTable, CaseInsensitiveSecondPass) {
    auto table = ContentTypeTable::default_table();
    EXPECT_EQ(table.lookup("/STREAM.MPD"), "application/dash+xml");
    EXPECT_EQ(table.lookup("/Index.Html"), "text/html");
}

TEST(ContentTypeTable, CustomTableIsIndependent) {
    ContentTypeTable custom({{".m4s", "video/iso.segment"}, {"", "text/plain"}}, "application/x-unknown");
    EXPECT_EQ(custom.lookup("/seg.m4s"), "video/iso.segment");
    EXPECT_EQ(custom.lookup("/noext"), "text/plain");
    EXPECT_EQ(custom.lookup("/stream.mpd"), "application/x-unknown");
    EXPECT_EQ(custom.fallback(), "application/x-unknown");

    // the default table is not affected by other instances
    EXPECT_EQ(ContentTypeTable::default_table().lookup("/seg.m4s"), "application/octet-stream");
}
