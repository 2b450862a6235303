#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "catalog.hpp"
#include "protocol/base64.hpp"
#include "security.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using testing_support::make_bytes;
using testing_support::make_file;
using transfer::Catalog;
using transfer::CatalogError;

TEST(CatalogTest, AppliesNameAndCountLimitsInOrder) {
    config::Settings settings;
    Catalog catalog({make_file("a.txt", 10), make_file("toolongname.txt", 10), make_file("b.txt", 10),
                     make_file("c.txt", 10), make_file("d.txt", 10), make_file("e.txt", 10)},
                    settings);

    std::vector<protocol::FileEntry> listed = catalog.list();
    ASSERT_EQ(listed.size(), 4u);
    EXPECT_EQ(listed[0].name, "a.txt");
    EXPECT_EQ(listed[1].name, "b.txt");
    EXPECT_EQ(listed[2].name, "c.txt");
    EXPECT_EQ(listed[3].name, "d.txt");

    ASSERT_EQ(catalog.warnings().size(), 2u);
    EXPECT_EQ(catalog.warnings()[0], "Skipping: toolongname.txt (filename too long, max 10 chars)");
    EXPECT_EQ(catalog.warnings()[1], "Skipping: e.txt (file limit reached, max 4 files)");
}

TEST(CatalogTest, NameAtLimitIsKept) {
    config::Settings settings;
    Catalog catalog({make_file("abcdef.txt", 1)}, settings);
    ASSERT_EQ(catalog.entries().size(), 1u);
    EXPECT_TRUE(catalog.warnings().empty());
}

TEST(CatalogTest, SkipsNamesWithWhitespace) {
    config::Settings settings;
    Catalog catalog({make_file("a b", 1), make_file("ok", 1)}, settings);
    ASSERT_EQ(catalog.entries().size(), 1u);
    EXPECT_EQ(catalog.entries()[0].name, "ok");
    EXPECT_EQ(catalog.warnings().size(), 1u);
}

TEST(CatalogTest, ChunksEncodedContent) {
    config::Settings settings;
    auto bytes = make_bytes(320);
    Catalog catalog({transfer::SourceFile{"data.bin", bytes}}, settings);

    const transfer::CatalogEntry* entry = catalog.find("data.bin");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->size, 320u);
    EXPECT_EQ(entry->encoded.size(), 428u);
    EXPECT_EQ(entry->chunk_count, 3u);
    EXPECT_EQ(entry->md5, security::md5_hex(bytes));

    EXPECT_EQ(catalog.get_chunk("data.bin", 0).size(), 150u);
    EXPECT_EQ(catalog.get_chunk("data.bin", 1).size(), 150u);
    EXPECT_EQ(catalog.get_chunk("data.bin", 2).size(), 128u);
}

TEST(CatalogTest, ChunksReassembleToOriginal) {
    config::Settings settings;
    settings.chunk_size = 7;
    auto bytes = make_bytes(101, 3);
    Catalog catalog({transfer::SourceFile{"x", bytes}}, settings);

    std::string joined;
    for (uint64_t i = 0; i < catalog.find("x")->chunk_count; ++i) {
        joined += catalog.get_chunk("x", i);
    }
    EXPECT_EQ(protocol::base64_decode(joined), bytes);
}

TEST(CatalogTest, EmptyFileHasNoChunks) {
    config::Settings settings;
    Catalog catalog({transfer::SourceFile{"empty", {}}}, settings);
    EXPECT_EQ(catalog.find("empty")->chunk_count, 0u);
    EXPECT_EQ(catalog.hash_of("empty"), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(CatalogTest, ErrorsCarryCodeAndText) {
    config::Settings settings;
    Catalog catalog({make_file("data.bin", 320)}, settings);

    try {
        (void)catalog.get_chunk("data.bin", 3);
        FAIL() << "expected CatalogError";
    } catch (const CatalogError& e) {
        EXPECT_EQ(e.code(), CatalogError::Code::INVALID_CHUNK);
        EXPECT_STREQ(e.what(), "Invalid chunk 3 for data.bin");
    }

    try {
        (void)catalog.get_chunk("nope", 0);
        FAIL() << "expected CatalogError";
    } catch (const CatalogError& e) {
        EXPECT_EQ(e.code(), CatalogError::Code::FILE_NOT_FOUND);
        EXPECT_STREQ(e.what(), "File not found: nope");
    }

    EXPECT_THROW((void)catalog.hash_of("nope"), CatalogError);
    EXPECT_EQ(catalog.find("nope"), nullptr);
}

TEST(CatalogTest, ScanDirectoryReadsRegularFilesSorted) {
    fs::path dir = fs::temp_directory_path() / "meshdrop_catalog_scan";
    fs::remove_all(dir);
    fs::create_directories(dir / "sub");
    {
        std::ofstream(dir / "b.txt", std::ios::binary) << "bravo";
        std::ofstream(dir / "a.txt", std::ios::binary) << "alpha";
    }

    std::vector<transfer::SourceFile> files = transfer::scan_directory(dir);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].name, "a.txt");
    EXPECT_EQ(files[1].name, "b.txt");
    EXPECT_EQ(std::string(files[1].bytes.begin(), files[1].bytes.end()), "bravo");

    fs::remove_all(dir);
}
