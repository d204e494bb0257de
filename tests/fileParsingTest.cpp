#include "networking/fileParsing.hpp"
#include "testUtil.hpp"

#include <gtest/gtest.h>

using namespace csw;

TEST(FileParsing, Sha256KnownVector) {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    auto digest = sha256Digest(abc);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", identityToHex(*digest));

    auto empty = sha256Digest({});
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", identityToHex(*empty));
}

TEST(FileParsing, IdentityHexRoundTrip) {
    ChunkIdentity id = test::fakeIdentity(0xAB);
    auto back = identityFromHex(identityToHex(id));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(id, *back);

    EXPECT_FALSE(identityFromHex("abc"));
    EXPECT_FALSE(identityFromHex(std::string(64, 'g')));
}

TEST(FileParsing, FileNameValidation) {
    EXPECT_TRUE(validFileName("movie.mp4"));
    EXPECT_TRUE(validFileName("name with spaces"));
    EXPECT_FALSE(validFileName(""));
    EXPECT_FALSE(validFileName("."));
    EXPECT_FALSE(validFileName(".."));
    EXPECT_FALSE(validFileName("../etc/passwd"));
    EXPECT_FALSE(validFileName(std::string("a\0b", 3)));
    EXPECT_FALSE(validFileName(std::string(256, 'x')));
}

TEST(FileParsing, ChunkNames) {
    test::TempDir dir;
    EXPECT_EQ(dir / "movie->3", chunkPath(dir.path(), "movie", 3));

    auto parsed = parseChunkName("my->file->12");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ("my->file", parsed->first);
    EXPECT_EQ(12u, parsed->second);

    EXPECT_FALSE(parseChunkName("movie->total"));
    EXPECT_FALSE(parseChunkName("movie->3.part"));
    EXPECT_FALSE(parseChunkName("->3"));
    EXPECT_FALSE(parseChunkName("movie"));
    EXPECT_FALSE(parseChunkName("movie->99999999999"));
}

TEST(FileParsing, WriteReadAndList) {
    test::TempDir dir;
    auto chunk_dir = dir / "chunks"; //created on first write

    auto a0 = test::patternBytes(100, 1);
    auto a1 = test::patternBytes(50, 2);
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(chunk_dir, "b", 0, a0));
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(chunk_dir, "a", 1, a1));
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(chunk_dir, "a", 0, a0));
    ASSERT_EQ(EXIT_SUCCESS, writeChunkTotal(chunk_dir, "a", 2));

    auto read = readChunk(chunk_dir, "a", 1);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(a1, *read);
    EXPECT_FALSE(readChunk(chunk_dir, "a", 2));

    auto listed = listChunks(chunk_dir);
    ASSERT_EQ(3u, listed.size()); //total marker isn't a chunk
    EXPECT_EQ("a", listed[0].f_name);
    EXPECT_EQ(0u,  listed[0].index);
    EXPECT_EQ(1u,  listed[1].index);
    EXPECT_EQ(50u, listed[1].size);
    EXPECT_EQ("b", listed[2].f_name);

    EXPECT_EQ(2u, readChunkTotal(chunk_dir, "a").value_or(0));
    EXPECT_FALSE(readChunkTotal(chunk_dir, "b"));

    //no scratch files left behind
    for (const auto& entry : std::filesystem::directory_iterator(chunk_dir))
        EXPECT_EQ(std::string::npos, entry.path().string().find(".part"));
}

TEST(FileParsing, SplitProducesFixedSizeChunks) {
    test::TempDir dir;
    auto source = test::patternBytes(10 * 1024 + 17, 9);
    test::writeFile(dir / "data.bin", source);

    auto count = splitFile(dir / "data.bin", dir / "chunks", 1024);
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(11u, *count);
    EXPECT_EQ(11u, readChunkTotal(dir / "chunks", "data.bin").value_or(0));

    auto listed = listChunks(dir / "chunks");
    ASSERT_EQ(11u, listed.size());
    for (uint32_t i = 0; i < 10; ++i)
        EXPECT_EQ(1024u, listed[i].size);
    EXPECT_EQ(17u, listed[10].size);
}

TEST(FileParsing, SplitEmptyFileGivesOneEmptyChunk) {
    test::TempDir dir;
    test::writeFile(dir / "empty", {});

    auto count = splitFile(dir / "empty", dir / "chunks", 1024);
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(1u, *count);

    auto chunk = readChunk(dir / "chunks", "empty", 0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_TRUE(chunk->empty());
}

TEST(FileParsing, SplitRejectsMissingFileAndZeroChunkSize) {
    test::TempDir dir;
    EXPECT_FALSE(splitFile(dir / "missing", dir / "chunks", 1024));

    test::writeFile(dir / "x", {1, 2, 3});
    EXPECT_FALSE(splitFile(dir / "x", dir / "chunks", 0));
}

TEST(FileParsing, StitchReproducesOriginal) {
    test::TempDir dir;
    auto source = test::patternBytes(5000, 3);
    test::writeFile(dir / "movie", source);

    auto count = splitFile(dir / "movie", dir / "chunks", 1500);
    ASSERT_TRUE(count.has_value());

    auto out = stitchChunks(dir / "chunks", "movie", *count, dir / "downloads");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(dir / "downloads" / "movie", *out);
    EXPECT_EQ(source, test::readFile(*out));

    //chunks stay behind to keep serving
    EXPECT_EQ(*count, listChunks(dir / "chunks").size());
}

TEST(FileParsing, StitchWithMissingChunkLeavesNothing) {
    test::TempDir dir;
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(dir / "chunks", "movie", 0, test::patternBytes(10, 1)));
    ASSERT_EQ(EXIT_SUCCESS, writeChunk(dir / "chunks", "movie", 2, test::patternBytes(10, 2)));

    EXPECT_FALSE(stitchChunks(dir / "chunks", "movie", 3, dir / "downloads"));
    EXPECT_FALSE(std::filesystem::exists(dir / "downloads" / "movie"));
    if (std::filesystem::exists(dir / "downloads"))
        EXPECT_TRUE(std::filesystem::is_empty(dir / "downloads"));
}
