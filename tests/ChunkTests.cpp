// ChunkTests.cpp - DAAP chunk decoding, child iteration and seeking

#include <gtest/gtest.h>
#include <string>

#include "protocol/chunk.hpp"
#include "DaapFixtures.hpp"

using namespace protocol;
using testing_support::container;
using testing_support::int_field;
using testing_support::string_field;

// =============================================================================
// decode()
// =============================================================================

TEST(ChunkDecodeTest, EmptyBufferIsIncompleteHeader) {
    EXPECT_EQ(decode("", 0).status, DecodeStatus::INCOMPLETE_HEADER);
}

TEST(ChunkDecodeTest, FewerThanEightBytesIsIncompleteHeader) {
    std::string buffer = int_field("mstt", 200);
    for (std::size_t len = 0; len < kHeaderLength; ++len) {
        EXPECT_EQ(decode(buffer.substr(0, len), 0).status, DecodeStatus::INCOMPLETE_HEADER)
            << "length " << len;
    }
    // Same rule applies relative to the offset.
    std::string padded = "xxxxx" + buffer.substr(0, 7);
    EXPECT_EQ(decode(padded, 5).status, DecodeStatus::INCOMPLETE_HEADER);
    EXPECT_EQ(decode(buffer, buffer.size()).status, DecodeStatus::INCOMPLETE_HEADER);
    EXPECT_EQ(decode(buffer, buffer.size() + 10).status, DecodeStatus::INCOMPLETE_HEADER);
}

TEST(ChunkDecodeTest, DeclaredLengthPastEndIsIncompleteBody) {
    std::string buffer = string_field("minm", "Song");
    buffer.pop_back();
    DecodeResult result = decode(buffer, 0);
    EXPECT_EQ(result.status, DecodeStatus::INCOMPLETE_BODY);
    EXPECT_TRUE(result.malformed());
    EXPECT_FALSE(result.chunk.has_value());
}

TEST(ChunkDecodeTest, HugeLengthIsIncompleteBody) {
    std::string buffer = "mlcl";
    buffer += std::string("\xFF\xFF\xFF\xFF", 4);
    buffer += "abc";
    EXPECT_EQ(decode(buffer, 0).status, DecodeStatus::INCOMPLETE_BODY);
}

TEST(ChunkDecodeTest, DecodesTagLengthAndPayload) {
    std::string buffer = string_field("asfm", "mp3");
    DecodeResult result = decode(buffer, 0);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.chunk->tag(), "asfm");
    EXPECT_EQ(result.chunk->length(), 3u);
    EXPECT_EQ(result.chunk->payload(), "mp3");
    EXPECT_EQ(result.chunk->size(), 11u);
    EXPECT_EQ(result.next_offset, 11u);
}

TEST(ChunkDecodeTest, DecodesAtOffset) {
    std::string buffer = int_field("mstt", 200) + string_field("minm", "Song");
    DecodeResult result = decode(buffer, 12);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.chunk->tag(), "minm");
    EXPECT_EQ(result.chunk->as_string(), "Song");
    EXPECT_EQ(result.next_offset, buffer.size());
}

TEST(ChunkDecodeTest, ZeroLengthPayload) {
    std::string buffer = protocol::encode_chunk("mlcl", "");
    DecodeResult result = decode(buffer, 0);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.chunk->size(), kHeaderLength);
    EXPECT_FALSE(result.chunk->seek_first("mlit").has_value());
    EXPECT_TRUE(result.chunk->seek_all("mlit").empty());
}

TEST(ChunkDecodeTest, EncodeDecodePreservesNestedPayload) {
    std::string inner = container("mlit", {int_field("miid", 7), string_field("minm", "A")});
    std::string outer = container("mlcl", {inner, inner});
    DecodeResult result = decode(outer, 0);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.chunk->tag(), "mlcl");
    EXPECT_EQ(result.chunk->length(), inner.size() * 2);
    EXPECT_EQ(result.chunk->payload(), inner + inner);
}

// =============================================================================
// Integers
// =============================================================================

TEST(ChunkIntegerTest, BigEndianUnsigned) {
    auto chunk = decode(int_field("mlid", 31), 0).chunk;
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->as_integer(), 31u);
}

TEST(ChunkIntegerTest, HighBytesDoNotSignExtend) {
    auto chunk = decode(int_field("assz", 0xFFFFFFFEu), 0).chunk;
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->as_integer(), 0xFFFFFFFEu);

    auto mixed = decode(int_field("assz", 0x80FF7F01u), 0).chunk;
    ASSERT_TRUE(mixed);
    EXPECT_EQ(mixed->as_integer(), 0x80FF7F01u);
}

TEST(ChunkIntegerTest, ShortPayloadReadsLeftAligned) {
    auto chunk = decode(testing_support::short_field("asbr", 192), 0).chunk;
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->as_integer(), 192u << 16);
}

TEST(ChunkIntegerTest, LongPayloadReadsFirstFourBytes) {
    std::string payload("\x00\x00\x01\x00\xAA\xBB\xCC\xDD", 8);
    auto chunk = decode(protocol::encode_chunk("mper", payload), 0).chunk;
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->as_integer(), 256u);
}

// =============================================================================
// Seeking
// =============================================================================

class ChunkSeekTest : public ::testing::Test {
protected:
    Chunk login_ = *decode(container("mlog", {int_field("mstt", 200), int_field("mlid", 31)}), 0).chunk;
};

TEST_F(ChunkSeekTest, SeekFirstFindsFields) {
    auto mlid = login_.seek_first("mlid");
    auto mstt = login_.seek_first("mstt");
    ASSERT_TRUE(mlid);
    ASSERT_TRUE(mstt);
    EXPECT_EQ(mlid->as_integer(), 31u);
    EXPECT_EQ(mstt->as_integer(), 200u);
}

TEST_F(ChunkSeekTest, SeekFirstAbsentTagIsNotFound) {
    EXPECT_NO_THROW({
        EXPECT_FALSE(login_.seek_first("musr").has_value());
    });
}

TEST_F(ChunkSeekTest, RepeatedSeeksAreIndependent) {
    // No scan position is kept between calls.
    EXPECT_EQ(login_.seek_first("mlid")->as_integer(), 31u);
    EXPECT_EQ(login_.seek_first("mstt")->as_integer(), 200u);
    EXPECT_EQ(login_.seek_first("mlid")->as_integer(), 31u);
}

TEST_F(ChunkSeekTest, CodeEqualsComparesAllFourBytes) {
    EXPECT_TRUE(login_.code_equals("mlog"));
    EXPECT_FALSE(login_.code_equals("mlo"));
    EXPECT_FALSE(login_.code_equals("mlogx"));
    EXPECT_FALSE(login_.code_equals("MLOG"));
}

TEST(ChunkSeekAllTest, CollectsMatchesInOrder) {
    Chunk chunk = *decode(container("mlog", {int_field("mlid", 15), int_field("mstt", 200),
                                             int_field("mlid", 4)}), 0).chunk;
    auto matches = chunk.seek_all("mlid");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].as_integer(), 15u);
    EXPECT_EQ(matches[1].as_integer(), 4u);
}

TEST(ChunkSeekAllTest, DoesNotDescendIntoGrandchildren) {
    std::string nested = container("mlit", {int_field("miid", 1)});
    Chunk chunk = *decode(container("mlcl", {nested, int_field("miid", 2)}), 0).chunk;
    auto matches = chunk.seek_all("miid");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].as_integer(), 2u);
}

// =============================================================================
// Child iteration
// =============================================================================

TEST(ChunkChildrenTest, NextChildWalksAndThenExhausts) {
    Chunk chunk = *decode(container("mlog", {int_field("mstt", 200), string_field("minm", "x")}), 0).chunk;

    DecodeResult first = chunk.next_child(0);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.chunk->tag(), "mstt");
    EXPECT_EQ(first.next_offset, 12u);

    DecodeResult second = chunk.next_child(first.next_offset);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.chunk->tag(), "minm");

    DecodeResult end = chunk.next_child(second.next_offset);
    EXPECT_EQ(end.status, DecodeStatus::EXHAUSTED);
    EXPECT_FALSE(end.malformed());
}

TEST(ChunkChildrenTest, TrailingGarbageIsMalformedNotExhausted) {
    std::string payload = int_field("mstt", 200) + "abc";
    Chunk chunk = *decode(protocol::encode_chunk("mlog", payload), 0).chunk;

    DecodeResult tail = chunk.next_child(12);
    EXPECT_EQ(tail.status, DecodeStatus::INCOMPLETE_HEADER);
    EXPECT_TRUE(tail.malformed());
}

TEST(ChunkChildrenTest, SeekThroughTruncatedChildThrows) {
    std::string truncated = string_field("minm", "Song");
    truncated.resize(truncated.size() - 2);
    std::string payload = int_field("mstt", 200) + truncated;
    Chunk chunk = *decode(protocol::encode_chunk("mlog", payload), 0).chunk;

    EXPECT_EQ(chunk.seek_first("mstt")->as_integer(), 200u);
    try {
        chunk.seek_first("mlid");
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.status(), DecodeStatus::INCOMPLETE_BODY);
    }
    EXPECT_THROW(chunk.seek_all("mlid"), DecodeError);
}

TEST(ChunkChildrenTest, LeafPayloadIsNotAChildSequence) {
    // A string value does not parse as chunks; seeking inside it is an error.
    Chunk leaf = *decode(string_field("minm", "Song"), 0).chunk;
    EXPECT_THROW(leaf.seek_first("mlid"), DecodeError);
}
