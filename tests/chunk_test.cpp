#include "../src/storage/chunk.hpp"
#include "../src/storage/compression.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

using namespace offsync_cpp::storage;

namespace {

auto sample_body() -> std::vector<std::byte> {
    return {std::byte{0x01}, std::byte{0x02}, std::byte{0x03}};
}

}  // namespace

TEST(Chunk, magic_bytes_spell_ofsj) {
    EXPECT_EQ(chunk_magic[0], std::byte{'O'});
    EXPECT_EQ(chunk_magic[1], std::byte{'F'});
    EXPECT_EQ(chunk_magic[2], std::byte{'S'});
    EXPECT_EQ(chunk_magic[3], std::byte{'J'});
}

TEST(Chunk, write_then_parse_header) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkType::record_put, sample_body(), output);

    auto parsed = parse_chunk_header(output);
    ASSERT_EQ(parsed.status, ParseStatus::ok);
    ASSERT_TRUE(parsed.header.has_value());
    EXPECT_EQ(parsed.header->type, ChunkType::record_put);
    EXPECT_EQ(parsed.header->body_length, 3u);
    EXPECT_EQ(parsed.header->total_size(), output.size());
    EXPECT_TRUE(validate_chunk_checksum(*parsed.header, output));
}

TEST(Chunk, tampered_body_fails_checksum) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkType::operation_upsert, sample_body(), output);

    auto parsed = parse_chunk_header(output);
    ASSERT_EQ(parsed.status, ParseStatus::ok);
    output[parsed.header->body_offset] = std::byte{0xFF};
    EXPECT_FALSE(validate_chunk_checksum(*parsed.header, output));
}

TEST(Chunk, bad_magic_is_reported) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkType::record_put, sample_body(), output);
    output[0] = std::byte{0x00};
    EXPECT_EQ(parse_chunk_header(output).status, ParseStatus::bad_magic);
}

TEST(Chunk, cut_body_is_truncated) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkType::record_put, sample_body(), output);
    output.pop_back();
    EXPECT_EQ(parse_chunk_header(output).status, ParseStatus::truncated);
}

TEST(Chunk, cut_header_is_truncated) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkType::record_put, sample_body(), output);
    output.resize(6);
    EXPECT_EQ(parse_chunk_header(output).status, ParseStatus::truncated);
}

TEST(Chunk, empty_body) {
    auto output = std::vector<std::byte>{};
    write_chunk(ChunkType::checkpoint, {}, output);
    auto parsed = parse_chunk_header(output);
    ASSERT_EQ(parsed.status, ParseStatus::ok);
    EXPECT_EQ(parsed.header->body_length, 0u);
    EXPECT_TRUE(validate_chunk_checksum(*parsed.header, output));
}

TEST(Chunk, checksum_is_standard_crc32) {
    const auto text = std::string_view{"123456789"};
    auto body = std::vector<std::byte>{};
    for (auto c : text) body.push_back(static_cast<std::byte>(c));
    EXPECT_EQ(compute_chunk_checksum(body), 0xCBF43926u);
}

TEST(Chunk, huge_length_does_not_wrap) {
    auto output = std::vector<std::byte>(chunk_magic.begin(), chunk_magic.end());
    output.insert(output.end(), 4, std::byte{0x00});
    output.push_back(static_cast<std::byte>(ChunkType::record_put));
    offsync_cpp::encoding::encode_uleb128(~std::uint64_t{0} - 4, output);
    output.insert(output.end(), 8, std::byte{0xAB});

    auto parsed = parse_chunk_header(output);
    EXPECT_EQ(parsed.status, ParseStatus::bad_length);
    EXPECT_FALSE(parsed.header.has_value());
}

TEST(Chunk, length_past_end_is_truncated) {
    auto output = std::vector<std::byte>(chunk_magic.begin(), chunk_magic.end());
    output.insert(output.end(), 4, std::byte{0x00});
    output.push_back(static_cast<std::byte>(ChunkType::record_put));
    offsync_cpp::encoding::encode_uleb128(1000, output);
    output.insert(output.end(), 8, std::byte{0xAB});

    auto parsed = parse_chunk_header(output);
    EXPECT_EQ(parsed.status, ParseStatus::truncated);
    ASSERT_TRUE(parsed.header.has_value());
    EXPECT_FALSE(validate_chunk_checksum(*parsed.header, output));
}

// -- Compression --------------------------------------------------------------

TEST(Compression, repetitive_input_shrinks_and_restores) {
    auto input = std::vector<std::byte>{};
    for (int i = 0; i < 8192; ++i) input.push_back(static_cast<std::byte>(i % 7));

    auto compressed = deflate_compress(input);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_LT(compressed->size(), input.size());

    auto restored = deflate_decompress(*compressed, input.size());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, input);
}

TEST(Compression, wrong_expected_size_fails) {
    auto input = std::vector<std::byte>(5000, std::byte{0x61});
    auto compressed = deflate_compress(input);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_FALSE(deflate_decompress(*compressed, 10).has_value());
}

TEST(Compression, garbage_fails_to_inflate) {
    auto garbage = std::vector<std::byte>(64, std::byte{0xFF});
    EXPECT_FALSE(deflate_decompress(garbage, 1024).has_value());
}

TEST(Compression, implausible_expected_size_fails_without_allocating) {
    auto input = std::vector<std::byte>(5000, std::byte{0x61});
    auto compressed = deflate_compress(input);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_FALSE(deflate_decompress(*compressed, std::size_t{1} << 62).has_value());
    EXPECT_FALSE(deflate_decompress(*compressed, compressed->size() * 2000).has_value());
    EXPECT_FALSE(deflate_decompress(*compressed, input.size(), 4096).has_value());
}
