/*
 * test_byte_codec.cpp - Unit tests for ByteCodec, BitstreamReader and UTF8Util
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "audiometa.h"
#include "test_framework.h"
#include "mp3_test_data.h"

using namespace AudioMeta;
using namespace AudioMeta::Core::Utility;
using namespace TestFramework;

// ============================================================================
// ByteCodec
// ============================================================================

void test_read_big_endian() {
    const uint8_t data[] = {0x12, 0x34, 0x56, 0x78, 0x9A};

    ASSERT_EQUALS(0x12u, static_cast<unsigned>(ByteCodec::readBE<uint8_t>(data)), "8-bit read");
    ASSERT_EQUALS(0x1234u, static_cast<unsigned>(ByteCodec::readBE<uint16_t>(data)), "16-bit read");
    ASSERT_EQUALS(0x12345678u, ByteCodec::readBE<uint32_t>(data), "32-bit read");
    ASSERT_EQUALS(0x123456ull, static_cast<unsigned long long>(ByteCodec::readBEBytes(data, 3)), "24-bit read");
    ASSERT_EQUALS(0x123456789Aull, static_cast<unsigned long long>(ByteCodec::readBEBytes(data, 5)), "40-bit read");
}

void test_synchsafe_decode() {
    const uint8_t max[] = {0x7F, 0x7F, 0x7F, 0x7F};
    ASSERT_EQUALS(0x0FFFFFFFull, static_cast<unsigned long long>(ByteCodec::decodeSynchsafe(max, 4)),
                  "Largest 28-bit synchsafe value");

    const uint8_t value[] = {0x00, 0x00, 0x02, 0x01};
    ASSERT_EQUALS(257ull, static_cast<unsigned long long>(ByteCodec::decodeSynchsafe(value, 4)),
                  "0x0201 synchsafe is 257");

    std::vector<uint8_t> five = {0x01, 0x00, 0x00, 0x00, 0x00};
    ASSERT_EQUALS(1ull << 28, static_cast<unsigned long long>(ByteCodec::decodeSynchsafe(five)),
                  "Five byte synchsafe value");
}

void test_synchsafe_rejects_high_bit() {
    for (size_t position = 0; position < 4; ++position) {
        uint8_t data[] = {0x00, 0x00, 0x00, 0x00};
        data[position] = 0x80;
        TestData::assertMetadataError([&]() { ByteCodec::decodeSynchsafe(data, 4); },
                                      MetadataError::MALFORMED_INTEGER,
                                      "High bit in byte " + std::to_string(position));
    }
}

void test_synchsafe_round_trip_exhaustive_two_bytes() {
    for (uint32_t value = 0; value < (1u << 14); ++value) {
        std::vector<uint8_t> encoded = ByteCodec::encodeSynchsafe(value, 2);
        ASSERT_EQUALS(2u, encoded.size(), "Encoded length");
        ASSERT_TRUE((encoded[0] & 0x80) == 0 && (encoded[1] & 0x80) == 0, "Encoded bytes keep bit 7 clear");
        ASSERT_EQUALS(static_cast<uint64_t>(value), ByteCodec::decodeSynchsafe(encoded), "Round trip");
    }
}

void test_can_encode_synchsafe() {
    ASSERT_TRUE(ByteCodec::canEncodeSynchsafe(0x0FFFFFFF, 4), "28 bits fit in 4 bytes");
    ASSERT_FALSE(ByteCodec::canEncodeSynchsafe(0x10000000, 4), "29 bits do not fit in 4 bytes");
    ASSERT_TRUE(ByteCodec::canEncodeSynchsafe(127, 1), "7 bits fit in 1 byte");
    ASSERT_FALSE(ByteCodec::canEncodeSynchsafe(128, 1), "8 bits do not fit in 1 byte");
}

// ============================================================================
// BitstreamReader
// ============================================================================

void test_bit_reading_accuracy() {
    // 0b10110011 0b11001010
    const uint8_t data[] = {0xB3, 0xCA};
    BitstreamReader reader(data, sizeof(data));

    uint32_t value = 0;
    ASSERT_TRUE(reader.readBits(value, 4), "Read 4 bits");
    ASSERT_EQUALS(11u, value, "First 4 bits should be 11");
    ASSERT_TRUE(reader.readBits(value, 3), "Read 3 bits");
    ASSERT_EQUALS(1u, value, "Next 3 bits should be 1");
    ASSERT_TRUE(reader.readBits(value, 5), "Read 5 bits");
    ASSERT_EQUALS(28u, value, "Next 5 bits should be 28");
    ASSERT_TRUE(reader.readBits(value, 4), "Read 4 bits");
    ASSERT_EQUALS(10u, value, "Last 4 bits should be 10");

    ASSERT_FALSE(reader.readBits(value, 1), "Should fail when no more data");
}

void test_signed_bit_reading() {
    const uint8_t data[] = {0xFF, 0x80};
    BitstreamReader reader(data, sizeof(data));

    int32_t value = 0;
    ASSERT_TRUE(reader.readBitsSigned(value, 8), "Read signed 8 bits");
    ASSERT_EQUALS(-1, value, "Should read -1");
    ASSERT_TRUE(reader.readBitsSigned(value, 8), "Read signed 8 bits");
    ASSERT_EQUALS(-128, value, "Should read -128");
}

void test_skip_and_position() {
    const uint8_t data[] = {0x00, 0xF0, 0x0F};
    BitstreamReader reader(data, sizeof(data));

    ASSERT_TRUE(reader.skipBits(12), "Skip 12 bits");
    ASSERT_EQUALS(12ull, static_cast<unsigned long long>(reader.getBitPosition()), "Bit position after skip");
    ASSERT_FALSE(reader.isAligned(), "Not byte aligned after 12 bits");

    uint32_t value = 0;
    ASSERT_TRUE(reader.readBits(value, 8), "Read straddling byte");
    ASSERT_EQUALS(0x00u, value, "Straddling byte");
    ASSERT_EQUALS(4ull, static_cast<unsigned long long>(reader.getAvailableBits()), "Bits left");
    ASSERT_TRUE(reader.canRead(4), "Four bits remain");
    ASSERT_FALSE(reader.canRead(5), "Five bits do not remain");
    ASSERT_FALSE(reader.skipBits(5), "Skipping past the end fails");
}

void test_read_32_bits() {
    const uint8_t data[] = {0xDE, 0xAD, 0xBE, 0xEF};
    BitstreamReader reader(data, sizeof(data));

    uint32_t value = 0;
    ASSERT_TRUE(reader.readBits(value, 32), "Read 32 bits");
    ASSERT_EQUALS(0xDEADBEEFu, value, "Full word");
}

// ============================================================================
// UTF8Util
// ============================================================================

void test_latin1_conversion() {
    const uint8_t data[] = {'c', 'a', 'f', 0xE9};
    ASSERT_EQUALS(std::string("caf\xC3\xA9"), UTF8Util::fromLatin1(data, sizeof(data)), "e-acute in Latin-1");
}

void test_utf16_with_bom() {
    const uint8_t le[] = {0xFF, 0xFE, 'H', 0x00, 'i', 0x00};
    const uint8_t be[] = {0xFE, 0xFF, 0x00, 'H', 0x00, 'i'};
    ASSERT_EQUALS(std::string("Hi"), UTF8Util::fromUTF16BOM(le, sizeof(le)), "Little endian BOM");
    ASSERT_EQUALS(std::string("Hi"), UTF8Util::fromUTF16BOM(be, sizeof(be)), "Big endian BOM");
}

void test_utf16_surrogate_pair() {
    // U+1F3B5 MUSICAL NOTE
    const uint8_t data[] = {0xD8, 0x3C, 0xDF, 0xB5};
    ASSERT_EQUALS(std::string("\xF0\x9F\x8E\xB5"), UTF8Util::fromUTF16BE(data, sizeof(data)),
                  "Surrogate pair decodes to a 4 byte sequence");
}

void test_find_null_terminator() {
    const uint8_t narrow[] = {'a', 'b', 0x00, 'c'};
    ASSERT_EQUALS(2u, UTF8Util::findNullTerminator(narrow, sizeof(narrow)), "Single byte terminator");

    const uint8_t wide[] = {'a', 0x00, 0x00, 'b', 0x00, 0x00};
    ASSERT_EQUALS(4u, UTF8Util::findNullTerminator(wide, sizeof(wide), 2), "Aligned double NUL");

    const uint8_t none[] = {'a', 'b'};
    ASSERT_EQUALS(2u, UTF8Util::findNullTerminator(none, sizeof(none)), "Missing terminator gives size");
}

void test_utf8_validation() {
    ASSERT_TRUE(UTF8Util::isValid(std::string("plain ascii")), "ASCII is valid UTF-8");
    ASSERT_FALSE(UTF8Util::isValid(std::string("bad \xC3")), "Truncated sequence is invalid");
    ASSERT_TRUE(UTF8Util::isValid(UTF8Util::repair("bad \xC3")), "Repaired text is valid");
    ASSERT_FALSE(UTF8Util::isValid(std::string("\xC0\xAF")), "Overlong form is invalid");
    ASSERT_FALSE(UTF8Util::isValid(std::string("\xED\xA0\x80")), "Encoded surrogate is invalid");
}

void test_utf8_decode_repairs() {
    const uint8_t good[] = {'n', 0xC3, 0xA9, 0x00, 'x'};
    ASSERT_EQUALS(std::string("n\xC3\xA9"), UTF8Util::fromUTF8(good, sizeof(good)), "Stops at NUL");

    const uint8_t bad[] = {'a', 0xFF, 'b'};
    ASSERT_EQUALS(std::string("a\xEF\xBF\xBD" "b"), UTF8Util::fromUTF8(bad, sizeof(bad)),
                  "Stray byte becomes U+FFFD");

    std::string encoded;
    UTF8Util::appendCodepoint(encoded, 0x20AC);
    UTF8Util::appendCodepoint(encoded, 0xD800);
    ASSERT_EQUALS(std::string("\xE2\x82\xAC\xEF\xBF\xBD"), encoded, "Euro sign then replaced surrogate");
}

int main() {
    TestSuite suite("Byte Codec Unit Tests");

    suite.addTest("test_read_big_endian", test_read_big_endian);
    suite.addTest("test_synchsafe_decode", test_synchsafe_decode);
    suite.addTest("test_synchsafe_rejects_high_bit", test_synchsafe_rejects_high_bit);
    suite.addTest("test_synchsafe_round_trip_exhaustive_two_bytes", test_synchsafe_round_trip_exhaustive_two_bytes);
    suite.addTest("test_can_encode_synchsafe", test_can_encode_synchsafe);

    suite.addTest("test_bit_reading_accuracy", test_bit_reading_accuracy);
    suite.addTest("test_signed_bit_reading", test_signed_bit_reading);
    suite.addTest("test_skip_and_position", test_skip_and_position);
    suite.addTest("test_read_32_bits", test_read_32_bits);

    suite.addTest("test_latin1_conversion", test_latin1_conversion);
    suite.addTest("test_utf16_with_bom", test_utf16_with_bom);
    suite.addTest("test_utf16_surrogate_pair", test_utf16_surrogate_pair);
    suite.addTest("test_find_null_terminator", test_find_null_terminator);
    suite.addTest("test_utf8_validation", test_utf8_validation);
    suite.addTest("test_utf8_decode_repairs", test_utf8_decode_repairs);

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
