/*
 * ID3v2Utils.h - ID3v2 frame body helpers
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_TAG_ID3V2UTILS_H
#define AUDIOMETA_TAG_ID3V2UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace AudioMeta {
namespace Tag {
namespace ID3v2Utils {

/// Values of the encoding byte that leads text-bearing frame bodies
enum class TextEncoding : uint8_t {
    ISO_8859_1 = 0,
    UTF_16_BOM = 1,
    UTF_16_BE = 2,
    UTF_8 = 3
};

/// Encoding bytes above 3 are read as ISO-8859-1
TextEncoding encodingFromByte(uint8_t value);

/// Width of a NUL terminator: two bytes for the UTF-16 encodings
inline size_t terminatorSize(TextEncoding encoding) {
    return (encoding == TextEncoding::UTF_16_BOM || encoding == TextEncoding::UTF_16_BE) ? 2 : 1;
}

std::string decodeText(const uint8_t* data, size_t size, TextEncoding encoding);

/// Offset of the first terminator, or size when there is none
size_t findNullTerminator(const uint8_t* data, size_t size, TextEncoding encoding);

/**
 * @brief Split a text body on NUL terminators
 *
 * A terminator at the very end does not produce an empty trailing value.
 */
std::vector<std::string> splitTextValues(const uint8_t* data, size_t size, TextEncoding encoding);

/**
 * @brief Decode the terminated string at offset and step past it
 * @return false, leaving offset alone, when no terminator follows
 */
bool readTerminatedString(const uint8_t* data, size_t size, size_t& offset,
                          TextEncoding encoding, std::string& out);

/// Undo unsynchronisation by dropping the 0x00 of every 0xFF 0x00 pair
std::vector<uint8_t> decodeUnsync(const uint8_t* data, size_t size);

} // namespace ID3v2Utils
} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_ID3V2UTILS_H
