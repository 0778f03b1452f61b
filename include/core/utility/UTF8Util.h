/*
 * UTF8Util.h - Conversions from tag text encodings to UTF-8
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_CORE_UTILITY_UTF8UTIL_H
#define AUDIOMETA_CORE_UTILITY_UTF8UTIL_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace AudioMeta {
namespace Core {
namespace Utility {

/**
 * @brief Conversions from the text encodings found in tags to UTF-8
 *
 * Results are always well-formed UTF-8: malformed input becomes U+FFFD.
 * The from* decoders stop at the first NUL code unit.
 */
class UTF8Util {
public:
    static std::string fromLatin1(const uint8_t* data, size_t size);
    static std::string fromUTF8(const uint8_t* data, size_t size);
    static std::string fromUTF16(const uint8_t* data, size_t size, bool big_endian);

    static std::string fromUTF16BE(const uint8_t* data, size_t size) {
        return fromUTF16(data, size, true);
    }

    /// Byte order from a leading BOM, big-endian when there is none
    static std::string fromUTF16BOM(const uint8_t* data, size_t size);

    static bool isValid(const std::string& text);
    static std::string repair(const std::string& text);

    /// Encode a scalar value; surrogates and out-of-range values become U+FFFD
    static void appendCodepoint(std::string& output, uint32_t codepoint);

    /// Offset of the first all-zero unit of unit_size bytes, or size
    static size_t findNullTerminator(const uint8_t* data, size_t size, size_t unit_size = 1);

private:
    // Length of the well-formed sequence starting at data, 0 if malformed
    static size_t sequenceLength(const uint8_t* data, size_t size);
};

} // namespace Utility
} // namespace Core
} // namespace AudioMeta

#endif // AUDIOMETA_CORE_UTILITY_UTF8UTIL_H
