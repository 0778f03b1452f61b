/*
 * ID3v2Utils.cpp - ID3v2 frame body helpers
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FINAL_BUILD
#include "audiometa.h"
#endif // !FINAL_BUILD

namespace AudioMeta {
namespace Tag {
namespace ID3v2Utils {

using Core::Utility::UTF8Util;

TextEncoding encodingFromByte(uint8_t value) {
    if (value <= static_cast<uint8_t>(TextEncoding::UTF_8)) {
        return static_cast<TextEncoding>(value);
    }
    Debug::log("id3v2", "Unknown text encoding ", static_cast<int>(value), ", reading as ISO-8859-1");
    return TextEncoding::ISO_8859_1;
}

std::string decodeText(const uint8_t* data, size_t size, TextEncoding encoding) {
    if (!data || size == 0) {
        return std::string();
    }

    switch (encoding) {
        case TextEncoding::UTF_16_BOM:
            return UTF8Util::fromUTF16BOM(data, size);
        case TextEncoding::UTF_16_BE:
            return UTF8Util::fromUTF16BE(data, size);
        case TextEncoding::UTF_8:
            return UTF8Util::fromUTF8(data, size);
        case TextEncoding::ISO_8859_1:
            break;
    }
    return UTF8Util::fromLatin1(data, size);
}

size_t findNullTerminator(const uint8_t* data, size_t size, TextEncoding encoding) {
    return UTF8Util::findNullTerminator(data, size, terminatorSize(encoding));
}

std::vector<std::string> splitTextValues(const uint8_t* data, size_t size, TextEncoding encoding) {
    std::vector<std::string> values;
    if (!data) {
        return values;
    }

    // Each UTF-16 value carries its own BOM, so pieces decode independently
    size_t offset = 0;
    while (offset < size) {
        size_t length = findNullTerminator(data + offset, size - offset, encoding);
        values.push_back(decodeText(data + offset, length, encoding));
        offset += length + terminatorSize(encoding);
    }
    return values;
}

bool readTerminatedString(const uint8_t* data, size_t size, size_t& offset,
                          TextEncoding encoding, std::string& out) {
    if (!data || offset >= size) {
        return false;
    }

    size_t remaining = size - offset;
    size_t length = findNullTerminator(data + offset, remaining, encoding);
    if (length == remaining) {
        return false;
    }

    out = decodeText(data + offset, length, encoding);
    offset += length + terminatorSize(encoding);
    return true;
}

std::vector<uint8_t> decodeUnsync(const uint8_t* data, size_t size) {
    std::vector<uint8_t> out;
    if (!data) {
        return out;
    }

    out.reserve(size);
    uint8_t previous = 0;
    for (size_t i = 0; i < size; ++i) {
        if (!(previous == 0xFF && data[i] == 0x00)) {
            out.push_back(data[i]);
        }
        previous = data[i];
    }
    return out;
}

} // namespace ID3v2Utils
} // namespace Tag
} // namespace AudioMeta
