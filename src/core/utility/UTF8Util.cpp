/*
 * UTF8Util.cpp - Conversions from tag text encodings to UTF-8
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
namespace Core {
namespace Utility {

namespace {

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

bool isSurrogate(uint32_t value) {
    return value >= 0xD800 && value <= 0xDFFF;
}

} // anonymous namespace

void UTF8Util::appendCodepoint(std::string& output, uint32_t codepoint) {
    if (codepoint > 0x10FFFF || isSurrogate(codepoint)) {
        codepoint = REPLACEMENT_CHARACTER;
    }

    char bytes[4];
    size_t count;
    if (codepoint < 0x80) {
        bytes[0] = static_cast<char>(codepoint);
        count = 1;
    } else {
        count = codepoint < 0x800 ? 2 : (codepoint < 0x10000 ? 3 : 4);
        for (size_t i = count - 1; i > 0; --i) {
            bytes[i] = static_cast<char>(0x80 | (codepoint & 0x3F));
            codepoint >>= 6;
        }
        static const uint8_t lead_marks[] = {0x00, 0x00, 0xC0, 0xE0, 0xF0};
        bytes[0] = static_cast<char>(lead_marks[count] | codepoint);
    }
    output.append(bytes, count);
}

size_t UTF8Util::sequenceLength(const uint8_t* data, size_t size) {
    uint8_t lead = data[0];
    if (lead < 0x80) {
        return 1;
    }

    size_t length;
    uint32_t value;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        value = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        value = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        value = lead & 0x07;
    } else {
        return 0;
    }

    if (size < length) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        if ((data[i] & 0xC0) != 0x80) {
            return 0;
        }
        value = (value << 6) | (data[i] & 0x3F);
    }

    // Overlong three byte forms, surrogates, and values past U+10FFFF
    if ((length == 3 && value < 0x800) || (length == 4 && (value < 0x10000 || value > 0x10FFFF)) ||
        isSurrogate(value)) {
        return 0;
    }
    return length;
}

bool UTF8Util::isValid(const std::string& text) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(text.data());
    size_t offset = 0;
    while (offset < text.size()) {
        size_t length = sequenceLength(data + offset, text.size() - offset);
        if (length == 0) {
            return false;
        }
        offset += length;
    }
    return true;
}

std::string UTF8Util::repair(const std::string& text) {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(text.data());
    std::string repaired;
    repaired.reserve(text.size());

    size_t offset = 0;
    while (offset < text.size()) {
        size_t length = sequenceLength(data + offset, text.size() - offset);
        if (length == 0) {
            appendCodepoint(repaired, REPLACEMENT_CHARACTER);
            ++offset;
        } else {
            repaired.append(text, offset, length);
            offset += length;
        }
    }
    return repaired;
}

std::string UTF8Util::fromLatin1(const uint8_t* data, size_t size) {
    std::string text;
    if (!data) {
        return text;
    }
    text.reserve(size);
    for (size_t i = 0; i < size && data[i] != 0; ++i) {
        appendCodepoint(text, data[i]);
    }
    return text;
}

std::string UTF8Util::fromUTF8(const uint8_t* data, size_t size) {
    if (!data) {
        return std::string();
    }
    std::string text(reinterpret_cast<const char*>(data), findNullTerminator(data, size));
    return isValid(text) ? text : repair(text);
}

std::string UTF8Util::fromUTF16(const uint8_t* data, size_t size, bool big_endian) {
    std::string text;
    if (!data) {
        return text;
    }

    size_t units = size / 2;
    auto unit = [&](size_t index) -> uint32_t {
        const uint8_t* p = data + index * 2;
        return big_endian ? static_cast<uint32_t>((p[0] << 8) | p[1]) : static_cast<uint32_t>((p[1] << 8) | p[0]);
    };

    for (size_t i = 0; i < units; ++i) {
        uint32_t value = unit(i);
        if (value == 0) {
            break;
        }
        if (value >= 0xD800 && value <= 0xDBFF && i + 1 < units) {
            uint32_t low = unit(i + 1);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                value = 0x10000 + ((value - 0xD800) << 10) + (low - 0xDC00);
                ++i;
            }
        }
        // Unpaired surrogates are replaced by appendCodepoint()
        appendCodepoint(text, value);
    }
    return text;
}

std::string UTF8Util::fromUTF16BOM(const uint8_t* data, size_t size) {
    if (!data || size < 2) {
        return std::string();
    }
    if (data[0] == 0xFF && data[1] == 0xFE) {
        return fromUTF16(data + 2, size - 2, false);
    }
    if (data[0] == 0xFE && data[1] == 0xFF) {
        return fromUTF16(data + 2, size - 2, true);
    }
    return fromUTF16(data, size, true);
}

size_t UTF8Util::findNullTerminator(const uint8_t* data, size_t size, size_t unit_size) {
    if (!data || unit_size == 0) {
        return size;
    }
    for (size_t offset = 0; offset + unit_size <= size; offset += unit_size) {
        size_t zeros = 0;
        while (zeros < unit_size && data[offset + zeros] == 0) {
            ++zeros;
        }
        if (zeros == unit_size) {
            return offset;
        }
    }
    return size;
}

} // namespace Utility
} // namespace Core
} // namespace AudioMeta
