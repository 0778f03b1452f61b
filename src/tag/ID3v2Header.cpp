/*
 * ID3v2Header.cpp - ID3v2 tag header decoding
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef FINAL_BUILD
#include "audiometa.h"
#endif // !FINAL_BUILD

namespace AudioMeta {
namespace Tag {

std::string toString(ID3Version version) {
    switch (version) {
        case ID3Version::V2_2:
            return "ID3v2.2";
        case ID3Version::V2_3:
            return "ID3v2.3";
        case ID3Version::V2_4:
            return "ID3v2.4";
        default:
            return "ID3v2";
    }
}

ID3v2HeaderFlags ID3v2HeaderFlags::fromByte(uint8_t flags) {
    ID3v2HeaderFlags result;
    result.unsynchronisation = (flags & 0x80) != 0;
    result.extended_header = (flags & 0x40) != 0;
    result.experimental = (flags & 0x20) != 0;
    result.footer = (flags & 0x10) != 0;
    return result;
}

bool ID3v2Header::hasMarker(const uint8_t* data, size_t size) {
    return data && size >= 3 && data[0] == 'I' && data[1] == 'D' && data[2] == '3';
}

ID3v2Header ID3v2Header::parse(const uint8_t* data, size_t size) {
    if (!data || size < HEADER_SIZE) {
        throw MetadataException(MetadataError::HEADER_NOT_FOUND,
                                "ID3v2 header needs 10 bytes, got " + std::to_string(data ? size : 0));
    }

    if (!hasMarker(data, size)) {
        throw MetadataException(MetadataError::HEADER_NOT_FOUND, "Missing ID3 marker");
    }

    ID3v2Header header;
    switch (data[3]) {
        case 2:
            header.version = ID3Version::V2_2;
            break;
        case 3:
            header.version = ID3Version::V2_3;
            break;
        case 4:
            header.version = ID3Version::V2_4;
            break;
        default:
            throw MetadataException(MetadataError::UNSUPPORTED_VERSION,
                                    "Unsupported ID3v2 version byte " + std::to_string(data[3]));
    }

    header.revision = data[4];
    if (header.revision != 0) {
        Debug::log("id3v2", "ID3v2Header::parse: Non-standard revision ", static_cast<int>(header.revision));
    }

    header.flags = ID3v2HeaderFlags::fromByte(data[5]);
    if (data[5] & 0x0F) {
        Debug::log("id3v2", "ID3v2Header::parse: Ignoring reserved flag bits 0x",
                   std::hex, static_cast<int>(data[5] & 0x0F));
    }

    header.size = static_cast<uint32_t>(Core::Utility::ByteCodec::decodeSynchsafe(data + 6, 4));

    Debug::log("id3v2", "ID3v2Header::parse: ", toString(header.version),
               " size=", header.size,
               " unsync=", header.flags.unsynchronisation,
               " extended=", header.flags.extended_header,
               " experimental=", header.flags.experimental,
               " footer=", header.flags.footer);

    return header;
}

} // namespace Tag
} // namespace AudioMeta
