/*
 * XingHeader.cpp - Xing/Info VBR summary header
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
namespace MPEG {

namespace ByteCodec = Core::Utility::ByteCodec;

bool XingHeader::hasMarker(const uint8_t* data, size_t size) {
    if (!data || size < 4) {
        return false;
    }
    return std::memcmp(data, "Xing", 4) == 0 || std::memcmp(data, "Info", 4) == 0;
}

XingHeader XingHeader::parse(const uint8_t* data, size_t size) {
    if (!hasMarker(data, size)) {
        throw MetadataException(MetadataError::HEADER_NOT_FOUND, "Valid Xing header not found");
    }

    size_t offset = 4;
    auto require = [&](size_t count, const char* field) {
        if (size - offset < count) {
            throw MetadataException(MetadataError::INVALID_HEADER,
                                    std::string("Xing header truncated at ") + field);
        }
    };

    XingHeader xing;
    xing.is_info = data[0] == 'I';

    require(4, "flags");
    xing.flags = ByteCodec::readBE<uint32_t>(data + offset);
    offset += 4;

    if (xing.flags & FRAMES_FLAG) {
        require(4, "frame count");
        xing.frame_count = ByteCodec::readBE<uint32_t>(data + offset);
        offset += 4;
    }

    if (xing.flags & BYTES_FLAG) {
        require(4, "byte count");
        xing.byte_count = ByteCodec::readBE<uint32_t>(data + offset);
        offset += 4;
    }

    if (xing.flags & TOC_FLAG) {
        require(TOC_SIZE, "table of contents");
        xing.toc = std::vector<uint8_t>(data + offset, data + offset + TOC_SIZE);
        offset += TOC_SIZE;
    }

    if (xing.flags & QUALITY_FLAG) {
        require(4, "quality");
        xing.quality = ByteCodec::readBE<uint32_t>(data + offset);
        offset += 4;
    }

    if (LAMEHeader::hasMarker(data + offset, size - offset)) {
        try {
            xing.lame = LAMEHeader::parse(data + offset, size - offset, xing.quality);
        } catch (const MetadataException& e) {
            Debug::log("mpeg", "XingHeader::parse: Ignoring LAME tag: ", e.what());
        }
    }

    Debug::log("mpeg", "XingHeader::parse: ", xing.is_info ? "Info" : "Xing", " flags=0x", std::hex,
               xing.flags, std::dec, " frames=", xing.frame_count.value_or(0),
               " bytes=", xing.byte_count.value_or(0), " lame=", xing.lame.has_value());

    return xing;
}

} // namespace MPEG
} // namespace AudioMeta
