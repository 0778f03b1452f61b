/*
 * VBRIHeader.cpp - Fraunhofer VBRI VBR summary header
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

bool VBRIHeader::hasMarker(const uint8_t* data, size_t size) {
    return data && size >= 4 && std::memcmp(data, "VBRI", 4) == 0;
}

size_t VBRIHeader::requiredSize(const uint8_t* data, size_t size) {
    if (!hasMarker(data, size) || size < PREAMBLE_SIZE) {
        return 0;
    }
    uint16_t entries = ByteCodec::readBE<uint16_t>(data + 18);
    uint16_t entry_size = ByteCodec::readBE<uint16_t>(data + 22);
    if (entry_size != 2 && entry_size != 4) {
        return PREAMBLE_SIZE;
    }
    return PREAMBLE_SIZE + static_cast<size_t>(entries) * entry_size;
}

VBRIHeader VBRIHeader::parse(const uint8_t* data, size_t size) {
    if (!hasMarker(data, size)) {
        throw MetadataException(MetadataError::HEADER_NOT_FOUND, "Valid VBRI header not found");
    }
    if (size < PREAMBLE_SIZE) {
        throw MetadataException(MetadataError::INVALID_HEADER, "Truncated VBRI header");
    }

    VBRIHeader vbri;
    vbri.version = ByteCodec::readBE<uint16_t>(data + 4);
    vbri.delay = decodeHalfFloat(ByteCodec::readBE<uint16_t>(data + 6));
    vbri.quality = ByteCodec::readBE<uint16_t>(data + 8);
    vbri.byte_count = ByteCodec::readBE<uint32_t>(data + 10);
    vbri.frame_count = ByteCodec::readBE<uint32_t>(data + 14);
    vbri.toc_entries = ByteCodec::readBE<uint16_t>(data + 18);
    vbri.toc_scale_factor = ByteCodec::readBE<uint16_t>(data + 20);
    vbri.toc_entry_size = ByteCodec::readBE<uint16_t>(data + 22);
    vbri.toc_frames_per_entry = ByteCodec::readBE<uint16_t>(data + 24);

    if (vbri.toc_entry_size != 2 && vbri.toc_entry_size != 4) {
        throw MetadataException(MetadataError::INVALID_HEADER,
                                "Invalid VBRI TOC entry size " + std::to_string(vbri.toc_entry_size));
    }

    size_t toc_bytes = static_cast<size_t>(vbri.toc_entries) * vbri.toc_entry_size;
    if (size - PREAMBLE_SIZE < toc_bytes) {
        throw MetadataException(MetadataError::INVALID_HEADER, "Truncated VBRI table of contents");
    }

    vbri.toc.reserve(vbri.toc_entries);
    const uint8_t* entry = data + PREAMBLE_SIZE;
    for (uint16_t i = 0; i < vbri.toc_entries; ++i) {
        vbri.toc.push_back(static_cast<uint32_t>(ByteCodec::readBEBytes(entry, vbri.toc_entry_size)));
        entry += vbri.toc_entry_size;
    }

    Debug::log("mpeg", "VBRIHeader::parse: version=", vbri.version, " frames=", vbri.frame_count,
               " bytes=", vbri.byte_count, " toc=", vbri.toc_entries, "x", vbri.toc_entry_size);

    return vbri;
}

float VBRIHeader::decodeHalfFloat(uint16_t bits) {
    int exponent = (bits >> 10) & 0x1F;
    int mantissa = bits & 0x3FF;
    float value;

    if (exponent == 0) {
        value = std::ldexp(static_cast<float>(mantissa), -24);
    } else if (exponent == 31) {
        value = mantissa == 0 ? std::numeric_limits<float>::infinity()
                              : std::numeric_limits<float>::quiet_NaN();
    } else {
        value = std::ldexp(static_cast<float>(mantissa + 1024), exponent - 25);
    }

    return (bits & 0x8000) ? -value : value;
}

} // namespace MPEG
} // namespace AudioMeta
