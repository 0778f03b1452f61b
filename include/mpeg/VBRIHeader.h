/*
 * VBRIHeader.h - Fraunhofer VBRI VBR summary header
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_MPEG_VBRIHEADER_H
#define AUDIOMETA_MPEG_VBRIHEADER_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace AudioMeta {
namespace MPEG {

/**
 * @brief VBRI header, 32 bytes after the frame header
 *
 * Layout (big-endian):
 *   0  "VBRI"
 *   4  u16 version
 *   6  f16 delay
 *   8  u16 quality
 *  10  u32 byte count
 *  14  u32 frame count
 *  18  u16 ToC entry count
 *  20  u16 ToC scale factor
 *  22  u16 ToC entry size (2 or 4)
 *  24  u16 frames per ToC entry
 *  26  ToC entries
 */
struct VBRIHeader {
    static constexpr size_t PREAMBLE_SIZE = 26;

    uint16_t version = 0;
    float delay = 0.0f;
    uint16_t quality = 0;
    uint32_t byte_count = 0;
    uint32_t frame_count = 0;
    uint16_t toc_entries = 0;
    uint16_t toc_scale_factor = 0;
    uint16_t toc_entry_size = 0;
    uint16_t toc_frames_per_entry = 0;
    std::vector<uint32_t> toc;

    static bool hasMarker(const uint8_t* data, size_t size);

    /**
     * @brief Total header size implied by a preamble, or 0 if it cannot be known
     */
    static size_t requiredSize(const uint8_t* data, size_t size);

    /**
     * @throws MetadataException HEADER_NOT_FOUND without the "VBRI"
     *         marker, INVALID_HEADER for a ToC entry size other than 2
     *         or 4 or for truncated data
     */
    static VBRIHeader parse(const uint8_t* data, size_t size);

    /**
     * @brief IEEE 754 binary16 to float
     */
    static float decodeHalfFloat(uint16_t bits);
};

} // namespace MPEG
} // namespace AudioMeta

#endif // AUDIOMETA_MPEG_VBRIHEADER_H
