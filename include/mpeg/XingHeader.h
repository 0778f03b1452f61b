/*
 * XingHeader.h - Xing/Info VBR summary header
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_MPEG_XINGHEADER_H
#define AUDIOMETA_MPEG_XINGHEADER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "mpeg/LAMEHeader.h"

namespace AudioMeta {
namespace MPEG {

/**
 * @brief Xing ("Xing" for VBR, "Info" for CBR) header in the first frame
 *
 * A 32-bit flags word gates each following field. Only fields whose
 * flag is set are present in the stream and populated here.
 */
struct XingHeader {
    static constexpr uint32_t FRAMES_FLAG = 0x0001;
    static constexpr uint32_t BYTES_FLAG = 0x0002;
    static constexpr uint32_t TOC_FLAG = 0x0004;
    static constexpr uint32_t QUALITY_FLAG = 0x0008;
    static constexpr size_t TOC_SIZE = 100;

    /// True for the "Info" marker LAME writes on CBR streams
    bool is_info = false;
    uint32_t flags = 0;

    std::optional<uint32_t> frame_count;
    std::optional<uint32_t> byte_count;
    std::optional<std::vector<uint8_t>> toc;
    std::optional<uint32_t> quality;

    std::optional<LAMEHeader> lame;

    static bool hasMarker(const uint8_t* data, size_t size);

    /**
     * @brief Decode from a buffer starting at the marker
     *
     * A LAME tag directly after the flagged fields is decoded as well; a
     * truncated LAME tag is dropped.
     *
     * @throws MetadataException HEADER_NOT_FOUND if the marker is not
     *         "Xing" or "Info", INVALID_HEADER if a flagged field is cut off
     */
    static XingHeader parse(const uint8_t* data, size_t size);
};

} // namespace MPEG
} // namespace AudioMeta

#endif // AUDIOMETA_MPEG_XINGHEADER_H
