/*
 * MPEGFrameHeader.h - MPEG audio frame header
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

#ifndef AUDIOMETA_MPEG_MPEGFRAMEHEADER_H
#define AUDIOMETA_MPEG_MPEGFRAMEHEADER_H

#include <cstddef>
#include <cstdint>
#include <optional>

#include "mpeg/MPEGTables.h"
#include "mpeg/VBRIHeader.h"
#include "mpeg/XingHeader.h"

namespace AudioMeta {
namespace IO {
class IOHandler;
} // namespace IO

namespace MPEG {

/**
 * @brief One physical MPEG audio frame
 *
 * Header bit layout (32 bits, MSB first):
 *   11 sync (all ones)
 *    2 version id     (0 = 2.5, 1 = reserved, 2 = 2, 3 = 1)
 *    2 layer id       (layer = 4 - id, 0 reserved)
 *    1 protection     (0 = CRC follows)
 *    4 bitrate index  (0 and 15 rejected)
 *    2 sample rate    (3 reserved)
 *    1 padding
 *    1 private
 *    2 channel mode
 *    6 mode extension, copyright, original, emphasis
 */
struct MPEGFrameHeader {
    static constexpr size_t HEADER_SIZE = 4;
    static constexpr uint16_t SYNC_WORD = 0x7FF;
    static constexpr size_t VBRI_OFFSET = 36;

    /// Byte offset of the frame in the source
    uint64_t start = 0;
    /// Frame length in bytes including the header
    uint32_t size = 0;

    MPEGVersion version = MPEGVersion::MPEG_1;
    uint8_t layer = 3;
    bool is_protected = false;
    bool padded = false;
    /// Bits per second
    uint32_t bitrate = 0;
    ChannelMode channel_mode = ChannelMode::Stereo;
    uint8_t channels = 2;
    uint32_t sample_rate = 0;

    std::optional<XingHeader> xing;
    std::optional<VBRIHeader> vbri;

    uint32_t samplesPerFrame() const { return Tables::samplesPerFrame(version, layer); }

    /**
     * @brief Decode the 4 header bytes only; no Xing or VBRI probing
     *
     * @throws MetadataException NOT_AN_AUDIO_FRAME on a bad sync word,
     *         a reserved field value, or fewer than 4 bytes
     */
    static MPEGFrameHeader decode(const uint8_t* data, size_t size, uint64_t start = 0);

    /**
     * @brief Decode the frame at the handler's position and probe for VBR headers
     *
     * The handler position afterwards is unspecified; callers seek to
     * start + size for the next frame.
     *
     * @throws MetadataException NOT_AN_AUDIO_FRAME as for decode()
     */
    static MPEGFrameHeader parse(IO::IOHandler& handler);

    /**
     * @brief Side information offset where a Xing header would start
     */
    static size_t xingOffset(MPEGVersion version, ChannelMode mode);

    /**
     * @brief Frame byte size from the standard formula
     *
     * size = (samples / 8 / slot * bitrate / sample_rate + padding) * slot
     */
    static uint32_t frameSize(MPEGVersion version, uint8_t layer, uint32_t bitrate,
                              uint32_t sample_rate, bool padded);
};

} // namespace MPEG
} // namespace AudioMeta

#endif // AUDIOMETA_MPEG_MPEGFRAMEHEADER_H
