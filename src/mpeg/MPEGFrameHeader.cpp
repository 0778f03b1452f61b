/*
 * MPEGFrameHeader.cpp - MPEG audio frame header
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
namespace MPEG {

namespace ByteCodec = Core::Utility::ByteCodec;

MPEGFrameHeader MPEGFrameHeader::decode(const uint8_t* data, size_t size, uint64_t start) {
    if (!data || size < HEADER_SIZE) {
        throw MetadataException(MetadataError::NOT_AN_AUDIO_FRAME, "Truncated MPEG frame header");
    }

    uint32_t word = ByteCodec::readBE<uint32_t>(data);

    uint16_t sync = static_cast<uint16_t>(word >> 21);
    uint8_t version_id = (word >> 19) & 0x03;
    uint8_t layer_id = (word >> 17) & 0x03;
    bool protection_bit = (word >> 16) & 0x01;
    uint8_t bitrate_index = (word >> 12) & 0x0F;
    uint8_t sample_rate_index = (word >> 10) & 0x03;
    bool padding = (word >> 9) & 0x01;
    uint8_t mode = (word >> 6) & 0x03;

    if (sync != SYNC_WORD) {
        throw MetadataException(MetadataError::NOT_AN_AUDIO_FRAME);
    }
    if (version_id == 1 || layer_id == 0 || bitrate_index == 0 || bitrate_index == 15 ||
        sample_rate_index == 3) {
        throw MetadataException(MetadataError::NOT_AN_AUDIO_FRAME,
                                "Reserved field in MPEG frame header at offset " + std::to_string(start));
    }

    MPEGFrameHeader frame;
    frame.start = start;
    switch (version_id) {
        case 0: frame.version = MPEGVersion::MPEG_2_5; break;
        case 2: frame.version = MPEGVersion::MPEG_2; break;
        default: frame.version = MPEGVersion::MPEG_1; break;
    }
    frame.layer = static_cast<uint8_t>(4 - layer_id);
    frame.is_protected = !protection_bit;
    frame.padded = padding;
    frame.channel_mode = static_cast<ChannelMode>(mode);
    frame.channels = frame.channel_mode == ChannelMode::Mono ? 1 : 2;
    frame.bitrate = Tables::bitrateKbps(frame.version, frame.layer, bitrate_index) * 1000;
    frame.sample_rate = Tables::sampleRate(frame.version, sample_rate_index);
    frame.size = frameSize(frame.version, frame.layer, frame.bitrate, frame.sample_rate, frame.padded);

    return frame;
}

MPEGFrameHeader MPEGFrameHeader::parse(IO::IOHandler& handler) {
    off_t frame_start = handler.tell();
    std::vector<uint8_t> bytes = handler.readBytes(HEADER_SIZE);
    MPEGFrameHeader frame = decode(bytes.data(), bytes.size(), static_cast<uint64_t>(frame_start));

    if (frame.layer != 3) {
        return frame;
    }

    off_t xing_start = frame_start + static_cast<off_t>(xingOffset(frame.version, frame.channel_mode));
    if (handler.seek(xing_start, SEEK_SET) == 0) {
        std::vector<uint8_t> marker = handler.peekBytes(4);
        if (XingHeader::hasMarker(marker.data(), marker.size())) {
            std::vector<uint8_t> buffer = handler.readBytes(frame.size);
            try {
                frame.xing = XingHeader::parse(buffer.data(), buffer.size());
            } catch (const MetadataException& e) {
                Debug::log("mpeg", "MPEGFrameHeader::parse: Dropping Xing header at ", xing_start, ": ", e.what());
            }
        }
    }

    off_t vbri_start = frame_start + static_cast<off_t>(VBRI_OFFSET);
    if (handler.seek(vbri_start, SEEK_SET) == 0) {
        std::vector<uint8_t> preamble = handler.peekBytes(VBRIHeader::PREAMBLE_SIZE);
        if (VBRIHeader::hasMarker(preamble.data(), preamble.size())) {
            size_t required = VBRIHeader::requiredSize(preamble.data(), preamble.size());
            std::vector<uint8_t> buffer = handler.readBytes(std::max(required, preamble.size()));
            try {
                frame.vbri = VBRIHeader::parse(buffer.data(), buffer.size());
            } catch (const MetadataException& e) {
                Debug::log("mpeg", "MPEGFrameHeader::parse: Dropping VBRI header at ", vbri_start, ": ", e.what());
            }
        }
    }

    return frame;
}

size_t MPEGFrameHeader::xingOffset(MPEGVersion version, ChannelMode mode) {
    bool mono = mode == ChannelMode::Mono;
    if (version == MPEGVersion::MPEG_1) {
        return mono ? 21 : 36;
    }
    return mono ? 13 : 21;
}

uint32_t MPEGFrameHeader::frameSize(MPEGVersion version, uint8_t layer, uint32_t bitrate,
                                    uint32_t sample_rate, bool padded) {
    if (sample_rate == 0) {
        return 0;
    }
    uint32_t slot = Tables::slotSize(layer);
    uint64_t coefficient = Tables::samplesPerFrame(version, layer) / 8 / slot;
    uint64_t slots = coefficient * bitrate / sample_rate + (padded ? 1 : 0);
    return static_cast<uint32_t>(slots * slot);
}

} // namespace MPEG
} // namespace AudioMeta
