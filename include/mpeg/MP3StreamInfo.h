/*
 * MP3StreamInfo.h - Audio frame synchronizer and stream summary
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_MPEG_MP3STREAMINFO_H
#define AUDIOMETA_MPEG_MP3STREAMINFO_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "mpeg/MPEGFrameHeader.h"
#include "mpeg/MPEGTables.h"

namespace AudioMeta {
namespace IO {
class IOHandler;
} // namespace IO

namespace MPEG {

/**
 * @brief Summary of the audio stream found in an MP3 file
 *
 * Built once by parse() and not modified afterwards.
 */
class MP3StreamInfo {
public:
    /// Bytes peeked per step when hunting for a 0xFF sync byte
    static constexpr size_t SYNC_WINDOW = 128;
    /// Consecutive frames that confirm a run
    static constexpr size_t ACCEPT_RUN = 4;
    /// Shortest run kept as a fallback
    static constexpr size_t FALLBACK_RUN = 2;
    /// Tail of the file searched for trailing tags
    static constexpr size_t TRAILING_TAG_WINDOW = 64 * 1024;

    /**
     * @brief Scan state: the run under test and the best fallback so far
     */
    struct ScanContext {
        std::vector<MPEGFrameHeader> run;
        std::optional<std::vector<MPEGFrameHeader>> fallback;
    };

    /**
     * @brief Locate the audio, the trailing tags and summarize the stream
     *
     * Scanning starts at the handler's current position.
     *
     * @throws MetadataException INSUFFICIENT_AUDIO_DATA when no frame run
     *         is found
     */
    static MP3StreamInfo parse(IO::IOHandler& handler);

    /**
     * @brief Find the first accepted run of frames from the current position
     *
     * A run is accepted at ACCEPT_RUN frames or when its first frame
     * carries a Xing header. Otherwise the first run of at least
     * FALLBACK_RUN frames is used.
     *
     * @throws MetadataException INSUFFICIENT_AUDIO_DATA
     */
    static std::vector<MPEGFrameHeader> findFrames(IO::IOHandler& handler);

    /**
     * @brief Bytes occupied by trailing APEv2, Lyrics3 and ID3v1 tags
     *
     * Each marker is searched from the end of the buffer; the largest
     * distance from a match to the end of the buffer wins. A match at
     * position 0 is ignored.
     */
    static uint64_t trailingTagOffset(const uint8_t* data, size_t size);

    /**
     * @brief Compute bitrate mode, bitrate and duration for a frame run
     *
     * @param frames Accepted run, first frame at the audio start
     * @param audio_end Offset one past the last audio byte
     */
    static MP3StreamInfo summarize(const std::vector<MPEGFrameHeader>& frames, uint64_t audio_end);

    uint64_t start() const { return m_start; }
    uint64_t end() const { return m_end; }
    uint64_t size() const { return m_size; }

    const std::optional<XingHeader>& xing() const { return m_xing; }
    const std::optional<VBRIHeader>& vbri() const { return m_vbri; }

    MPEGVersion version() const { return m_version; }
    uint8_t layer() const { return m_layer; }
    bool isProtected() const { return m_protected; }

    /// Bits per second; fractional for VBR and ABR streams
    double bitrate() const { return m_bitrate; }
    BitrateMode bitrateMode() const { return m_bitrate_mode; }

    ChannelMode channelMode() const { return m_channel_mode; }
    uint8_t channels() const { return m_channels; }

    /// Seconds
    double duration() const { return m_duration; }
    uint32_t sampleRate() const { return m_sample_rate; }

    /// Total samples used for the bitrate estimate (may be fractional)
    double sampleCount() const { return m_sample_count; }

private:
    /// Decode up to ACCEPT_RUN frames from the current position; true if the run is accepted
    static bool scanRun(IO::IOHandler& handler, ScanContext& context);

    uint64_t m_start = 0;
    uint64_t m_end = 0;
    uint64_t m_size = 0;
    std::optional<XingHeader> m_xing;
    std::optional<VBRIHeader> m_vbri;
    MPEGVersion m_version = MPEGVersion::MPEG_1;
    uint8_t m_layer = 3;
    bool m_protected = false;
    double m_bitrate = 0.0;
    BitrateMode m_bitrate_mode = BitrateMode::Unknown;
    ChannelMode m_channel_mode = ChannelMode::Stereo;
    uint8_t m_channels = 2;
    double m_duration = 0.0;
    uint32_t m_sample_rate = 0;
    double m_sample_count = 0.0;
};

} // namespace MPEG
} // namespace AudioMeta

#endif // AUDIOMETA_MPEG_MP3STREAMINFO_H
