/*
 * LAMEHeader.h - LAME encoder extension of the Xing header
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_MPEG_LAMEHEADER_H
#define AUDIOMETA_MPEG_LAMEHEADER_H

#include <cstddef>
#include <cstdint>
#include <optional>

#include "mpeg/MPEGTables.h"

namespace AudioMeta {
namespace Core {
namespace Utility {
class BitstreamReader;
} // namespace Utility
} // namespace Core

namespace MPEG {

/**
 * @brief Track and album gain stored in the LAME tag
 *
 * Layout: 32-bit peak, then for track and album a 16-bit word of
 * 3-bit type, 3-bit origin, sign bit, 9-bit magnitude in 0.1 dB.
 */
struct ReplayGain {
    static constexpr size_t SIZE = 8;

    /// 0 when unset, else the raw value scaled by 2^-23
    double peak = 0.0;

    ReplayGainType track_type = ReplayGainType::NotSet;
    ReplayGainOrigin track_origin = ReplayGainOrigin::NotSet;
    double track_adjustment = 0.0;

    ReplayGainType album_type = ReplayGainType::NotSet;
    ReplayGainOrigin album_origin = ReplayGainOrigin::NotSet;
    double album_adjustment = 0.0;

    /**
     * @throws MetadataException INVALID_HEADER if fewer than 8 bytes remain
     */
    static ReplayGain parse(Core::Utility::BitstreamReader& reader);
};

struct LAMEEncodingFlags {
    bool nogap_continuation = false;
    bool nogap_continued = false;
    bool nssafejoint = false;
    bool nspsytune = false;
};

/**
 * @brief Encoder version parsed from the marker text, e.g. 3.99
 */
struct LAMEVersion {
    int major = 0;
    int minor = 0;
};

/**
 * @brief LAME info tag following the Xing header fields
 *
 * 36 bytes: 9-byte encoder string, then 27 bytes of packed fields.
 */
struct LAMEHeader {
    static constexpr size_t MARKER_SIZE = 9;
    static constexpr size_t SIZE = 36;

    std::optional<LAMEVersion> version;
    uint8_t revision = 0;
    LAMEBitrateMode bitrate_mode = LAMEBitrateMode::Unknown;

    /// Lowpass cutoff in Hz
    uint32_t lowpass_filter = 0;

    ReplayGain replay_gain;
    LAMEEncodingFlags encoding_flags;

    /// Minimal (VBR) or target (CBR/ABR) bitrate in bps; saturates at 255 kbps
    uint32_t bitrate = 0;

    /// Encoder delay and padding in samples
    uint16_t delay = 0;
    uint16_t padding = 0;

    LAMESourceSampleRate source_sample_rate = LAMESourceSampleRate::UpTo32000;
    bool unwise_settings_used = false;
    LAMEChannelMode channel_mode = LAMEChannelMode::Mono;
    uint8_t noise_shaping = 0;
    int8_t mp3_gain = 0;
    LAMESurroundInfo surround_info = LAMESurroundInfo::None;
    LAMEPreset preset = LAMEPreset::Unknown;

    uint32_t audio_size = 0;
    uint16_t audio_crc = 0;
    uint16_t lame_crc = 0;

    /// Xing quality indicator, passed through uninterpreted
    std::optional<uint32_t> quality;

    static bool hasMarker(const uint8_t* data, size_t size);

    /**
     * @brief Decode a LAME tag
     *
     * @param xing_quality Quality field of the enclosing Xing header
     * @throws MetadataException HEADER_NOT_FOUND if data does not start
     *         with "LAME", INVALID_HEADER if it is shorter than SIZE
     */
    static LAMEHeader parse(const uint8_t* data, size_t size,
                            std::optional<uint32_t> xing_quality = std::nullopt);
};

} // namespace MPEG
} // namespace AudioMeta

#endif // AUDIOMETA_MPEG_LAMEHEADER_H
