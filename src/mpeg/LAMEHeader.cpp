/*
 * LAMEHeader.cpp - LAME encoder extension of the Xing header
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

using Core::Utility::BitstreamReader;

namespace {

uint32_t readField(BitstreamReader& reader, uint32_t bits) {
    uint32_t value = 0;
    if (!reader.readBits(value, bits)) {
        throw MetadataException(MetadataError::INVALID_HEADER, "Truncated LAME header");
    }
    return value;
}

void skipField(BitstreamReader& reader, uint32_t bits) {
    if (!reader.skipBits(bits)) {
        throw MetadataException(MetadataError::INVALID_HEADER, "Truncated LAME header");
    }
}

bool readFlag(BitstreamReader& reader) {
    bool value = false;
    if (!reader.readBit(value)) {
        throw MetadataException(MetadataError::INVALID_HEADER, "Truncated LAME header");
    }
    return value;
}

double readAdjustment(BitstreamReader& reader, ReplayGainType& type, ReplayGainOrigin& origin) {
    type = static_cast<ReplayGainType>(readField(reader, 3));
    origin = static_cast<ReplayGainOrigin>(readField(reader, 3));
    bool negative = readFlag(reader);
    double adjustment = readField(reader, 9) / 10.0;
    return negative ? -adjustment : adjustment;
}

} // namespace

ReplayGain ReplayGain::parse(BitstreamReader& reader) {
    if (!reader.canRead(SIZE * 8)) {
        throw MetadataException(MetadataError::INVALID_HEADER, "Truncated ReplayGain field");
    }

    ReplayGain gain;
    uint32_t peak = readField(reader, 32);
    gain.peak = peak == 0 ? 0.0 : peak / static_cast<double>(1u << 23);
    gain.track_adjustment = readAdjustment(reader, gain.track_type, gain.track_origin);
    gain.album_adjustment = readAdjustment(reader, gain.album_type, gain.album_origin);
    return gain;
}

bool LAMEHeader::hasMarker(const uint8_t* data, size_t size) {
    return data && size >= 4 && std::memcmp(data, "LAME", 4) == 0;
}

LAMEHeader LAMEHeader::parse(const uint8_t* data, size_t size, std::optional<uint32_t> xing_quality) {
    if (!hasMarker(data, size)) {
        throw MetadataException(MetadataError::HEADER_NOT_FOUND, "Valid LAME header not found");
    }
    if (size < SIZE) {
        throw MetadataException(MetadataError::INVALID_HEADER,
                                "Truncated LAME header (" + std::to_string(size) + " bytes)");
    }

    LAMEHeader lame;
    lame.quality = xing_quality;

    // Encoder string, e.g. "LAME3.99r" or "LAME3.100"
    static const std::regex version_pattern("LAME(\\d+)\\.(\\d+)");
    std::string encoder(reinterpret_cast<const char*>(data), MARKER_SIZE);
    std::smatch match;
    if (std::regex_search(encoder, match, version_pattern)) {
        lame.version = LAMEVersion{std::stoi(match[1].str()), std::stoi(match[2].str())};
    }

    BitstreamReader reader(data + MARKER_SIZE, SIZE - MARKER_SIZE);

    lame.revision = static_cast<uint8_t>(readField(reader, 4));
    lame.bitrate_mode = static_cast<LAMEBitrateMode>(readField(reader, 4));
    lame.lowpass_filter = readField(reader, 8) * 100;

    lame.replay_gain = ReplayGain::parse(reader);

    lame.encoding_flags.nogap_continuation = readFlag(reader);
    lame.encoding_flags.nogap_continued = readFlag(reader);
    lame.encoding_flags.nssafejoint = readFlag(reader);
    lame.encoding_flags.nspsytune = readFlag(reader);
    skipField(reader, 4); // ATH type

    lame.bitrate = readField(reader, 8) * 1000;

    lame.delay = static_cast<uint16_t>(readField(reader, 12));
    lame.padding = static_cast<uint16_t>(readField(reader, 12));

    lame.source_sample_rate = static_cast<LAMESourceSampleRate>(readField(reader, 2));
    lame.unwise_settings_used = readFlag(reader);
    lame.channel_mode = static_cast<LAMEChannelMode>(readField(reader, 3));
    lame.noise_shaping = static_cast<uint8_t>(readField(reader, 2));

    int32_t gain = 0;
    if (!reader.readBitsSigned(gain, 8)) {
        throw MetadataException(MetadataError::INVALID_HEADER, "Truncated LAME header");
    }
    lame.mp3_gain = static_cast<int8_t>(gain);

    skipField(reader, 2);
    lame.surround_info = static_cast<LAMESurroundInfo>(readField(reader, 3));
    lame.preset = static_cast<LAMEPreset>(readField(reader, 11));

    lame.audio_size = readField(reader, 32);
    lame.audio_crc = static_cast<uint16_t>(readField(reader, 16));
    lame.lame_crc = static_cast<uint16_t>(readField(reader, 16));

    Debug::log("mpeg", "LAMEHeader::parse: ", encoder.c_str(), " mode=", toString(lame.bitrate_mode),
               " delay=", lame.delay, " padding=", lame.padding, " preset=", toString(lame.preset));

    return lame;
}

} // namespace MPEG
} // namespace AudioMeta
