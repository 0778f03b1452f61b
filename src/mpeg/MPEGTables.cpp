/*
 * MPEGTables.cpp - MPEG audio enumerations and lookup tables
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

double versionNumber(MPEGVersion version) {
    switch (version) {
        case MPEGVersion::MPEG_1: return 1.0;
        case MPEGVersion::MPEG_2: return 2.0;
        case MPEGVersion::MPEG_2_5: return 2.5;
    }
    return 0.0;
}

std::string toString(MPEGVersion version) {
    switch (version) {
        case MPEGVersion::MPEG_1: return "MPEG-1";
        case MPEGVersion::MPEG_2: return "MPEG-2";
        case MPEGVersion::MPEG_2_5: return "MPEG-2.5";
    }
    return "Unknown";
}

std::string toString(ChannelMode mode) {
    switch (mode) {
        case ChannelMode::Stereo: return "Stereo";
        case ChannelMode::JointStereo: return "Joint Stereo";
        case ChannelMode::DualChannel: return "Dual Channel";
        case ChannelMode::Mono: return "Mono";
    }
    return "Unknown";
}

std::string toString(BitrateMode mode) {
    switch (mode) {
        case BitrateMode::Unknown: return "Unknown";
        case BitrateMode::CBR: return "CBR";
        case BitrateMode::ABR: return "ABR";
        case BitrateMode::VBR: return "VBR";
    }
    return "Unknown";
}

std::string toString(LAMEBitrateMode mode) {
    switch (mode) {
        case LAMEBitrateMode::Unknown: return "Unknown";
        case LAMEBitrateMode::CBR: return "CBR";
        case LAMEBitrateMode::ABR: return "ABR";
        case LAMEBitrateMode::VBR_RH: return "VBR (rh)";
        case LAMEBitrateMode::VBR_MTRH: return "VBR (mtrh)";
        case LAMEBitrateMode::VBR_MT: return "VBR (mt)";
        case LAMEBitrateMode::VBR_NEW: return "VBR";
        case LAMEBitrateMode::CBR_2PASS: return "CBR (2-pass)";
        case LAMEBitrateMode::ABR_2PASS: return "ABR (2-pass)";
    }
    return "Reserved (" + std::to_string(static_cast<int>(mode)) + ")";
}

BitrateMode toBitrateMode(LAMEBitrateMode mode) {
    switch (mode) {
        case LAMEBitrateMode::CBR:
        case LAMEBitrateMode::CBR_2PASS:
            return BitrateMode::CBR;
        case LAMEBitrateMode::ABR:
        case LAMEBitrateMode::ABR_2PASS:
            return BitrateMode::ABR;
        case LAMEBitrateMode::VBR_RH:
        case LAMEBitrateMode::VBR_MTRH:
        case LAMEBitrateMode::VBR_MT:
        case LAMEBitrateMode::VBR_NEW:
            return BitrateMode::VBR;
        default:
            return BitrateMode::Unknown;
    }
}

std::string toString(LAMEChannelMode mode) {
    switch (mode) {
        case LAMEChannelMode::Mono: return "Mono";
        case LAMEChannelMode::Stereo: return "Stereo";
        case LAMEChannelMode::DualChannel: return "Dual Channel";
        case LAMEChannelMode::JointStereo: return "Joint Stereo";
        case LAMEChannelMode::Forced: return "Forced";
        case LAMEChannelMode::Auto: return "Auto";
        case LAMEChannelMode::Intensity: return "Intensity";
        case LAMEChannelMode::Undefined: return "Undefined";
    }
    return "Undefined";
}

std::string toString(LAMEPreset preset) {
    uint16_t value = static_cast<uint16_t>(preset);
    if (value >= 8 && value <= 320) {
        return "ABR " + std::to_string(value);
    }
    if (value >= 410 && value <= 500 && value % 10 == 0) {
        return "V" + std::to_string((500 - value) / 10);
    }

    switch (preset) {
        case LAMEPreset::Unknown: return "Unknown";
        case LAMEPreset::R3MIX: return "R3MIX";
        case LAMEPreset::STANDARD: return "Standard";
        case LAMEPreset::EXTREME: return "Extreme";
        case LAMEPreset::INSANE: return "Insane";
        case LAMEPreset::STANDARD_FAST: return "Standard Fast";
        case LAMEPreset::EXTREME_FAST: return "Extreme Fast";
        case LAMEPreset::MEDIUM: return "Medium";
        case LAMEPreset::MEDIUM_FAST: return "Medium Fast";
        default:
            return "Unknown (" + std::to_string(value) + ")";
    }
}

std::string toString(LAMESourceSampleRate rate) {
    switch (rate) {
        case LAMESourceSampleRate::UpTo32000: return "<= 32 kHz";
        case LAMESourceSampleRate::Rate44100: return "44.1 kHz";
        case LAMESourceSampleRate::Rate48000: return "48 kHz";
        case LAMESourceSampleRate::Above48000: return "> 48 kHz";
    }
    return "Unknown";
}

std::string toString(LAMESurroundInfo info) {
    switch (info) {
        case LAMESurroundInfo::None: return "None";
        case LAMESurroundInfo::DPL: return "DPL";
        case LAMESurroundInfo::DPL2: return "DPL2";
        case LAMESurroundInfo::Ambisonic: return "Ambisonic";
    }
    return "Reserved (" + std::to_string(static_cast<int>(info)) + ")";
}

std::string toString(ReplayGainType type) {
    switch (type) {
        case ReplayGainType::NotSet: return "Not Set";
        case ReplayGainType::Radio: return "Radio";
        case ReplayGainType::Audiophile: return "Audiophile";
    }
    return "Reserved (" + std::to_string(static_cast<int>(type)) + ")";
}

std::string toString(ReplayGainOrigin origin) {
    switch (origin) {
        case ReplayGainOrigin::NotSet: return "Not Set";
        case ReplayGainOrigin::Artist: return "Artist";
        case ReplayGainOrigin::User: return "User";
        case ReplayGainOrigin::Automatic: return "Automatic";
        case ReplayGainOrigin::RMSAverage: return "RMS Average";
    }
    return "Reserved (" + std::to_string(static_cast<int>(origin)) + ")";
}

namespace Tables {

// Index 0 (free format) and 15 (bad) are left as 0
static const uint16_t s_bitrates_v1[3][16] = {
    {0, 32, 64, 96, 128, 160, 192, 224, 256, 288, 320, 352, 384, 416, 448, 0}, // Layer I
    {0, 32, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 384, 0},    // Layer II
    {0, 32, 40, 48, 56, 64, 80, 96, 112, 128, 160, 192, 224, 256, 320, 0},     // Layer III
};

// MPEG-2 and 2.5 share a table; layers II and III share a row
static const uint16_t s_bitrates_v2[2][16] = {
    {0, 32, 48, 56, 64, 80, 96, 112, 128, 144, 160, 176, 192, 224, 256, 0},    // Layer I
    {0, 8, 16, 24, 32, 40, 48, 56, 64, 80, 96, 112, 128, 144, 160, 0},         // Layer II/III
};

static const uint32_t s_sample_rates[3][4] = {
    {44100, 48000, 32000, 0}, // MPEG-1
    {22050, 24000, 16000, 0}, // MPEG-2
    {11025, 12000, 8000, 0},  // MPEG-2.5
};

uint32_t bitrateKbps(MPEGVersion version, uint8_t layer, uint8_t index) {
    if (layer < 1 || layer > 3 || index > 15) {
        return 0;
    }
    if (version == MPEGVersion::MPEG_1) {
        return s_bitrates_v1[layer - 1][index];
    }
    return s_bitrates_v2[layer == 1 ? 0 : 1][index];
}

uint32_t sampleRate(MPEGVersion version, uint8_t index) {
    if (index > 3) {
        return 0;
    }
    return s_sample_rates[static_cast<int>(version)][index];
}

uint32_t samplesPerFrame(MPEGVersion version, uint8_t layer) {
    switch (layer) {
        case 1:
            return 384;
        case 2:
            return 1152;
        case 3:
            return version == MPEGVersion::MPEG_1 ? 1152 : 576;
        default:
            return 0;
    }
}

uint32_t slotSize(uint8_t layer) {
    return layer == 1 ? 4 : 1;
}

} // namespace Tables

} // namespace MPEG
} // namespace AudioMeta
