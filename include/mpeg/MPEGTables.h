/*
 * MPEGTables.h - MPEG audio enumerations and lookup tables
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_MPEG_MPEGTABLES_H
#define AUDIOMETA_MPEG_MPEGTABLES_H

#include <cstdint>
#include <string>

namespace AudioMeta {
namespace MPEG {

enum class MPEGVersion : uint8_t {
    MPEG_1,
    MPEG_2,
    MPEG_2_5
};

/**
 * @brief 1.0, 2.0 or 2.5
 */
double versionNumber(MPEGVersion version);
std::string toString(MPEGVersion version);

/**
 * @brief Frame header channel mode, valued by its 2-bit field
 */
enum class ChannelMode : uint8_t {
    Stereo = 0,
    JointStereo = 1,
    DualChannel = 2,
    Mono = 3
};

std::string toString(ChannelMode mode);

/**
 * @brief Stream-level bitrate classification
 */
enum class BitrateMode : uint8_t {
    Unknown,
    CBR,
    ABR,
    VBR
};

std::string toString(BitrateMode mode);

// ============================================================================
// LAME extension codes
// ============================================================================

/**
 * @brief LAME "VBR method" nibble
 */
enum class LAMEBitrateMode : uint8_t {
    Unknown = 0,
    CBR = 1,
    ABR = 2,
    VBR_RH = 3,
    VBR_MTRH = 4,
    VBR_MT = 5,
    VBR_NEW = 6,
    CBR_2PASS = 8,
    ABR_2PASS = 9
};

std::string toString(LAMEBitrateMode mode);

/**
 * @brief Collapse a LAME method code to CBR, ABR, VBR or Unknown
 */
BitrateMode toBitrateMode(LAMEBitrateMode mode);

enum class LAMEChannelMode : uint8_t {
    Mono = 0,
    Stereo = 1,
    DualChannel = 2,
    JointStereo = 3,
    Forced = 4,
    Auto = 5,
    Intensity = 6,
    Undefined = 7
};

std::string toString(LAMEChannelMode mode);

/**
 * @brief 11-bit LAME preset id
 *
 * Values 8-320 are ABR bitrates in kbps and are not enumerated.
 */
enum class LAMEPreset : uint16_t {
    Unknown = 0,
    V9 = 410,
    V8 = 420,
    V7 = 430,
    V6 = 440,
    V5 = 450,
    V4 = 460,
    V3 = 470,
    V2 = 480,
    V1 = 490,
    V0 = 500,
    R3MIX = 1000,
    STANDARD = 1001,
    EXTREME = 1002,
    INSANE = 1003,
    STANDARD_FAST = 1004,
    EXTREME_FAST = 1005,
    MEDIUM = 1006,
    MEDIUM_FAST = 1007
};

std::string toString(LAMEPreset preset);

enum class LAMESourceSampleRate : uint8_t {
    UpTo32000 = 0,
    Rate44100 = 1,
    Rate48000 = 2,
    Above48000 = 3
};

std::string toString(LAMESourceSampleRate rate);

enum class LAMESurroundInfo : uint8_t {
    None = 0,
    DPL = 1,
    DPL2 = 2,
    Ambisonic = 3
};

std::string toString(LAMESurroundInfo info);

enum class ReplayGainType : uint8_t {
    NotSet = 0,
    Radio = 1,
    Audiophile = 2
};

std::string toString(ReplayGainType type);

enum class ReplayGainOrigin : uint8_t {
    NotSet = 0,
    Artist = 1,
    User = 2,
    Automatic = 3,
    RMSAverage = 4
};

std::string toString(ReplayGainOrigin origin);

// ============================================================================
// Frame header tables
// ============================================================================

namespace Tables {

/**
 * @brief Bitrate in kbps for a 4-bit index; 0 for the free and bad indices
 */
uint32_t bitrateKbps(MPEGVersion version, uint8_t layer, uint8_t index);

/**
 * @brief Sample rate in Hz for a 2-bit index; 0 for the reserved index 3
 */
uint32_t sampleRate(MPEGVersion version, uint8_t index);

/**
 * @brief 384 for layer I, 1152 for layer II, 1152/576 for layer III
 */
uint32_t samplesPerFrame(MPEGVersion version, uint8_t layer);

/**
 * @brief 4 bytes for layer I, 1 otherwise
 */
uint32_t slotSize(uint8_t layer);

} // namespace Tables

} // namespace MPEG
} // namespace AudioMeta

#endif // AUDIOMETA_MPEG_MPEGTABLES_H
