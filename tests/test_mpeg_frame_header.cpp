/*
 * test_mpeg_frame_header.cpp - Unit tests for MPEG audio frame header decoding
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "audiometa.h"
#include "test_framework.h"
#include "mp3_test_data.h"

using namespace AudioMeta;
using namespace AudioMeta::MPEG;
using namespace TestFramework;
using TestData::Bytes;

static MPEGFrameHeader decodeBytes(const Bytes& data, uint64_t start = 0) {
    return MPEGFrameHeader::decode(data.data(), data.size(), start);
}

// ============================================================================
// Header decoding
// ============================================================================

class MPEGFrameHeader_DecodesMpeg1Layer3 : public TestCase {
public:
    MPEGFrameHeader_DecodesMpeg1Layer3() : TestCase("MPEGFrameHeader_DecodesMpeg1Layer3") {}
protected:
    void runTest() override {
        MPEGFrameHeader frame = decodeBytes(TestData::mpegHeader(TestData::BITRATE_128), 1234);

        ASSERT_TRUE(frame.version == MPEGVersion::MPEG_1, "MPEG-1");
        ASSERT_EQUALS(3, static_cast<int>(frame.layer), "Layer III");
        ASSERT_FALSE(frame.is_protected, "Protection bit set means no CRC");
        ASSERT_FALSE(frame.padded, "Not padded");
        ASSERT_EQUALS(128000u, frame.bitrate, "Bitrate in bps");
        ASSERT_EQUALS(44100u, frame.sample_rate, "Sample rate");
        ASSERT_TRUE(frame.channel_mode == ChannelMode::Stereo, "Stereo");
        ASSERT_EQUALS(2, static_cast<int>(frame.channels), "Two channels");
        ASSERT_EQUALS(static_cast<uint32_t>(TestData::FRAME_SIZE_128), frame.size, "Frame size");
        ASSERT_EQUALS(1152u, frame.samplesPerFrame(), "Samples per frame");
        ASSERT_EQUALS(static_cast<uint64_t>(1234), frame.start, "Start offset carried through");
        ASSERT_FALSE(frame.xing.has_value(), "decode() never probes for Xing");
    }
};

class MPEGFrameHeader_DecodesVariants : public TestCase {
public:
    MPEGFrameHeader_DecodesVariants() : TestCase("MPEGFrameHeader_DecodesVariants") {}
protected:
    void runTest() override {
        // CRC protected, padded, mono
        MPEGFrameHeader crc = decodeBytes(Bytes({0xFF, 0xFA, 0x92, 0xC0}));
        ASSERT_TRUE(crc.is_protected, "Protection bit clear means CRC follows");
        ASSERT_TRUE(crc.padded, "Padding bit");
        ASSERT_TRUE(crc.channel_mode == ChannelMode::Mono, "Mono");
        ASSERT_EQUALS(1, static_cast<int>(crc.channels), "One channel");
        ASSERT_EQUALS(418u, crc.size, "Padded frame is one byte longer");

        MPEGFrameHeader joint = decodeBytes(TestData::mpegHeader(TestData::BITRATE_128, false, 1));
        ASSERT_TRUE(joint.channel_mode == ChannelMode::JointStereo, "Joint stereo");

        MPEGFrameHeader dual = decodeBytes(TestData::mpegHeader(TestData::BITRATE_128, false, 2));
        ASSERT_TRUE(dual.channel_mode == ChannelMode::DualChannel, "Dual channel");
        ASSERT_EQUALS(2, static_cast<int>(dual.channels), "Dual channel has two channels");

        // MPEG-2 Layer III, 64 kbps, 22050 Hz
        MPEGFrameHeader mpeg2 = decodeBytes(Bytes({0xFF, 0xF3, 0x80, 0x00}));
        ASSERT_TRUE(mpeg2.version == MPEGVersion::MPEG_2, "MPEG-2");
        ASSERT_EQUALS(64000u, mpeg2.bitrate, "MPEG-2 bitrate table");
        ASSERT_EQUALS(22050u, mpeg2.sample_rate, "MPEG-2 sample rate");
        ASSERT_EQUALS(576u, mpeg2.samplesPerFrame(), "MPEG-2 Layer III frame length");
        ASSERT_EQUALS(208u, mpeg2.size, "MPEG-2 frame size");

        // MPEG-2.5 Layer III, 8 kbps, 8000 Hz
        MPEGFrameHeader mpeg25 = decodeBytes(Bytes({0xFF, 0xE3, 0x18, 0x00}));
        ASSERT_TRUE(mpeg25.version == MPEGVersion::MPEG_2_5, "MPEG-2.5");
        ASSERT_NEAR(2.5, versionNumber(mpeg25.version), 1e-9, "MPEG-2.5 version number");
        ASSERT_NEAR(1.0, versionNumber(MPEGVersion::MPEG_1), 1e-9, "MPEG-1 version number");
        ASSERT_EQUALS(8000u, mpeg25.sample_rate, "MPEG-2.5 sample rate");
        ASSERT_EQUALS(8000u, mpeg25.bitrate, "MPEG-2.5 bitrate");

        // MPEG-1 Layer I, 32 kbps, 44100 Hz
        MPEGFrameHeader layer1 = decodeBytes(Bytes({0xFF, 0xFF, 0x10, 0x00}));
        ASSERT_EQUALS(1, static_cast<int>(layer1.layer), "Layer I");
        ASSERT_EQUALS(32000u, layer1.bitrate, "Layer I bitrate table");
        ASSERT_EQUALS(32u, layer1.size, "Layer I sizes are whole 4-byte slots");

        // MPEG-1 Layer II, 128 kbps, 48000 Hz
        MPEGFrameHeader layer2 = decodeBytes(Bytes({0xFF, 0xFD, 0x84, 0x00}));
        ASSERT_EQUALS(2, static_cast<int>(layer2.layer), "Layer II");
        ASSERT_EQUALS(48000u, layer2.sample_rate, "48 kHz");
        ASSERT_EQUALS(384u, layer2.size, "Layer II frame size");
    }
};

class MPEGFrameHeader_FrameSizeFormula : public TestCase {
public:
    MPEGFrameHeader_FrameSizeFormula() : TestCase("MPEGFrameHeader_FrameSizeFormula") {}
protected:
    void runTest() override {
        ASSERT_EQUALS(417u, MPEGFrameHeader::frameSize(MPEGVersion::MPEG_1, 3, 128000, 44100, false), "128 kbps");
        ASSERT_EQUALS(418u, MPEGFrameHeader::frameSize(MPEGVersion::MPEG_1, 3, 128000, 44100, true), "Padded");
        ASSERT_EQUALS(626u, MPEGFrameHeader::frameSize(MPEGVersion::MPEG_1, 3, 192000, 44100, false), "192 kbps");
        ASSERT_EQUALS(1044u, MPEGFrameHeader::frameSize(MPEGVersion::MPEG_1, 3, 320000, 44100, false), "320 kbps");
        ASSERT_EQUALS(36u, MPEGFrameHeader::frameSize(MPEGVersion::MPEG_1, 1, 32000, 44100, true),
                      "Layer I padding adds a 4-byte slot");
        ASSERT_EQUALS(0u, MPEGFrameHeader::frameSize(MPEGVersion::MPEG_1, 3, 128000, 0, false),
                      "Zero sample rate gives zero size");

        for (uint8_t index = 1; index < 15; ++index) {
            MPEGFrameHeader frame = decodeBytes(TestData::mpegHeader(index));
            ASSERT_EQUALS(static_cast<uint32_t>(TestData::mpeg1Layer3FrameSize(index, false)), frame.size,
                          "Frame size for bitrate index " + std::to_string(index));
        }
    }
};

// ============================================================================
// Rejection
// ============================================================================

class MPEGFrameHeader_RejectsBadSync : public TestCase {
public:
    MPEGFrameHeader_RejectsBadSync() : TestCase("MPEGFrameHeader_RejectsBadSync") {}
protected:
    void runTest() override {
        size_t rejected = 0;
        for (uint32_t prefix = 0; prefix <= 0xFFFF; ++prefix) {
            if ((prefix >> 5) == MPEGFrameHeader::SYNC_WORD) {
                continue;
            }
            Bytes data = {static_cast<uint8_t>(prefix >> 8), static_cast<uint8_t>(prefix & 0xFF), 0x90, 0x00};
            TestData::assertMetadataError([&]() { decodeBytes(data); },
                                          MetadataError::NOT_AN_AUDIO_FRAME,
                                          "Prefix " + std::to_string(prefix));
            rejected++;
        }
        ASSERT_EQUALS(65536u - 32u, rejected, "Every non-sync prefix rejected");

        TestData::assertMetadataError([]() { decodeBytes(Bytes({0xFF, 0xFB, 0x90})); },
                                      MetadataError::NOT_AN_AUDIO_FRAME, "Three bytes");
    }
};

class MPEGFrameHeader_RejectsReservedFields : public TestCase {
public:
    MPEGFrameHeader_RejectsReservedFields() : TestCase("MPEGFrameHeader_RejectsReservedFields") {}
protected:
    void runTest() override {
        struct Case {
            Bytes data;
            const char* what;
        };
        const Case cases[] = {
            {{0xFF, 0xEB, 0x90, 0x00}, "Reserved version"},
            {{0xFF, 0xF9, 0x90, 0x00}, "Reserved layer"},
            {{0xFF, 0xFB, 0x00, 0x00}, "Free format bitrate"},
            {{0xFF, 0xFB, 0xF0, 0x00}, "Bad bitrate index"},
            {{0xFF, 0xFB, 0x9C, 0x00}, "Reserved sample rate"},
        };
        for (const auto& test : cases) {
            TestData::assertMetadataError([&]() { decodeBytes(test.data); },
                                          MetadataError::NOT_AN_AUDIO_FRAME, test.what);
        }
    }
};

// ============================================================================
// VBR header probing
// ============================================================================

class MPEGFrameHeader_XingOffsets : public TestCase {
public:
    MPEGFrameHeader_XingOffsets() : TestCase("MPEGFrameHeader_XingOffsets") {}
protected:
    void runTest() override {
        ASSERT_EQUALS(36u, MPEGFrameHeader::xingOffset(MPEGVersion::MPEG_1, ChannelMode::Stereo), "MPEG-1 stereo");
        ASSERT_EQUALS(36u, MPEGFrameHeader::xingOffset(MPEGVersion::MPEG_1, ChannelMode::JointStereo),
                      "MPEG-1 joint stereo");
        ASSERT_EQUALS(21u, MPEGFrameHeader::xingOffset(MPEGVersion::MPEG_1, ChannelMode::Mono), "MPEG-1 mono");
        ASSERT_EQUALS(21u, MPEGFrameHeader::xingOffset(MPEGVersion::MPEG_2, ChannelMode::Stereo), "MPEG-2 stereo");
        ASSERT_EQUALS(13u, MPEGFrameHeader::xingOffset(MPEGVersion::MPEG_2_5, ChannelMode::Mono), "MPEG-2.5 mono");
    }
};

class MPEGFrameHeader_ParseProbesVbrHeaders : public TestCase {
public:
    MPEGFrameHeader_ParseProbesVbrHeaders() : TestCase("MPEGFrameHeader_ParseProbesVbrHeaders") {}
protected:
    void runTest() override {
        Bytes xing = TestData::xingFrame(TestData::xingTag("Xing", 100u, 50000u));
        IO::MemoryIOHandler xing_handler(xing);
        MPEGFrameHeader with_xing = MPEGFrameHeader::parse(xing_handler);
        ASSERT_TRUE(with_xing.xing.has_value(), "Xing found at the stereo offset");
        ASSERT_EQUALS(100u, *with_xing.xing->frame_count, "Xing frame count");
        ASSERT_FALSE(with_xing.vbri.has_value(), "No VBRI");

        // Mono frame: Xing sits 21 bytes in
        Bytes mono = TestData::mpegFrame(TestData::BITRATE_128, false, 3);
        Bytes mono_body = TestData::xingTag("Info", 10u, std::nullopt);
        std::copy(mono_body.begin(), mono_body.end(), mono.begin() + 21);
        IO::MemoryIOHandler mono_handler(mono);
        MPEGFrameHeader with_info = MPEGFrameHeader::parse(mono_handler);
        ASSERT_TRUE(with_info.xing.has_value(), "Info found at the mono offset");
        ASSERT_TRUE(with_info.xing->is_info, "Info marker");

        Bytes vbri = TestData::vbriFrame(TestData::vbriTag(500, 200000, 2, {100, 200, 300}));
        IO::MemoryIOHandler vbri_handler(vbri);
        MPEGFrameHeader with_vbri = MPEGFrameHeader::parse(vbri_handler);
        ASSERT_TRUE(with_vbri.vbri.has_value(), "VBRI found");
        ASSERT_EQUALS(500u, with_vbri.vbri->frame_count, "VBRI frame count");
        ASSERT_FALSE(with_vbri.xing.has_value(), "No Xing");

        IO::MemoryIOHandler plain_handler(TestData::mpegFrame());
        MPEGFrameHeader plain = MPEGFrameHeader::parse(plain_handler);
        ASSERT_FALSE(plain.xing.has_value() || plain.vbri.has_value(), "Plain frame has no VBR header");
    }
};

class MPEGFrameHeader_ParseDropsBrokenVbrHeaders : public TestCase {
public:
    MPEGFrameHeader_ParseDropsBrokenVbrHeaders() : TestCase("MPEGFrameHeader_ParseDropsBrokenVbrHeaders") {}
protected:
    void runTest() override {
        // Flags promise a ToC but the stream ends after the flags word
        Bytes truncated = TestData::xingFrame(TestData::xingTag("Xing", 100u, std::nullopt, true));
        truncated.resize(TestData::XING_OFFSET_MPEG1_STEREO + 12);
        IO::MemoryIOHandler truncated_handler(truncated);
        MPEGFrameHeader frame = MPEGFrameHeader::parse(truncated_handler);
        ASSERT_FALSE(frame.xing.has_value(), "Truncated Xing dropped");
        ASSERT_EQUALS(static_cast<uint32_t>(TestData::FRAME_SIZE_128), frame.size, "Frame still decoded");

        Bytes bad_vbri = TestData::vbriFrame(TestData::vbriTag(500, 200000, 3, {}));
        IO::MemoryIOHandler vbri_handler(bad_vbri);
        frame = MPEGFrameHeader::parse(vbri_handler);
        ASSERT_FALSE(frame.vbri.has_value(), "VBRI with a bad entry size dropped");

        // Layer II frames are never probed
        Bytes layer2 = {0xFF, 0xFD, 0x84, 0x00};
        layer2.resize(384, 0x00);
        Bytes xing_body = TestData::xingTag("Xing", 1u, std::nullopt);
        std::copy(xing_body.begin(), xing_body.end(), layer2.begin() + 36);
        IO::MemoryIOHandler layer2_handler(layer2);
        frame = MPEGFrameHeader::parse(layer2_handler);
        ASSERT_FALSE(frame.xing.has_value(), "Layer II frame not probed");

        IO::MemoryIOHandler garbage(Bytes({0x00, 0x01, 0x02, 0x03}));
        TestData::assertMetadataError([&]() { MPEGFrameHeader::parse(garbage); },
                                      MetadataError::NOT_AN_AUDIO_FRAME, "Garbage at position");
    }
};

int main() {
    TestSuite suite("MPEGFrameHeader Unit Tests");

    suite.addTest(std::make_unique<MPEGFrameHeader_DecodesMpeg1Layer3>());
    suite.addTest(std::make_unique<MPEGFrameHeader_DecodesVariants>());
    suite.addTest(std::make_unique<MPEGFrameHeader_FrameSizeFormula>());
    suite.addTest(std::make_unique<MPEGFrameHeader_RejectsBadSync>());
    suite.addTest(std::make_unique<MPEGFrameHeader_RejectsReservedFields>());
    suite.addTest(std::make_unique<MPEGFrameHeader_XingOffsets>());
    suite.addTest(std::make_unique<MPEGFrameHeader_ParseProbesVbrHeaders>());
    suite.addTest(std::make_unique<MPEGFrameHeader_ParseDropsBrokenVbrHeaders>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
