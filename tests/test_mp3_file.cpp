/*
 * test_mp3_file.cpp - Unit tests for top-level MP3 decoding
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

static Bytes pictureBody(const std::string& mime_type, const Bytes& image) {
    Bytes body = {0x00};
    TestData::appendString(body, mime_type);
    body.push_back(0x00);
    body.push_back(0x03); // front cover
    body.push_back(0x00);
    TestData::append(body, image);
    return body;
}

static Bytes apeFooter() {
    Bytes footer;
    TestData::appendString(footer, "APETAGEX");
    footer.resize(32, 0x00);
    return footer;
}

// ============================================================================
// Tag selection
// ============================================================================

class MP3File_ID3v2AndAudio : public TestCase {
public:
    MP3File_ID3v2AndAudio() : TestCase("MP3File_ID3v2AndAudio") {}
protected:
    void runTest() override {
        Bytes image = {0x89, 'P', 'N', 'G', 0x01, 0x02};
        Bytes id3 = TestData::id3v2Tag(3, TestData::concat({
            TestData::id3v2Frame(3, "TIT2", TestData::textBody("Song")),
            TestData::id3v2Frame(3, "TPE1", TestData::textBody("Band")),
            TestData::id3v2Frame(3, "APIC", pictureBody("image/png", image)),
        }), 0, 64);
        Bytes data = TestData::concat({
            id3,
            TestData::mpegFrames(5),
            TestData::id3v1Trailer("Other", "", "", "", "", 0, 0),
        });

        IO::MemoryIOHandler handler(data);
        MP3File file = MP3File::load(handler);

        ASSERT_EQUALS(static_cast<uint64_t>(data.size()), file.fileSize(), "File size");
        ASSERT_NOT_NULL(file.id3v2(), "ID3v2 tag decoded");
        ASSERT_NULL(file.id3v1(), "ID3v1 ignored when ID3v2 is present");
        ASSERT_TRUE(file.tag() == file.id3v2(), "ID3v2 is the tag in effect");
        ASSERT_EQUALS(std::string("Song"), file.tag()->title(), "Title");
        ASSERT_EQUALS(std::string("Band"), file.tags().text("artist"), "Artist through the tag set");
        ASSERT_EQUALS(1u, file.pictures().size(), "One picture");
        ASSERT_TRUE(file.pictures()[0].data == image, "Picture bytes");

        const MP3StreamInfo& info = file.streamInfo();
        ASSERT_EQUALS(static_cast<uint64_t>(id3.size()), info.start(), "Audio starts after the tag");
        ASSERT_EQUALS(static_cast<uint64_t>(id3.size() + 5 * 417), info.end(), "Audio ends before ID3v1");
        ASSERT_TRUE(info.bitrateMode() == BitrateMode::CBR, "CBR stream");
        ASSERT_TRUE(handler.isClosed(), "Handler closed after load");
    }
};

class MP3File_ID3v1Fallback : public TestCase {
public:
    MP3File_ID3v1Fallback() : TestCase("MP3File_ID3v1Fallback") {}
protected:
    void runTest() override {
        Bytes data = TestData::concat({
            TestData::mpegFrames(4),
            TestData::id3v1Trailer("Old Title", "Old Artist", "", "1995", "", 2, 17),
        });

        IO::MemoryIOHandler handler(data);
        MP3File file = MP3File::load(handler);

        ASSERT_NULL(file.id3v2(), "No ID3v2 tag");
        ASSERT_NOT_NULL(file.id3v1(), "ID3v1 trailer decoded");
        ASSERT_TRUE(file.tag() == file.id3v1(), "ID3v1 is the tag in effect");
        ASSERT_EQUALS(std::string("Old Title"), file.tag()->title(), "Title");
        ASSERT_EQUALS(2u, file.tag()->track(), "Track");
        ASSERT_EQUALS(std::string("Rock"), file.tag()->genre(), "Genre");
        ASSERT_TRUE(file.pictures().empty(), "ID3v1 has no pictures");
    }
};

class MP3File_ID3v1AfterAPE : public TestCase {
public:
    MP3File_ID3v1AfterAPE() : TestCase("MP3File_ID3v1AfterAPE") {}
protected:
    void runTest() override {
        Bytes data = TestData::concat({
            TestData::mpegFrames(4),
            apeFooter(),
            TestData::id3v1Trailer("Behind APE", "", "", "", "", 0, 255),
        });

        IO::MemoryIOHandler handler(data);
        MP3File file = MP3File::load(handler);

        ASSERT_EQUALS(static_cast<uint64_t>(4 * 417), file.streamInfo().end(), "Both trailing tags excluded");
        ASSERT_NOT_NULL(file.id3v1(), "ID3v1 found after the APE block");
        ASSERT_EQUALS(std::string("Behind APE"), file.id3v1()->title(), "Title");
    }
};

class MP3File_InvalidID3v2IsNotFatal : public TestCase {
public:
    MP3File_InvalidID3v2IsNotFatal() : TestCase("MP3File_InvalidID3v2IsNotFatal") {}
protected:
    void runTest() override {
        // Unsupported major version
        Bytes bad_header = TestData::id3v2Header(5, 0x00, 20);
        bad_header.resize(bad_header.size() + 20, 0x00);

        Bytes data = TestData::concat({
            bad_header,
            TestData::mpegFrames(4),
            TestData::id3v1Trailer("Fallback", "", "", "", "", 0, 0),
        });

        IO::MemoryIOHandler handler(data);
        MP3File file = MP3File::load(handler);

        ASSERT_NULL(file.id3v2(), "Broken ID3v2 tag dropped");
        ASSERT_EQUALS(static_cast<uint64_t>(bad_header.size()), file.streamInfo().start(),
                      "Audio found by scanning from offset 0");
        ASSERT_NOT_NULL(file.id3v1(), "ID3v1 fallback used");
        ASSERT_EQUALS(std::string("Fallback"), file.tag()->title(), "Fallback title");
    }
};

class MP3File_NoTags : public TestCase {
public:
    MP3File_NoTags() : TestCase("MP3File_NoTags") {}
protected:
    void runTest() override {
        IO::MemoryIOHandler handler(TestData::mpegFrames(4));
        MP3File file = MP3File::load(handler);

        ASSERT_NULL(file.tag(), "No tag in effect");
        ASSERT_TRUE(file.tags().empty(), "Empty tag set");
        ASSERT_TRUE(file.pictures().empty(), "No pictures");
        ASSERT_EQUALS(static_cast<uint64_t>(4 * 417), file.streamInfo().size(), "All bytes are audio");
    }
};

class MP3File_NoAudio : public TestCase {
public:
    MP3File_NoAudio() : TestCase("MP3File_NoAudio") {}
protected:
    void runTest() override {
        Bytes data = TestData::concat({
            TestData::id3v2Tag(4, TestData::id3v2Frame(4, "TIT2", TestData::textBody("Silent"))),
            Bytes(2048, 0x00),
        });

        IO::MemoryIOHandler handler(data);
        TestData::assertMetadataError([&]() { MP3File::load(handler); },
                                      MetadataError::INSUFFICIENT_AUDIO_DATA, "Tag without audio");
        ASSERT_TRUE(handler.isClosed(), "Handler closed after a failed load");
    }
};

// ============================================================================
// Local files
// ============================================================================

class MP3File_OpenLocalFile : public TestCase {
public:
    MP3File_OpenLocalFile() : TestCase("MP3File_OpenLocalFile") {}

protected:
    void setUp() override {
        m_path = "/tmp/audiometa_mp3_test_" + std::to_string(getpid()) + ".mp3";
        std::ofstream out(m_path, std::ios::binary);
        if (!out) {
            throw TestSetupFailure("Cannot create " + m_path);
        }
        Bytes data = TestData::concat({
            TestData::id3v2Tag(3, TestData::id3v2Frame(3, "TALB", TestData::textBody("On Disk"))),
            TestData::mpegFrames(6),
        });
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    void tearDown() override {
        if (std::remove(m_path.c_str()) != 0) {
            throw TestSetupFailure("Cannot remove " + m_path);
        }
    }

    void runTest() override {
        MP3File file = MP3File::open(m_path);
        ASSERT_NOT_NULL(file.id3v2(), "Tag read from disk");
        ASSERT_EQUALS(std::string("On Disk"), file.tag()->album(), "Album");
        ASSERT_NEAR(6.0 * 417.0 * 8.0 / 128000.0, file.streamInfo().duration(), 1e-9, "Duration");

        TestData::assertMetadataError([this]() { MP3File::open(m_path + ".missing"); },
                                      MetadataError::IO_ERROR, "Missing file");
    }

private:
    std::string m_path;
};

int main() {
    TestSuite suite("MP3File Unit Tests");

    suite.addTest(std::make_unique<MP3File_ID3v2AndAudio>());
    suite.addTest(std::make_unique<MP3File_ID3v1Fallback>());
    suite.addTest(std::make_unique<MP3File_ID3v1AfterAPE>());
    suite.addTest(std::make_unique<MP3File_InvalidID3v2IsNotFatal>());
    suite.addTest(std::make_unique<MP3File_NoTags>());
    suite.addTest(std::make_unique<MP3File_NoAudio>());
    suite.addTest(std::make_unique<MP3File_OpenLocalFile>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
