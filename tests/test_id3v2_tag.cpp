/*
 * test_id3v2_tag.cpp - Unit tests for ID3v2Tag
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
using namespace AudioMeta::Tag;
using namespace TestFramework;
using TestData::Bytes;

// ============================================================================
// Helper functions to create ID3v2 test data
// ============================================================================

// Insert 0x00 after every 0xFF
static Bytes unsynchronise(const Bytes& data) {
    Bytes out;
    for (uint8_t byte : data) {
        out.push_back(byte);
        if (byte == 0xFF) {
            out.push_back(0x00);
        }
    }
    return out;
}

static Bytes pictureBody(const std::string& mime_type, uint8_t type, const Bytes& image) {
    Bytes body = {0x00};
    TestData::appendString(body, mime_type);
    body.push_back(0x00);
    body.push_back(type);
    body.push_back(0x00);
    TestData::append(body, image);
    return body;
}

static std::unique_ptr<ID3v2Tag> parseBytes(const Bytes& data) {
    return ID3v2Tag::parse(data.data(), data.size());
}

// ============================================================================
// Version-specific parsing
// ============================================================================

class ID3v2Tag_ParsesV23 : public TestCase {
public:
    ID3v2Tag_ParsesV23() : TestCase("ID3v2Tag_ParsesV23") {}
protected:
    void runTest() override {
        Bytes frames = TestData::concat({
            TestData::id3v2Frame(3, "TIT2", TestData::textBody("Song Title")),
            TestData::id3v2Frame(3, "TPE1", TestData::textBody("Artist Name")),
            TestData::id3v2Frame(3, "TALB", TestData::textBody("Album Name")),
            TestData::id3v2Frame(3, "TPE2", TestData::textBody("Various")),
            TestData::id3v2Frame(3, "TRCK", TestData::textBody("3/12")),
            TestData::id3v2Frame(3, "TPOS", TestData::textBody("1/2")),
            TestData::id3v2Frame(3, "TYER", TestData::textBody("1999")),
            TestData::id3v2Frame(3, "TCON", TestData::textBody("(17)")),
            TestData::id3v2Frame(3, "COMM", TestData::commentBody("eng", "", "A comment")),
        });
        Bytes data = TestData::id3v2Tag(3, frames, 0, 32);

        auto tag = parseBytes(data);
        ASSERT_NOT_NULL(tag.get(), "Tag parsed");
        ASSERT_EQUALS(std::string("ID3v2.3"), tag->formatName(), "Format name");
        ASSERT_EQUALS(data.size(), tag->totalSize(), "Total size covers header, frames and padding");

        ASSERT_EQUALS(std::string("Song Title"), tag->title(), "Title");
        ASSERT_EQUALS(std::string("Artist Name"), tag->artist(), "Artist");
        ASSERT_EQUALS(std::string("Album Name"), tag->album(), "Album");
        ASSERT_EQUALS(std::string("Various"), tag->albumArtist(), "Album artist from TPE2");
        ASSERT_EQUALS(3u, tag->track(), "Track number");
        ASSERT_EQUALS(12u, tag->trackTotal(), "Track total");
        ASSERT_EQUALS(1u, tag->disc(), "Disc number");
        ASSERT_EQUALS(2u, tag->discTotal(), "Disc total");
        ASSERT_EQUALS(1999u, tag->year(), "Year");
        ASSERT_EQUALS(std::string("Rock"), tag->genre(), "Genre reference resolved");
        ASSERT_EQUALS(std::string("A comment"), tag->comment(), "Comment");

        ASSERT_EQUALS(std::string("Song Title"), tag->getTag("TIT2"), "Raw frame id lookup");
        ASSERT_TRUE(tag->hasTag("title"), "Canonical name lookup");
        ASSERT_FALSE(tag->isEmpty(), "Tag is not empty");

        auto all = tag->getAllTags();
        ASSERT_EQUALS(std::string("Album Name"), all["album"], "getAllTags uses canonical names");
    }
};

class ID3v2Tag_ParsesV22 : public TestCase {
public:
    ID3v2Tag_ParsesV22() : TestCase("ID3v2Tag_ParsesV22") {}
protected:
    void runTest() override {
        Bytes frames = TestData::concat({
            TestData::id3v2Frame(2, "TT2", TestData::textBody("Old Song")),
            TestData::id3v2Frame(2, "TP1", TestData::textBody("Old Artist")),
            TestData::id3v2Frame(2, "TRK", TestData::textBody("7")),
            TestData::id3v2Frame(2, "TYE", TestData::textBody("1987")),
            TestData::id3v2Frame(2, "COM", TestData::commentBody("eng", "", "v2.2 comment")),
            TestData::id3v2Frame(2, "PIC", Bytes({0x00, 'P', 'N', 'G', 0x03, 0x00, 0x89, 'P'})),
        });
        auto tag = parseBytes(TestData::id3v2Tag(2, frames));

        ASSERT_TRUE(tag->version() == ID3Version::V2_2, "Version");
        ASSERT_EQUALS(std::string("Old Song"), tag->title(), "Title from TT2");
        ASSERT_EQUALS(std::string("Old Artist"), tag->artist(), "Artist from TP1");
        ASSERT_EQUALS(7u, tag->track(), "Track without total");
        ASSERT_EQUALS(0u, tag->trackTotal(), "Missing total is 0");
        ASSERT_EQUALS(1987u, tag->year(), "Year from TYE");
        ASSERT_EQUALS(std::string("v2.2 comment"), tag->comment(), "Comment from COM");

        ASSERT_EQUALS(1u, tag->pictureCount(), "PIC frame collected");
        ASSERT_EQUALS(std::string("image/png"), tag->pictures()[0].mime_type, "PIC image format");
    }
};

class ID3v2Tag_ParsesV24WithFooter : public TestCase {
public:
    ID3v2Tag_ParsesV24WithFooter() : TestCase("ID3v2Tag_ParsesV24WithFooter") {}
protected:
    void runTest() override {
        Bytes frames = TestData::concat({
            TestData::id3v2Frame(4, "TIT2", TestData::textBody("Modern")),
            TestData::id3v2Frame(4, "TDRC", TestData::textBody("2004-05-06")),
            TestData::id3v2Frame(4, "TPE1", TestData::textBody(std::vector<std::string>{"One", "Two"})),
        });
        Bytes data = TestData::id3v2Tag(4, frames, 0x10);

        auto tag = parseBytes(data);
        ASSERT_EQUALS(std::string("ID3v2.4"), tag->formatName(), "Format name");
        ASSERT_EQUALS(data.size() + ID3v2Header::FOOTER_SIZE, tag->totalSize(), "Footer counted in total size");
        ASSERT_EQUALS(2004u, tag->year(), "Year from TDRC");

        auto artists = tag->getTagValues("artist");
        ASSERT_EQUALS(2u, artists.size(), "Multiple text values");
        ASSERT_EQUALS(std::string("Two"), artists[1], "Second artist");
    }
};

// ============================================================================
// Extended header
// ============================================================================

class ID3v2Tag_ExtendedHeader : public TestCase {
public:
    ID3v2Tag_ExtendedHeader() : TestCase("ID3v2Tag_ExtendedHeader") {}
protected:
    void runTest() override {
        Bytes frame = TestData::id3v2Frame(3, "TIT2", TestData::textBody("After extended"));

        // v2.3: big-endian size excluding itself, then flags and padding size
        Bytes v23_ext;
        TestData::appendBE(v23_ext, 6, 4);
        v23_ext.insert(v23_ext.end(), 6, 0x00);
        auto v23 = parseBytes(TestData::id3v2Tag(3, TestData::concat({v23_ext, frame}), 0x40));
        ASSERT_EQUALS(std::string("After extended"), v23->title(), "v2.3 extended header skipped");

        // v2.4: synchsafe size including itself, then flag byte count and flags
        Bytes v24_ext = TestData::synchsafe(6);
        TestData::append(v24_ext, {0x01, 0x00});
        Bytes v24_frame = TestData::id3v2Frame(4, "TIT2", TestData::textBody("After extended"));
        auto v24 = parseBytes(TestData::id3v2Tag(4, TestData::concat({v24_ext, v24_frame}), 0x40));
        ASSERT_EQUALS(std::string("After extended"), v24->title(), "v2.4 extended header skipped");

        Bytes too_small = TestData::synchsafe(2);
        TestData::assertMetadataError(
            [&]() { parseBytes(TestData::id3v2Tag(4, TestData::concat({too_small, v24_frame}), 0x40)); },
            MetadataError::INVALID_HEADER, "v2.4 extended header smaller than its size field");

        Bytes too_large;
        TestData::appendBE(too_large, 1000, 4);
        TestData::assertMetadataError(
            [&]() { parseBytes(TestData::id3v2Tag(3, TestData::concat({too_large, frame}), 0x40)); },
            MetadataError::INVALID_HEADER, "Extended header larger than the tag");

        // Bit 6 in v2.2 means compression, not an extended header
        Bytes v22_frame = TestData::id3v2Frame(2, "TT2", TestData::textBody("No extended"));
        auto v22 = parseBytes(TestData::id3v2Tag(2, v22_frame, 0x40));
        ASSERT_EQUALS(std::string("No extended"), v22->title(), "v2.2 ignores the extended header flag");
    }
};

// ============================================================================
// Unsynchronisation
// ============================================================================

class ID3v2Tag_WholeTagUnsynchronisation : public TestCase {
public:
    ID3v2Tag_WholeTagUnsynchronisation() : TestCase("ID3v2Tag_WholeTagUnsynchronisation") {}
protected:
    void runTest() override {
        Bytes image = {0xFF, 0xD8, 0xFF, 0xE0};
        Bytes frames = TestData::concat({
            TestData::id3v2Frame(3, "APIC", pictureBody("image/jpeg", 0x03, image)),
            TestData::id3v2Frame(3, "TIT2", TestData::textBody("Synced")),
        });
        Bytes encoded = unsynchronise(frames);
        ASSERT_TRUE(encoded.size() > frames.size(), "Fixture contains bytes to unsynchronise");

        auto tag = parseBytes(TestData::id3v2Tag(3, encoded, 0x80));
        ASSERT_EQUALS(1u, tag->pictureCount(), "Picture decoded after resync");
        ASSERT_TRUE(tag->pictures()[0].data == image, "Picture bytes restored");
        ASSERT_EQUALS(std::string("Synced"), tag->title(), "Frame after the picture");
    }
};

class ID3v2Tag_PerFrameUnsynchronisation : public TestCase {
public:
    ID3v2Tag_PerFrameUnsynchronisation() : TestCase("ID3v2Tag_PerFrameUnsynchronisation") {}
protected:
    void runTest() override {
        Bytes image = {0xFF, 0xD8, 0xFF, 0xE0};
        Bytes body = unsynchronise(pictureBody("image/jpeg", 0x03, image));
        Bytes frames = TestData::concat({
            TestData::id3v2Frame(4, "APIC", body, FrameFlags::V24_UNSYNCHRONISATION),
            TestData::id3v2Frame(4, "TIT2", TestData::textBody("Plain")),
        });

        // The tag-level flag is informational in v2.4
        auto tag = parseBytes(TestData::id3v2Tag(4, frames, 0x80));
        ASSERT_EQUALS(1u, tag->pictureCount(), "Picture decoded");
        ASSERT_TRUE(tag->pictures()[0].data == image, "Per-frame unsynchronisation removed");
        ASSERT_EQUALS(std::string("Plain"), tag->title(), "Following frame intact");
    }
};

// ============================================================================
// Padding and truncation
// ============================================================================

class ID3v2Tag_PaddingAndTruncation : public TestCase {
public:
    ID3v2Tag_PaddingAndTruncation() : TestCase("ID3v2Tag_PaddingAndTruncation") {}
protected:
    void runTest() override {
        Bytes frames = TestData::concat({
            TestData::id3v2Frame(3, "TIT2", TestData::textBody("Title")),
            TestData::id3v2Frame(3, "TPE1", TestData::textBody("Artist")),
        });

        auto padded = parseBytes(TestData::id3v2Tag(3, frames, 0, 1024));
        ASSERT_EQUALS(2u, padded->tags().size(), "Padding ends the frame scan");

        // Declared size claims 1000 bytes of padding that are not present
        Bytes truncated = TestData::id3v2Tag(3, frames, 0, 1000);
        truncated.resize(truncated.size() - 1000);
        auto clamped = parseBytes(truncated);
        ASSERT_EQUALS(std::string("Artist"), clamped->artist(), "Frames decoded from a short buffer");
        ASSERT_EQUALS(truncated.size() + 1000, clamped->totalSize(), "Total size still follows the header");

        // Cut in the middle of the second frame
        Bytes cut = TestData::id3v2Tag(3, frames);
        cut.resize(cut.size() - 3);
        auto partial = parseBytes(cut);
        ASSERT_EQUALS(std::string("Title"), partial->title(), "First frame kept");
        ASSERT_FALSE(partial->hasTag("artist"), "Truncated frame dropped");

        auto empty = parseBytes(TestData::id3v2Tag(4, Bytes()));
        ASSERT_TRUE(empty->isEmpty(), "Tag without frames is empty");
    }
};

// ============================================================================
// Comments and pictures
// ============================================================================

class ID3v2Tag_CommentPreference : public TestCase {
public:
    ID3v2Tag_CommentPreference() : TestCase("ID3v2Tag_CommentPreference") {}
protected:
    void runTest() override {
        Bytes frames = TestData::concat({
            TestData::id3v2Frame(3, "COMM", TestData::commentBody("eng", "0note", "Described")),
            TestData::id3v2Frame(3, "COMM", TestData::commentBody("eng", "", "Plain")),
        });
        auto tag = parseBytes(TestData::id3v2Tag(3, frames));

        ASSERT_EQUALS(std::string("Plain"), tag->comment(), "Comment without description preferred");
        ASSERT_EQUALS(std::string("Described"), tag->getTag("COMM:0note:eng"), "Composite key lookup");

        Bytes only_described = TestData::id3v2Frame(3, "COMM", TestData::commentBody("deu", "x", "Nur"));
        auto fallback = parseBytes(TestData::id3v2Tag(3, only_described));
        ASSERT_EQUALS(std::string("Nur"), fallback->comment(), "Described comment used as fallback");
    }
};

class ID3v2Tag_Pictures : public TestCase {
public:
    ID3v2Tag_Pictures() : TestCase("ID3v2Tag_Pictures") {}
protected:
    void runTest() override {
        Bytes frames = TestData::concat({
            TestData::id3v2Frame(3, "APIC", pictureBody("image/png", 0x04, Bytes({0x01}))),
            TestData::id3v2Frame(3, "APIC", pictureBody("image/jpeg", 0x03, Bytes({0x02, 0x03}))),
        });
        auto tag = parseBytes(TestData::id3v2Tag(3, frames));

        ASSERT_EQUALS(2u, tag->pictureCount(), "Two pictures");
        ASSERT_FALSE(tag->getPicture(2).has_value(), "Out of range picture");

        auto cover = tag->getFrontCover();
        ASSERT_TRUE(cover.has_value(), "Front cover found");
        ASSERT_EQUALS(std::string("image/jpeg"), cover->mime_type, "Front cover preferred over first picture");
        ASSERT_TRUE(tag->tags().empty(), "Pictures are not stored in the tag set");
    }
};

// ============================================================================
// Reading from an IOHandler
// ============================================================================

class ID3v2Tag_ReadFromHandler : public TestCase {
public:
    ID3v2Tag_ReadFromHandler() : TestCase("ID3v2Tag_ReadFromHandler") {}
protected:
    void runTest() override {
        Bytes frames = TestData::id3v2Frame(4, "TIT2", TestData::textBody("Streamed"));
        Bytes tag_bytes = TestData::id3v2Tag(4, frames, 0x10, 16);
        Bytes footer = {'3', 'D', 'I', 0x04, 0x00, 0x10};
        TestData::append(footer, TestData::synchsafe(static_cast<uint32_t>(frames.size() + 16)));

        Bytes file = TestData::concat({tag_bytes, footer, TestData::mpegFrame()});
        IO::MemoryIOHandler handler(file);

        auto tag = ID3v2Tag::read(handler);
        ASSERT_EQUALS(std::string("Streamed"), tag->title(), "Title");
        ASSERT_EQUALS(static_cast<off_t>(tag->totalSize()), handler.tell(), "Handler left after the footer");

        std::vector<uint8_t> next = handler.peekBytes(2);
        ASSERT_EQUALS(0xFF, static_cast<int>(next[0]), "Audio follows the tag");

        IO::MemoryIOHandler no_tag(TestData::mpegFrame());
        TestData::assertMetadataError([&]() { ID3v2Tag::read(no_tag); },
                                      MetadataError::HEADER_NOT_FOUND, "No tag at position");
    }
};

class ID3v2Tag_DeclaredSizeBeyondSource : public TestCase {
public:
    ID3v2Tag_DeclaredSizeBeyondSource() : TestCase("ID3v2Tag_DeclaredSizeBeyondSource") {}
protected:
    void runTest() override {
        // Largest synchsafe size with nothing after the header
        Bytes header_only = {'I', 'D', '3', 0x03, 0x00, 0x00, 0x7F, 0x7F, 0x7F, 0x7F};
        IO::MemoryIOHandler handler(header_only);

        auto tag = ID3v2Tag::read(handler);
        ASSERT_NOT_NULL(tag.get(), "Tag decoded");
        ASSERT_EQUALS(0x0FFFFFFFu, tag->header().size, "Declared size kept");
        ASSERT_TRUE(tag->tags().empty(), "No frames");
        ASSERT_EQUALS(0u, tag->pictureCount(), "No pictures");
        ASSERT_EQUALS(static_cast<off_t>(10), handler.tell(), "Only the header was consumed");
    }
};

int main() {
    TestSuite suite("ID3v2Tag Unit Tests");

    suite.addTest(std::make_unique<ID3v2Tag_ParsesV23>());
    suite.addTest(std::make_unique<ID3v2Tag_ParsesV22>());
    suite.addTest(std::make_unique<ID3v2Tag_ParsesV24WithFooter>());
    suite.addTest(std::make_unique<ID3v2Tag_ExtendedHeader>());
    suite.addTest(std::make_unique<ID3v2Tag_WholeTagUnsynchronisation>());
    suite.addTest(std::make_unique<ID3v2Tag_PerFrameUnsynchronisation>());
    suite.addTest(std::make_unique<ID3v2Tag_PaddingAndTruncation>());
    suite.addTest(std::make_unique<ID3v2Tag_CommentPreference>());
    suite.addTest(std::make_unique<ID3v2Tag_Pictures>());
    suite.addTest(std::make_unique<ID3v2Tag_ReadFromHandler>());
    suite.addTest(std::make_unique<ID3v2Tag_DeclaredSizeBeyondSource>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
