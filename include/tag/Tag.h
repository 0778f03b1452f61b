/*
 * Tag.h - Format-neutral metadata tag interface
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_TAG_TAG_H
#define AUDIOMETA_TAG_TAG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tag/TagSet.h"

namespace AudioMeta {
namespace Tag {

/// APIC/PIC picture type byte
enum class PictureType : uint8_t {
    Other = 0, FileIcon, OtherFileIcon, FrontCover, BackCover, LeafletPage, Media,
    LeadArtist, Artist, Conductor, Band, Composer, Lyricist, RecordingLocation,
    DuringRecording, DuringPerformance, MovieScreenCapture, BrightColoredFish,
    Illustration, BandLogotype, PublisherLogotype
};

struct Picture {
    PictureType type = PictureType::Other;
    std::string mime_type;
    std::string description;
    std::vector<uint8_t> data;
};

/**
 * @brief Read-only view shared by the ID3v1 and ID3v2 tags
 *
 * A format supplies its TagSet and name, plus its pictures if it has
 * any. Every named accessor is a lookup of a canonical key in tags().
 */
class Tag {
public:
    virtual ~Tag() = default;

    virtual const TagSet& tags() const = 0;

    /// "ID3v1", "ID3v1.1", "ID3v2.2" ... "ID3v2.4"
    virtual std::string formatName() const = 0;

    virtual size_t pictureCount() const { return 0; }
    virtual std::optional<Picture> getPicture(size_t index) const;

    std::string title() const { return tags().text("title"); }
    std::string artist() const { return tags().text("artist"); }
    std::string album() const { return tags().text("album"); }
    std::string albumArtist() const { return tags().text("albumartist"); }
    std::string genre() const { return tags().text("genre"); }
    std::string composer() const { return tags().text("composer"); }

    /// First four-digit run of the date, 0 without one
    uint32_t year() const { return parseYear(tags().text("date")); }

    // "n/total" fields; a missing half reads as 0
    uint32_t track() const { return parseNumberPair(tags().text("tracknumber")).first; }
    uint32_t trackTotal() const { return parseNumberPair(tags().text("tracknumber")).second; }
    uint32_t disc() const { return parseNumberPair(tags().text("discnumber")).first; }
    uint32_t discTotal() const { return parseNumberPair(tags().text("discnumber")).second; }

    /// Comment with an empty description if there is one, else the first comment
    std::string comment() const;

    std::string getTag(const std::string& key) const;
    std::vector<std::string> getTagValues(const std::string& key) const { return tags().texts(key); }
    bool hasTag(const std::string& key) const { return tags().contains(key); }

    /// First text value of every key, keyed by canonical name
    std::map<std::string, std::string> getAllTags() const;

    /// The first FrontCover picture, else the first picture
    std::optional<Picture> getFrontCover() const;

    bool isEmpty() const { return tags().empty() && pictureCount() == 0; }

    static std::pair<uint32_t, uint32_t> parseNumberPair(const std::string& text);
    static uint32_t parseYear(const std::string& text);
};

} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_TAG_H
