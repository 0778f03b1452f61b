/*
 * ID3v1Tag.h - ID3v1/ID3v1.1 trailer tag
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_TAG_ID3V1TAG_H
#define AUDIOMETA_TAG_ID3V1TAG_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "tag/Tag.h"
#include "tag/TagSet.h"

namespace AudioMeta {
namespace Tag {

/**
 * @brief The 128 byte "TAG" trailer
 *
 *   offset  size  field
 *        0     3  "TAG"
 *        3    30  title
 *       33    30  artist
 *       63    30  album
 *       93     4  year
 *       97    30  comment; v1.1 puts NUL at 125 and the track at 126
 *      127     1  genre index, 255 when unset
 *
 * Text is Latin-1 padded with NULs or spaces. Non-empty fields land in
 * tags() under title, artist, album, date, comment, tracknumber, genre.
 */
class ID3v1Tag : public Tag {
public:
    static constexpr size_t TAG_SIZE = 128;
    static constexpr size_t GENRE_COUNT = 192;  // 80 standard plus the Winamp extensions

    /**
     * @throws MetadataException(HEADER_NOT_FOUND) when size is short of
     *         TAG_SIZE or the marker is absent
     */
    static std::unique_ptr<ID3v1Tag> parse(const uint8_t* data, size_t size);

    /// True when at least three bytes are present and they spell "TAG"
    static bool hasMarker(const uint8_t* data, size_t size);

    /// Empty for indices past the list, including 255
    static std::string genreFromIndex(uint8_t index);
    static const std::array<std::string, GENRE_COUNT>& genreList();

    const TagSet& tags() const override { return m_tags; }
    std::string formatName() const override { return m_has_track ? "ID3v1.1" : "ID3v1"; }

    bool isID3v1_1() const { return m_has_track; }
    uint8_t genreIndex() const { return m_genre; }

private:
    TagSet m_tags;
    uint8_t m_genre = 255;
    bool m_has_track = false;
};

} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_ID3V1TAG_H
