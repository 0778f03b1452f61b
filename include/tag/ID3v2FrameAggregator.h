/*
 * ID3v2FrameAggregator.h - Folds decoded ID3v2 frames into a tag set
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_TAG_ID3V2FRAMEAGGREGATOR_H
#define AUDIOMETA_TAG_ID3V2FRAMEAGGREGATOR_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "tag/ID3v2Frame.h"
#include "tag/ID3v2Header.h"
#include "tag/TagSet.h"

namespace AudioMeta {
namespace Tag {

/**
 * @brief Walks an ID3v2 frame region and builds the tag set
 *
 * Keying by category:
 * - Text, NumericText, Timestamp, Genre: raw frame id, last write wins
 * - Comment, SyncedLyrics: "{id}:{description}:{language}", appended
 * - UserText: "{id}:{description}", appended
 * - Object: "GEOB:{description}", appended
 * - Private: "PRIV:{owner}", appended
 * - Picture: collected separately, never stored in the tag set
 * - Other: raw frame id, appended
 *
 * The tag set carries the version's FieldMap so canonical names resolve.
 */
class ID3v2FrameAggregator {
public:
    explicit ID3v2FrameAggregator(ID3Version version);

    /**
     * @brief Scan a frame region until padding, exhaustion or a bad envelope
     *
     * Frame bodies that fail to decode are skipped; an envelope that fails
     * to decode ends the scan.
     *
     * @param data Frame region with tag-level unsynchronisation already removed
     * @return Number of frames folded into the tag set
     */
    size_t aggregate(const uint8_t* data, size_t size);

    /**
     * @brief Fold one decoded frame
     */
    void add(const ID3v2Frame& frame);

    const TagSet& tags() const { return m_tags; }
    const std::vector<Picture>& pictures() const { return m_pictures; }

    TagSet takeTags() { return std::move(m_tags); }
    std::vector<Picture> takePictures() { return std::move(m_pictures); }

    ID3Version version() const { return m_version; }

private:
    /**
     * @brief Apply v2.3/v2.4 frame format flags to the envelope body
     *
     * @return false if the frame is compressed or encrypted and must be skipped
     */
    bool unwrapBody(ID3v2FrameEnvelope& envelope) const;

    ID3Version m_version;
    TagSet m_tags;
    std::vector<Picture> m_pictures;
};

} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_ID3V2FRAMEAGGREGATOR_H
