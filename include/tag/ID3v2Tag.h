/*
 * ID3v2Tag.h - ID3v2 tag container
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_TAG_ID3V2TAG_H
#define AUDIOMETA_TAG_ID3V2TAG_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tag/ID3v2Header.h"
#include "tag/Tag.h"
#include "tag/TagSet.h"

namespace AudioMeta {
namespace IO {
class IOHandler;
} // namespace IO

namespace Tag {

/**
 * @brief ID3v2.2/2.3/2.4 tag
 *
 * Structure of an ID3v2 tag:
 * - 10-byte header ("ID3", version, revision, flags, synchsafe size)
 * - Optional extended header (v2.3/v2.4)
 * - Frames
 * - Optional padding
 * - Optional 10-byte footer (v2.4, flag bit 4)
 *
 * Frame values are stored under raw frame ids and composite keys; the
 * version's FieldMap lets callers use canonical names instead. Picture
 * frames are held apart from the tag set.
 */
class ID3v2Tag : public Tag {
public:
    /**
     * @brief Decode a tag from a buffer starting with the "ID3" header
     *
     * A buffer shorter than the declared size is decoded as far as it
     * goes.
     *
     * @throws MetadataException HEADER_NOT_FOUND, UNSUPPORTED_VERSION or
     *         MALFORMED_INTEGER from the header, INVALID_HEADER for a bad
     *         extended header
     */
    static std::unique_ptr<ID3v2Tag> parse(const uint8_t* data, size_t size);

    /**
     * @brief Read and decode a tag at the handler's current position
     *
     * Leaves the handler positioned after the tag (or at end of data).
     */
    static std::unique_ptr<ID3v2Tag> read(IO::IOHandler& handler);

    ID3v2Tag() = default;
    ~ID3v2Tag() override = default;

    ID3v2Tag(const ID3v2Tag&) = delete;
    ID3v2Tag& operator=(const ID3v2Tag&) = delete;
    ID3v2Tag(ID3v2Tag&&) = default;
    ID3v2Tag& operator=(ID3v2Tag&&) = default;

    // ========================================================================
    // Tag interface implementation
    // ========================================================================

    const TagSet& tags() const override { return m_tags; }
    std::string formatName() const override { return toString(m_header.version); }

    size_t pictureCount() const override { return m_pictures.size(); }
    std::optional<Picture> getPicture(size_t index) const override;

    // ========================================================================
    // ID3v2-specific methods
    // ========================================================================

    const ID3v2Header& header() const { return m_header; }
    ID3Version version() const { return m_header.version; }

    /**
     * @brief Bytes occupied in the file: 10 + declared size (+10 footer)
     */
    size_t totalSize() const { return m_header.totalSize(); }

    const std::vector<Picture>& pictures() const { return m_pictures; }

private:
    /**
     * @brief Bytes of extended header to skip, including its size field
     */
    static size_t extendedHeaderSize(const ID3v2Header& header, const uint8_t* data, size_t size);

    ID3v2Header m_header;
    TagSet m_tags;
    std::vector<Picture> m_pictures;
};

} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_ID3V2TAG_H
