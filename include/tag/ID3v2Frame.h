/*
 * ID3v2Frame.h - ID3v2 frame envelope, categories and body decoders
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_TAG_ID3V2FRAME_H
#define AUDIOMETA_TAG_ID3V2FRAME_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tag/ID3v2Header.h"
#include "tag/Tag.h"

namespace AudioMeta {
namespace Tag {

/**
 * @brief Frame flag bits
 *
 * v2.3 and v2.4 number the format flags differently; v2.2 frames have
 * no flags at all.
 */
namespace FrameFlags {
    constexpr uint16_t V23_COMPRESSION = 0x0080;
    constexpr uint16_t V23_ENCRYPTION = 0x0040;

    constexpr uint16_t V24_COMPRESSION = 0x0008;
    constexpr uint16_t V24_ENCRYPTION = 0x0004;
    constexpr uint16_t V24_UNSYNCHRONISATION = 0x0002;
    constexpr uint16_t V24_DATA_LENGTH_INDICATOR = 0x0001;
} // namespace FrameFlags

/**
 * @brief Generic frame envelope: id, declared size, flags and raw body
 *
 * v2.2: 3-byte id, 3-byte big-endian size, no flags.
 * v2.3: 4-byte id, 4-byte big-endian size, 2 flag bytes.
 * v2.4: 4-byte id, 4-byte synchsafe size, 2 flag bytes.
 */
struct ID3v2FrameEnvelope {
    std::string id;
    uint32_t size = 0;
    uint16_t flags = 0;
    std::vector<uint8_t> body;

    static size_t headerSize(ID3Version version);

    /**
     * @brief Decode one envelope from the start of data
     *
     * @param consumed Set to header plus body size on success
     * @throws MetadataException INVALID_FRAME when the header is
     *         truncated, the id holds a byte outside A-Z0-9 (padding
     *         included), or the body runs past the end of data
     */
    static ID3v2FrameEnvelope parse(const uint8_t* data, size_t size,
                                    ID3Version version, size_t& consumed);
};

/**
 * @brief Semantic category of a frame, driving aggregation
 */
enum class FrameCategory {
    Text,
    NumericText,
    Timestamp,
    Genre,
    Comment,
    SyncedLyrics,
    UserText,
    Object,
    Private,
    Picture,
    Other
};

std::string toString(FrameCategory category);

/**
 * @brief Map a v2.2 three-character id to its v2.3 equivalent
 *
 * v2.3 and v2.4 ids, and v2.2 ids without an equivalent, are returned
 * unchanged.
 */
std::string normalizeFrameId(const std::string& id, ID3Version version);

/**
 * @brief Category of a frame id, or nullopt if the id is not decoded
 */
std::optional<FrameCategory> categorize(const std::string& frame_id, ID3Version version);

/**
 * @brief A decoded frame body
 *
 * Only the fields relevant to the category are filled in:
 * - Text, NumericText, Timestamp, Genre: values
 * - Comment, SyncedLyrics: language, description, values (one entry)
 * - UserText: description, values (one entry)
 * - Object: mime_type, filename, description, data
 * - Private: owner, data
 * - Picture: picture
 * - Other: values (URL, counter, rating) or owner and data (UFID, MCDI)
 */
struct ID3v2Frame {
    std::string id;
    FrameCategory category = FrameCategory::Other;
    std::vector<std::string> values;
    std::string description;
    std::string language;
    std::string owner;
    std::string filename;
    std::string mime_type;
    std::vector<uint8_t> data;
    Picture picture;

    /**
     * @brief First text value, or an empty string
     */
    std::string value() const { return values.empty() ? "" : values.front(); }
};

/**
 * @brief Per-category frame body decoders
 */
class ID3v2FrameDecoder {
public:
    /**
     * @brief Decode an envelope's body according to its category
     *
     * The body must already have unsynchronisation and any data length
     * indicator removed.
     *
     * @return The frame, or nullopt when the id is unclassifiable
     * @throws MetadataException INVALID_FRAME for a truncated or
     *         malformed body
     */
    static std::optional<ID3v2Frame> decode(const ID3v2FrameEnvelope& envelope, ID3Version version);

    /**
     * @brief Expand ID3v1 genre references in TCON values
     *
     * Handles bare indices ("17"), v2.3 parenthesised references with
     * optional refinement ("(17)Rock & Roll", "((Escaped)"), and the
     * "RX" (Remix) and "CR" (Cover) keywords.
     */
    static std::vector<std::string> resolveGenres(const std::vector<std::string>& values);

    /**
     * @brief MIME type for a v2.2 PIC image format, e.g. "JPG" -> "image/jpeg"
     */
    static std::string mimeTypeFromImageFormat(const std::string& format);

private:
    static void decodeText(const uint8_t* data, size_t size, ID3v2Frame& frame);
    static void decodeComment(const uint8_t* data, size_t size, ID3v2Frame& frame);
    static void decodeSyncedLyrics(const uint8_t* data, size_t size, ID3v2Frame& frame);
    static void decodeUserText(const uint8_t* data, size_t size, ID3v2Frame& frame);
    static void decodeObject(const uint8_t* data, size_t size, ID3v2Frame& frame);
    static void decodePrivate(const uint8_t* data, size_t size, ID3v2Frame& frame);
    static void decodeAPIC(const uint8_t* data, size_t size, ID3v2Frame& frame);
    static void decodePIC(const uint8_t* data, size_t size, ID3v2Frame& frame);
    static void decodeOther(const std::string& normalized_id, const uint8_t* data,
                            size_t size, ID3v2Frame& frame);
};

} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_ID3V2FRAME_H
