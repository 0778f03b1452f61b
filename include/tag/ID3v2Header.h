/*
 * ID3v2Header.h - ID3v2 tag header decoding
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef AUDIOMETA_TAG_ID3V2HEADER_H
#define AUDIOMETA_TAG_ID3V2HEADER_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace AudioMeta {
namespace Tag {

/**
 * @brief Supported ID3v2 revisions, valued by their version byte
 */
enum class ID3Version : uint8_t {
    V2_2 = 2,
    V2_3 = 3,
    V2_4 = 4
};

/**
 * @brief Human-readable version, e.g. "ID3v2.3"
 */
std::string toString(ID3Version version);

/**
 * @brief The four defined flag bits of the header flags byte
 *
 * Bits 7..4 in order. The low nibble is reserved and never decoded.
 */
struct ID3v2HeaderFlags {
    bool unsynchronisation = false;
    bool extended_header = false;
    bool experimental = false;
    bool footer = false;

    static ID3v2HeaderFlags fromByte(uint8_t flags);
};

/**
 * @brief Decoded 10-byte ID3v2 tag header
 *
 * Layout: "ID3", version byte, revision byte, flags byte, 4-byte
 * synchsafe size. The declared size excludes the header itself and the
 * footer but includes the extended header, frames and padding.
 */
struct ID3v2Header {
    static constexpr size_t HEADER_SIZE = 10;
    static constexpr size_t FOOTER_SIZE = 10;

    ID3Version version = ID3Version::V2_4;
    uint8_t revision = 0;
    ID3v2HeaderFlags flags;
    uint32_t size = 0;

    /**
     * @brief Decode a tag header
     *
     * @param data At least HEADER_SIZE bytes
     * @throws MetadataException HEADER_NOT_FOUND if the "ID3" marker is
     *         missing or fewer than 10 bytes are given, UNSUPPORTED_VERSION
     *         for a version byte outside 2..4, MALFORMED_INTEGER for a
     *         size byte with bit 7 set
     */
    static ID3v2Header parse(const uint8_t* data, size_t size);

    /**
     * @brief Quick check for the "ID3" marker
     */
    static bool hasMarker(const uint8_t* data, size_t size);

    uint8_t majorVersion() const { return 2; }
    uint8_t minorVersion() const { return static_cast<uint8_t>(version); }

    /**
     * @brief Bytes occupied by the whole tag: header, body and footer
     */
    size_t totalSize() const {
        return HEADER_SIZE + size + (flags.footer ? FOOTER_SIZE : 0);
    }
};

} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_ID3V2HEADER_H
