/*
 * ID3v2Tag.cpp - ID3v2 tag container
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FINAL_BUILD
#include "audiometa.h"
#endif // !FINAL_BUILD

namespace AudioMeta {
namespace Tag {

// ============================================================================
// Static factory methods
// ============================================================================

std::unique_ptr<ID3v2Tag> ID3v2Tag::parse(const uint8_t* data, size_t size) {
    ID3v2Header header = ID3v2Header::parse(data, size);

    Debug::log("id3v2", "ID3v2Tag::parse: ", toString(header.version), ".", static_cast<int>(header.revision),
               " size=", header.size, " unsync=", header.flags.unsynchronisation,
               " extended=", header.flags.extended_header, " footer=", header.flags.footer);

    // Frames, padding and the extended header all live inside the declared size
    size_t available = size - ID3v2Header::HEADER_SIZE;
    size_t body_size = header.size;
    if (body_size > available) {
        Debug::log("id3v2", "ID3v2Tag::parse: Tag size (", body_size, ") exceeds available data (",
                   available, "), truncating");
        body_size = available;
    }

    const uint8_t* body = data + ID3v2Header::HEADER_SIZE;
    size_t frame_offset = 0;
    if (header.flags.extended_header) {
        frame_offset = extendedHeaderSize(header, body, body_size);
    }

    const uint8_t* frame_data = body + frame_offset;
    size_t frame_size = body_size - frame_offset;

    // v2.2/v2.3 unsynchronise the whole tag; v2.4 flags it per frame
    std::vector<uint8_t> resynced;
    if (header.flags.unsynchronisation && header.version != ID3Version::V2_4) {
        resynced = ID3v2Utils::decodeUnsync(frame_data, frame_size);
        Debug::log("id3v2", "ID3v2Tag::parse: Decoded unsynchronisation, size ", frame_size,
                   " -> ", resynced.size());
        frame_data = resynced.data();
        frame_size = resynced.size();
    }

    ID3v2FrameAggregator aggregator(header.version);
    aggregator.aggregate(frame_data, frame_size);

    auto tag = std::make_unique<ID3v2Tag>();
    tag->m_header = header;
    tag->m_tags = aggregator.takeTags();
    tag->m_pictures = aggregator.takePictures();

    Debug::log("id3v2", "ID3v2Tag::parse: Parsed ", tag->formatName(), " tag with ",
               tag->m_tags.size(), " keys and ", tag->m_pictures.size(), " pictures");
    return tag;
}

std::unique_ptr<ID3v2Tag> ID3v2Tag::read(IO::IOHandler& handler) {
    std::vector<uint8_t> data = handler.readBytes(ID3v2Header::HEADER_SIZE);
    ID3v2Header header = ID3v2Header::parse(data.data(), data.size());

    std::vector<uint8_t> body = handler.readBytes(header.size);
    if (body.size() < header.size) {
        Debug::log("id3v2", "ID3v2Tag::read: Short read, wanted ", header.size, " got ", body.size());
    }
    data.insert(data.end(), body.begin(), body.end());

    if (header.flags.footer) {
        // The footer repeats the header with "3DI"; nothing in it is needed
        std::vector<uint8_t> footer = handler.readBytes(ID3v2Header::FOOTER_SIZE);
        if (footer.size() < ID3v2Header::FOOTER_SIZE) {
            Debug::log("id3v2", "ID3v2Tag::read: Footer truncated (", footer.size(), " bytes)");
        }
    }

    return parse(data.data(), data.size());
}

size_t ID3v2Tag::extendedHeaderSize(const ID3v2Header& header, const uint8_t* data, size_t size) {
    if (header.version == ID3Version::V2_2) {
        // Bit 6 means compression in v2.2 and no extended header exists
        Debug::log("id3v2", "ID3v2Tag::extendedHeaderSize: Extended header flag set on v2.2 tag, ignoring");
        return 0;
    }

    if (size < 4) {
        throw MetadataException(MetadataError::INVALID_HEADER, "Truncated extended header");
    }

    uint32_t ext_size = 0;
    size_t skip = 0;
    if (header.version == ID3Version::V2_4) {
        // v2.4 uses a synchsafe size that counts the size field itself
        ext_size = static_cast<uint32_t>(Core::Utility::ByteCodec::decodeSynchsafe(data, 4));
        if (ext_size < 4) {
            throw MetadataException(MetadataError::INVALID_HEADER,
                                    "Extended header size " + std::to_string(ext_size) + " below minimum");
        }
        skip = ext_size - 4;
    } else {
        ext_size = Core::Utility::ByteCodec::readBE<uint32_t>(data);
        skip = ext_size;
    }

    if (skip > size - 4) {
        throw MetadataException(MetadataError::INVALID_HEADER,
                                "Extended header size " + std::to_string(ext_size) + " exceeds tag");
    }

    Debug::log("id3v2", "ID3v2Tag::extendedHeaderSize: Skipping extended header (", skip + 4, " bytes)");
    return skip + 4;
}

// ============================================================================
// Tag interface implementation
// ============================================================================

std::optional<Picture> ID3v2Tag::getPicture(size_t index) const {
    if (index >= m_pictures.size()) {
        return std::nullopt;
    }
    return m_pictures[index];
}

} // namespace Tag
} // namespace AudioMeta
