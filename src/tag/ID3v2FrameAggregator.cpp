/*
 * ID3v2FrameAggregator.cpp - Folds decoded ID3v2 frames into a tag set
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

ID3v2FrameAggregator::ID3v2FrameAggregator(ID3Version version)
    : m_version(version), m_tags(&FieldMap::forVersion(version)) {
}

size_t ID3v2FrameAggregator::aggregate(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return 0;
    }

    size_t offset = 0;
    size_t frame_count = 0;

    while (offset < size) {
        if (data[offset] == 0x00) {
            Debug::log("id3v2", "ID3v2FrameAggregator::aggregate: Reached padding at offset ", offset);
            break;
        }

        size_t consumed = 0;
        ID3v2FrameEnvelope envelope;
        try {
            envelope = ID3v2FrameEnvelope::parse(data + offset, size - offset, m_version, consumed);
        } catch (const MetadataException& e) {
            Debug::log("id3v2", "ID3v2FrameAggregator::aggregate: Stopping at offset ", offset, ": ", e.what());
            break;
        }
        offset += consumed;

        if (!unwrapBody(envelope)) {
            continue;
        }

        std::optional<ID3v2Frame> frame;
        try {
            frame = ID3v2FrameDecoder::decode(envelope, m_version);
        } catch (const MetadataException& e) {
            Debug::log("id3v2", "ID3v2FrameAggregator::aggregate: Skipping frame ", envelope.id, ": ", e.what());
            continue;
        }

        if (!frame) {
            continue;
        }

        add(*frame);
        frame_count++;
        Debug::log("id3v2", "ID3v2FrameAggregator::aggregate: Parsed frame ", envelope.id,
                   " (", envelope.size, " bytes, ", toString(frame->category), ")");
    }

    Debug::log("id3v2", "ID3v2FrameAggregator::aggregate: Parsed ", frame_count, " frames");
    return frame_count;
}

bool ID3v2FrameAggregator::unwrapBody(ID3v2FrameEnvelope& envelope) const {
    switch (m_version) {
        case ID3Version::V2_2:
            return true;

        case ID3Version::V2_3:
            if (envelope.flags & (FrameFlags::V23_COMPRESSION | FrameFlags::V23_ENCRYPTION)) {
                Debug::log("id3v2", "ID3v2FrameAggregator::unwrapBody: Frame ", envelope.id,
                           " is compressed or encrypted (not supported)");
                return false;
            }
            return true;

        case ID3Version::V2_4:
            if (envelope.flags & (FrameFlags::V24_COMPRESSION | FrameFlags::V24_ENCRYPTION)) {
                Debug::log("id3v2", "ID3v2FrameAggregator::unwrapBody: Frame ", envelope.id,
                           " is compressed or encrypted (not supported)");
                return false;
            }
            if (envelope.flags & FrameFlags::V24_UNSYNCHRONISATION) {
                envelope.body = ID3v2Utils::decodeUnsync(envelope.body.data(), envelope.body.size());
            }
            if (envelope.flags & FrameFlags::V24_DATA_LENGTH_INDICATOR) {
                if (envelope.body.size() < 4) {
                    Debug::log("id3v2", "ID3v2FrameAggregator::unwrapBody: Frame ", envelope.id,
                               " has data length indicator but insufficient data");
                    return false;
                }
                envelope.body.erase(envelope.body.begin(), envelope.body.begin() + 4);
            }
            return true;
    }
    return true;
}

void ID3v2FrameAggregator::add(const ID3v2Frame& frame) {
    switch (frame.category) {
        case FrameCategory::Text:
        case FrameCategory::NumericText:
        case FrameCategory::Timestamp:
        case FrameCategory::Genre: {
            std::vector<TagValue> values(frame.values.begin(), frame.values.end());
            m_tags.set(frame.id, std::move(values));
            break;
        }

        case FrameCategory::Comment:
        case FrameCategory::SyncedLyrics:
            m_tags.append(frame.id + ":" + frame.description + ":" + frame.language, frame.value());
            break;

        case FrameCategory::UserText:
            m_tags.append(frame.id + ":" + frame.description, frame.value());
            break;

        case FrameCategory::Object: {
            EncapsulatedObject object;
            object.filename = frame.filename;
            object.mime_type = frame.mime_type;
            object.description = frame.description;
            object.data = frame.data;
            m_tags.append("GEOB:" + frame.description, std::move(object));
            break;
        }

        case FrameCategory::Private:
            m_tags.append("PRIV:" + frame.owner, frame.data);
            break;

        case FrameCategory::Picture:
            m_pictures.push_back(frame.picture);
            break;

        case FrameCategory::Other:
            // One entry per frame: URL, counter or rating text, else the raw body
            if (!frame.values.empty()) {
                m_tags.append(frame.id, frame.value());
            } else {
                m_tags.append(frame.id, frame.data);
            }
            break;
    }
}

} // namespace Tag
} // namespace AudioMeta
