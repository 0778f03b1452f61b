/*
 * ID3v2Frame.cpp - ID3v2 frame envelope, categories and body decoders
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

using Core::Utility::UTF8Util;
using ID3v2Utils::TextEncoding;
namespace ByteCodec = Core::Utility::ByteCodec;

namespace {

[[noreturn]] void throwInvalidFrame(const std::string& id, const std::string& reason) {
    throw MetadataException(MetadataError::INVALID_FRAME, "Invalid " + id + " frame: " + reason);
}

bool isFrameIdChar(uint8_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

// Latin-1 string ending at the first NUL or the end of data
std::string latin1Until(const uint8_t* data, size_t size, size_t& offset, bool& terminated) {
    size_t end = offset;
    while (end < size && data[end] != 0x00) {
        end++;
    }
    terminated = end < size;
    std::string out = UTF8Util::fromLatin1(data + offset, end - offset);
    offset = terminated ? end + 1 : end;
    return out;
}

} // namespace

// ============================================================================
// Envelope
// ============================================================================

size_t ID3v2FrameEnvelope::headerSize(ID3Version version) {
    return version == ID3Version::V2_2 ? 6 : 10;
}

ID3v2FrameEnvelope ID3v2FrameEnvelope::parse(const uint8_t* data, size_t size,
                                             ID3Version version, size_t& consumed) {
    consumed = 0;
    size_t header_size = headerSize(version);
    if (!data || size < header_size) {
        throw MetadataException(MetadataError::INVALID_FRAME, "Truncated frame header");
    }

    size_t id_size = version == ID3Version::V2_2 ? 3 : 4;
    for (size_t i = 0; i < id_size; ++i) {
        if (!isFrameIdChar(data[i])) {
            throw MetadataException(MetadataError::INVALID_FRAME, "Invalid frame id");
        }
    }

    ID3v2FrameEnvelope envelope;
    envelope.id.assign(reinterpret_cast<const char*>(data), id_size);

    switch (version) {
        case ID3Version::V2_2:
            envelope.size = static_cast<uint32_t>(ByteCodec::readBEBytes(data + 3, 3));
            break;
        case ID3Version::V2_3:
            envelope.size = ByteCodec::readBE<uint32_t>(data + 4);
            envelope.flags = ByteCodec::readBE<uint16_t>(data + 8);
            break;
        case ID3Version::V2_4:
            envelope.size = static_cast<uint32_t>(ByteCodec::decodeSynchsafe(data + 4, 4));
            envelope.flags = ByteCodec::readBE<uint16_t>(data + 8);
            break;
    }

    if (envelope.size > size - header_size) {
        throwInvalidFrame(envelope.id, "size " + std::to_string(envelope.size) +
                          " exceeds available data (" + std::to_string(size - header_size) + ")");
    }

    envelope.body.assign(data + header_size, data + header_size + envelope.size);
    consumed = header_size + envelope.size;
    return envelope;
}

// ============================================================================
// Categories
// ============================================================================

std::string toString(FrameCategory category) {
    switch (category) {
        case FrameCategory::Text: return "Text";
        case FrameCategory::NumericText: return "NumericText";
        case FrameCategory::Timestamp: return "Timestamp";
        case FrameCategory::Genre: return "Genre";
        case FrameCategory::Comment: return "Comment";
        case FrameCategory::SyncedLyrics: return "SyncedLyrics";
        case FrameCategory::UserText: return "UserText";
        case FrameCategory::Object: return "Object";
        case FrameCategory::Private: return "Private";
        case FrameCategory::Picture: return "Picture";
        case FrameCategory::Other: return "Other";
    }
    return "Unknown";
}

std::string normalizeFrameId(const std::string& id, ID3Version version) {
    if (version != ID3Version::V2_2) {
        return id;
    }

    static const std::map<std::string, std::string> v22_to_v23_map = {
        // Text frames
        {"TT1", "TIT1"}, {"TT2", "TIT2"}, {"TT3", "TIT3"},
        {"TP1", "TPE1"}, {"TP2", "TPE2"}, {"TP3", "TPE3"}, {"TP4", "TPE4"},
        {"TCM", "TCOM"}, {"TXT", "TEXT"}, {"TLA", "TLAN"}, {"TCO", "TCON"},
        {"TAL", "TALB"}, {"TPA", "TPOS"}, {"TRK", "TRCK"}, {"TRC", "TSRC"},
        {"TYE", "TYER"}, {"TDA", "TDAT"}, {"TIM", "TIME"}, {"TRD", "TRDA"},
        {"TMT", "TMED"}, {"TFT", "TFLT"}, {"TBP", "TBPM"}, {"TCR", "TCOP"},
        {"TPB", "TPUB"}, {"TEN", "TENC"}, {"TSS", "TSSE"}, {"TOF", "TOFN"},
        {"TLE", "TLEN"}, {"TSI", "TSIZ"}, {"TDY", "TDLY"}, {"TKE", "TKEY"},
        {"TOT", "TOAL"}, {"TOA", "TOPE"}, {"TOL", "TOLY"}, {"TOR", "TORY"},
        {"TXX", "TXXX"},

        // URL frames
        {"WAF", "WOAF"}, {"WAR", "WOAR"}, {"WAS", "WOAS"}, {"WCM", "WCOM"},
        {"WCP", "WCOP"}, {"WPB", "WPUB"}, {"WXX", "WXXX"},

        {"COM", "COMM"}, {"ULT", "USLT"}, {"SLT", "SYLT"},
        {"PIC", "APIC"}, {"GEO", "GEOB"},

        {"CNT", "PCNT"}, {"POP", "POPM"}, {"UFI", "UFID"}, {"MCI", "MCDI"},
        {"BUF", "RBUF"}, {"CRA", "AENC"}, {"CRM", "COMR"}, {"ETC", "ETCO"},
        {"EQU", "EQUA"}, {"IPL", "IPLS"}, {"LNK", "LINK"}, {"MLL", "MLLT"},
        {"REV", "RVRB"}, {"STC", "SYTC"},
    };

    auto it = v22_to_v23_map.find(id);
    if (it != v22_to_v23_map.end()) {
        return it->second;
    }
    return id;
}

std::optional<FrameCategory> categorize(const std::string& frame_id, ID3Version version) {
    static const std::set<std::string> numeric_ids = {"TBPM", "TDLY", "TLEN", "TSIZ"};
    static const std::set<std::string> timestamp_ids = {
        "TDEN", "TDOR", "TDRC", "TDRL", "TDTG", "TYER", "TDAT", "TIME", "TORY", "TRDA"
    };
    static const std::set<std::string> other_ids = {"PCNT", "POPM", "UFID", "MCDI"};

    std::string id = normalizeFrameId(frame_id, version);
    if (id.empty()) {
        return std::nullopt;
    }

    if (id == "TCON") return FrameCategory::Genre;
    if (id == "TXXX" || id == "WXXX") return FrameCategory::UserText;
    if (id == "COMM" || id == "USLT") return FrameCategory::Comment;
    if (id == "SYLT") return FrameCategory::SyncedLyrics;
    if (id == "GEOB") return FrameCategory::Object;
    if (id == "APIC") return FrameCategory::Picture;
    if (id == "PRIV" && version != ID3Version::V2_2) return FrameCategory::Private;
    if (numeric_ids.count(id)) return FrameCategory::NumericText;
    if (timestamp_ids.count(id)) return FrameCategory::Timestamp;
    if (id[0] == 'T') return FrameCategory::Text;
    if (id[0] == 'W' || other_ids.count(id)) return FrameCategory::Other;

    return std::nullopt;
}

// ============================================================================
// Body decoders
// ============================================================================

std::optional<ID3v2Frame> ID3v2FrameDecoder::decode(const ID3v2FrameEnvelope& envelope, ID3Version version) {
    auto category = categorize(envelope.id, version);
    if (!category) {
        Debug::log("id3v2", "ID3v2FrameDecoder::decode: Unclassifiable frame ", envelope.id);
        return std::nullopt;
    }

    ID3v2Frame frame;
    frame.id = envelope.id;
    frame.category = *category;

    const uint8_t* data = envelope.body.data();
    size_t size = envelope.body.size();

    switch (frame.category) {
        case FrameCategory::Text:
        case FrameCategory::NumericText:
        case FrameCategory::Timestamp:
            decodeText(data, size, frame);
            break;
        case FrameCategory::Genre:
            decodeText(data, size, frame);
            frame.values = resolveGenres(frame.values);
            break;
        case FrameCategory::Comment:
            decodeComment(data, size, frame);
            break;
        case FrameCategory::SyncedLyrics:
            decodeSyncedLyrics(data, size, frame);
            break;
        case FrameCategory::UserText:
            decodeUserText(data, size, frame);
            break;
        case FrameCategory::Object:
            decodeObject(data, size, frame);
            break;
        case FrameCategory::Private:
            decodePrivate(data, size, frame);
            break;
        case FrameCategory::Picture:
            if (version == ID3Version::V2_2) {
                decodePIC(data, size, frame);
            } else {
                decodeAPIC(data, size, frame);
            }
            break;
        case FrameCategory::Other:
            decodeOther(normalizeFrameId(envelope.id, version), data, size, frame);
            break;
    }

    return frame;
}

void ID3v2FrameDecoder::decodeText(const uint8_t* data, size_t size, ID3v2Frame& frame) {
    if (size < 1) {
        throwInvalidFrame(frame.id, "missing encoding byte");
    }
    TextEncoding encoding = ID3v2Utils::encodingFromByte(data[0]);
    frame.values = ID3v2Utils::splitTextValues(data + 1, size - 1, encoding);
}

void ID3v2FrameDecoder::decodeComment(const uint8_t* data, size_t size, ID3v2Frame& frame) {
    // Encoding byte and 3-byte language code
    if (size < 4) {
        throwInvalidFrame(frame.id, "truncated before language");
    }
    TextEncoding encoding = ID3v2Utils::encodingFromByte(data[0]);
    frame.language = UTF8Util::fromLatin1(data + 1, 3);

    size_t offset = 4;
    if (!ID3v2Utils::readTerminatedString(data, size, offset, encoding, frame.description)) {
        throwInvalidFrame(frame.id, "description not terminated");
    }

    // A trailing terminator on the text itself is tolerated
    size_t text_end = offset + ID3v2Utils::findNullTerminator(data + offset, size - offset, encoding);
    frame.values.push_back(ID3v2Utils::decodeText(data + offset, text_end - offset, encoding));
}

void ID3v2FrameDecoder::decodeSyncedLyrics(const uint8_t* data, size_t size, ID3v2Frame& frame) {
    // Encoding, language, timestamp format, content type
    if (size < 6) {
        throwInvalidFrame(frame.id, "truncated before description");
    }
    TextEncoding encoding = ID3v2Utils::encodingFromByte(data[0]);
    frame.language = UTF8Util::fromLatin1(data + 1, 3);

    size_t offset = 6;
    if (!ID3v2Utils::readTerminatedString(data, size, offset, encoding, frame.description)) {
        throwInvalidFrame(frame.id, "description not terminated");
    }

    std::string lyrics;
    bool first = true;
    while (offset < size) {
        std::string line;
        if (!ID3v2Utils::readTerminatedString(data, size, offset, encoding, line)) {
            break;
        }
        if (size - offset < 4) {
            Debug::log("id3v2", "ID3v2FrameDecoder::decodeSyncedLyrics: Entry without timestamp in ", frame.id);
            break;
        }
        offset += 4;

        if (!first) {
            lyrics += '\n';
        }
        lyrics += line;
        first = false;
    }
    frame.values.push_back(lyrics);
}

void ID3v2FrameDecoder::decodeUserText(const uint8_t* data, size_t size, ID3v2Frame& frame) {
    if (size < 1) {
        throwInvalidFrame(frame.id, "missing encoding byte");
    }
    TextEncoding encoding = ID3v2Utils::encodingFromByte(data[0]);

    size_t offset = 1;
    if (!ID3v2Utils::readTerminatedString(data, size, offset, encoding, frame.description)) {
        throwInvalidFrame(frame.id, "description not terminated");
    }

    bool is_url = frame.id == "WXXX" || frame.id == "WXX";
    if (is_url) {
        bool terminated = false;
        frame.values.push_back(latin1Until(data, size, offset, terminated));
        return;
    }

    std::vector<std::string> values = ID3v2Utils::splitTextValues(data + offset, size - offset, encoding);
    frame.values.push_back(values.empty() ? "" : values.front());
}

void ID3v2FrameDecoder::decodeObject(const uint8_t* data, size_t size, ID3v2Frame& frame) {
    if (size < 1) {
        throwInvalidFrame(frame.id, "missing encoding byte");
    }
    TextEncoding encoding = ID3v2Utils::encodingFromByte(data[0]);

    size_t offset = 1;
    bool terminated = false;
    frame.mime_type = latin1Until(data, size, offset, terminated);
    if (!terminated) {
        throwInvalidFrame(frame.id, "MIME type not terminated");
    }
    if (!ID3v2Utils::readTerminatedString(data, size, offset, encoding, frame.filename)) {
        throwInvalidFrame(frame.id, "filename not terminated");
    }
    if (!ID3v2Utils::readTerminatedString(data, size, offset, encoding, frame.description)) {
        throwInvalidFrame(frame.id, "description not terminated");
    }
    frame.data.assign(data + offset, data + size);
}

void ID3v2FrameDecoder::decodePrivate(const uint8_t* data, size_t size, ID3v2Frame& frame) {
    size_t offset = 0;
    bool terminated = false;
    frame.owner = latin1Until(data, size, offset, terminated);
    if (!terminated) {
        throwInvalidFrame(frame.id, "owner not terminated");
    }
    frame.data.assign(data + offset, data + size);
}

void ID3v2FrameDecoder::decodeAPIC(const uint8_t* data, size_t size, ID3v2Frame& frame) {
    if (size < 1) {
        throwInvalidFrame(frame.id, "missing encoding byte");
    }
    TextEncoding encoding = ID3v2Utils::encodingFromByte(data[0]);

    size_t offset = 1;
    bool terminated = false;
    std::string mime_type = latin1Until(data, size, offset, terminated);
    if (!terminated) {
        throwInvalidFrame(frame.id, "MIME type not terminated");
    }
    if (offset >= size) {
        throwInvalidFrame(frame.id, "missing picture type");
    }
    uint8_t picture_type = data[offset++];

    std::string description;
    if (!ID3v2Utils::readTerminatedString(data, size, offset, encoding, description)) {
        throwInvalidFrame(frame.id, "description not terminated");
    }

    frame.picture.type = static_cast<PictureType>(picture_type);
    frame.picture.mime_type = mime_type;
    frame.picture.description = description;
    frame.picture.data.assign(data + offset, data + size);
    frame.mime_type = mime_type;
    frame.description = description;

    Debug::log("id3v2", "ID3v2FrameDecoder::decodeAPIC: type=", static_cast<int>(picture_type),
               ", MIME=", mime_type, ", size=", frame.picture.data.size());
}

void ID3v2FrameDecoder::decodePIC(const uint8_t* data, size_t size, ID3v2Frame& frame) {
    // Encoding byte, 3-character image format, picture type
    if (size < 5) {
        throwInvalidFrame(frame.id, "truncated before description");
    }
    TextEncoding encoding = ID3v2Utils::encodingFromByte(data[0]);
    std::string format(reinterpret_cast<const char*>(data + 1), 3);
    uint8_t picture_type = data[4];

    size_t offset = 5;
    std::string description;
    if (!ID3v2Utils::readTerminatedString(data, size, offset, encoding, description)) {
        throwInvalidFrame(frame.id, "description not terminated");
    }

    frame.picture.type = static_cast<PictureType>(picture_type);
    frame.picture.mime_type = mimeTypeFromImageFormat(format);
    frame.picture.description = description;
    frame.picture.data.assign(data + offset, data + size);
    frame.mime_type = frame.picture.mime_type;
    frame.description = description;
}

void ID3v2FrameDecoder::decodeOther(const std::string& normalized_id, const uint8_t* data,
                                    size_t size, ID3v2Frame& frame) {
    if (normalized_id == "PCNT") {
        if (size < 1 || size > 8) {
            throwInvalidFrame(frame.id, "invalid counter width " + std::to_string(size));
        }
        frame.values.push_back(std::to_string(ByteCodec::readBEBytes(data, size)));
        return;
    }

    if (normalized_id == "POPM") {
        size_t offset = 0;
        bool terminated = false;
        std::string email = latin1Until(data, size, offset, terminated);
        if (!terminated || offset >= size) {
            throwInvalidFrame(frame.id, "truncated before rating");
        }
        uint8_t rating = data[offset++];

        // The play counter may be omitted
        uint64_t count = 0;
        size_t counter_size = std::min<size_t>(size - offset, 8);
        if (counter_size > 0) {
            count = ByteCodec::readBEBytes(data + offset, counter_size);
        }
        frame.owner = email;
        frame.values.push_back(email + ":" + std::to_string(rating) + ":" + std::to_string(count));
        return;
    }

    if (normalized_id == "UFID") {
        size_t offset = 0;
        bool terminated = false;
        frame.owner = latin1Until(data, size, offset, terminated);
        if (!terminated) {
            throwInvalidFrame(frame.id, "owner not terminated");
        }
        frame.data.assign(data + offset, data + size);
        return;
    }

    if (normalized_id == "MCDI") {
        frame.data.assign(data, data + size);
        return;
    }

    // URL link frame: Latin-1 text up to an optional terminator
    size_t offset = 0;
    bool terminated = false;
    frame.values.push_back(latin1Until(data, size, offset, terminated));
}

std::vector<std::string> ID3v2FrameDecoder::resolveGenres(const std::vector<std::string>& values) {
    auto keyword = [](const std::string& text) -> std::string {
        if (text == "RX") return "Remix";
        if (text == "CR") return "Cover";
        return "";
    };
    auto index = [](const std::string& text) -> std::string {
        if (text.empty() || text.size() > 3 ||
            !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return "";
        }
        int number = std::stoi(text);
        return number <= 255 ? ID3v1Tag::genreFromIndex(static_cast<uint8_t>(number)) : "";
    };

    std::vector<std::string> genres;
    for (const auto& value : values) {
        std::string name = keyword(value);
        if (name.empty()) {
            name = index(value);
        }
        if (!name.empty()) {
            genres.push_back(name);
            continue;
        }

        // v2.3 references: "(n)" or "(RX)" runs, optionally followed by a refinement
        std::string rest = value;
        bool had_reference = false;
        while (rest.size() > 1 && rest[0] == '(' && rest[1] != '(') {
            size_t close = rest.find(')');
            if (close == std::string::npos) {
                break;
            }
            std::string inner = rest.substr(1, close - 1);
            std::string resolved = keyword(inner);
            if (resolved.empty()) {
                resolved = index(inner);
            }
            if (resolved.empty()) {
                break;
            }
            genres.push_back(resolved);
            had_reference = true;
            rest = rest.substr(close + 1);
        }

        // "((" escapes a literal opening parenthesis
        if (rest.compare(0, 2, "((") == 0) {
            rest = rest.substr(1);
        }
        if (!rest.empty() && (!had_reference || rest != genres.back())) {
            genres.push_back(rest);
        }
    }
    return genres;
}

std::string ID3v2FrameDecoder::mimeTypeFromImageFormat(const std::string& format) {
    std::string upper = format;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "JPG") return "image/jpeg";
    if (upper == "PNG") return "image/png";
    if (upper == "GIF") return "image/gif";
    if (upper == "BMP") return "image/bmp";

    std::string lower = format;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "image/" + lower;
}

} // namespace Tag
} // namespace AudioMeta
