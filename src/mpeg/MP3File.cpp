/*
 * MP3File.cpp - Top-level MP3 metadata decode
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
namespace MPEG {

namespace {

/**
 * @brief Closes a handler when the decode leaves scope
 */
class HandlerCloser {
public:
    explicit HandlerCloser(IO::IOHandler& handler) : m_handler(handler) {}

    ~HandlerCloser() {
        if (m_handler.close() != 0) {
            Debug::log("io", "MP3File: Close failed, error ", m_handler.getLastError());
        }
    }

    HandlerCloser(const HandlerCloser&) = delete;
    HandlerCloser& operator=(const HandlerCloser&) = delete;

private:
    IO::IOHandler& m_handler;
};

void seekOrThrow(IO::IOHandler& handler, off_t offset) {
    if (handler.seek(offset, SEEK_SET) != 0) {
        throw MetadataException(MetadataError::IO_ERROR,
                                "Seek to " + std::to_string(offset) + " failed");
    }
}

} // anonymous namespace

MP3File MP3File::open(const std::string& path) {
    Debug::log("mp3", "MP3File::open: ", path);
    IO::File::FileIOHandler handler(path);
    return load(handler);
}

MP3File MP3File::load(IO::IOHandler& handler) {
    HandlerCloser closer(handler);
    MP3File file;

    off_t file_size = handler.getFileSize();
    if (file_size < 0) {
        throw MetadataException(MetadataError::IO_ERROR, "Unable to determine stream size");
    }
    file.m_file_size = static_cast<uint64_t>(file_size);

    seekOrThrow(handler, 0);
    try {
        file.m_id3v2 = Tag::ID3v2Tag::read(handler);
    } catch (const MetadataException& e) {
        Debug::log("mp3", "MP3File::load: No ID3v2 tag: ", e.what());
        file.m_id3v2.reset();
    }

    off_t audio_search = 0;
    if (file.m_id3v2) {
        audio_search = static_cast<off_t>(
            std::min<uint64_t>(file.m_id3v2->totalSize(), file.m_file_size));
    }
    seekOrThrow(handler, audio_search);

    file.m_stream_info = MP3StreamInfo::parse(handler);

    if (!file.m_id3v2) {
        file.readID3v1(handler);
    }

    Debug::log("mp3", "MP3File::load: ", file.tag() ? file.tag()->formatName() : std::string("no tag"),
               ", ", file.m_stream_info.duration(), " s");
    return file;
}

void MP3File::readID3v1(IO::IOHandler& handler) {
    uint64_t audio_end = m_stream_info.start() + m_stream_info.size();
    if (audio_end >= m_file_size) {
        return;
    }

    seekOrThrow(handler, static_cast<off_t>(audio_end));
    std::vector<uint8_t> trailer = handler.readBytes(static_cast<size_t>(m_file_size - audio_end));

    std::string_view view(reinterpret_cast<const char*>(trailer.data()), trailer.size());
    size_t search_from = 0;
    size_t ape = view.find("APETAGEX");
    if (ape != std::string_view::npos) {
        search_from = ape + 8;
    }

    size_t marker = view.find("TAG", search_from);
    if (marker == std::string_view::npos || trailer.size() - marker < Tag::ID3v1Tag::TAG_SIZE) {
        Debug::log("id3v1", "MP3File::readID3v1: No ID3v1 trailer after offset ", audio_end);
        return;
    }

    try {
        m_id3v1 = Tag::ID3v1Tag::parse(trailer.data() + marker, Tag::ID3v1Tag::TAG_SIZE);
    } catch (const MetadataException& e) {
        Debug::log("id3v1", "MP3File::readID3v1: ", e.what());
    }
}

const Tag::Tag* MP3File::tag() const {
    if (m_id3v2) {
        return m_id3v2.get();
    }
    return m_id3v1.get();
}

const Tag::TagSet& MP3File::tags() const {
    static const Tag::TagSet empty;
    const Tag::Tag* current = tag();
    return current ? current->tags() : empty;
}

const std::vector<Tag::Picture>& MP3File::pictures() const {
    static const std::vector<Tag::Picture> none;
    return m_id3v2 ? m_id3v2->pictures() : none;
}

} // namespace MPEG
} // namespace AudioMeta
