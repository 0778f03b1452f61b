/*
 * MP3File.h - Top-level MP3 metadata decode
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_MPEG_MP3FILE_H
#define AUDIOMETA_MPEG_MP3FILE_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "mpeg/MP3StreamInfo.h"
#include "tag/ID3v1Tag.h"
#include "tag/ID3v2Tag.h"

namespace AudioMeta {
namespace IO {
class IOHandler;
} // namespace IO

namespace MPEG {

/**
 * @brief Tags and stream summary of one MP3 file
 *
 * An ID3v2 tag at the start of the file takes precedence. The ID3v1
 * trailer is only decoded when no ID3v2 tag could be read.
 */
class MP3File {
public:
    /**
     * @brief Decode a local file
     * @throws MetadataException IO_ERROR if the file cannot be opened,
     *         INSUFFICIENT_AUDIO_DATA if it holds no MPEG audio
     */
    static MP3File open(const std::string& path);

    /**
     * @brief Decode from any byte source, starting at offset 0
     *
     * The handler is closed before this returns or throws.
     */
    static MP3File load(IO::IOHandler& handler);

    MP3File(MP3File&&) = default;
    MP3File& operator=(MP3File&&) = default;

    uint64_t fileSize() const { return m_file_size; }
    const MP3StreamInfo& streamInfo() const { return m_stream_info; }

    /// nullptr when the file has no decodable ID3v2 tag
    const Tag::ID3v2Tag* id3v2() const { return m_id3v2.get(); }
    /// nullptr unless the ID3v1 fallback found a trailer
    const Tag::ID3v1Tag* id3v1() const { return m_id3v1.get(); }

    /// The tag in effect, or nullptr if the file carries none
    const Tag::Tag* tag() const;

    /// Tag set of the tag in effect; empty when there is none
    const Tag::TagSet& tags() const;

    const std::vector<Tag::Picture>& pictures() const;

private:
    MP3File() = default;

    void readID3v1(IO::IOHandler& handler);

    uint64_t m_file_size = 0;
    MP3StreamInfo m_stream_info;
    std::unique_ptr<Tag::ID3v2Tag> m_id3v2;
    std::unique_ptr<Tag::ID3v1Tag> m_id3v1;
};

} // namespace MPEG
} // namespace AudioMeta

#endif // AUDIOMETA_MPEG_MP3FILE_H
