/*
 * MP3StreamInfo.cpp - Audio frame synchronizer and stream summary
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

const char* const TRAILING_TAG_MARKERS[] = {"APETAGEX", "LYRICSBEGIN", "TAG"};

void seekOrThrow(IO::IOHandler& handler, off_t offset, int whence) {
    if (handler.seek(offset, whence) != 0) {
        throw MetadataException(MetadataError::IO_ERROR,
                                "Seek to " + std::to_string(offset) + " failed");
    }
}

bool isSyncPrefix(uint8_t b0, uint8_t b1) {
    return b0 == 0xFF && (b1 & 0xE0) == 0xE0;
}

} // anonymous namespace

MP3StreamInfo MP3StreamInfo::parse(IO::IOHandler& handler) {
    std::vector<MPEGFrameHeader> frames = findFrames(handler);

    seekOrThrow(handler, 0, SEEK_END);
    off_t file_size = handler.tell();
    if (file_size < 0) {
        throw MetadataException(MetadataError::IO_ERROR, "Unable to determine stream size");
    }

    size_t window = static_cast<size_t>(
        std::min<uint64_t>(static_cast<uint64_t>(file_size), TRAILING_TAG_WINDOW));
    seekOrThrow(handler, file_size - static_cast<off_t>(window), SEEK_SET);
    std::vector<uint8_t> tail = handler.readBytes(window);

    uint64_t tag_offset = trailingTagOffset(tail.data(), tail.size());
    uint64_t audio_end = static_cast<uint64_t>(file_size) - tag_offset;
    Debug::log("streaminfo", "MP3StreamInfo::parse: file size ", file_size, ", trailing tags ",
               tag_offset, " bytes");

    return summarize(frames, audio_end);
}

std::vector<MPEGFrameHeader> MP3StreamInfo::findFrames(IO::IOHandler& handler) {
    ScanContext context;

    while (true) {
        off_t position = handler.tell();
        if (position < 0) {
            throw MetadataException(MetadataError::IO_ERROR, "Unable to determine stream position");
        }

        std::vector<uint8_t> window = handler.peekBytes(SYNC_WINDOW);
        if (window.size() < MPEGFrameHeader::HEADER_SIZE) {
            break;
        }

        auto it = std::find(window.begin(), window.end(), static_cast<uint8_t>(0xFF));
        if (it == window.end()) {
            seekOrThrow(handler, position + static_cast<off_t>(window.size()), SEEK_SET);
            continue;
        }

        size_t index = static_cast<size_t>(it - window.begin());
        off_t candidate = position + static_cast<off_t>(index);

        // Sync byte at the window edge: re-peek from it
        if (index + 1 >= window.size()) {
            seekOrThrow(handler, candidate, SEEK_SET);
            continue;
        }

        if (isSyncPrefix(window[index], window[index + 1])) {
            seekOrThrow(handler, candidate, SEEK_SET);
            if (scanRun(handler, context)) {
                Debug::log("streaminfo", "MP3StreamInfo::findFrames: Accepted ", context.run.size(),
                           " frame run at ", candidate);
                return std::move(context.run);
            }
        }

        seekOrThrow(handler, candidate + 1, SEEK_SET);
    }

    if (context.fallback) {
        Debug::log("streaminfo", "MP3StreamInfo::findFrames: Using ", context.fallback->size(),
                   " frame fallback run at ", context.fallback->front().start);
        return std::move(*context.fallback);
    }

    throw MetadataException(MetadataError::INSUFFICIENT_AUDIO_DATA,
                            "Missing XING header and insufficient MPEG frames");
}

bool MP3StreamInfo::scanRun(IO::IOHandler& handler, ScanContext& context) {
    context.run.clear();

    while (context.run.size() < ACCEPT_RUN) {
        off_t frame_start = handler.tell();
        try {
            context.run.push_back(MPEGFrameHeader::parse(handler));
        } catch (const MetadataException& e) {
            Debug::log("streaminfo", "MP3StreamInfo::scanRun: Run broken at ", frame_start, ": ", e.what());
            break;
        }

        const MPEGFrameHeader& frame = context.run.back();
        if (frame.xing) {
            break;
        }
        if (handler.seek(static_cast<off_t>(frame.start + frame.size), SEEK_SET) != 0) {
            break;
        }
    }

    if (context.run.size() >= ACCEPT_RUN || (!context.run.empty() && context.run.front().xing)) {
        return true;
    }

    if (context.run.size() >= FALLBACK_RUN && !context.fallback) {
        Debug::log("streaminfo", "MP3StreamInfo::scanRun: Caching ", context.run.size(),
                   " frame run at ", context.run.front().start);
        context.fallback = context.run;
    }
    return false;
}

uint64_t MP3StreamInfo::trailingTagOffset(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return 0;
    }

    std::string_view view(reinterpret_cast<const char*>(data), size);
    uint64_t offset = 0;
    for (const char* marker : TRAILING_TAG_MARKERS) {
        size_t index = view.rfind(marker);
        if (index != std::string_view::npos && index > 0) {
            offset = std::max<uint64_t>(offset, size - index);
        }
    }
    return offset;
}

MP3StreamInfo MP3StreamInfo::summarize(const std::vector<MPEGFrameHeader>& frames, uint64_t audio_end) {
    if (frames.empty()) {
        throw MetadataException(MetadataError::INSUFFICIENT_AUDIO_DATA, "No MPEG frames to summarize");
    }

    const MPEGFrameHeader& first = frames.front();

    MP3StreamInfo info;
    info.m_start = first.start;
    info.m_end = std::max(audio_end, first.start);
    info.m_size = info.m_end - info.m_start;
    info.m_xing = first.xing;
    info.m_vbri = first.vbri;
    info.m_version = first.version;
    info.m_layer = first.layer;
    info.m_protected = first.is_protected;
    info.m_channel_mode = first.channel_mode;
    info.m_channels = first.channels;
    info.m_sample_rate = first.sample_rate;

    double samples_per_frame = static_cast<double>(first.samplesPerFrame());

    if (first.xing && first.xing->frame_count) {
        info.m_sample_count = samples_per_frame * *first.xing->frame_count;
        if (first.xing->lame) {
            const LAMEHeader& lame = *first.xing->lame;
            double trim = static_cast<double>(lame.delay) + lame.padding;
            if (trim < info.m_sample_count) {
                info.m_sample_count -= trim;
            }
            info.m_bitrate_mode = toBitrateMode(lame.bitrate_mode);
        }
    } else if (first.vbri) {
        info.m_sample_count = samples_per_frame * first.vbri->frame_count;
        info.m_bitrate_mode = BitrateMode::VBR;
    } else {
        bool constant = std::all_of(frames.begin(), frames.end(), [&first](const MPEGFrameHeader& frame) {
            return frame.bitrate == first.bitrate;
        });
        if (constant) {
            info.m_bitrate_mode = BitrateMode::CBR;
        }
        if (first.size > 0) {
            info.m_sample_count = samples_per_frame * (static_cast<double>(info.m_size) / first.size);
        }
    }

    if (info.m_bitrate_mode == BitrateMode::CBR) {
        info.m_bitrate = first.bitrate;
    } else {
        uint64_t audio_bytes = info.m_size;
        if (first.xing) {
            audio_bytes = audio_bytes > first.size ? audio_bytes - first.size : 0;
        }
        double bitrate = 0.0;
        if (info.m_sample_count > 0.0) {
            bitrate = static_cast<double>(audio_bytes) * 8.0 * first.sample_rate / info.m_sample_count;
        }
        if (!(bitrate > 0.0) || !std::isfinite(bitrate)) {
            Debug::log("streaminfo", "MP3StreamInfo::summarize: No usable bitrate estimate, using ",
                       first.bitrate, " from the first frame");
            bitrate = first.bitrate;
        }
        info.m_bitrate = bitrate;
    }

    if (info.m_bitrate > 0.0) {
        info.m_duration = static_cast<double>(info.m_size) * 8.0 / info.m_bitrate;
    }

    Debug::log("streaminfo", "MP3StreamInfo::summarize: ", toString(info.m_bitrate_mode), " ",
               info.m_bitrate, " bps, ", info.m_duration, " s over ", info.m_size, " bytes");

    return info;
}

} // namespace MPEG
} // namespace AudioMeta
