/*
 * debug.h - Channel-based diagnostic log
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_DEBUG_H
#define AUDIOMETA_DEBUG_H

#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Channel-based debug log.
 *
 * Nothing is written until init() enables at least one channel. The
 * special channel "all" enables every channel. Channels used by the
 * library: id3v2, id3v1, mpeg, streaminfo, mp3, io.
 */
class Debug {
public:
    /// Environment variable holding a comma-separated channel list
    static constexpr const char* CHANNELS_ENV = "AUDIOMETA_DEBUG";
    /// Environment variable naming the log file; stdout when unset
    static constexpr const char* LOGFILE_ENV = "AUDIOMETA_DEBUG_FILE";

    /**
     * @brief Enable channels and pick the output
     * @param logfile Appended to; empty or unopenable means stdout
     */
    static void init(const std::string& logfile, const std::vector<std::string>& channels);

    /// init() from AUDIOMETA_DEBUG and AUDIOMETA_DEBUG_FILE
    static void initFromEnvironment();

    /// Disable every channel and close the log file
    static void shutdown();

    static bool isChannelEnabled(const std::string& channel);

    /// Split "id3v2, mpeg,,io" into {"id3v2", "mpeg", "io"}
    static std::vector<std::string> parseChannelList(const std::string& list);

    template<typename... Args>
    static void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel)) {
            write(channel, nullptr, 0, format(std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void logAt(const std::string& channel, const char* function, int line, Args&&... args) {
        if (isChannelEnabled(channel)) {
            write(channel, function, line, format(std::forward<Args>(args)...));
        }
    }

private:
    template<typename... Args>
    static std::string format(Args&&... args) {
        std::ostringstream ss;
        (ss << ... << args);
        return ss.str();
    }

    static void write(const std::string& channel, const char* function, int line, const std::string& message);
};

// Log with the calling function and line
#define DEBUG_LOG(channel, ...) Debug::logAt(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

#endif // AUDIOMETA_DEBUG_H
