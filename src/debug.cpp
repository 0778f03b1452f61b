/*
 * debug.cpp - Channel-based diagnostic log
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FINAL_BUILD
#include "audiometa.h"
#endif // !FINAL_BUILD

namespace {

struct DebugSink {
    std::mutex mutex;
    std::ofstream file;
    std::unordered_set<std::string> channels;
    // Lock-free early out for the common all-disabled case
    std::atomic<bool> enabled{false};
};

DebugSink& debugSink() {
    static DebugSink sink;
    return sink;
}

// HH:MM:SS.micro in local time
std::string debugTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << micros.count();
    return ss.str();
}

} // anonymous namespace

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    DebugSink& sink = debugSink();
    std::lock_guard<std::mutex> lock(sink.mutex);

    if (!logfile.empty()) {
        if (sink.file.is_open()) {
            sink.file.close();
        }
        sink.file.open(logfile, std::ios::out | std::ios::app);
        if (!sink.file.is_open()) {
            std::cerr << "Debug: cannot open " << logfile << ", logging to stdout" << std::endl;
        }
    }

    for (const auto& channel : channels) {
        if (!channel.empty()) {
            sink.channels.insert(channel);
        }
    }
    sink.enabled.store(!sink.channels.empty());
}

void Debug::initFromEnvironment() {
    const char* channels = std::getenv(CHANNELS_ENV);
    if (!channels || !*channels) {
        return;
    }
    const char* logfile = std::getenv(LOGFILE_ENV);
    init(logfile ? logfile : "", parseChannelList(channels));
}

void Debug::shutdown() {
    DebugSink& sink = debugSink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    sink.enabled.store(false);
    sink.channels.clear();
    if (sink.file.is_open()) {
        sink.file.close();
    }
}

bool Debug::isChannelEnabled(const std::string& channel) {
    DebugSink& sink = debugSink();
    if (!sink.enabled.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(sink.mutex);
    return sink.channels.count("all") > 0 || sink.channels.count(channel) > 0;
}

std::vector<std::string> Debug::parseChannelList(const std::string& list) {
    std::vector<std::string> channels;
    std::istringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        size_t last = item.find_last_not_of(" \t");
        channels.push_back(item.substr(first, last - first + 1));
    }
    return channels;
}

void Debug::write(const std::string& channel, const char* function, int line, const std::string& message) {
    std::ostringstream entry;
    entry << debugTimestamp() << " [" << channel << "]: ";
    if (function && *function) {
        entry << function << ":" << line << ": ";
    }
    entry << message;

    DebugSink& sink = debugSink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    std::ostream& out = sink.file.is_open() ? static_cast<std::ostream&>(sink.file) : std::cout;
    out << entry.str() << std::endl;
}
