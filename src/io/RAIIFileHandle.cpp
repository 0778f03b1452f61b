/*
 * RAIIFileHandle.cpp - Owning wrapper for a stdio FILE*
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
namespace IO {

void RAIIFileHandle::Closer::operator()(FILE* stream) const {
    // Destructor path: nobody is left to hear about a failed fclose
    if (std::fclose(stream) != 0) {
        Debug::log("io", "RAIIFileHandle: fclose failed: ", strerror(errno));
    }
}

bool RAIIFileHandle::open(const std::string& filename, const char* mode) {
    int closed = close();
    if (closed != 0) {
        Debug::log("io", "RAIIFileHandle::open() - previous stream failed to close");
    }

    FILE* stream = std::fopen(filename.c_str(), mode);
    if (!stream) {
        return false;
    }
    m_stream.reset(stream);
    return true;
}

int RAIIFileHandle::close() {
    FILE* stream = m_stream.release();
    return stream ? std::fclose(stream) : 0;
}

} // namespace IO
} // namespace AudioMeta
