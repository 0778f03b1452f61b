/*
 * FileIOHandler.cpp - Implementation for the file I/O handler.
 * This file is part of AudioMeta.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
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

#ifndef FINAL_BUILD
#include "audiometa.h"
#endif // !FINAL_BUILD

namespace AudioMeta {
namespace IO {
namespace File {

FileIOHandler::FileIOHandler(const std::string& path) : m_path(path) {
    if (!m_stream.open(path, "rb")) {
        int error = errno;
        setError(error);
        throw MetadataException(MetadataError::IO_ERROR,
                                "Could not open " + path + ": " + strerror(error));
    }
    Debug::log("io", "FileIOHandler: opened ", path);
}

size_t FileIOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    FILE* stream = m_stream.get();
    size_t items = fread(buffer, size, count, stream);

    if (items < count) {
        if (ferror(stream)) {
            setError(errno, "read failed on " + m_path);
            clearerr(stream);
        } else {
            setEof(true);
        }
    }
    return items;
}

int FileIOHandler::seek_unlocked(off_t offset, int whence) {
    if (fseeko(m_stream.get(), offset, whence) != 0) {
        setError(errno, "seek failed on " + m_path);
        return -1;
    }
    setEof(false);
    return 0;
}

off_t FileIOHandler::tell_unlocked() {
    off_t position = ftello(m_stream.get());
    if (position < 0) {
        setError(errno, "tell failed on " + m_path);
    }
    return position;
}

off_t FileIOHandler::size_unlocked() {
    if (m_size < 0) {
        struct stat info;
        if (fstat(fileno(m_stream.get()), &info) != 0) {
            setError(errno, "fstat failed on " + m_path);
            return -1;
        }
        m_size = static_cast<off_t>(info.st_size);
    }
    return m_size;
}

int FileIOHandler::close_unlocked() {
    int result = m_stream.close();
    if (result != 0) {
        setError(errno, "close failed on " + m_path);
    }
    return result;
}

} // namespace File
} // namespace IO
} // namespace AudioMeta
