/*
 * IOHandler.cpp - Abstract byte source for metadata decoding
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
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

size_t IOHandler::read(void* buffer, size_t size, size_t count) {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    m_error.store(0);

    if (m_closed.load()) {
        setError(EBADF);
        return 0;
    }
    if (size == 0 || count == 0) {
        return 0;
    }
    if (!buffer) {
        setError(EINVAL);
        return 0;
    }
    return read_unlocked(buffer, size, count);
}

size_t IOHandler::peek(void* buffer, size_t size) {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    m_error.store(0);

    if (m_closed.load()) {
        setError(EBADF);
        return 0;
    }
    if (size == 0 || !buffer) {
        return 0;
    }

    off_t origin = tell_unlocked();
    if (origin < 0) {
        return 0;
    }

    size_t got = read_unlocked(buffer, 1, size);
    if (seek_unlocked(origin, SEEK_SET) != 0) {
        setError(m_error.load(), "peek could not return to offset " + std::to_string(origin));
    }
    return got;
}

std::vector<uint8_t> IOHandler::readBytes(size_t count) {
    std::vector<uint8_t> bytes;
    while (bytes.size() < count) {
        size_t filled = bytes.size();
        size_t want = std::min(count - filled, READ_CHUNK_SIZE);
        bytes.resize(filled + want);

        size_t got = read(bytes.data() + filled, 1, want);
        bytes.resize(filled + got);
        if (got < want) {
            break;
        }
    }
    return bytes;
}

std::vector<uint8_t> IOHandler::peekBytes(size_t count) {
    off_t size = getFileSize();
    off_t position = tell();
    if (size >= 0 && position >= 0) {
        size_t remaining = position < size ? static_cast<size_t>(size - position) : 0;
        count = std::min(count, remaining);
    }

    std::vector<uint8_t> bytes(count);
    bytes.resize(peek(bytes.data(), count));
    return bytes;
}

int IOHandler::seek(off_t offset, int whence) {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    m_error.store(0);

    if (m_closed.load()) {
        setError(EBADF);
        return -1;
    }
    if (whence != SEEK_SET && whence != SEEK_CUR && whence != SEEK_END) {
        setError(EINVAL);
        return -1;
    }
    return seek_unlocked(offset, whence);
}

off_t IOHandler::tell() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    if (m_closed.load()) {
        setError(EBADF);
        return -1;
    }
    return tell_unlocked();
}

int IOHandler::close() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    if (m_closed.load()) {
        return 0;
    }

    int result = close_unlocked();
    m_closed.store(true);
    m_eof.store(true);
    Debug::log("io", "IOHandler::close() - closed, result ", result);
    return result;
}

off_t IOHandler::getFileSize() {
    std::lock_guard<std::mutex> lock(m_operation_mutex);
    if (m_closed.load()) {
        setError(EBADF);
        return -1;
    }
    return size_unlocked();
}

void IOHandler::setError(int error_code, const std::string& reason) {
    m_error.store(error_code);
    if (!reason.empty()) {
        Debug::log("io", "IOHandler: error ", error_code, ": ", reason);
    }
}

} // namespace IO
} // namespace AudioMeta
