/*
 * MemoryIOHandler.cpp - Memory-based IOHandler implementation
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

MemoryIOHandler::MemoryIOHandler(std::vector<uint8_t> data)
    : m_storage(std::move(data)), m_data(m_storage.data()), m_size(m_storage.size()) {
}

MemoryIOHandler::MemoryIOHandler(const uint8_t* data, size_t size)
    : m_data(data), m_size(data ? size : 0) {
}

size_t MemoryIOHandler::read_unlocked(void* buffer, size_t size, size_t count) {
    size_t remaining = m_cursor < m_size ? m_size - m_cursor : 0;

    // Whole items only, as fread() does
    size_t items = std::min(count, remaining / size);
    if (items > 0) {
        std::memcpy(buffer, m_data + m_cursor, items * size);
        m_cursor += items * size;
    }

    setEof(items < count || m_cursor >= m_size);
    return items;
}

int MemoryIOHandler::seek_unlocked(off_t offset, int whence) {
    off_t base = 0;
    if (whence == SEEK_CUR) {
        base = static_cast<off_t>(m_cursor);
    } else if (whence == SEEK_END) {
        base = static_cast<off_t>(m_size);
    }

    off_t target = base + offset;
    if (target < 0) {
        setError(EINVAL, "seek to " + std::to_string(target) + " before start of buffer");
        return -1;
    }

    m_cursor = static_cast<size_t>(target);
    setEof(m_cursor >= m_size);
    return 0;
}

off_t MemoryIOHandler::tell_unlocked() {
    return static_cast<off_t>(m_cursor);
}

off_t MemoryIOHandler::size_unlocked() {
    return static_cast<off_t>(m_size);
}

int MemoryIOHandler::close_unlocked() {
    std::vector<uint8_t>().swap(m_storage);
    m_data = nullptr;
    m_size = 0;
    m_cursor = 0;
    return 0;
}

} // namespace IO
} // namespace AudioMeta
