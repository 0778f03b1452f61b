/*
 * MemoryIOHandler.h - Memory-based IOHandler implementation
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

#ifndef AUDIOMETA_IO_MEMORYIOHANDLER_H
#define AUDIOMETA_IO_MEMORYIOHANDLER_H

// No direct includes - all includes should be in audiometa.h

namespace AudioMeta {
namespace IO {

/**
 * @brief IOHandler over an in-memory byte buffer
 *
 * Seeking past the end is allowed; reads there return nothing.
 */
class MemoryIOHandler : public IOHandler {
public:
    /// Own the bytes
    explicit MemoryIOHandler(std::vector<uint8_t> data);

    /// Borrow size bytes at data; the caller keeps them alive
    MemoryIOHandler(const uint8_t* data, size_t size);

protected:
    size_t read_unlocked(void* buffer, size_t size, size_t count) override;
    int seek_unlocked(off_t offset, int whence) override;
    off_t tell_unlocked() override;
    off_t size_unlocked() override;
    int close_unlocked() override;

private:
    std::vector<uint8_t> m_storage;
    const uint8_t* m_data;
    size_t m_size;
    size_t m_cursor = 0;
};

} // namespace IO
} // namespace AudioMeta

#endif // AUDIOMETA_IO_MEMORYIOHANDLER_H
