/*
 * IOHandler.h - Abstract byte source for metadata decoding
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

#ifndef AUDIOMETA_IO_IOHANDLER_H
#define AUDIOMETA_IO_IOHANDLER_H

// No direct includes - all includes should be in audiometa.h

namespace AudioMeta {
namespace IO {

/**
 * @brief Random-access byte source
 *
 * The public operations take the handler lock, reject use after close()
 * and validate their arguments before forwarding to the protected
 * *_unlocked primitives. Subclasses implement only the primitives.
 * peek() is composed from tell/read/seek under a single lock.
 *
 * Errors follow stdio conventions: read() returns the number of complete
 * items, seek() returns 0 or -1, and getLastError() holds the errno value
 * of the most recent failure.
 */
class IOHandler {
public:
    static constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

    IOHandler() = default;
    virtual ~IOHandler() = default;

    IOHandler(const IOHandler&) = delete;
    IOHandler& operator=(const IOHandler&) = delete;

    /// Read up to count items of size bytes; returns complete items read
    size_t read(void* buffer, size_t size, size_t count);

    /// Copy up to size bytes from the current position without consuming them
    size_t peek(void* buffer, size_t size);

    /**
     * @brief read() into a vector that is shorter than count at end of stream
     *
     * The vector grows READ_CHUNK_SIZE bytes at a time, so a count larger
     * than the source allocates only what is actually read.
     */
    std::vector<uint8_t> readBytes(size_t count);

    /// peek() into a vector, count clamped to the bytes left when the size is known
    std::vector<uint8_t> peekBytes(size_t count);

    /**
     * @param whence SEEK_SET, SEEK_CUR or SEEK_END
     * @return 0 on success, -1 with getLastError() set otherwise
     */
    int seek(off_t offset, int whence);

    off_t tell();

    /// Release the underlying resource. A second close() returns 0.
    int close();

    /// Total size in bytes, -1 on failure
    off_t getFileSize();

    bool eof() const { return m_closed.load() || m_eof.load(); }
    bool isClosed() const { return m_closed.load(); }
    int getLastError() const { return m_error.load(); }

protected:
    virtual size_t read_unlocked(void* buffer, size_t size, size_t count) = 0;
    virtual int seek_unlocked(off_t offset, int whence) = 0;
    virtual off_t tell_unlocked() = 0;
    virtual off_t size_unlocked() = 0;
    virtual int close_unlocked() = 0;

    /// Record an errno value; a non-empty reason also goes to the io channel
    void setError(int error_code, const std::string& reason = std::string());
    void setEof(bool at_eof) { m_eof.store(at_eof); }

    mutable std::mutex m_operation_mutex;

private:
    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_eof{false};
    std::atomic<int> m_error{0};
};

} // namespace IO
} // namespace AudioMeta

#endif // AUDIOMETA_IO_IOHANDLER_H
