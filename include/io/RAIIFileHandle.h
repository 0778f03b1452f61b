/*
 * RAIIFileHandle.h - Owning wrapper for a stdio FILE*
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_IO_RAIIFILEHANDLE_H
#define AUDIOMETA_IO_RAIIFILEHANDLE_H

// No direct includes - all includes should be in audiometa.h

namespace AudioMeta {
namespace IO {

/**
 * @brief Move-only owner of a FILE*, closed on destruction
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() = default;
    RAIIFileHandle(RAIIFileHandle&&) = default;
    RAIIFileHandle& operator=(RAIIFileHandle&&) = default;

    /**
     * @brief Open @p filename, dropping any stream already held
     * @return false with errno set on failure
     */
    bool open(const std::string& filename, const char* mode);

    /// fclose() result, or 0 when nothing is held
    int close();

    FILE* get() const { return m_stream.get(); }
    explicit operator bool() const { return static_cast<bool>(m_stream); }

private:
    struct Closer {
        void operator()(FILE* stream) const;
    };

    std::unique_ptr<FILE, Closer> m_stream;
};

} // namespace IO
} // namespace AudioMeta

#endif // AUDIOMETA_IO_RAIIFILEHANDLE_H
