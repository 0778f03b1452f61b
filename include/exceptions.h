/*
 * exceptions.h - Metadata decoding error types
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

#ifndef AUDIOMETA_EXCEPTIONS_H
#define AUDIOMETA_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace AudioMeta {

/**
 * @brief Error codes for metadata decoding
 *
 * Whether a failure is fatal depends on the layer that catches it:
 * frame-level and sub-header failures are recovered locally, while
 * failures on the primary tag or stream path reach the caller.
 */
enum class MetadataError {
    /**
     * @brief A required marker (ID3, Xing/Info, VBRI, LAME) is absent
     *
     * Recovery: treat the container as absent
     */
    HEADER_NOT_FOUND,

    /**
     * @brief Version byte maps to no supported variant
     */
    UNSUPPORTED_VERSION,

    /**
     * @brief Synchsafe byte has its reserved top bit set
     */
    MALFORMED_INTEGER,

    /**
     * @brief Sync word or reserved field check failed
     *
     * Recovery: advance one byte and resynchronize
     */
    NOT_AN_AUDIO_FRAME,

    /**
     * @brief Header fields are structurally invalid
     *
     * Recovery: drop the sub-header, keep the enclosing frame
     */
    INVALID_HEADER,

    /**
     * @brief No run of valid frames and no Xing header was found
     */
    INSUFFICIENT_AUDIO_DATA,

    /**
     * @brief ID3v2 frame envelope or body is truncated or malformed
     *
     * Recovery: skip the frame
     */
    INVALID_FRAME,

    /**
     * @brief Byte source could not be opened or ran short
     */
    IO_ERROR
};

/**
 * @brief Exception carrying a MetadataError code
 *
 * USAGE:
 * ======
 * throw MetadataException(MetadataError::HEADER_NOT_FOUND, "Missing ID3 marker");
 *
 * try {
 *     auto header = ID3v2Header::parse(bytes);
 * } catch (const MetadataException& e) {
 *     if (e.getError() == MetadataError::HEADER_NOT_FOUND) {
 *         // no tag present
 *     }
 * }
 */
class MetadataException : public std::runtime_error {
public:
    MetadataException(MetadataError error, const std::string& message)
        : std::runtime_error(message), m_error(error) {}

    explicit MetadataException(MetadataError error);

    MetadataError getError() const { return m_error; }

    /**
     * @brief Get human-readable error type name
     */
    const char* getErrorName() const;

private:
    MetadataError m_error;
};

/**
 * @brief Get the symbolic name of an error code, e.g. "HEADER_NOT_FOUND"
 */
const char* getErrorName(MetadataError error);

/**
 * @brief Get the default descriptive message for an error code
 */
const char* getErrorMessage(MetadataError error);

} // namespace AudioMeta

#endif // AUDIOMETA_EXCEPTIONS_H
