/*
 * exceptions.cpp - Metadata decoding error types
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

MetadataException::MetadataException(MetadataError error)
    : std::runtime_error(getErrorMessage(error)), m_error(error) {}

const char* MetadataException::getErrorName() const {
    return AudioMeta::getErrorName(m_error);
}

const char* getErrorName(MetadataError error) {
    switch (error) {
        case MetadataError::HEADER_NOT_FOUND:
            return "HEADER_NOT_FOUND";
        case MetadataError::UNSUPPORTED_VERSION:
            return "UNSUPPORTED_VERSION";
        case MetadataError::MALFORMED_INTEGER:
            return "MALFORMED_INTEGER";
        case MetadataError::NOT_AN_AUDIO_FRAME:
            return "NOT_AN_AUDIO_FRAME";
        case MetadataError::INVALID_HEADER:
            return "INVALID_HEADER";
        case MetadataError::INSUFFICIENT_AUDIO_DATA:
            return "INSUFFICIENT_AUDIO_DATA";
        case MetadataError::INVALID_FRAME:
            return "INVALID_FRAME";
        case MetadataError::IO_ERROR:
            return "IO_ERROR";
        default:
            return "UNKNOWN";
    }
}

const char* getErrorMessage(MetadataError error) {
    switch (error) {
        case MetadataError::HEADER_NOT_FOUND:
            return "Required header marker not found";
        case MetadataError::UNSUPPORTED_VERSION:
            return "Unsupported header version";
        case MetadataError::MALFORMED_INTEGER:
            return "Synchsafe integer has reserved bit set";
        case MetadataError::NOT_AN_AUDIO_FRAME:
            return "Not an MPEG audio frame";
        case MetadataError::INVALID_HEADER:
            return "Invalid header fields";
        case MetadataError::INSUFFICIENT_AUDIO_DATA:
            return "Missing XING header and insufficient MPEG frames";
        case MetadataError::INVALID_FRAME:
            return "Invalid or truncated ID3v2 frame";
        case MetadataError::IO_ERROR:
            return "I/O error";
        default:
            return "Unknown error";
    }
}

} // namespace AudioMeta
