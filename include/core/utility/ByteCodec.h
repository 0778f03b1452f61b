/*
 * ByteCodec.h - Big-endian and synchsafe integer decoding
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_CORE_UTILITY_BYTECODEC_H
#define AUDIOMETA_CORE_UTILITY_BYTECODEC_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace AudioMeta {
namespace Core {
namespace Utility {
namespace ByteCodec {

/**
 * @brief Read sizeof(T) big-endian bytes as an unsigned integer
 *
 * @param data Pointer to at least sizeof(T) bytes
 */
template<typename T>
inline T readBE(const uint8_t* data) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | data[i]);
    }
    return value;
}

/**
 * @brief Read an arbitrary width (1-8 bytes) big-endian unsigned integer
 *
 * Used for the 3-byte frame sizes of ID3v2.2.
 */
uint64_t readBEBytes(const uint8_t* data, size_t count);

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

/**
 * @brief Decode a synchsafe integer of any length
 *
 * The low 7 bits of each byte are concatenated most-significant-first.
 *
 * @throws MetadataException(MALFORMED_INTEGER) if any byte has bit 7 set
 */
uint64_t decodeSynchsafe(const uint8_t* data, size_t count);

uint64_t decodeSynchsafe(const std::vector<uint8_t>& bytes);

/**
 * @brief Encode a value as a synchsafe byte sequence of the given length
 *
 * Bits above 7 * count are discarded.
 */
std::vector<uint8_t> encodeSynchsafe(uint64_t value, size_t count);

/**
 * @brief Check if a value fits in a synchsafe field of the given length
 */
bool canEncodeSynchsafe(uint64_t value, size_t count);

} // namespace ByteCodec
} // namespace Utility
} // namespace Core
} // namespace AudioMeta

#endif // AUDIOMETA_CORE_UTILITY_BYTECODEC_H
