/*
 * BitstreamReader.h - MSB-first bit reader over a byte buffer
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_CORE_UTILITY_BITSTREAMREADER_H
#define AUDIOMETA_CORE_UTILITY_BITSTREAMREADER_H

#include <cstddef>
#include <cstdint>

namespace AudioMeta {
namespace Core {
namespace Utility {

/**
 * BitstreamReader - Bit-level reading from a byte-aligned buffer
 *
 * Unpacks packed header fields (LAME tag nibbles, ReplayGain words)
 * most-significant bit first. The buffer is not copied and must outlive
 * the reader.
 *
 * All readers return false and leave the output and the position
 * untouched when the buffer runs out.
 */
class BitstreamReader {
public:
    BitstreamReader(const uint8_t* data, size_t size);

    // Basic bit reading (up to 32 bits per call)
    bool readBits(uint32_t& value, uint32_t bit_count);
    bool readBitsSigned(int32_t& value, uint32_t bit_count);
    bool readBit(bool& value);
    bool skipBits(uint32_t bit_count);

    // Position tracking
    uint64_t getBitPosition() const { return m_bit_position; }
    uint64_t getAvailableBits() const { return m_bit_size - m_bit_position; }
    bool isAligned() const { return (m_bit_position % 8) == 0; }
    bool canRead(uint64_t bit_count) const { return getAvailableBits() >= bit_count; }

private:
    const uint8_t* m_data;
    uint64_t m_bit_size;
    uint64_t m_bit_position = 0;
};

} // namespace Utility
} // namespace Core
} // namespace AudioMeta

#endif // AUDIOMETA_CORE_UTILITY_BITSTREAMREADER_H
