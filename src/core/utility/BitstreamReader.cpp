/*
 * BitstreamReader.cpp - MSB-first bit reader over a byte buffer
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FINAL_BUILD
#include "audiometa.h"
#endif // !FINAL_BUILD

namespace AudioMeta {
namespace Core {
namespace Utility {

BitstreamReader::BitstreamReader(const uint8_t* data, size_t size)
    : m_data(data)
    , m_bit_size(data ? static_cast<uint64_t>(size) * 8 : 0)
{
}

bool BitstreamReader::readBits(uint32_t& value, uint32_t bit_count)
{
    if (bit_count > 32 || !canRead(bit_count)) {
        return false;
    }

    uint64_t result = 0;
    uint32_t remaining = bit_count;
    while (remaining > 0) {
        size_t byte_index = static_cast<size_t>(m_bit_position / 8);
        uint32_t bit_offset = static_cast<uint32_t>(m_bit_position % 8);
        uint32_t take = std::min(8 - bit_offset, remaining);

        // Bits [bit_offset, bit_offset + take) of the current byte, MSB first
        uint32_t chunk = (m_data[byte_index] >> (8 - bit_offset - take)) & ((1u << take) - 1);
        result = (result << take) | chunk;

        m_bit_position += take;
        remaining -= take;
    }

    value = static_cast<uint32_t>(result);
    return true;
}

bool BitstreamReader::readBitsSigned(int32_t& value, uint32_t bit_count)
{
    uint32_t raw;
    if (!readBits(raw, bit_count)) {
        return false;
    }

    // Sign-extend from the top bit of the field
    if (bit_count > 0 && bit_count < 32 && (raw & (1u << (bit_count - 1)))) {
        raw |= ~((1u << bit_count) - 1);
    }

    value = static_cast<int32_t>(raw);
    return true;
}

bool BitstreamReader::readBit(bool& value)
{
    uint32_t bit;
    if (!readBits(bit, 1)) {
        return false;
    }
    value = (bit != 0);
    return true;
}

bool BitstreamReader::skipBits(uint32_t bit_count)
{
    if (!canRead(bit_count)) {
        return false;
    }
    m_bit_position += bit_count;
    return true;
}

} // namespace Utility
} // namespace Core
} // namespace AudioMeta
