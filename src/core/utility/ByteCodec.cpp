/*
 * ByteCodec.cpp - Big-endian and synchsafe integer decoding
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
namespace ByteCodec {

uint64_t readBEBytes(const uint8_t* data, size_t count) {
    uint64_t value = 0;
    for (size_t i = 0; i < count && i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

uint64_t decodeSynchsafe(const uint8_t* data, size_t count) {
    uint64_t value = 0;
    for (size_t i = 0; i < count; ++i) {
        if (data[i] & 0x80) {
            std::ostringstream msg;
            msg << "Synchsafe byte " << i << " has reserved bit set (0x"
                << std::hex << static_cast<int>(data[i]) << ")";
            throw MetadataException(MetadataError::MALFORMED_INTEGER, msg.str());
        }
        value = (value << 7) | (data[i] & 0x7F);
    }
    return value;
}

uint64_t decodeSynchsafe(const std::vector<uint8_t>& bytes) {
    return decodeSynchsafe(bytes.data(), bytes.size());
}

std::vector<uint8_t> encodeSynchsafe(uint64_t value, size_t count) {
    std::vector<uint8_t> out(count, 0);
    for (size_t i = count; i > 0; --i) {
        out[i - 1] = static_cast<uint8_t>(value & 0x7F);
        value >>= 7;
    }
    return out;
}

bool canEncodeSynchsafe(uint64_t value, size_t count) {
    if (count * 7 >= 64) {
        return true;
    }
    return value < (uint64_t(1) << (count * 7));
}

} // namespace ByteCodec
} // namespace Utility
} // namespace Core
} // namespace AudioMeta
