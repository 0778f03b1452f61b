/*
 * ID3v2FieldMap.h - Canonical field names for ID3v2 frame ids
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_TAG_ID3V2FIELDMAP_H
#define AUDIOMETA_TAG_ID3V2FIELDMAP_H

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "tag/ID3v2Header.h"

namespace AudioMeta {
namespace Tag {

/**
 * @brief Bidirectional canonical name <-> frame id table for one ID3v2 version
 *
 * The three tables are built once and never modified. Each is injective
 * in both directions: no two names share a frame id and no name maps to
 * two ids.
 */
class FieldMap {
public:
    struct Entry {
        const char* name;
        const char* frame_id;
    };

    /**
     * @brief The table for a tag version
     */
    static const FieldMap& forVersion(ID3Version version);

    /**
     * @brief Frame id for a canonical name, e.g. "title" -> "TIT2"
     */
    std::optional<std::string> frameId(const std::string& name) const;

    /**
     * @brief Canonical name for a frame id, e.g. "TT2" -> "title" (v2.2)
     */
    std::optional<std::string> canonicalName(const std::string& frame_id) const;

    const std::vector<Entry>& entries() const { return m_entries; }
    ID3Version version() const { return m_version; }

private:
    FieldMap(ID3Version version, std::initializer_list<Entry> entries);

    ID3Version m_version;
    std::vector<Entry> m_entries;
    std::unordered_map<std::string, std::string> m_name_to_id;
    std::unordered_map<std::string, std::string> m_id_to_name;
};

} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_ID3V2FIELDMAP_H
