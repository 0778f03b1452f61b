/*
 * TagSet.h - Aggregated tag values keyed by field name
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef AUDIOMETA_TAG_TAGSET_H
#define AUDIOMETA_TAG_TAGSET_H

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace AudioMeta {
namespace Tag {

class FieldMap;

/**
 * @brief General encapsulated object (GEOB) payload
 */
struct EncapsulatedObject {
    std::string filename;
    std::string mime_type;
    std::string description;
    std::vector<uint8_t> data;

    bool operator==(const EncapsulatedObject& other) const {
        return filename == other.filename && mime_type == other.mime_type &&
               description == other.description && data == other.data;
    }
};

/**
 * @brief One stored value: text, raw bytes, or an encapsulated object
 */
using TagValue = std::variant<std::string, std::vector<uint8_t>, EncapsulatedObject>;

/**
 * @brief Render a value as text
 *
 * Binary values become "<N bytes>", objects their filename.
 */
std::string toString(const TagValue& value);

/**
 * @brief Mapping from field key to one or more values
 *
 * Entries are stored under the raw key they were written with: a frame
 * id ("TIT2"), a composite key ("COMM:desc:eng"), or for ID3v1 a
 * canonical name ("title"). When a FieldMap is attached, lookups also
 * accept canonical names and keys() reports them.
 */
class TagSet {
public:
    TagSet();
    explicit TagSet(const FieldMap* field_map);

    /**
     * @brief Replace the entry for key with the given values
     */
    void set(const std::string& key, std::vector<TagValue> values);
    void set(const std::string& key, TagValue value);

    /**
     * @brief Add one value to the entry for key, creating it if needed
     */
    void append(const std::string& key, TagValue value);

    bool remove(const std::string& key);
    bool contains(const std::string& key) const;

    /**
     * @brief All values stored for key, or nullptr
     */
    const std::vector<TagValue>* get(const std::string& key) const;

    /**
     * @brief First text value for key, or an empty string
     */
    std::string text(const std::string& key) const;

    /**
     * @brief All values for key rendered as text
     */
    std::vector<std::string> texts(const std::string& key) const;

    /**
     * @brief Keys with frame ids translated to canonical names where known
     */
    std::vector<std::string> keys() const;

    /**
     * @brief Keys exactly as stored
     */
    std::vector<std::string> rawKeys() const;

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    const FieldMap* fieldMap() const { return m_field_map; }

private:
    std::string resolve(const std::string& key) const;

    std::map<std::string, std::vector<TagValue>> m_entries;
    const FieldMap* m_field_map;
};

} // namespace Tag
} // namespace AudioMeta

#endif // AUDIOMETA_TAG_TAGSET_H
