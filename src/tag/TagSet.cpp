/*
 * TagSet.cpp - Aggregated tag values keyed by field name
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
namespace Tag {

std::string toString(const TagValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto* bytes = std::get_if<std::vector<uint8_t>>(&value)) {
        return "<" + std::to_string(bytes->size()) + " bytes>";
    }
    return std::get<EncapsulatedObject>(value).filename;
}

TagSet::TagSet() : m_field_map(nullptr) {
}

TagSet::TagSet(const FieldMap* field_map) : m_field_map(field_map) {
}

std::string TagSet::resolve(const std::string& key) const {
    if (m_entries.count(key) > 0 || !m_field_map) {
        return key;
    }
    auto frame_id = m_field_map->frameId(key);
    return frame_id ? *frame_id : key;
}

void TagSet::set(const std::string& key, std::vector<TagValue> values) {
    m_entries[resolve(key)] = std::move(values);
}

void TagSet::set(const std::string& key, TagValue value) {
    std::vector<TagValue> values;
    values.push_back(std::move(value));
    set(key, std::move(values));
}

void TagSet::append(const std::string& key, TagValue value) {
    m_entries[resolve(key)].push_back(std::move(value));
}

bool TagSet::remove(const std::string& key) {
    return m_entries.erase(resolve(key)) > 0;
}

bool TagSet::contains(const std::string& key) const {
    return m_entries.count(resolve(key)) > 0;
}

const std::vector<TagValue>* TagSet::get(const std::string& key) const {
    auto it = m_entries.find(resolve(key));
    return it == m_entries.end() ? nullptr : &it->second;
}

std::string TagSet::text(const std::string& key) const {
    const auto* values = get(key);
    if (!values) {
        return "";
    }
    for (const auto& value : *values) {
        if (const auto* text = std::get_if<std::string>(&value)) {
            return *text;
        }
    }
    return "";
}

std::vector<std::string> TagSet::texts(const std::string& key) const {
    std::vector<std::string> result;
    if (const auto* values = get(key)) {
        for (const auto& value : *values) {
            result.push_back(toString(value));
        }
    }
    return result;
}

std::vector<std::string> TagSet::keys() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        std::optional<std::string> name;
        if (m_field_map) {
            name = m_field_map->canonicalName(entry.first);
        }
        result.push_back(name ? *name : entry.first);
    }
    return result;
}

std::vector<std::string> TagSet::rawKeys() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace Tag
} // namespace AudioMeta
