/*
 * Tag.cpp - Format-neutral metadata tag interface
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

std::string Tag::comment() const {
    const TagSet& set = tags();
    std::string direct = set.text("comment");
    if (!direct.empty() || !set.fieldMap()) {
        return direct;
    }

    // Comments are stored under "COMM:{description}:{language}"
    auto comment_id = set.fieldMap()->frameId("comment");
    if (!comment_id) {
        return "";
    }

    std::string prefix = *comment_id + ":";
    std::string fallback;
    for (const auto& key : set.rawKeys()) {
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        if (key.compare(prefix.size(), 1, ":") == 0) {
            return set.text(key);
        }
        if (fallback.empty()) {
            fallback = set.text(key);
        }
    }
    return fallback;
}

std::string Tag::getTag(const std::string& key) const {
    std::vector<std::string> values = tags().texts(key);
    return values.empty() ? std::string() : values.front();
}

std::map<std::string, std::string> Tag::getAllTags() const {
    std::map<std::string, std::string> result;
    const TagSet& set = tags();
    auto names = set.keys();
    auto raw = set.rawKeys();
    for (size_t i = 0; i < raw.size(); ++i) {
        auto values = set.texts(raw[i]);
        if (!values.empty()) {
            result[names[i]] = values.front();
        }
    }
    return result;
}

std::optional<Picture> Tag::getPicture(size_t) const {
    return std::nullopt;
}

std::optional<Picture> Tag::getFrontCover() const {
    std::optional<Picture> first;
    for (size_t i = 0; i < pictureCount(); ++i) {
        auto picture = getPicture(i);
        if (!picture) {
            continue;
        }
        if (picture->type == PictureType::FrontCover) {
            return picture;
        }
        if (!first) {
            first = std::move(picture);
        }
    }
    return first;
}

namespace {

// Leading decimal number after optional spaces, 0 when there is none
uint32_t leadingNumber(const std::string& text, size_t begin, size_t end) {
    while (begin < end && text[begin] == ' ') {
        ++begin;
    }
    uint64_t value = 0;
    size_t digits = 0;
    for (; begin < end && std::isdigit(static_cast<unsigned char>(text[begin])); ++begin, ++digits) {
        value = value * 10 + static_cast<uint64_t>(text[begin] - '0');
        if (value > UINT32_MAX) {
            return 0;
        }
    }
    return digits ? static_cast<uint32_t>(value) : 0;
}

} // anonymous namespace

std::pair<uint32_t, uint32_t> Tag::parseNumberPair(const std::string& text) {
    size_t slash = text.find('/');
    if (slash == std::string::npos) {
        return {leadingNumber(text, 0, text.size()), 0};
    }
    return {leadingNumber(text, 0, slash), leadingNumber(text, slash + 1, text.size())};
}

uint32_t Tag::parseYear(const std::string& text) {
    size_t first = text.find_first_of("0123456789");
    if (first == std::string::npos || first + 4 > text.size()) {
        return 0;
    }
    for (size_t i = first; i < first + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return 0;
        }
    }
    return leadingNumber(text, first, first + 4);
}

} // namespace Tag
} // namespace AudioMeta
