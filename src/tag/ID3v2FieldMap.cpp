/*
 * ID3v2FieldMap.cpp - Canonical field names for ID3v2 frame ids
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

FieldMap::FieldMap(ID3Version version, std::initializer_list<Entry> entries)
    : m_version(version), m_entries(entries) {
    for (const auto& entry : m_entries) {
        m_name_to_id.emplace(entry.name, entry.frame_id);
        m_id_to_name.emplace(entry.frame_id, entry.name);
    }
}

const FieldMap& FieldMap::forVersion(ID3Version version) {
    static const FieldMap v22(ID3Version::V2_2, {
        {"album", "TAL"},
        {"albumartist", "TP2"},
        {"artist", "TP1"},
        {"audiodelay", "TDY"},
        {"audiolength", "TLE"},
        {"audiosize", "TSI"},
        {"bpm", "TBP"},
        {"comment", "COM"},
        {"composer", "TCM"},
        {"conductor", "TP3"},
        {"copyright", "TCR"},
        {"date", "TYE"},
        {"discnumber", "TPA"},
        {"encodedby", "TEN"},
        {"encodersettings", "TSS"},
        {"genre", "TCO"},
        {"grouping", "TT1"},
        {"isrc", "TRC"},
        {"label", "TPB"},
        {"language", "TLA"},
        {"lyricist", "TXT"},
        {"lyrics", "ULT"},
        {"media", "TMT"},
        {"originalalbum", "TOT"},
        {"originalartist", "TOA"},
        {"originalauthor", "TOL"},
        {"originaldate", "TOR"},
        {"pictures", "PIC"},
        {"playcount", "CNT"},
        {"remixer", "TP4"},
        {"subtitle", "TT3"},
        {"title", "TT2"},
        {"tracknumber", "TRK"},
    });

    static const FieldMap v23(ID3Version::V2_3, {
        {"album", "TALB"},
        {"albumsort", "TSOA"},
        {"albumartist", "TPE2"},
        {"albumartistsort", "TSO2"},
        {"artist", "TPE1"},
        {"artistsort", "TSOP"},
        {"audiodelay", "TDLY"},
        {"audiolength", "TLEN"},
        {"audiosize", "TSIZ"},
        {"bpm", "TBPM"},
        {"comment", "COMM"},
        {"compilation", "TCMP"},
        {"composer", "TCOM"},
        {"composersort", "TSOC"},
        {"conductor", "TPE3"},
        {"copyright", "TCOP"},
        {"date", "TYER"},
        {"discnumber", "TPOS"},
        {"encodedby", "TENC"},
        {"encodersettings", "TSSE"},
        {"genre", "TCON"},
        {"grouping", "TIT1"},
        {"isrc", "TSRC"},
        {"label", "TPUB"},
        {"language", "TLAN"},
        {"lyricist", "TEXT"},
        {"lyrics", "USLT"},
        {"media", "TMED"},
        {"originalalbum", "TOAL"},
        {"originalartist", "TOPE"},
        {"originalauthor", "TOLY"},
        {"originaldate", "TORY"},
        {"pictures", "APIC"},
        {"playcount", "PCNT"},
        {"remixer", "TPE4"},
        {"subtitle", "TIT3"},
        {"title", "TIT2"},
        {"titlesort", "TSOT"},
        {"tracknumber", "TRCK"},
    });

    // v2.4 replaces TYER/TORY with TDRC/TDOR and adds TMOO
    static const FieldMap v24(ID3Version::V2_4, {
        {"album", "TALB"},
        {"albumsort", "TSOA"},
        {"albumartist", "TPE2"},
        {"albumartistsort", "TSO2"},
        {"artist", "TPE1"},
        {"artistsort", "TSOP"},
        {"audiodelay", "TDLY"},
        {"audiolength", "TLEN"},
        {"audiosize", "TSIZ"},
        {"bpm", "TBPM"},
        {"comment", "COMM"},
        {"compilation", "TCMP"},
        {"composer", "TCOM"},
        {"composersort", "TSOC"},
        {"conductor", "TPE3"},
        {"copyright", "TCOP"},
        {"date", "TDRC"},
        {"discnumber", "TPOS"},
        {"encodedby", "TENC"},
        {"encodersettings", "TSSE"},
        {"genre", "TCON"},
        {"grouping", "TIT1"},
        {"isrc", "TSRC"},
        {"label", "TPUB"},
        {"language", "TLAN"},
        {"lyricist", "TEXT"},
        {"lyrics", "USLT"},
        {"media", "TMED"},
        {"mood", "TMOO"},
        {"originalalbum", "TOAL"},
        {"originalartist", "TOPE"},
        {"originalauthor", "TOLY"},
        {"originaldate", "TDOR"},
        {"pictures", "APIC"},
        {"playcount", "PCNT"},
        {"remixer", "TPE4"},
        {"subtitle", "TIT3"},
        {"title", "TIT2"},
        {"titlesort", "TSOT"},
        {"tracknumber", "TRCK"},
    });

    switch (version) {
        case ID3Version::V2_2:
            return v22;
        case ID3Version::V2_3:
            return v23;
        case ID3Version::V2_4:
        default:
            return v24;
    }
}

std::optional<std::string> FieldMap::frameId(const std::string& name) const {
    auto it = m_name_to_id.find(name);
    if (it == m_name_to_id.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> FieldMap::canonicalName(const std::string& frame_id) const {
    auto it = m_id_to_name.find(frame_id);
    if (it == m_id_to_name.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace Tag
} // namespace AudioMeta
