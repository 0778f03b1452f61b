/*
 * ID3v1Tag.cpp - ID3v1/ID3v1.1 trailer tag
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

using Core::Utility::UTF8Util;

// Standard genres 0-79 followed by the Winamp extensions up to 191
static const std::array<std::string, ID3v1Tag::GENRE_COUNT> s_genre_list = {{
    /*   0 */ "Blues", "Classic Rock", "Country", "Dance", "Disco", "Funk",
    /*   6 */ "Grunge", "Hip-Hop", "Jazz", "Metal", "New Age", "Oldies",
    /*  12 */ "Other", "Pop", "R&B", "Rap", "Reggae", "Rock",
    /*  18 */ "Techno", "Industrial", "Alternative", "Ska", "Death Metal", "Pranks",
    /*  24 */ "Soundtrack", "Euro-Techno", "Ambient", "Trip-Hop", "Vocal", "Jazz+Funk",
    /*  30 */ "Fusion", "Trance", "Classical", "Instrumental", "Acid", "House",
    /*  36 */ "Game", "Sound Clip", "Gospel", "Noise", "AlternRock", "Bass",
    /*  42 */ "Soul", "Punk", "Space", "Meditative", "Instrumental Pop", "Instrumental Rock",
    /*  48 */ "Ethnic", "Gothic", "Darkwave", "Techno-Industrial", "Electronic", "Pop-Folk",
    /*  54 */ "Eurodance", "Dream", "Southern Rock", "Comedy", "Cult", "Gangsta",
    /*  60 */ "Top 40", "Christian Rap", "Pop/Funk", "Jungle", "Native American", "Cabaret",
    /*  66 */ "New Wave", "Psychedelic", "Rave", "Showtunes", "Trailer", "Lo-Fi",
    /*  72 */ "Tribal", "Acid Punk", "Acid Jazz", "Polka", "Retro", "Musical",
    /*  78 */ "Rock & Roll", "Hard Rock", "Folk", "Folk-Rock", "National Folk", "Swing",
    /*  84 */ "Fast Fusion", "Bebop", "Latin", "Revival", "Celtic", "Bluegrass",
    /*  90 */ "Avantgarde", "Gothic Rock", "Progressive Rock", "Psychedelic Rock", "Symphonic Rock", "Slow Rock",
    /*  96 */ "Big Band", "Chorus", "Easy Listening", "Acoustic", "Humour", "Speech",
    /* 102 */ "Chanson", "Opera", "Chamber Music", "Sonata", "Symphony", "Booty Bass",
    /* 108 */ "Primus", "Porn Groove", "Satire", "Slow Jam", "Club", "Tango",
    /* 114 */ "Samba", "Folklore", "Ballad", "Power Ballad", "Rhythmic Soul", "Freestyle",
    /* 120 */ "Duet", "Punk Rock", "Drum Solo", "A Cappella", "Euro-House", "Dance Hall",
    /* 126 */ "Goa", "Drum & Bass", "Club-House", "Hardcore Techno", "Terror", "Indie",
    /* 132 */ "BritPop", "Negerpunk", "Polsk Punk", "Beat", "Christian Gangsta Rap", "Heavy Metal",
    /* 138 */ "Black Metal", "Crossover", "Contemporary Christian", "Christian Rock", "Merengue", "Salsa",
    /* 144 */ "Thrash Metal", "Anime", "JPop", "Synthpop", "Abstract", "Art Rock",
    /* 150 */ "Baroque", "Bhangra", "Big Beat", "Breakbeat", "Chillout", "Downtempo",
    /* 156 */ "Dub", "EBM", "Eclectic", "Electro", "Electroclash", "Emo",
    /* 162 */ "Experimental", "Garage", "Global", "IDM", "Illbient", "Industro-Goth",
    /* 168 */ "Jam Band", "Krautrock", "Leftfield", "Lounge", "Math Rock", "New Romantic",
    /* 174 */ "Nu-Breakz", "Post-Punk", "Post-Rock", "Psytrance", "Shoegaze", "Space Rock",
    /* 180 */ "Trop Rock", "World Music", "Neoclassical", "Audiobook", "Audio Theatre", "Neue Deutsche Welle",
    /* 186 */ "Podcast", "Indie Rock", "G-Funk", "Dubstep", "Garage Rock", "Psybient"
}};

const std::array<std::string, ID3v1Tag::GENRE_COUNT>& ID3v1Tag::genreList() {
    return s_genre_list;
}

std::string ID3v1Tag::genreFromIndex(uint8_t index) {
    if (index < GENRE_COUNT) {
        return s_genre_list[index];
    }
    return "";
}

bool ID3v1Tag::hasMarker(const uint8_t* data, size_t size) {
    return data && size >= 3 && std::memcmp(data, "TAG", 3) == 0;
}

namespace {

// Latin-1 text up to the first NUL, trailing spaces dropped
std::string latin1Field(const uint8_t* field, size_t width) {
    size_t length = UTF8Util::findNullTerminator(field, width);
    while (length > 0 && field[length - 1] == ' ') {
        --length;
    }
    return UTF8Util::fromLatin1(field, length);
}

} // anonymous namespace

std::unique_ptr<ID3v1Tag> ID3v1Tag::parse(const uint8_t* data, size_t size) {
    if (!data || size < TAG_SIZE || !hasMarker(data, size)) {
        throw MetadataException(MetadataError::HEADER_NOT_FOUND,
                                "No 128 byte ID3v1 trailer (" + std::to_string(size) + " bytes given)");
    }

    auto tag = std::make_unique<ID3v1Tag>();

    // v1.1 steals the last two comment bytes for a NUL and the track number
    tag->m_has_track = data[125] == 0x00 && data[126] != 0x00;
    uint8_t track = tag->m_has_track ? data[126] : 0;
    tag->m_genre = data[127];

    const struct {
        const char* key;
        std::string value;
    } fields[] = {
        {"title", latin1Field(data + 3, 30)},
        {"artist", latin1Field(data + 33, 30)},
        {"album", latin1Field(data + 63, 30)},
        {"date", latin1Field(data + 93, 4)},
        {"comment", latin1Field(data + 97, tag->m_has_track ? 28 : 30)},
        {"tracknumber", track ? std::to_string(track) : std::string()},
        {"genre", genreFromIndex(tag->m_genre)},
    };

    for (const auto& field : fields) {
        if (!field.value.empty()) {
            tag->m_tags.set(field.key, TagValue(field.value));
        }
    }

    Debug::log("id3v1", "ID3v1Tag::parse: ", tag->formatName(), " with ", tag->m_tags.size(),
               " fields, genre byte ", static_cast<int>(tag->m_genre));
    return tag;
}

} // namespace Tag
} // namespace AudioMeta
