// AudioMeta Final Build - Single Compilation Unit
// This file includes all library source files for optimized compilation
//
// Enable final build with: cmake -DAUDIOMETA_FINAL_BUILD=ON
//
// Note: This must be kept in sync with the library source list in
// CMakeLists.txt when files are added/removed

#include "audiometa.h"

// ============================================================================
// Core
// ============================================================================
#include "debug.cpp"
#include "exceptions.cpp"

// ============================================================================
// Utility
// ============================================================================
#include "core/utility/ByteCodec.cpp"
#include "core/utility/BitstreamReader.cpp"
#include "core/utility/UTF8Util.cpp"

// ============================================================================
// I/O Subsystem
// ============================================================================
#include "io/IOHandler.cpp"
#include "io/MemoryIOHandler.cpp"
#include "io/RAIIFileHandle.cpp"
#include "io/file/FileIOHandler.cpp"

// ============================================================================
// Tag Subsystem
// ============================================================================
#include "tag/ID3v2Header.cpp"
#include "tag/ID3v2FieldMap.cpp"
#include "tag/TagSet.cpp"
#include "tag/Tag.cpp"
#include "tag/ID3v2Utils.cpp"
#include "tag/ID3v1Tag.cpp"
#include "tag/ID3v2Frame.cpp"
#include "tag/ID3v2FrameAggregator.cpp"
#include "tag/ID3v2Tag.cpp"

// ============================================================================
// MPEG Audio Subsystem
// ============================================================================
#include "mpeg/MPEGTables.cpp"
#include "mpeg/LAMEHeader.cpp"
#include "mpeg/XingHeader.cpp"
#include "mpeg/VBRIHeader.cpp"
#include "mpeg/MPEGFrameHeader.cpp"
#include "mpeg/MP3StreamInfo.cpp"
#include "mpeg/MP3File.cpp"
