/*
 * audiometa.h - main include for all other source files.
 * This file is part of AudioMeta.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * AudioMeta is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef AUDIOMETA_H
#define AUDIOMETA_H

// defines
#define AUDIOMETA_VERSION "1.0.0"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// C Standard Library (wrapped)
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#ifndef _WIN32
#include <unistd.h>
#endif

// Local project headers (in dependency order where possible)
#include "debug.h"
#include "exceptions.h"

// Byte and bit level primitives
#include "core/utility/ByteCodec.h"
#include "core/utility/BitstreamReader.h"
#include "core/utility/UTF8Util.h"

// I/O Handler subsystem
#include "io/IOHandler.h"
#include "io/MemoryIOHandler.h"
#include "io/RAIIFileHandle.h"
#include "io/file/FileIOHandler.h"

// Tag subsystem
#include "tag/ID3v2Header.h"
#include "tag/ID3v2FieldMap.h"
#include "tag/TagSet.h"
#include "tag/Tag.h"
#include "tag/ID3v2Utils.h"
#include "tag/ID3v1Tag.h"
#include "tag/ID3v2Frame.h"
#include "tag/ID3v2FrameAggregator.h"
#include "tag/ID3v2Tag.h"

// MPEG audio subsystem
#include "mpeg/MPEGTables.h"
#include "mpeg/LAMEHeader.h"
#include "mpeg/XingHeader.h"
#include "mpeg/VBRIHeader.h"
#include "mpeg/MPEGFrameHeader.h"
#include "mpeg/MP3StreamInfo.h"
#include "mpeg/MP3File.h"

#endif // AUDIOMETA_H
