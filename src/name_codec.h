#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "errors.h"
#include "mkdos_format.h"

namespace mkdos_fuse {

using RawName = std::array<uint8_t, NAME_SIZE>;

// Conversion between host (UTF-8) names and MKDOS record name fields.
//
// A record name is 14 bytes of KOI8-R padded with spaces; a directory
// record spends the first byte on DIR_MARKER and keeps 13 for the name.
// Names that do not fit are rejected, never truncated.
class NameCodec {
public:
    static Errc encode(std::string_view name, bool directory, RawName& out);
    static std::string decode(const RawName& raw, bool directory);

    // Case-folded comparison key of the name part of a record
    static std::string key(const RawName& raw, bool directory);

    static uint8_t fold(uint8_t c) noexcept;
};

} // namespace mkdos_fuse
