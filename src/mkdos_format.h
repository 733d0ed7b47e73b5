#pragma once

/*
 * MKDOS on-disk layout (BK-0010/0011).
 * Offsets follow the MKDOS documentation and are given in octal.
 */

#include <bit>
#include <cstddef>
#include <cstdint>

namespace mkdos_fuse {

// Constants
constexpr size_t BLOCK_SIZE = 512;
constexpr uint16_t MICRODOS_LABEL = 0123456;
constexpr uint16_t MKDOS_LABEL = 051414;
constexpr uint8_t DIR_MARKER = 0177;
constexpr size_t RECORD_SIZE = 030;
constexpr size_t NAME_SIZE = 14;
constexpr size_t DIR_NAME_SIZE = NAME_SIZE - 1;
constexpr size_t CATALOG_START = 0500;

// Meta block offsets
constexpr size_t META_FILES = 030;
constexpr size_t META_BLOCKS = 032;
constexpr size_t META_MICRODOS_LABEL = 0400;
constexpr size_t META_MKDOS_LABEL = 0402;
constexpr size_t META_DISK_SIZE = 0466;
constexpr size_t META_START_BLOCK = 0470;

// Record status byte
constexpr uint8_t STATUS_NORMAL = 0;
constexpr uint8_t STATUS_PROTECTED = 1;
constexpr uint8_t STATUS_LOGICAL_DISK = 2;
constexpr uint8_t STATUS_BAD = 0200;
constexpr uint8_t STATUS_DELETED = 0377;

// Directory numbers live in the status byte of a directory record
constexpr uint8_t ROOT_DIR = 0;
constexpr uint8_t MAX_DIR_NUMBER = 0376;

// Block count and length of a run are 16-bit fields
constexpr uint32_t MAX_FILE_BLOCKS = 0xFFFF;
// Record indices are 16-bit and 0xFFFF names the root
constexpr uint32_t MAX_CATALOG_RECORDS = 0xFFFF;

// Default load address written into new records
constexpr uint16_t DEFAULT_LOAD_ADDRESS = 01000;

// MKDOS keeps no timestamps; everything reports this instant
// (1979-01-29 00:00 Moscow time)
constexpr int64_t MKDOS_EPOCH = 286405200;

// Endian helpers (PDP-11 is little endian)
namespace endian {
    template<typename T>
    constexpr T byteswap(T value) noexcept {
        if constexpr (sizeof(T) == 1) {
            return value;
        } else if constexpr (sizeof(T) == 2) {
            return static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
        } else if constexpr (sizeof(T) == 4) {
            return static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
        } else if constexpr (sizeof(T) == 8) {
            return static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
        }
    }

    template<typename T>
    constexpr T from_little_endian(T value) noexcept {
        if constexpr (std::endian::native == std::endian::little) {
            return value;
        } else {
            return byteswap(value);
        }
    }

    template<typename T>
    constexpr T to_little_endian(T value) noexcept {
        return from_little_endian(value);
    }
}

#pragma pack(push, 1)
struct CatalogRecord {
    uint8_t status;              // 0
    uint8_t dir_no;              // 1
    uint8_t name[NAME_SIZE];     // 2
    uint16_t start_block;        // 020
    uint16_t blocks;             // 022
    uint16_t load_address;       // 024
    uint16_t length;             // 026
};
#pragma pack(pop)

static_assert(sizeof(CatalogRecord) == RECORD_SIZE, "CatalogRecord must be 24 bytes");

constexpr uint32_t blocks_for(uint64_t bytes) noexcept {
    return static_cast<uint32_t>((bytes + BLOCK_SIZE - 1) / BLOCK_SIZE);
}

} // namespace mkdos_fuse
