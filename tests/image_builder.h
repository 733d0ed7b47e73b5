#pragma once

// Builds MKDOS images for the tests, byte by byte, independent of Volume.

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "mkdos_format.h"

namespace mkdos_fuse::testing {

class TempDir {
public:
    explicit TempDir(const std::string& prefix = "mkdos_test_") {
        auto base = std::filesystem::temp_directory_path();
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = base / (prefix + std::to_string(static_cast<unsigned long long>(stamp)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline std::vector<uint8_t> pattern(size_t size, uint8_t seed) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(seed + i * 7 + (i >> 9));
    }
    return data;
}

inline std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline uint16_t peek_u16(const std::vector<uint8_t>& image, size_t offset) {
    return static_cast<uint16_t>(image[offset] | (image[offset + 1] << 8));
}

class ImageBuilder {
public:
    struct Record {
        uint8_t status = STATUS_NORMAL;
        uint8_t dir_no = ROOT_DIR;
        std::string name;          // raw KOI8-R bytes
        bool directory = false;
        uint16_t start_block = 0;
        uint16_t blocks = 0;
        uint16_t length = 0;
    };

    explicit ImageBuilder(uint16_t disk_size = 800, uint16_t start_block = 20)
        : disk_size_(disk_size), start_block_(start_block), next_block_(start_block),
          image_(size_t(disk_size) * BLOCK_SIZE, 0) {}

    // Adds a file record and its data at the next free block
    ImageBuilder& add_file(const std::string& name, const std::vector<uint8_t>& content,
                           uint8_t status = STATUS_NORMAL, uint8_t dir_no = ROOT_DIR) {
        Record rec;
        rec.status = status;
        rec.dir_no = dir_no;
        rec.name = name;
        rec.start_block = next_block_;
        rec.blocks = static_cast<uint16_t>(blocks_for(content.size()));
        rec.length = static_cast<uint16_t>(content.size() & 0xFFFF);
        std::copy(content.begin(), content.end(), image_.begin() + size_t(next_block_) * BLOCK_SIZE);
        next_block_ = static_cast<uint16_t>(next_block_ + rec.blocks);
        records_.push_back(rec);
        return *this;
    }

    ImageBuilder& add_directory(const std::string& name, uint8_t dir_id, uint8_t parent = ROOT_DIR) {
        Record rec;
        rec.status = dir_id;
        rec.dir_no = parent;
        rec.name = name;
        rec.directory = true;
        rec.start_block = next_block_;
        records_.push_back(rec);
        return *this;
    }

    ImageBuilder& add_record(const Record& rec) {
        records_.push_back(rec);
        next_block_ = std::max<uint16_t>(next_block_, static_cast<uint16_t>(rec.start_block + rec.blocks));
        return *this;
    }

    // Leaves a hole of unused blocks before the next file
    ImageBuilder& skip_blocks(uint16_t count) {
        next_block_ = static_cast<uint16_t>(next_block_ + count);
        return *this;
    }

    ImageBuilder& break_label() {
        broken_label_ = true;
        return *this;
    }

    std::vector<uint8_t> bytes() const {
        std::vector<uint8_t> image = image_;
        put_u16(image, META_MICRODOS_LABEL, MICRODOS_LABEL);
        put_u16(image, META_MKDOS_LABEL, broken_label_ ? 0 : MKDOS_LABEL);
        put_u16(image, META_DISK_SIZE, disk_size_);
        put_u16(image, META_START_BLOCK, start_block_);

        uint16_t files = 0;
        uint32_t used = start_block_;
        uint16_t tail = start_block_;
        size_t offset = CATALOG_START;
        for (const auto& rec : records_) {
            image[offset] = rec.status;
            image[offset + 1] = rec.dir_no;
            size_t name_at = offset + 2;
            std::memset(image.data() + name_at, ' ', NAME_SIZE);
            if (rec.directory) {
                image[name_at++] = DIR_MARKER;
            }
            std::memcpy(image.data() + name_at, rec.name.data(), rec.name.size());
            put_u16(image, offset + 020, rec.start_block);
            put_u16(image, offset + 022, rec.blocks);
            put_u16(image, offset + 024, DEFAULT_LOAD_ADDRESS);
            put_u16(image, offset + 026, rec.length);

            bool live = rec.status != STATUS_BAD && rec.status != STATUS_DELETED;
            if (live) {
                ++files;
                if (!rec.directory) used += rec.blocks;
            }
            if (!rec.directory && rec.status != STATUS_DELETED) {
                tail = std::max<uint16_t>(tail, static_cast<uint16_t>(rec.start_block + rec.blocks));
            }
            offset += RECORD_SIZE;
        }
        // Terminator
        image[offset + 2] = 0;
        put_u16(image, offset + 020, tail);

        put_u16(image, META_FILES, files);
        put_u16(image, META_BLOCKS, static_cast<uint16_t>(used));
        return image;
    }

    void write(const std::string& path, bool inverted = false, size_t lead_blocks = 0) const {
        std::vector<uint8_t> image(lead_blocks * BLOCK_SIZE, 0xE5);
        auto body = bytes();
        image.insert(image.end(), body.begin(), body.end());
        if (inverted) {
            for (size_t i = lead_blocks * BLOCK_SIZE; i < image.size(); ++i) {
                image[i] = static_cast<uint8_t>(~image[i]);
            }
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(image.data()), static_cast<std::streamsize>(image.size()));
    }

private:
    static void put_u16(std::vector<uint8_t>& image, size_t offset, uint16_t value) {
        image[offset] = static_cast<uint8_t>(value & 0xFF);
        image[offset + 1] = static_cast<uint8_t>(value >> 8);
    }

    uint16_t disk_size_;
    uint16_t start_block_;
    uint16_t next_block_;
    std::vector<uint8_t> image_;
    std::vector<Record> records_;
    bool broken_label_ = false;
};

} // namespace mkdos_fuse::testing
