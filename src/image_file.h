#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace mkdos_fuse {

struct ImageOptions {
    bool read_only = false;
    uint64_t offset_blocks = 0;   // partition start inside a larger image
    uint64_t size_blocks = 0;     // 0 = up to the end of the file
    bool inverted = false;        // bytes stored bit-inverted (BK HDD controllers)
};

// Memory-mapped disk image. All offsets are relative to the partition start.
class ImageFile {
public:
    explicit ImageFile(std::string_view filename, ImageOptions options = {});
    ~ImageFile();

    ImageFile(const ImageFile&) = delete;
    ImageFile& operator=(const ImageFile&) = delete;

    bool open();
    void close();

    bool is_valid() const;
    bool is_read_only() const { return read_only_; }
    uint64_t size() const { return size_; }
    const std::string& filename() const { return filename_; }

    bool read(uint64_t offset, std::span<uint8_t> out) const;
    bool write(uint64_t offset, std::span<const uint8_t> data);
    bool sync();

private:
    bool in_range(uint64_t offset, size_t length) const;

    std::string filename_;
    ImageOptions options_;
    int fd_ = -1;
    void* mapped_data_ = nullptr;
    size_t file_size_ = 0;
    uint8_t* base_ = nullptr;
    uint64_t size_ = 0;
    bool read_only_ = false;
};

} // namespace mkdos_fuse
