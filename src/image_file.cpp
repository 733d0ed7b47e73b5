#include "image_file.h"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "log.h"
#include "mkdos_format.h"

namespace mkdos_fuse {

ImageFile::ImageFile(std::string_view filename, ImageOptions options)
    : filename_(filename), options_(options) {}

ImageFile::~ImageFile() {
    close();
}

bool ImageFile::open() {
    read_only_ = options_.read_only;

    // Try to open with write access first
    fd_ = ::open(filename_.c_str(), read_only_ ? O_RDONLY : O_RDWR);
    if (fd_ == -1 && !read_only_) {
        // Fall back to read-only if write fails
        log::warn("cannot open ", filename_, " for writing (", std::strerror(errno),
                  "), mounting read-only");
        fd_ = ::open(filename_.c_str(), O_RDONLY);
        read_only_ = true;
    }
    if (fd_ == -1) {
        log::error("cannot open ", filename_, ": ", std::strerror(errno));
        return false;
    }

    struct stat st;
    if (fstat(fd_, &st) == -1) {
        log::error("cannot stat ", filename_, ": ", std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    file_size_ = static_cast<size_t>(st.st_size);

    uint64_t offset = options_.offset_blocks * BLOCK_SIZE;
    if (offset >= file_size_) {
        log::error("partition offset ", options_.offset_blocks, " is beyond the end of ", filename_);
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    size_ = file_size_ - offset;
    if (options_.size_blocks != 0) {
        uint64_t wanted = options_.size_blocks * BLOCK_SIZE;
        if (wanted > size_) {
            log::warn("partition size ", options_.size_blocks, " blocks exceeds the image, clamping");
        }
        size_ = std::min<uint64_t>(size_, wanted);
    }

    // Map with appropriate protection
    int prot = PROT_READ;
    if (!read_only_) prot |= PROT_WRITE;

    mapped_data_ = mmap(nullptr, file_size_, prot, MAP_SHARED, fd_, 0);
    if (mapped_data_ == MAP_FAILED) {
        log::error("cannot map ", filename_, ": ", std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        mapped_data_ = nullptr;
        return false;
    }

    base_ = static_cast<uint8_t*>(mapped_data_) + offset;
    return true;
}

void ImageFile::close() {
    if (mapped_data_ && mapped_data_ != MAP_FAILED) {
        // Sync changes to disk if writeable
        if (!read_only_) {
            msync(mapped_data_, file_size_, MS_SYNC);
        }
        munmap(mapped_data_, file_size_);
        mapped_data_ = nullptr;
        base_ = nullptr;
    }
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool ImageFile::is_valid() const {
    return fd_ != -1 && base_ != nullptr;
}

bool ImageFile::in_range(uint64_t offset, size_t length) const {
    return is_valid() && offset <= size_ && length <= size_ - offset;
}

bool ImageFile::read(uint64_t offset, std::span<uint8_t> out) const {
    if (!in_range(offset, out.size())) return false;

    std::memcpy(out.data(), base_ + offset, out.size());
    if (options_.inverted) {
        for (auto& b : out) b = static_cast<uint8_t>(~b);
    }
    return true;
}

bool ImageFile::write(uint64_t offset, std::span<const uint8_t> data) {
    if (read_only_ || !in_range(offset, data.size())) return false;

    if (options_.inverted) {
        uint8_t* dst = base_ + offset;
        for (size_t i = 0; i < data.size(); ++i) {
            dst[i] = static_cast<uint8_t>(~data[i]);
        }
    } else {
        std::memmove(base_ + offset, data.data(), data.size());
    }
    return true;
}

bool ImageFile::sync() {
    if (!mapped_data_ || read_only_) return true;
    if (msync(mapped_data_, file_size_, MS_SYNC) == -1) {
        log::error("msync failed on ", filename_, ": ", std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace mkdos_fuse
