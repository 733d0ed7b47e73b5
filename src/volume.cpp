#include "volume.h"

#include <algorithm>
#include <cstring>

#include "log.h"

namespace mkdos_fuse {

namespace {

uint16_t get_u16(const std::vector<uint8_t>& buf, size_t offset) {
    uint16_t value;
    std::memcpy(&value, buf.data() + offset, sizeof(value));
    return endian::from_little_endian(value);
}

void put_u16(std::vector<uint8_t>& buf, size_t offset, uint16_t value) {
    value = endian::to_little_endian(value);
    std::memcpy(buf.data() + offset, &value, sizeof(value));
}

bool is_directory_name(const RawName& raw) {
    return raw[0] == DIR_MARKER;
}

} // namespace

Volume::Volume(std::string_view filename, ImageOptions options)
    : image_(filename, options) {}

Errc Volume::open() {
    if (!image_.open()) {
        return Errc::io_error;
    }

    if (image_.size() < CATALOG_START + RECORD_SIZE) {
        log::error(image_.filename(), ": image is too small for an MKDOS volume");
        return Errc::bad_format;
    }

    std::vector<uint8_t> meta(CATALOG_START);
    if (!image_.read(0, meta)) {
        return Errc::io_error;
    }

    if (get_u16(meta, META_MICRODOS_LABEL) != MICRODOS_LABEL) {
        log::error(image_.filename(), ": MicroDOS label not found");
        return Errc::bad_format;
    }
    if (get_u16(meta, META_MKDOS_LABEL) != MKDOS_LABEL) {
        log::error(image_.filename(), ": MKDOS label not found");
        return Errc::bad_format;
    }

    disk_size_ = get_u16(meta, META_DISK_SIZE);
    start_block_ = get_u16(meta, META_START_BLOCK);

    if (static_cast<uint64_t>(start_block_) * BLOCK_SIZE < CATALOG_START + RECORD_SIZE) {
        log::error(image_.filename(), ": first data block ", start_block_,
                   " leaves no room for the catalog");
        return Errc::bad_format;
    }
    if (disk_size_ <= start_block_) {
        log::error(image_.filename(), ": disk size ", disk_size_,
                   " does not exceed the first data block ", start_block_);
        return Errc::bad_format;
    }

    uint64_t image_blocks = image_.size() / BLOCK_SIZE;
    if (image_blocks < start_block_) {
        log::error(image_.filename(), ": catalog area is truncated");
        return Errc::bad_format;
    }
    usable_blocks_ = disk_size_;
    if (image_blocks < disk_size_) {
        log::warn(image_.filename(), ": disk size ", disk_size_, " blocks exceeds the image (",
                  image_blocks, " blocks), blocks past the end are not used");
        usable_blocks_ = static_cast<uint32_t>(image_blocks);
    }

    capacity_ = static_cast<uint32_t>((start_block_ * BLOCK_SIZE - CATALOG_START) / RECORD_SIZE);
    if (capacity_ > MAX_CATALOG_RECORDS) {
        log::error(image_.filename(), ": catalog area of ", start_block_,
                   " blocks holds more records than can be addressed");
        return Errc::bad_format;
    }

    catalog_.resize(start_block_ * BLOCK_SIZE);
    if (!image_.read(0, catalog_)) {
        return Errc::io_error;
    }

    Errc rc = parse_catalog();
    if (rc != Errc::ok) {
        return rc;
    }

    log::info(image_.filename(), ": ", disk_size_, " blocks, data from block ", start_block_,
              ", ", slots_.size(), " of ", slot_capacity(), " catalog records used, ",
              free_space_units(), " blocks free", is_read_only() ? " [read-only]" : "");
    return Errc::ok;
}

Errc Volume::parse_catalog() {
    slots_.clear();

    uint32_t live_files = 0;
    uint32_t used_blocks = start_block_;

    for (uint32_t i = 0; i < capacity_; ++i) {
        CatalogRecord rec;
        std::memcpy(&rec, catalog_.data() + CATALOG_START + i * RECORD_SIZE, RECORD_SIZE);
        if (rec.name[0] == 0) {
            break;
        }

        Slot slot;
        slot.status = rec.status;
        slot.length = endian::from_little_endian(rec.length);

        DirEntry& e = slot.entry;
        e.position = {static_cast<uint16_t>(i), next_generation_++};
        std::copy(rec.name, rec.name + NAME_SIZE, e.raw_name.begin());
        e.dir_no = rec.dir_no;
        e.start_block = endian::from_little_endian(rec.start_block);
        e.blocks = endian::from_little_endian(rec.blocks);
        e.load_address = endian::from_little_endian(rec.load_address);

        bool directory = is_directory_name(e.raw_name);
        if (directory) {
            if (rec.status == STATUS_DELETED) {
                e.kind = EntryKind::deleted;
            } else {
                e.kind = EntryKind::directory;
                e.dir_id = rec.status;
            }
        } else {
            switch (rec.status) {
            case STATUS_NORMAL:       e.kind = EntryKind::file; break;
            case STATUS_PROTECTED:    e.kind = EntryKind::protected_file; break;
            case STATUS_LOGICAL_DISK: e.kind = EntryKind::logical_disk; break;
            case STATUS_BAD:          e.kind = EntryKind::bad; break;
            case STATUS_DELETED:      e.kind = EntryKind::deleted; break;
            default:
                log::warn("record ", i, ": unknown status 0", std::oct, int(rec.status), std::dec,
                          ", treating as a file");
                e.kind = EntryKind::file;
                break;
            }
        }

        e.name = NameCodec::decode(e.raw_name, directory);
        e.size = directory ? 0 : decode_size(e.blocks, slot.length);

        if (e.occupies_blocks() && e.blocks > 0) {
            uint32_t end = uint32_t(e.start_block) + e.blocks;
            if (e.start_block < start_block_ || end > disk_size_) {
                log::warn("record ", i, " (", e.name, "): run ", e.start_block, "+", e.blocks,
                          " lies outside the data area");
            }
        }

        if (e.is_live()) {
            ++live_files;
            if (!e.is_directory()) used_blocks += e.blocks;
        }

        slots_.push_back(std::move(slot));
    }

    if (slots_.size() == capacity_) {
        log::warn("catalog has no terminating record");
    }

    rebuild_usage();

    // Overlapping runs are reported but left alone
    std::vector<bool> seen(disk_size_, false);
    for (const auto& slot : slots_) {
        const DirEntry& e = slot.entry;
        if (!e.occupies_blocks()) continue;
        for (uint32_t b = e.start_block; b < uint32_t(e.start_block) + e.blocks && b < disk_size_; ++b) {
            if (seen[b]) {
                log::warn("record ", e.position.slot, " (", e.name, "): block ", b,
                          " is shared with another run");
                break;
            }
            seen[b] = true;
        }
    }

    uint16_t stored_files = get_u16(catalog_, META_FILES);
    uint16_t stored_blocks = get_u16(catalog_, META_BLOCKS);
    if (stored_files != live_files) {
        log::warn("meta block lists ", stored_files, " files, catalog has ", live_files);
    }
    if (stored_blocks != std::min<uint32_t>(used_blocks, 0xFFFF)) {
        log::warn("meta block lists ", stored_blocks, " used blocks, catalog has ", used_blocks);
    }

    return Errc::ok;
}

void Volume::rebuild_usage() {
    used_.assign(disk_size_, false);
    for (uint32_t b = 0; b < start_block_ && b < disk_size_; ++b) {
        used_[b] = true;
    }
    for (uint32_t b = usable_blocks_; b < disk_size_; ++b) {
        used_[b] = true;
    }
    for (const auto& slot : slots_) {
        const DirEntry& e = slot.entry;
        if (!e.occupies_blocks()) continue;
        for (uint32_t b = e.start_block; b < uint32_t(e.start_block) + e.blocks && b < disk_size_; ++b) {
            used_[b] = true;
        }
    }
}

Errc Volume::commit() {
    if (image_.is_read_only()) {
        return Errc::read_only;
    }

    uint32_t files = 0;
    uint32_t blocks = start_block_;
    for (const auto& slot : slots_) {
        const DirEntry& e = slot.entry;
        if (!e.is_live()) continue;
        ++files;
        if (!e.is_directory()) blocks += e.blocks;
    }
    put_u16(catalog_, META_FILES, static_cast<uint16_t>(files));
    put_u16(catalog_, META_BLOCKS, static_cast<uint16_t>(std::min<uint32_t>(blocks, 0xFFFF)));

    for (size_t i = 0; i < slots_.size(); ++i) {
        const Slot& slot = slots_[i];
        const DirEntry& e = slot.entry;

        CatalogRecord rec{};
        rec.status = slot.status;
        rec.dir_no = e.dir_no;
        std::copy(e.raw_name.begin(), e.raw_name.end(), rec.name);
        rec.start_block = endian::to_little_endian(e.start_block);
        rec.blocks = endian::to_little_endian(e.blocks);
        rec.load_address = endian::to_little_endian(e.load_address);
        rec.length = endian::to_little_endian(slot.length);
        std::memcpy(catalog_.data() + CATALOG_START + i * RECORD_SIZE, &rec, RECORD_SIZE);
    }

    if (slots_.size() < capacity_) {
        CatalogRecord end{};
        end.start_block = endian::to_little_endian(static_cast<uint16_t>(tail_start()));
        std::memcpy(catalog_.data() + CATALOG_START + slots_.size() * RECORD_SIZE, &end, RECORD_SIZE);
    }

    if (!image_.write(0, catalog_)) {
        log::error("cannot write the catalog of ", image_.filename());
        return Errc::io_error;
    }
    return Errc::ok;
}

Errc Volume::transact(const std::function<Errc()>& mutate) {
    if (image_.is_read_only()) {
        return Errc::read_only;
    }

    std::vector<Slot> saved = slots_;
    Errc rc = mutate();
    if (rc == Errc::ok) {
        rebuild_usage();
        rc = commit();
    }
    if (rc != Errc::ok) {
        slots_ = std::move(saved);
        rebuild_usage();
    }
    return rc;
}

uint32_t Volume::slot_capacity() const {
    // One record is kept for the terminator
    return capacity_ > 0 ? capacity_ - 1 : 0;
}

uint32_t Volume::free_slots() const {
    uint32_t free = slot_capacity() > slots_.size() ? slot_capacity() - uint32_t(slots_.size()) : 0;
    for (const auto& slot : slots_) {
        if (slot.entry.kind == EntryKind::deleted) ++free;
    }
    return free;
}

uint32_t Volume::file_count() const {
    return static_cast<uint32_t>(std::count_if(slots_.begin(), slots_.end(),
        [](const Slot& s) { return s.entry.is_live(); }));
}

uint32_t Volume::free_space_units() const {
    uint32_t free = 0;
    for (uint32_t b = start_block_; b < disk_size_; ++b) {
        if (!used_[b]) ++free;
    }
    return free;
}

std::vector<DirEntry> Volume::list_entries(uint8_t dir_no, ListFilter filter) const {
    std::vector<DirEntry> result;
    for (const auto& slot : slots_) {
        const DirEntry& e = slot.entry;
        if (e.is_live()) {
            if (e.dir_no == dir_no) result.push_back(e);
        } else if (dir_no == ROOT_DIR) {
            if ((filter.show_bad && e.kind == EntryKind::bad) ||
                (filter.show_deleted && e.kind == EntryKind::deleted)) {
                result.push_back(e);
            }
        }
    }
    return result;
}

Errc Volume::find(uint8_t dir_no, std::string_view name, DirEntry& out, ListFilter filter) const {
    RawName raw;
    Errc rc = NameCodec::encode(name, false, raw);
    if (rc != Errc::ok) {
        return rc;
    }
    std::string wanted = NameCodec::key(raw, false);

    // A live entry wins over a deleted one of the same name
    const DirEntry* shadow = nullptr;
    for (const auto& slot : slots_) {
        const DirEntry& e = slot.entry;
        if (e.is_live()) {
            if (e.dir_no != dir_no) continue;
        } else if (dir_no != ROOT_DIR ||
                   !((filter.show_bad && e.kind == EntryKind::bad) ||
                     (filter.show_deleted && e.kind == EntryKind::deleted))) {
            continue;
        }
        if (NameCodec::key(e.raw_name, is_directory_name(e.raw_name)) != wanted) continue;
        if (e.is_live()) {
            out = e;
            return Errc::ok;
        }
        if (!shadow) shadow = &e;
    }
    if (shadow) {
        out = *shadow;
        return Errc::ok;
    }
    return Errc::not_found;
}

std::optional<DirEntry> Volume::entry(const CatalogPosition& position) const {
    auto index = slot_index(position);
    if (!index) return std::nullopt;
    return slots_[*index].entry;
}

std::optional<DirEntry> Volume::directory_entry(uint8_t dir_id) const {
    for (const auto& slot : slots_) {
        if (slot.entry.is_directory() && slot.entry.dir_id == dir_id) {
            return slot.entry;
        }
    }
    return std::nullopt;
}

Errc Volume::read_range(const CatalogPosition& position, uint64_t offset, size_t length,
                        std::vector<uint8_t>& out) const {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& e = slots_[*index].entry;
    if (e.is_directory()) return Errc::is_directory;

    out.clear();
    if (offset >= e.size) return Errc::ok;

    size_t n = static_cast<size_t>(std::min<uint64_t>(length, e.size - offset));
    out.resize(n);
    if (!image_.read(uint64_t(e.start_block) * BLOCK_SIZE + offset, out)) {
        log::error("read of ", e.name, " at ", offset, " failed");
        out.clear();
        return Errc::io_error;
    }
    return Errc::ok;
}

Errc Volume::allocate_entry(uint8_t dir_no, std::string_view name, DirEntry& out) {
    if (is_read_only()) return Errc::read_only;
    if (!directory_exists(dir_no)) return Errc::not_found;

    RawName raw;
    Errc rc = NameCodec::encode(name, false, raw);
    if (rc != Errc::ok) return rc;
    if (name_taken(dir_no, NameCodec::key(raw, false), std::nullopt)) return Errc::name_conflict;

    return transact([&] {
        auto index = take_slot();
        if (!index) return Errc::no_space;

        Slot& slot = slots_[*index];
        slot = Slot{};
        slot.status = STATUS_NORMAL;

        DirEntry& e = slot.entry;
        e.position = {static_cast<uint16_t>(*index), next_generation_++};
        e.kind = EntryKind::file;
        e.dir_no = dir_no;
        e.name = std::string(name);
        e.raw_name = raw;
        e.start_block = static_cast<uint16_t>(tail_start());
        e.load_address = DEFAULT_LOAD_ADDRESS;
        set_size(slot, 0);

        out = e;
        return Errc::ok;
    });
}

Errc Volume::make_directory(uint8_t parent, std::string_view name, DirEntry& out) {
    if (is_read_only()) return Errc::read_only;
    if (!directory_exists(parent)) return Errc::not_found;

    RawName raw;
    Errc rc = NameCodec::encode(name, true, raw);
    if (rc != Errc::ok) return rc;
    if (name_taken(parent, NameCodec::key(raw, true), std::nullopt)) return Errc::name_conflict;

    std::vector<bool> taken(MAX_DIR_NUMBER + 1, false);
    for (const auto& slot : slots_) {
        if (slot.entry.is_directory()) taken[slot.entry.dir_id] = true;
    }
    uint8_t dir_id = 0;
    for (uint32_t id = 1; id <= MAX_DIR_NUMBER; ++id) {
        if (!taken[id]) {
            dir_id = static_cast<uint8_t>(id);
            break;
        }
    }
    if (dir_id == 0) {
        log::warn("all ", int(MAX_DIR_NUMBER), " directory numbers are in use");
        return Errc::no_space;
    }

    return transact([&] {
        auto index = take_slot();
        if (!index) return Errc::no_space;

        Slot& slot = slots_[*index];
        slot = Slot{};
        slot.status = dir_id;

        DirEntry& e = slot.entry;
        e.position = {static_cast<uint16_t>(*index), next_generation_++};
        e.kind = EntryKind::directory;
        e.dir_no = parent;
        e.dir_id = dir_id;
        e.name = std::string(name);
        e.raw_name = raw;
        e.start_block = static_cast<uint16_t>(tail_start());

        out = e;
        return Errc::ok;
    });
}

Errc Volume::remove_directory(const CatalogPosition& position) {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& dir = slots_[*index].entry;
    if (!dir.is_live()) return Errc::not_found;
    if (!dir.is_directory()) return Errc::not_directory;

    uint8_t dir_id = dir.dir_id;
    for (const auto& slot : slots_) {
        if (slot.entry.is_live() && slot.entry.dir_no == dir_id) {
            return Errc::not_empty;
        }
    }

    return transact([&] {
        Slot& slot = slots_[*index];
        slot.status = STATUS_DELETED;
        slot.entry.kind = EntryKind::deleted;
        slot.entry.position.generation = next_generation_++;
        return Errc::ok;
    });
}

Errc Volume::extend_chain(const CatalogPosition& position, uint32_t additional_units) {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& e = slots_[*index].entry;
    if (e.is_directory()) return Errc::is_directory;
    if (!e.is_writable()) return Errc::access_denied;
    if (additional_units == 0) return Errc::ok;

    uint32_t new_blocks = uint32_t(e.blocks) + additional_units;
    Errc rc = ensure_room(*index, new_blocks);
    if (rc != Errc::ok) return rc;

    return transact([&] {
        return place_run(*index, new_blocks, true);
    });
}

Errc Volume::truncate(const CatalogPosition& position, uint64_t size) {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& e = slots_[*index].entry;
    if (e.is_directory()) return Errc::is_directory;
    if (!e.is_writable()) return Errc::access_denied;
    if (size > uint64_t(MAX_FILE_BLOCKS) * BLOCK_SIZE) return Errc::no_space;

    uint32_t new_blocks = blocks_for(size);
    Errc rc = ensure_room(*index, new_blocks);
    if (rc != Errc::ok) return rc;

    // Run, zero fill and size land in one commit
    return transact([&] {
        Slot& slot = slots_[*index];
        Errc placed = place_run(*index, new_blocks, true);
        if (placed != Errc::ok) return placed;

        // Bytes past the old end read as zeros
        if (size > slot.entry.size) {
            uint64_t base = uint64_t(slot.entry.start_block) * BLOCK_SIZE;
            Errc zeroed = zero_range(base + slot.entry.size, base + uint64_t(slot.entry.blocks) * BLOCK_SIZE);
            if (zeroed != Errc::ok) return zeroed;
        }
        set_size(slot, static_cast<uint32_t>(size));
        return Errc::ok;
    });
}

Errc Volume::store(const CatalogPosition& position, std::span<const uint8_t> content) {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& e = slots_[*index].entry;
    if (e.is_directory()) return Errc::is_directory;
    if (!e.is_writable()) return Errc::access_denied;
    if (content.size() > uint64_t(MAX_FILE_BLOCKS) * BLOCK_SIZE) return Errc::no_space;

    uint32_t new_blocks = blocks_for(content.size());
    Errc rc = ensure_room(*index, new_blocks);
    if (rc != Errc::ok) return rc;

    return transact([&] {
        Slot& slot = slots_[*index];
        Errc placed = place_run(*index, new_blocks, false);
        if (placed != Errc::ok) return placed;

        Errc written = write_bytes(slot, 0, content);
        if (written != Errc::ok) return written;

        uint64_t base = uint64_t(slot.entry.start_block) * BLOCK_SIZE;
        Errc zeroed = zero_range(base + content.size(), base + uint64_t(new_blocks) * BLOCK_SIZE);
        if (zeroed != Errc::ok) return zeroed;

        set_size(slot, static_cast<uint32_t>(content.size()));
        return Errc::ok;
    });
}

Errc Volume::write_range(const CatalogPosition& position, uint64_t offset,
                         std::span<const uint8_t> data) {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& e = slots_[*index].entry;
    if (e.is_directory()) return Errc::is_directory;
    if (!e.is_writable()) return Errc::access_denied;
    if (offset + data.size() > uint64_t(e.blocks) * BLOCK_SIZE) return Errc::invalid_argument;

    return transact([&] {
        Slot& slot = slots_[*index];
        uint64_t base = uint64_t(slot.entry.start_block) * BLOCK_SIZE;
        if (offset > slot.entry.size) {
            Errc zeroed = zero_range(base + slot.entry.size, base + offset);
            if (zeroed != Errc::ok) return zeroed;
        }

        Errc written = write_bytes(slot, offset, data);
        if (written != Errc::ok) return written;

        uint64_t end = offset + data.size();
        if (end > slot.entry.size) set_size(slot, static_cast<uint32_t>(end));
        return Errc::ok;
    });
}

Errc Volume::release_chain(const CatalogPosition& position) {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& e = slots_[*index].entry;
    if (!e.is_live()) return Errc::not_found;
    if (e.is_directory()) return Errc::is_directory;
    if (e.kind == EntryKind::protected_file) return Errc::access_denied;

    return transact([&] {
        Slot& slot = slots_[*index];
        slot.status = STATUS_DELETED;
        slot.entry.kind = EntryKind::deleted;
        slot.entry.position.generation = next_generation_++;
        return Errc::ok;
    });
}

Errc Volume::rename_entry(const CatalogPosition& position, uint8_t new_dir, std::string_view new_name) {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& e = slots_[*index].entry;
    if (!e.is_live()) return Errc::not_found;
    if (!directory_exists(new_dir)) return Errc::not_found;

    bool directory = e.is_directory();
    if (directory && new_dir != e.dir_no) return Errc::cross_directory;

    RawName raw;
    Errc rc = NameCodec::encode(new_name, directory, raw);
    if (rc != Errc::ok) return rc;
    if (name_taken(new_dir, NameCodec::key(raw, directory), *index)) return Errc::name_conflict;

    return transact([&] {
        DirEntry& entry = slots_[*index].entry;
        entry.raw_name = raw;
        entry.name = std::string(new_name);
        entry.dir_no = new_dir;
        return Errc::ok;
    });
}

Errc Volume::replace_entry(const CatalogPosition& position, const CatalogPosition& target,
                          uint8_t new_dir, std::string_view new_name) {
    auto index = slot_index(position);
    auto victim = slot_index(target);
    if (!index || !victim) return Errc::not_found;
    if (*index == *victim) return rename_entry(position, new_dir, new_name);

    const DirEntry& e = slots_[*index].entry;
    const DirEntry& old = slots_[*victim].entry;
    if (!e.is_live() || !old.is_live()) return Errc::not_found;
    if (!directory_exists(new_dir)) return Errc::not_found;
    if (e.is_directory() || old.is_directory()) return Errc::already_exists;
    if (!old.is_writable()) return Errc::access_denied;

    RawName raw;
    Errc rc = NameCodec::encode(new_name, false, raw);
    if (rc != Errc::ok) return rc;

    // The old entry goes and the source takes its place in one commit
    return transact([&] {
        Slot& gone = slots_[*victim];
        gone.status = STATUS_DELETED;
        gone.entry.kind = EntryKind::deleted;
        gone.entry.position.generation = next_generation_++;

        if (name_taken(new_dir, NameCodec::key(raw, false), *index)) return Errc::name_conflict;

        DirEntry& entry = slots_[*index].entry;
        entry.raw_name = raw;
        entry.name = std::string(new_name);
        entry.dir_no = new_dir;
        return Errc::ok;
    });
}

Errc Volume::set_protected(const CatalogPosition& position, bool protect) {
    auto index = slot_index(position);
    if (!index) return Errc::not_found;

    const DirEntry& e = slots_[*index].entry;
    if (e.kind != EntryKind::file && e.kind != EntryKind::protected_file) {
        return Errc::invalid_argument;
    }
    if ((e.kind == EntryKind::protected_file) == protect) return Errc::ok;

    return transact([&] {
        Slot& slot = slots_[*index];
        slot.status = protect ? STATUS_PROTECTED : STATUS_NORMAL;
        slot.entry.kind = protect ? EntryKind::protected_file : EntryKind::file;
        return Errc::ok;
    });
}

uint32_t Volume::squeeze() {
    if (is_read_only()) return 0;

    uint32_t moved = 0;
    bool progress = true;
    while (progress) {
        progress = false;

        std::vector<size_t> order;
        for (size_t i = 0; i < slots_.size(); ++i) {
            const DirEntry& e = slots_[i].entry;
            if (e.occupies_blocks() && e.kind != EntryKind::bad && e.blocks > 0) {
                order.push_back(i);
            }
        }
        std::sort(order.begin(), order.end(), [this](size_t a, size_t b) {
            return slots_[a].entry.start_block < slots_[b].entry.start_block;
        });

        for (size_t index : order) {
            uint32_t from = slots_[index].entry.start_block;
            uint32_t count = slots_[index].entry.blocks;

            // Only strictly free space, so the old copy survives a crash
            auto target = find_run(count, std::nullopt);
            if (!target || *target >= from) continue;

            Errc rc = transact([&] {
                Errc copied = copy_blocks(from, *target, count);
                if (copied != Errc::ok) return copied;
                slots_[index].entry.start_block = static_cast<uint16_t>(*target);
                return Errc::ok;
            });
            if (rc != Errc::ok) {
                log::error("squeeze: cannot move ", slots_[index].entry.name, ": ", describe(rc));
                progress = false;
                break;
            }
            log::debug("squeeze: moved ", slots_[index].entry.name, " from block ", from,
                       " to ", *target);
            ++moved;
            progress = true;
        }
    }

    if (moved > 0) {
        ++layout_version_;
        log::info("squeeze moved ", moved, " files, ", free_space_units(), " blocks free");
    }
    return moved;
}

Errc Volume::sync() {
    return image_.sync() ? Errc::ok : Errc::io_error;
}

std::optional<size_t> Volume::slot_index(const CatalogPosition& position) const {
    if (position.slot >= slots_.size()) return std::nullopt;
    if (slots_[position.slot].entry.position.generation != position.generation) return std::nullopt;
    return position.slot;
}

std::optional<size_t> Volume::take_slot() {
    if (slots_.size() < slot_capacity()) {
        slots_.emplace_back();
        return slots_.size() - 1;
    }
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].entry.kind == EntryKind::deleted) return i;
    }
    return std::nullopt;
}

bool Volume::name_taken(uint8_t dir_no, const std::string& key, std::optional<size_t> except) const {
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (except && *except == i) continue;
        const DirEntry& e = slots_[i].entry;
        if (!e.is_live() || e.dir_no != dir_no) continue;
        if (NameCodec::key(e.raw_name, e.is_directory()) == key) return true;
    }
    return false;
}

bool Volume::directory_exists(uint8_t dir_no) const {
    return dir_no == ROOT_DIR || directory_entry(dir_no).has_value();
}

uint32_t Volume::tail_start() const {
    uint32_t tail = start_block_;
    for (const auto& slot : slots_) {
        const DirEntry& e = slot.entry;
        if (e.occupies_blocks() && e.blocks > 0) {
            tail = std::max<uint32_t>(tail, uint32_t(e.start_block) + e.blocks);
        }
    }
    return std::min(tail, disk_size_);
}

bool Volume::range_free(uint32_t start, uint32_t count) const {
    if (start < start_block_ || uint64_t(start) + count > usable_blocks_) return false;
    for (uint32_t b = start; b < start + count; ++b) {
        if (used_[b]) return false;
    }
    return true;
}

std::optional<uint32_t> Volume::find_run(uint32_t count, std::optional<size_t> ignore_slot) const {
    uint32_t ignore_begin = 0;
    uint32_t ignore_end = 0;
    if (ignore_slot) {
        const DirEntry& e = slots_[*ignore_slot].entry;
        ignore_begin = e.start_block;
        ignore_end = uint32_t(e.start_block) + e.blocks;
    }

    uint32_t run_start = start_block_;
    uint32_t run_length = 0;
    for (uint32_t b = start_block_; b < usable_blocks_; ++b) {
        bool free = !used_[b] || (b >= ignore_begin && b < ignore_end);
        if (!free) {
            run_length = 0;
            run_start = b + 1;
            continue;
        }
        if (++run_length >= count) return run_start;
    }
    return std::nullopt;
}

Errc Volume::ensure_room(size_t index, uint32_t new_blocks) {
    const DirEntry& e = slots_[index].entry;
    if (new_blocks <= e.blocks) return Errc::ok;
    if (new_blocks > MAX_FILE_BLOCKS) return Errc::no_space;
    if (new_blocks - e.blocks > free_space_units()) return Errc::no_space;

    auto fits = [&] {
        const DirEntry& cur = slots_[index].entry;
        return range_free(uint32_t(cur.start_block) + cur.blocks, new_blocks - cur.blocks) ||
               find_run(new_blocks, index).has_value();
    };
    if (fits()) return Errc::ok;

    log::info("no free run of ", new_blocks, " blocks for ", e.name, ", squeezing");
    squeeze();
    return fits() ? Errc::ok : Errc::no_space;
}

Errc Volume::place_run(size_t index, uint32_t new_blocks, bool preserve_data) {
    DirEntry& e = slots_[index].entry;
    if (new_blocks > MAX_FILE_BLOCKS) return Errc::no_space;

    if (new_blocks <= e.blocks) {
        e.blocks = static_cast<uint16_t>(new_blocks);
        return Errc::ok;
    }

    // Grow in place
    if (range_free(uint32_t(e.start_block) + e.blocks, new_blocks - e.blocks)) {
        e.blocks = static_cast<uint16_t>(new_blocks);
        return Errc::ok;
    }

    // First fit, preferring space that leaves the old run intact
    auto target = find_run(new_blocks, std::nullopt);
    if (!target) target = find_run(new_blocks, index);
    if (!target) return Errc::no_space;

    if (preserve_data && e.blocks > 0 && *target != e.start_block) {
        Errc rc = copy_blocks(e.start_block, *target, e.blocks);
        if (rc != Errc::ok) return rc;
    }
    e.start_block = static_cast<uint16_t>(*target);
    e.blocks = static_cast<uint16_t>(new_blocks);
    return Errc::ok;
}

Errc Volume::copy_blocks(uint32_t from, uint32_t to, uint32_t count) {
    std::vector<uint8_t> buffer(uint64_t(count) * BLOCK_SIZE);
    if (!image_.read(uint64_t(from) * BLOCK_SIZE, buffer)) return Errc::io_error;
    if (!image_.write(uint64_t(to) * BLOCK_SIZE, buffer)) return Errc::io_error;
    return Errc::ok;
}

Errc Volume::zero_range(uint64_t from, uint64_t to) {
    if (to <= from) return Errc::ok;
    std::vector<uint8_t> zeros(to - from, 0);
    return image_.write(from, zeros) ? Errc::ok : Errc::io_error;
}

Errc Volume::write_bytes(const Slot& slot, uint64_t offset, std::span<const uint8_t> data) {
    if (data.empty()) return Errc::ok;
    uint64_t base = uint64_t(slot.entry.start_block) * BLOCK_SIZE;
    if (!image_.write(base + offset, data)) {
        log::error("write of ", slot.entry.name, " at ", offset, " failed");
        return Errc::io_error;
    }
    return Errc::ok;
}

void Volume::set_size(Slot& slot, uint32_t size) {
    slot.entry.size = size;
    slot.length = static_cast<uint16_t>(size & 0xFFFF);
}

uint32_t Volume::decode_size(uint16_t blocks, uint16_t length) {
    if (blocks == 0) return 0;

    uint32_t capacity = uint32_t(blocks) * BLOCK_SIZE;
    if (length == 0) return capacity;
    if (capacity <= 0x10000) return std::min<uint32_t>(length, capacity);

    // Only the low 16 bits are stored; pick the value that fits the last block
    uint32_t floor = capacity - BLOCK_SIZE;
    uint32_t size = (floor & ~uint32_t(0xFFFF)) | length;
    if (size <= floor) size += 0x10000;
    return size <= capacity ? size : capacity;
}

} // namespace mkdos_fuse
