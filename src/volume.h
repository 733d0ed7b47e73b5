#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "errors.h"
#include "image_file.h"
#include "mkdos_format.h"
#include "name_codec.h"

namespace mkdos_fuse {

// Identity of a catalog record. The generation changes whenever the slot is
// deleted or handed to a new entry, so an old position never matches again.
struct CatalogPosition {
    uint16_t slot = 0;
    uint32_t generation = 0;

    bool operator==(const CatalogPosition&) const = default;
};

struct CatalogPositionHash {
    size_t operator()(const CatalogPosition& p) const noexcept {
        return (static_cast<size_t>(p.generation) << 16) ^ p.slot;
    }
};

enum class EntryKind {
    file,
    protected_file,
    logical_disk,
    directory,
    bad,
    deleted,
};

struct DirEntry {
    CatalogPosition position;
    EntryKind kind = EntryKind::file;
    uint8_t dir_no = ROOT_DIR;       // parent directory number
    uint8_t dir_id = ROOT_DIR;       // own number, directories only
    std::string name;
    RawName raw_name{};
    uint16_t start_block = 0;
    uint16_t blocks = 0;
    uint16_t load_address = 0;
    uint32_t size = 0;

    bool is_directory() const { return kind == EntryKind::directory; }
    bool is_live() const { return kind != EntryKind::bad && kind != EntryKind::deleted; }
    bool is_writable() const { return kind == EntryKind::file; }
    bool occupies_blocks() const {
        return kind == EntryKind::file || kind == EntryKind::protected_file ||
               kind == EntryKind::logical_disk || kind == EntryKind::bad;
    }
};

struct ListFilter {
    bool show_bad = false;
    bool show_deleted = false;
};

// MKDOS volume: meta block, catalog and contiguous file runs.
//
// Every mutation is applied to the in-memory catalog, data is written to the
// image, then the catalog region is committed. A failed commit rolls the
// in-memory state back. The class does no locking of its own; callers must
// serialize mutations against each other and against readers.
class Volume {
public:
    explicit Volume(std::string_view filename, ImageOptions options = {});

    Volume(const Volume&) = delete;
    Volume& operator=(const Volume&) = delete;

    Errc open();

    bool is_read_only() const { return image_.is_read_only(); }
    uint32_t disk_size() const { return disk_size_; }
    uint32_t first_data_block() const { return start_block_; }
    uint32_t slot_capacity() const;
    uint32_t free_slots() const;
    uint32_t file_count() const;
    uint32_t free_space_units() const;
    uint64_t layout_version() const { return layout_version_; }

    std::vector<DirEntry> list_entries(uint8_t dir_no, ListFilter filter = {}) const;
    Errc find(uint8_t dir_no, std::string_view name, DirEntry& out, ListFilter filter = {}) const;
    std::optional<DirEntry> entry(const CatalogPosition& position) const;
    std::optional<DirEntry> directory_entry(uint8_t dir_id) const;

    Errc read_range(const CatalogPosition& position, uint64_t offset, size_t length,
                    std::vector<uint8_t>& out) const;

    Errc allocate_entry(uint8_t dir_no, std::string_view name, DirEntry& out);
    Errc make_directory(uint8_t parent, std::string_view name, DirEntry& out);
    Errc remove_directory(const CatalogPosition& position);
    Errc extend_chain(const CatalogPosition& position, uint32_t additional_units);
    Errc truncate(const CatalogPosition& position, uint64_t size);
    Errc store(const CatalogPosition& position, std::span<const uint8_t> content);
    // Writes inside the allocated run; the size grows to cover the range
    Errc write_range(const CatalogPosition& position, uint64_t offset,
                     std::span<const uint8_t> data);
    Errc release_chain(const CatalogPosition& position);
    Errc rename_entry(const CatalogPosition& position, uint8_t new_dir, std::string_view new_name);
    // Renames position over the file at target, releasing target's run
    Errc replace_entry(const CatalogPosition& position, const CatalogPosition& target,
                       uint8_t new_dir, std::string_view new_name);
    Errc set_protected(const CatalogPosition& position, bool protect);

    // Compacts file runs toward the catalog; returns the number of runs moved
    uint32_t squeeze();

    Errc sync();

private:
    struct Slot {
        DirEntry entry;
        uint8_t status = STATUS_NORMAL;
        uint16_t length = 0;      // raw length field, low 16 bits of the size
    };

    Errc parse_catalog();
    void rebuild_usage();
    Errc commit();
    Errc transact(const std::function<Errc()>& mutate);

    std::optional<size_t> slot_index(const CatalogPosition& position) const;
    std::optional<size_t> take_slot();
    bool name_taken(uint8_t dir_no, const std::string& key, std::optional<size_t> except) const;
    bool directory_exists(uint8_t dir_no) const;
    uint32_t tail_start() const;

    bool range_free(uint32_t start, uint32_t count) const;
    std::optional<uint32_t> find_run(uint32_t count, std::optional<size_t> ignore_slot) const;
    Errc ensure_room(size_t index, uint32_t new_blocks);
    Errc place_run(size_t index, uint32_t new_blocks, bool preserve_data);
    Errc copy_blocks(uint32_t from, uint32_t to, uint32_t count);
    Errc zero_range(uint64_t from, uint64_t to);
    Errc write_bytes(const Slot& slot, uint64_t offset, std::span<const uint8_t> data);

    static void set_size(Slot& slot, uint32_t size);
    static uint32_t decode_size(uint16_t blocks, uint16_t length);

    ImageFile image_;
    std::vector<uint8_t> catalog_;        // raw catalog region, blocks [0, start_block_)
    std::vector<Slot> slots_;
    std::vector<bool> used_;              // block usage map
    uint32_t disk_size_ = 0;
    uint32_t usable_blocks_ = 0;          // disk size clamped to the image
    uint32_t start_block_ = 0;
    uint32_t capacity_ = 0;               // records that fit in the catalog area
    uint32_t next_generation_ = 1;
    uint64_t layout_version_ = 0;
};

} // namespace mkdos_fuse
