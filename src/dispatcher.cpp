#include "dispatcher.h"

#include <fcntl.h>

#include <algorithm>
#include <cstring>
#include <mutex>

#include "log.h"

namespace mkdos_fuse {

namespace {

int fail(Errc e) {
    return -to_errno(e);
}

// Units a buffer of the given size needs beyond the entry's current run
uint32_t growth_units(uint64_t size, const DirEntry& entry) {
    uint32_t needed = blocks_for(size);
    return needed > entry.blocks ? needed - entry.blocks : 0;
}

uint32_t available_units(uint32_t free_units, uint32_t reserved) {
    return free_units > reserved ? free_units - reserved : 0;
}

} // namespace

Dispatcher::Dispatcher(Volume& volume, DispatcherOptions options)
    : volume_(volume),
      options_(options),
      inodes_(AttrContext{options.uid, options.gid, volume.is_read_only()}),
      resolver_(volume_, inodes_, ListFilter{options.show_bad, options.show_deleted}),
      seen_layout_(volume.layout_version()) {}

Errc Dispatcher::resolve_live(InodeHandle ino, CachedEntry& out) {
    auto cached = inodes_.lookup(ino);
    if (!cached) return Errc::stale_handle;
    if (ino == ROOT_INODE) {
        out = *cached;
        return Errc::ok;
    }

    auto current = volume_.entry(cached->position);
    if (!current) {
        inodes_.invalidate(ino);
        return Errc::stale_handle;
    }
    out = *cached;
    out.entry = *current;
    return Errc::ok;
}

struct stat Dispatcher::attributes_of(InodeHandle ino, const CachedEntry& cached) {
    struct stat st = cached.attr;
    if (cached.entry.is_directory()) return st;

    // Unflushed writes are visible through stat
    open_files_.with_state(ino, [&](OpenState& s) {
        if (s.loaded && s.dirty) {
            st.st_size = static_cast<off_t>(s.buffer.size());
            st.st_blocks = std::max<blkcnt_t>(st.st_blocks, blocks_for(s.buffer.size()));
        }
    });
    return st;
}

Errc Dispatcher::load_buffer(OpenState& state, const DirEntry& entry) {
    if (state.loaded) return Errc::ok;
    Errc rc = volume_.read_range(entry.position, 0, entry.size, state.buffer);
    if (rc != Errc::ok) return rc;
    state.loaded = true;
    return Errc::ok;
}

void Dispatcher::refresh_locked(InodeHandle ino, const CatalogPosition& position) {
    if (volume_.layout_version() != seen_layout_) {
        // A squeeze moved other files too
        seen_layout_ = volume_.layout_version();
        inodes_.refresh_all(volume_);
        return;
    }
    if (auto entry = volume_.entry(position)) {
        inodes_.refresh(ino, *entry);
    }
}

int Dispatcher::lookup(InodeHandle parent, std::string_view name, EntryReply& out) {
    std::shared_lock<std::shared_mutex> lock(volume_mutex_);

    InodeHandle ino;
    Errc rc = resolver_.resolve(parent, name, ino);
    if (rc != Errc::ok) return fail(rc);

    auto cached = inodes_.lookup(ino);
    if (!cached) return fail(Errc::stale_handle);
    out.ino = ino;
    out.attr = attributes_of(ino, *cached);
    return 0;
}

void Dispatcher::forget(InodeHandle, uint64_t) {
    // Handles stay bound for the lifetime of the mount
}

int Dispatcher::getattr(InodeHandle ino, struct stat& out) {
    std::shared_lock<std::shared_mutex> lock(volume_mutex_);

    CachedEntry cached;
    Errc rc = resolve_live(ino, cached);
    if (rc != Errc::ok) return fail(rc);
    out = attributes_of(ino, cached);
    return 0;
}

int Dispatcher::setattr(InodeHandle ino, const AttrChange& change, struct stat& out) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    CachedEntry cached;
    Errc rc = resolve_live(ino, cached);
    if (rc != Errc::ok) return fail(rc);

    if (change.mode && ino != ROOT_INODE) {
        EntryKind kind = cached.entry.kind;
        bool protect = (*change.mode & S_IWUSR) == 0;
        if ((kind == EntryKind::file || kind == EntryKind::protected_file) &&
            (kind == EntryKind::protected_file) != protect) {
            rc = volume_.set_protected(cached.position, protect);
            if (rc != Errc::ok) return fail(rc);
            log::debug("setattr: ", cached.entry.name, protect ? " protected" : " unprotected");
            refresh_locked(ino, cached.position);
            rc = resolve_live(ino, cached);
            if (rc != Errc::ok) return fail(rc);
        }
    }

    if (change.size) {
        const DirEntry& entry = cached.entry;
        if (entry.is_directory()) return fail(Errc::is_directory);
        if (volume_.is_read_only()) return fail(Errc::read_only);
        if (!entry.is_writable()) return fail(Errc::access_denied);

        uint64_t size = *change.size;
        if (size > uint64_t(MAX_FILE_BLOCKS) * BLOCK_SIZE) return fail(Errc::no_space);

        uint32_t free_units = volume_.free_space_units();
        bool buffered = open_files_.with_reservation(ino, [&](OpenState& s, uint32_t elsewhere) {
            rc = load_buffer(s, entry);
            if (rc != Errc::ok) return;
            uint32_t growth = growth_units(size, entry);
            if (growth > available_units(free_units, elsewhere)) {
                rc = Errc::no_space;
                return;
            }
            s.buffer.resize(size, 0);
            s.dirty = true;
            s.reserved = growth;
        });
        if (!buffered) {
            rc = volume_.truncate(entry.position, size);
            if (rc == Errc::ok) refresh_locked(ino, entry.position);
        }
        if (rc != Errc::ok) return fail(rc);

        rc = resolve_live(ino, cached);
        if (rc != Errc::ok) return fail(rc);
    }

    out = attributes_of(ino, cached);
    return 0;
}

int Dispatcher::opendir(InodeHandle ino) {
    std::shared_lock<std::shared_mutex> lock(volume_mutex_);

    uint8_t dir_no;
    Errc rc = resolver_.directory_number(ino, dir_no);
    return rc == Errc::ok ? 0 : fail(rc);
}

int Dispatcher::readdir(InodeHandle ino, off_t offset, std::vector<DirListing>& out) {
    std::shared_lock<std::shared_mutex> lock(volume_mutex_);

    uint8_t dir_no;
    Errc rc = resolver_.directory_number(ino, dir_no);
    if (rc != Errc::ok) return fail(rc);

    InodeHandle parent = ROOT_INODE;
    if (dir_no != ROOT_DIR) {
        auto self = volume_.directory_entry(dir_no);
        if (self && self->dir_no != ROOT_DIR) {
            if (auto up = volume_.directory_entry(self->dir_no)) {
                parent = inodes_.resolve_or_create(*up);
            }
        }
    }

    std::vector<DirListing> all;
    all.push_back({".", ino, S_IFDIR, 1});
    all.push_back({"..", parent, S_IFDIR, 2});

    for (const DirEntry& entry : volume_.list_entries(dir_no, {options_.show_bad, options_.show_deleted})) {
        DirListing listing;
        listing.name = entry.name;
        listing.ino = inodes_.resolve_or_create(entry);
        listing.mode = entry.is_directory() ? S_IFDIR : S_IFREG;
        listing.next_offset = static_cast<off_t>(all.size() + 1);
        all.push_back(std::move(listing));
    }

    out.clear();
    if (offset < 0) return fail(Errc::invalid_argument);
    for (size_t i = static_cast<size_t>(offset); i < all.size(); ++i) {
        out.push_back(std::move(all[i]));
    }
    return 0;
}

int Dispatcher::open(InodeHandle ino, int flags, uint64_t& fh) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    CachedEntry cached;
    Errc rc = resolve_live(ino, cached);
    if (rc != Errc::ok) return fail(rc);
    if (cached.entry.is_directory()) return fail(Errc::is_directory);

    bool write = (flags & O_ACCMODE) != O_RDONLY;
    if (write) {
        if (volume_.is_read_only()) return fail(Errc::read_only);
        if (!cached.entry.is_writable()) return fail(Errc::access_denied);
        if (cached.entry.blocks == 0 && volume_.free_space_units() == 0) return fail(Errc::no_space);
    }

    fh = open_files_.open(ino);

    if (write && (flags & O_TRUNC)) {
        open_files_.with_state(ino, [&](OpenState& s) {
            if (s.writer && *s.writer != fh) {
                rc = Errc::busy;
                return;
            }
            s.buffer.clear();
            s.loaded = true;
            s.dirty = true;
            s.writer = fh;
            s.reserved = 0;
        });
        if (rc != Errc::ok) {
            open_files_.release(fh);
            return fail(rc);
        }
    }

    log::debug("open ", cached.entry.name, " fh ", fh, write ? " rw" : " ro");
    return 0;
}

int Dispatcher::read(InodeHandle ino, uint64_t, off_t offset, size_t size, std::vector<uint8_t>& out) {
    std::shared_lock<std::shared_mutex> lock(volume_mutex_);

    CachedEntry cached;
    Errc rc = resolve_live(ino, cached);
    if (rc != Errc::ok) return fail(rc);
    if (cached.entry.is_directory()) return fail(Errc::is_directory);
    if (offset < 0) return fail(Errc::invalid_argument);

    bool buffered = false;
    open_files_.with_state(ino, [&](OpenState& s) {
        if (!s.loaded) return;
        buffered = true;
        out.clear();
        if (static_cast<uint64_t>(offset) >= s.buffer.size()) return;
        size_t n = std::min<size_t>(size, s.buffer.size() - offset);
        out.assign(s.buffer.begin() + offset, s.buffer.begin() + offset + n);
    });
    if (buffered) return 0;

    rc = volume_.read_range(cached.position, offset, size, out);
    return rc == Errc::ok ? 0 : fail(rc);
}

int Dispatcher::write(InodeHandle ino, uint64_t fh, off_t offset, std::span<const uint8_t> data) {
    std::shared_lock<std::shared_mutex> lock(volume_mutex_);

    CachedEntry cached;
    Errc rc = resolve_live(ino, cached);
    if (rc != Errc::ok) return fail(rc);

    const DirEntry& entry = cached.entry;
    if (entry.is_directory()) return fail(Errc::is_directory);
    if (volume_.is_read_only()) return fail(Errc::read_only);
    if (!entry.is_writable()) return fail(Errc::access_denied);
    if (offset < 0) return fail(Errc::invalid_argument);

    uint64_t end = static_cast<uint64_t>(offset) + data.size();
    if (end > uint64_t(MAX_FILE_BLOCKS) * BLOCK_SIZE) return fail(Errc::no_space);

    uint32_t free_units = volume_.free_space_units();
    bool open = open_files_.with_reservation(ino, [&](OpenState& s, uint32_t elsewhere) {
        if (s.writer && *s.writer != fh) {
            rc = Errc::busy;
            return;
        }
        rc = load_buffer(s, entry);
        if (rc != Errc::ok) return;

        // Units promised to other unflushed buffers are not free
        uint64_t new_size = std::max<uint64_t>(s.buffer.size(), end);
        uint32_t growth = growth_units(new_size, entry);
        if (growth > available_units(free_units, elsewhere)) {
            rc = Errc::no_space;
            return;
        }

        s.writer = fh;
        if (new_size > s.buffer.size()) s.buffer.resize(new_size, 0);
        std::copy(data.begin(), data.end(), s.buffer.begin() + offset);
        s.dirty = true;
        s.reserved = growth;
    });
    if (!open) return fail(Errc::invalid_argument);
    if (rc != Errc::ok) {
        log::debug("write to ", entry.name, " refused: ", describe(rc));
        return fail(rc);
    }
    return static_cast<int>(data.size());
}

Errc Dispatcher::flush_locked(InodeHandle ino) {
    std::vector<uint8_t> content;
    bool dirty = false;
    open_files_.with_state(ino, [&](OpenState& s) {
        if (s.dirty) {
            dirty = true;
            content = s.buffer;
        }
    });
    if (!dirty) return Errc::ok;

    CachedEntry cached;
    Errc rc = resolve_live(ino, cached);
    if (rc != Errc::ok) {
        // Unlinked or replaced while open; the data has nowhere to go
        open_files_.with_state(ino, [](OpenState& s) {
            s.dirty = false;
            s.reserved = 0;
        });
        return Errc::ok;
    }

    const DirEntry& entry = cached.entry;
    if (content.size() >= entry.size && blocks_for(content.size()) <= entry.blocks) {
        rc = volume_.write_range(entry.position, 0, content);
    } else {
        rc = volume_.store(entry.position, content);
    }
    if (rc != Errc::ok) {
        log::warn("cannot write back ", entry.name, ": ", describe(rc));
        return rc;
    }

    open_files_.with_state(ino, [](OpenState& s) {
        s.dirty = false;
        s.reserved = 0;
    });
    refresh_locked(ino, entry.position);
    log::debug("flushed ", entry.name, ", ", content.size(), " bytes");
    return Errc::ok;
}

int Dispatcher::flush(InodeHandle ino, uint64_t) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    Errc rc = flush_locked(ino);
    if (rc != Errc::ok) return fail(rc);
    rc = open_files_.take_deferred_error(ino);
    return rc == Errc::ok ? 0 : fail(rc);
}

int Dispatcher::fsync(InodeHandle ino, uint64_t fh) {
    int res = flush(ino, fh);
    if (res != 0) return res;

    std::shared_lock<std::shared_mutex> lock(volume_mutex_);
    Errc rc = volume_.sync();
    return rc == Errc::ok ? 0 : fail(rc);
}

int Dispatcher::release(InodeHandle ino, uint64_t fh) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    bool write_back = false;
    open_files_.with_state(ino, [&](OpenState& s) {
        write_back = s.dirty && (s.writer == fh || s.refcount == 1);
    });
    if (write_back) {
        Errc rc = flush_locked(ino);
        if (rc != Errc::ok) {
            log::error("release of inode ", ino, ": write back failed: ", describe(rc));
            open_files_.defer_error(ino, rc);
        }
    }

    open_files_.release(fh);
    return 0;
}

int Dispatcher::create(InodeHandle parent, std::string_view name, int flags, EntryReply& out,
                       uint64_t& fh) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    if (volume_.is_read_only()) return fail(Errc::read_only);

    uint8_t dir_no;
    Errc rc = resolver_.directory_number(parent, dir_no);
    if (rc != Errc::ok) return fail(rc);

    DirEntry entry;
    rc = volume_.allocate_entry(dir_no, name, entry);
    if (rc == Errc::name_conflict) rc = Errc::already_exists;
    if (rc != Errc::ok) return fail(rc);

    out.ino = inodes_.resolve_or_create(entry);
    auto cached = inodes_.lookup(out.ino);
    if (!cached) return fail(Errc::stale_handle);
    out.attr = cached->attr;

    fh = open_files_.open(out.ino);
    bool write = (flags & O_ACCMODE) != O_RDONLY;
    open_files_.with_state(out.ino, [&](OpenState& s) {
        s.loaded = true;
        if (write) s.writer = fh;
    });

    log::debug("created ", name, " as inode ", out.ino);
    return 0;
}

int Dispatcher::mkdir(InodeHandle parent, std::string_view name, EntryReply& out) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    uint8_t dir_no;
    Errc rc = resolver_.directory_number(parent, dir_no);
    if (rc != Errc::ok) return fail(rc);

    DirEntry entry;
    rc = volume_.make_directory(dir_no, name, entry);
    if (rc == Errc::name_conflict) rc = Errc::already_exists;
    if (rc != Errc::ok) return fail(rc);

    out.ino = inodes_.resolve_or_create(entry);
    auto cached = inodes_.lookup(out.ino);
    if (!cached) return fail(Errc::stale_handle);
    out.attr = cached->attr;
    return 0;
}

int Dispatcher::unlink(InodeHandle parent, std::string_view name) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    InodeHandle ino;
    DirEntry entry;
    Errc rc = resolver_.resolve(parent, name, ino, entry);
    if (rc != Errc::ok) return fail(rc);
    if (entry.is_directory()) return fail(Errc::is_directory);
    if (!entry.is_live()) return fail(Errc::access_denied);

    rc = volume_.release_chain(entry.position);
    if (rc != Errc::ok) return fail(rc);

    inodes_.invalidate(ino);
    log::debug("unlinked ", entry.name);
    return 0;
}

int Dispatcher::rmdir(InodeHandle parent, std::string_view name) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    InodeHandle ino;
    DirEntry entry;
    Errc rc = resolver_.resolve(parent, name, ino, entry);
    if (rc != Errc::ok) return fail(rc);
    if (!entry.is_directory()) return fail(Errc::not_directory);

    rc = volume_.remove_directory(entry.position);
    if (rc != Errc::ok) return fail(rc);

    inodes_.invalidate(ino);
    return 0;
}

int Dispatcher::rename(InodeHandle old_parent, std::string_view old_name,
                       InodeHandle new_parent, std::string_view new_name) {
    std::unique_lock<std::shared_mutex> lock(volume_mutex_);

    uint8_t src_dir, dst_dir;
    Errc rc = resolver_.directory_number(old_parent, src_dir);
    if (rc != Errc::ok) return fail(rc);
    rc = resolver_.directory_number(new_parent, dst_dir);
    if (rc != Errc::ok) return fail(rc);

    DirEntry source;
    rc = volume_.find(src_dir, old_name, source);
    if (rc != Errc::ok) return fail(rc);
    if (source.is_directory() && src_dir != dst_dir) return fail(Errc::cross_directory);

    DirEntry target;
    rc = volume_.find(dst_dir, new_name, target);
    if (rc == Errc::ok && target.position != source.position) {
        if (source.is_directory() || target.is_directory()) return fail(Errc::already_exists);
        if (!target.is_writable()) return fail(Errc::access_denied);

        auto target_ino = inodes_.find(target.position);
        rc = volume_.replace_entry(source.position, target.position, dst_dir, new_name);
        if (rc == Errc::name_conflict) rc = Errc::already_exists;
        if (rc != Errc::ok) return fail(rc);
        if (target_ino) inodes_.invalidate(*target_ino);
        log::debug("rename: replaced ", target.name);
    } else if (rc == Errc::ok || rc == Errc::not_found) {
        rc = volume_.rename_entry(source.position, dst_dir, new_name);
        if (rc == Errc::name_conflict) rc = Errc::already_exists;
        if (rc != Errc::ok) return fail(rc);
    } else {
        return fail(rc);
    }

    if (auto ino = inodes_.find(source.position)) {
        refresh_locked(*ino, source.position);
    }
    return 0;
}

int Dispatcher::statfs(struct statvfs& out) {
    std::shared_lock<std::shared_mutex> lock(volume_mutex_);

    std::memset(&out, 0, sizeof(out));
    out.f_bsize = BLOCK_SIZE;
    out.f_frsize = BLOCK_SIZE;
    out.f_blocks = volume_.disk_size();
    out.f_bfree = volume_.free_space_units();
    uint32_t reserved = open_files_.reserved_units();
    out.f_bavail = out.f_bfree > reserved ? out.f_bfree - reserved : 0;
    out.f_files = volume_.slot_capacity();
    out.f_ffree = volume_.free_slots();
    out.f_favail = out.f_ffree;
    out.f_namemax = NAME_SIZE;
    if (volume_.is_read_only()) out.f_flag |= ST_RDONLY;
    return 0;
}

} // namespace mkdos_fuse
