#include "path_resolver.h"

namespace mkdos_fuse {

PathResolver::PathResolver(const Volume& volume, InodeTable& inodes, ListFilter filter)
    : volume_(volume), inodes_(inodes), filter_(filter) {}

Errc PathResolver::resolve(InodeHandle parent, std::string_view name, InodeHandle& out) const {
    DirEntry entry;
    return resolve(parent, name, out, entry);
}

Errc PathResolver::resolve(InodeHandle parent, std::string_view name, InodeHandle& out,
                           DirEntry& entry) const {
    uint8_t dir_no;
    Errc rc = directory_number(parent, dir_no);
    if (rc != Errc::ok) return rc;

    rc = volume_.find(dir_no, name, entry, filter_);
    if (rc != Errc::ok) return rc;

    out = inodes_.resolve_or_create(entry);
    return Errc::ok;
}

Errc PathResolver::directory_number(InodeHandle handle, uint8_t& dir_no) const {
    auto cached = inodes_.lookup(handle);
    if (!cached) return Errc::stale_handle;
    if (!cached->entry.is_directory()) return Errc::not_directory;

    if (handle != ROOT_INODE) {
        // The directory may have been removed behind a cached handle
        auto current = volume_.entry(cached->position);
        if (!current || !current->is_directory()) return Errc::stale_handle;
        dir_no = current->dir_id;
        return Errc::ok;
    }
    dir_no = ROOT_DIR;
    return Errc::ok;
}

} // namespace mkdos_fuse
