#pragma once

#include <string_view>

#include "errors.h"
#include "inode_table.h"
#include "volume.h"

namespace mkdos_fuse {

// Resolves (parent handle, name) pairs against the catalog
class PathResolver {
public:
    PathResolver(const Volume& volume, InodeTable& inodes, ListFilter filter = {});

    Errc resolve(InodeHandle parent, std::string_view name, InodeHandle& out) const;

    // Same, also returning the entry that was found
    Errc resolve(InodeHandle parent, std::string_view name, InodeHandle& out, DirEntry& entry) const;

    // MKDOS directory number of a directory handle
    Errc directory_number(InodeHandle handle, uint8_t& dir_no) const;

private:
    const Volume& volume_;
    InodeTable& inodes_;
    ListFilter filter_;
};

} // namespace mkdos_fuse
