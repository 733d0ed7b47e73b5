#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include <cstdint>

#include "volume.h"

namespace mkdos_fuse {

struct AttrContext {
    uid_t uid = 0;
    gid_t gid = 0;
    bool read_only = false;
};

struct stat make_attributes(const DirEntry& entry, uint64_t ino, const AttrContext& ctx);
struct stat root_attributes(uint64_t ino, const AttrContext& ctx);

} // namespace mkdos_fuse
