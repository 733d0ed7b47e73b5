#include "attributes.h"

#include <cstring>

namespace mkdos_fuse {

namespace {

void fill_common(struct stat& st, uint64_t ino, const AttrContext& ctx) {
    st.st_ino = static_cast<ino_t>(ino);
    st.st_uid = ctx.uid;
    st.st_gid = ctx.gid;
    st.st_blksize = BLOCK_SIZE;
    // MKDOS keeps no dates
    st.st_atime = MKDOS_EPOCH;
    st.st_mtime = MKDOS_EPOCH;
    st.st_ctime = MKDOS_EPOCH;
}

} // namespace

struct stat make_attributes(const DirEntry& entry, uint64_t ino, const AttrContext& ctx) {
    struct stat st;
    std::memset(&st, 0, sizeof(st));
    fill_common(st, ino, ctx);

    if (entry.is_directory()) {
        st.st_mode = S_IFDIR | 0755;
        st.st_nlink = 2;
        return st;
    }

    bool writable = entry.is_writable() && !ctx.read_only;
    st.st_mode = S_IFREG | (writable ? 0644 : 0444);
    st.st_nlink = 1;
    st.st_size = entry.size;
    st.st_blocks = entry.blocks;
    return st;
}

struct stat root_attributes(uint64_t ino, const AttrContext& ctx) {
    struct stat st;
    std::memset(&st, 0, sizeof(st));
    fill_common(st, ino, ctx);
    st.st_mode = S_IFDIR | 0755;
    st.st_nlink = 2;
    return st;
}

} // namespace mkdos_fuse
