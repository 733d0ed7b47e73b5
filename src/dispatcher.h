#pragma once

#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "errors.h"
#include "inode_table.h"
#include "open_file_table.h"
#include "path_resolver.h"
#include "volume.h"

namespace mkdos_fuse {

struct DispatcherOptions {
    bool show_bad = false;
    bool show_deleted = false;
    uid_t uid = 0;
    gid_t gid = 0;
};

struct AttrChange {
    std::optional<uint64_t> size;
    std::optional<mode_t> mode;
};

struct EntryReply {
    InodeHandle ino = 0;
    struct stat attr{};
};

struct DirListing {
    std::string name;
    InodeHandle ino = 0;
    mode_t mode = 0;
    off_t next_offset = 0;
};

// Protocol-independent request handlers.
//
// Every handler returns 0 (or a byte count for write) on success and a
// negated errno value on failure, ready to be passed to fuse_reply_err.
class Dispatcher {
public:
    explicit Dispatcher(Volume& volume, DispatcherOptions options = {});

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    int lookup(InodeHandle parent, std::string_view name, EntryReply& out);
    void forget(InodeHandle ino, uint64_t nlookup);
    int getattr(InodeHandle ino, struct stat& out);
    int setattr(InodeHandle ino, const AttrChange& change, struct stat& out);

    int opendir(InodeHandle ino);
    int readdir(InodeHandle ino, off_t offset, std::vector<DirListing>& out);

    int open(InodeHandle ino, int flags, uint64_t& fh);
    int read(InodeHandle ino, uint64_t fh, off_t offset, size_t size, std::vector<uint8_t>& out);
    int write(InodeHandle ino, uint64_t fh, off_t offset, std::span<const uint8_t> data);
    int flush(InodeHandle ino, uint64_t fh);
    int fsync(InodeHandle ino, uint64_t fh);
    int release(InodeHandle ino, uint64_t fh);

    int create(InodeHandle parent, std::string_view name, int flags, EntryReply& out, uint64_t& fh);
    int mkdir(InodeHandle parent, std::string_view name, EntryReply& out);
    int unlink(InodeHandle parent, std::string_view name);
    int rmdir(InodeHandle parent, std::string_view name);
    int rename(InodeHandle old_parent, std::string_view old_name,
               InodeHandle new_parent, std::string_view new_name);

    int statfs(struct statvfs& out);

    const InodeTable& inodes() const { return inodes_; }
    const OpenFileTable& open_files() const { return open_files_; }

private:
    Errc resolve_live(InodeHandle ino, CachedEntry& out);
    struct stat attributes_of(InodeHandle ino, const CachedEntry& cached);
    Errc load_buffer(OpenState& state, const DirEntry& entry);
    Errc flush_locked(InodeHandle ino);
    void refresh_locked(InodeHandle ino, const CatalogPosition& position);

    Volume& volume_;
    DispatcherOptions options_;
    std::shared_mutex volume_mutex_;
    InodeTable inodes_;
    OpenFileTable open_files_;
    PathResolver resolver_;
    uint64_t seen_layout_ = 0;
};

} // namespace mkdos_fuse
