#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "errors.h"
#include "inode_table.h"

namespace mkdos_fuse {

// Per-inode state shared by all open file handles of that inode
struct OpenState {
    uint32_t refcount = 0;
    std::vector<uint8_t> buffer;       // whole file content once loaded
    bool loaded = false;
    bool dirty = false;
    std::optional<uint64_t> writer;    // file handle owning the writer slot
    uint32_t reserved = 0;             // free units promised to the dirty buffer
};

class OpenFileTable {
public:
    uint64_t open(InodeHandle ino);

    // Drops a file handle; returns true when it was the last one of its inode
    bool release(uint64_t fh);

    std::optional<InodeHandle> inode_of(uint64_t fh) const;
    bool is_open(InodeHandle ino) const;
    size_t handle_count() const;

    // Runs fn on the inode's state under the table lock; false if not open
    bool with_state(InodeHandle ino, const std::function<void(OpenState&)>& fn);

    // Same, also passing the units reserved by the dirty buffers of all
    // other inodes
    bool with_reservation(InodeHandle ino, const std::function<void(OpenState&, uint32_t)>& fn);
    uint32_t reserved_units() const;

    void defer_error(InodeHandle ino, Errc error);
    Errc take_deferred_error(InodeHandle ino);

private:
    mutable std::mutex mutex_;
    std::unordered_map<InodeHandle, OpenState> states_;
    std::unordered_map<uint64_t, InodeHandle> handles_;
    std::unordered_map<InodeHandle, Errc> deferred_;
    uint64_t next_fh_ = 1;
};

} // namespace mkdos_fuse
