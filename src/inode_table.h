#pragma once

#include <sys/stat.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "attributes.h"
#include "volume.h"

namespace mkdos_fuse {

using InodeHandle = uint64_t;

// Same value as FUSE_ROOT_ID
constexpr InodeHandle ROOT_INODE = 1;

struct CachedEntry {
    CatalogPosition position;
    DirEntry entry;
    struct stat attr;
};

// Stable numeric handles for catalog positions.
//
// A handle stays bound to its position until it is invalidated; handles are
// never reused, so a retired one can only ever report stale. The root handle
// is bound to a synthetic directory entry with no catalog position.
class InodeTable {
public:
    explicit InodeTable(AttrContext ctx);

    InodeHandle resolve_or_create(const DirEntry& entry);
    std::optional<CachedEntry> lookup(InodeHandle handle) const;
    std::optional<InodeHandle> find(const CatalogPosition& position) const;

    void invalidate(InodeHandle handle);
    void refresh(InodeHandle handle, const DirEntry& entry);

    // Re-reads every bound entry, dropping the ones the volume no longer has
    void refresh_all(const Volume& volume);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<InodeHandle, CachedEntry> by_handle_;
    std::unordered_map<CatalogPosition, InodeHandle, CatalogPositionHash> by_position_;
    InodeHandle next_handle_ = ROOT_INODE + 1;
    AttrContext ctx_;
};

} // namespace mkdos_fuse
