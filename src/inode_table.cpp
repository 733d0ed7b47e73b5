#include "inode_table.h"

#include <vector>

#include "log.h"

namespace mkdos_fuse {

InodeTable::InodeTable(AttrContext ctx) : ctx_(ctx) {
    CachedEntry root;
    root.position = {0xFFFF, 0};
    root.entry.kind = EntryKind::directory;
    root.entry.dir_no = ROOT_DIR;
    root.entry.dir_id = ROOT_DIR;
    root.entry.name = "/";
    root.attr = root_attributes(ROOT_INODE, ctx_);
    by_handle_.emplace(ROOT_INODE, root);
}

InodeHandle InodeTable::resolve_or_create(const DirEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = by_position_.find(entry.position);
    if (it != by_position_.end()) {
        CachedEntry& cached = by_handle_[it->second];
        cached.entry = entry;
        cached.attr = make_attributes(entry, it->second, ctx_);
        return it->second;
    }

    InodeHandle handle = next_handle_++;
    CachedEntry cached;
    cached.position = entry.position;
    cached.entry = entry;
    cached.attr = make_attributes(entry, handle, ctx_);
    by_handle_.emplace(handle, std::move(cached));
    by_position_.emplace(entry.position, handle);
    log::debug("inode ", handle, " -> record ", entry.position.slot, " (", entry.name, ")");
    return handle;
}

std::optional<CachedEntry> InodeTable::lookup(InodeHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_handle_.find(handle);
    if (it == by_handle_.end()) return std::nullopt;
    return it->second;
}

std::optional<InodeHandle> InodeTable::find(const CatalogPosition& position) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_position_.find(position);
    if (it == by_position_.end()) return std::nullopt;
    return it->second;
}

void InodeTable::invalidate(InodeHandle handle) {
    if (handle == ROOT_INODE) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_handle_.find(handle);
    if (it == by_handle_.end()) return;
    by_position_.erase(it->second.position);
    by_handle_.erase(it);
}

void InodeTable::refresh(InodeHandle handle, const DirEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_handle_.find(handle);
    if (it == by_handle_.end() || handle == ROOT_INODE) return;
    it->second.entry = entry;
    it->second.attr = make_attributes(entry, handle, ctx_);
}

void InodeTable::refresh_all(const Volume& volume) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<InodeHandle> gone;
    for (auto& [handle, cached] : by_handle_) {
        if (handle == ROOT_INODE) continue;
        auto entry = volume.entry(cached.position);
        if (!entry) {
            gone.push_back(handle);
            continue;
        }
        cached.entry = *entry;
        cached.attr = make_attributes(*entry, handle, ctx_);
    }
    for (InodeHandle handle : gone) {
        by_position_.erase(by_handle_[handle].position);
        by_handle_.erase(handle);
    }
}

size_t InodeTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_handle_.size();
}

} // namespace mkdos_fuse
