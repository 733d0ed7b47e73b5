#include "open_file_table.h"

namespace mkdos_fuse {

uint64_t OpenFileTable::open(InodeHandle ino) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t fh = next_fh_++;
    handles_.emplace(fh, ino);
    ++states_[ino].refcount;
    return fh;
}

bool OpenFileTable::release(uint64_t fh) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(fh);
    if (it == handles_.end()) return false;

    InodeHandle ino = it->second;
    handles_.erase(it);

    auto state = states_.find(ino);
    if (state == states_.end()) return true;
    if (state->second.writer == fh) state->second.writer.reset();
    if (--state->second.refcount == 0) {
        states_.erase(state);
        return true;
    }
    return false;
}

std::optional<InodeHandle> OpenFileTable::inode_of(uint64_t fh) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(fh);
    if (it == handles_.end()) return std::nullopt;
    return it->second;
}

bool OpenFileTable::is_open(InodeHandle ino) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.count(ino) != 0;
}

size_t OpenFileTable::handle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

bool OpenFileTable::with_state(InodeHandle ino, const std::function<void(OpenState&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(ino);
    if (it == states_.end()) return false;
    fn(it->second);
    return true;
}

bool OpenFileTable::with_reservation(InodeHandle ino,
                                     const std::function<void(OpenState&, uint32_t)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(ino);
    if (it == states_.end()) return false;

    uint32_t elsewhere = 0;
    for (const auto& [other, state] : states_) {
        if (other != ino && state.dirty) elsewhere += state.reserved;
    }
    fn(it->second, elsewhere);
    return true;
}

uint32_t OpenFileTable::reserved_units() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t total = 0;
    for (const auto& [ino, state] : states_) {
        if (state.dirty) total += state.reserved;
    }
    return total;
}

void OpenFileTable::defer_error(InodeHandle ino, Errc error) {
    std::lock_guard<std::mutex> lock(mutex_);
    deferred_[ino] = error;
}

Errc OpenFileTable::take_deferred_error(InodeHandle ino) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deferred_.find(ino);
    if (it == deferred_.end()) return Errc::ok;
    Errc error = it->second;
    deferred_.erase(it);
    return error;
}

} // namespace mkdos_fuse
