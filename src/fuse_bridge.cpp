#include "fuse_bridge.h"

#include <sys/stat.h>

#include <cstring>
#include <span>
#include <string>
#include <vector>

#include "dispatcher.h"

namespace mkdos_fuse {

namespace {

// Catalog changes only come from this process
constexpr double ATTR_TIMEOUT = 1.0;
constexpr double ENTRY_TIMEOUT = 1.0;

Dispatcher& dispatcher(fuse_req_t req) {
    return *static_cast<Dispatcher*>(fuse_req_userdata(req));
}

void fill_entry_param(struct fuse_entry_param& e, const EntryReply& reply) {
    std::memset(&e, 0, sizeof(e));
    e.ino = reply.ino;
    e.generation = 1;
    e.attr = reply.attr;
    e.attr_timeout = ATTR_TIMEOUT;
    e.entry_timeout = ENTRY_TIMEOUT;
}

} // namespace

namespace fuse_ops {

static void lookup(fuse_req_t req, fuse_ino_t parent, const char* name) {
    EntryReply reply;
    int res = dispatcher(req).lookup(parent, name, reply);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    struct fuse_entry_param e;
    fill_entry_param(e, reply);
    fuse_reply_entry(req, &e);
}

static void forget(fuse_req_t req, fuse_ino_t ino, unsigned long nlookup) {
    dispatcher(req).forget(ino, nlookup);
    fuse_reply_none(req);
}

static void getattr(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info*) {
    struct stat st;
    int res = dispatcher(req).getattr(ino, st);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    fuse_reply_attr(req, &st, ATTR_TIMEOUT);
}

static void setattr(fuse_req_t req, fuse_ino_t ino, struct stat* attr, int to_set,
                    struct fuse_file_info*) {
    AttrChange change;
    if (to_set & FUSE_SET_ATTR_SIZE) change.size = static_cast<uint64_t>(attr->st_size);
    if (to_set & FUSE_SET_ATTR_MODE) change.mode = attr->st_mode;
    // Owner and time changes cannot be stored and are accepted silently

    struct stat st;
    int res = dispatcher(req).setattr(ino, change, st);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    fuse_reply_attr(req, &st, ATTR_TIMEOUT);
}

static void opendir(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi) {
    int res = dispatcher(req).opendir(ino);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    fuse_reply_open(req, fi);
}

static void readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off,
                    struct fuse_file_info*) {
    std::vector<DirListing> listings;
    int res = dispatcher(req).readdir(ino, off, listings);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }

    std::vector<char> buf(size);
    size_t used = 0;
    for (const auto& listing : listings) {
        struct stat st;
        std::memset(&st, 0, sizeof(st));
        st.st_ino = listing.ino;
        st.st_mode = listing.mode;

        size_t needed = fuse_add_direntry(req, nullptr, 0, listing.name.c_str(), nullptr, 0);
        if (used + needed > size) break;
        fuse_add_direntry(req, buf.data() + used, size - used, listing.name.c_str(), &st,
                          listing.next_offset);
        used += needed;
    }
    fuse_reply_buf(req, buf.data(), used);
}

static void releasedir(fuse_req_t req, fuse_ino_t, struct fuse_file_info*) {
    fuse_reply_err(req, 0);
}

static void open(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi) {
    uint64_t fh = 0;
    int res = dispatcher(req).open(ino, fi->flags, fh);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    fi->fh = fh;
    if (fuse_reply_open(req, fi) == -ENOENT) {
        // Interrupted; the kernel will never release this handle
        dispatcher(req).release(ino, fh);
    }
}

static void read(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off,
                 struct fuse_file_info* fi) {
    std::vector<uint8_t> data;
    int res = dispatcher(req).read(ino, fi->fh, off, size, data);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    fuse_reply_buf(req, reinterpret_cast<const char*>(data.data()), data.size());
}

static void write(fuse_req_t req, fuse_ino_t ino, const char* buf, size_t size, off_t off,
                  struct fuse_file_info* fi) {
    std::span<const uint8_t> data(reinterpret_cast<const uint8_t*>(buf), size);
    int res = dispatcher(req).write(ino, fi->fh, off, data);
    if (res < 0) {
        fuse_reply_err(req, -res);
        return;
    }
    fuse_reply_write(req, static_cast<size_t>(res));
}

static void flush(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi) {
    fuse_reply_err(req, -dispatcher(req).flush(ino, fi->fh));
}

static void fsync(fuse_req_t req, fuse_ino_t ino, int, struct fuse_file_info* fi) {
    fuse_reply_err(req, -dispatcher(req).fsync(ino, fi->fh));
}

static void release(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi) {
    fuse_reply_err(req, -dispatcher(req).release(ino, fi->fh));
}

static void create(fuse_req_t req, fuse_ino_t parent, const char* name, mode_t,
                   struct fuse_file_info* fi) {
    EntryReply reply;
    uint64_t fh = 0;
    int res = dispatcher(req).create(parent, name, fi->flags, reply, fh);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    struct fuse_entry_param e;
    fill_entry_param(e, reply);
    fi->fh = fh;
    if (fuse_reply_create(req, &e, fi) == -ENOENT) {
        dispatcher(req).release(reply.ino, fh);
    }
}

static void mknod(fuse_req_t req, fuse_ino_t, const char*, mode_t, dev_t) {
    fuse_reply_err(req, EPERM);
}

static void mkdir(fuse_req_t req, fuse_ino_t parent, const char* name, mode_t) {
    EntryReply reply;
    int res = dispatcher(req).mkdir(parent, name, reply);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    struct fuse_entry_param e;
    fill_entry_param(e, reply);
    fuse_reply_entry(req, &e);
}

static void unlink(fuse_req_t req, fuse_ino_t parent, const char* name) {
    fuse_reply_err(req, -dispatcher(req).unlink(parent, name));
}

static void rmdir(fuse_req_t req, fuse_ino_t parent, const char* name) {
    fuse_reply_err(req, -dispatcher(req).rmdir(parent, name));
}

static void rename(fuse_req_t req, fuse_ino_t parent, const char* name,
                   fuse_ino_t newparent, const char* newname) {
    fuse_reply_err(req, -dispatcher(req).rename(parent, name, newparent, newname));
}

static void statfs(fuse_req_t req, fuse_ino_t) {
    struct statvfs st;
    int res = dispatcher(req).statfs(st);
    if (res != 0) {
        fuse_reply_err(req, -res);
        return;
    }
    fuse_reply_statfs(req, &st);
}

} // namespace fuse_ops

const struct fuse_lowlevel_ops& lowlevel_operations() {
    static const struct fuse_lowlevel_ops ops = [] {
        struct fuse_lowlevel_ops o;
        std::memset(&o, 0, sizeof(o));
        o.lookup = fuse_ops::lookup;
        o.forget = fuse_ops::forget;
        o.getattr = fuse_ops::getattr;
        o.setattr = fuse_ops::setattr;
        o.opendir = fuse_ops::opendir;
        o.readdir = fuse_ops::readdir;
        o.releasedir = fuse_ops::releasedir;
        o.open = fuse_ops::open;
        o.read = fuse_ops::read;
        o.write = fuse_ops::write;
        o.flush = fuse_ops::flush;
        o.fsync = fuse_ops::fsync;
        o.release = fuse_ops::release;
        o.create = fuse_ops::create;
        o.mknod = fuse_ops::mknod;
        o.mkdir = fuse_ops::mkdir;
        o.unlink = fuse_ops::unlink;
        o.rmdir = fuse_ops::rmdir;
        o.rename = fuse_ops::rename;
        o.statfs = fuse_ops::statfs;
        return o;
    }();
    return ops;
}

} // namespace mkdos_fuse
