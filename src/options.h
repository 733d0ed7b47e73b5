#pragma once

#include <fuse_opt.h>

#include <cstdint>
#include <string>

namespace mkdos_fuse {

struct MountOptions {
    std::string image;
    bool read_only = false;
    uint64_t offset_blocks = 0;
    uint64_t size_blocks = 0;
    bool inverted = false;
    bool show_bad = false;
    bool show_deleted = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

// Pulls the image path and MKDOS options out of args, leaving the mount
// point and libfuse options in place. Returns false on a parse error.
bool parse_mount_options(struct fuse_args* args, MountOptions& out);

void print_usage(const char* progname);

} // namespace mkdos_fuse
