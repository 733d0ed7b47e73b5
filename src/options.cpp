#include "options.h"

#include <cstddef>
#include <iostream>

namespace mkdos_fuse {

namespace {

struct RawOptions {
    unsigned long offset;
    unsigned long size;
    int inverted;
    int show_bad;
    int show_deleted;
    int verbose;
    MountOptions* out;
};

enum {
    KEY_HELP,
    KEY_VERSION,
    KEY_RO,
};

const struct fuse_opt option_spec[] = {
    { "offset=%lu", offsetof(RawOptions, offset), 0 },
    { "size=%lu", offsetof(RawOptions, size), 0 },
    { "inverted", offsetof(RawOptions, inverted), 1 },
    { "show_bad", offsetof(RawOptions, show_bad), 1 },
    { "show_deleted", offsetof(RawOptions, show_deleted), 1 },
    { "verbose", offsetof(RawOptions, verbose), 1 },
    FUSE_OPT_KEY("ro", KEY_RO),
    FUSE_OPT_KEY("-h", KEY_HELP),
    FUSE_OPT_KEY("--help", KEY_HELP),
    FUSE_OPT_KEY("-V", KEY_VERSION),
    FUSE_OPT_KEY("--version", KEY_VERSION),
    FUSE_OPT_END
};

int process_arg(void* data, const char* arg, int key, struct fuse_args*) {
    MountOptions* options = static_cast<RawOptions*>(data)->out;

    switch (key) {
    case FUSE_OPT_KEY_NONOPT:
        // First bare argument is the image, the next one the mount point
        if (options->image.empty()) {
            options->image = arg;
            return 0;
        }
        return 1;

    case KEY_RO:
        // Kept so the kernel mounts read-only as well
        options->read_only = true;
        return 1;

    case KEY_HELP:
        options->help = true;
        return 0;

    case KEY_VERSION:
        options->version = true;
        return 0;

    default:
        return 1;
    }
}

} // namespace

bool parse_mount_options(struct fuse_args* args, MountOptions& out) {
    RawOptions raw{};
    raw.out = &out;

    if (fuse_opt_parse(args, &raw, option_spec, process_arg) == -1) {
        return false;
    }

    out.offset_blocks = raw.offset;
    out.size_blocks = raw.size;
    out.inverted = raw.inverted != 0;
    out.show_bad = raw.show_bad != 0;
    out.show_deleted = raw.show_deleted != 0;
    out.verbose = raw.verbose != 0;
    return true;
}

void print_usage(const char* progname) {
    std::cerr << "usage: " << progname << " IMAGE MOUNTPOINT [options]\n"
              << "\n"
              << "MKDOS options:\n"
              << "    -o ro                  mount read-only\n"
              << "    -o offset=N            volume starts N blocks into the image\n"
              << "    -o size=N              volume is N blocks long\n"
              << "    -o inverted            image bytes are stored inverted\n"
              << "    -o show_bad            list bad areas in the root directory\n"
              << "    -o show_deleted        list deleted entries in the root directory\n"
              << "    -o verbose             debug logging\n"
              << "\n";
}

} // namespace mkdos_fuse
