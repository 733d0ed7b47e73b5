#include "options.h"

#include <cassert>
#include <cstring>
#include <string>

using namespace mkdos_fuse;

namespace {

bool has_arg(const struct fuse_args& args, const char* value) {
    for (int i = 0; i < args.argc; ++i) {
        if (std::strcmp(args.argv[i], value) == 0) return true;
    }
    return false;
}

void flags_and_numbers() {
    char* argv[] = {
        const_cast<char*>("mkdos-fuse"),
        const_cast<char*>("disk.img"),
        const_cast<char*>("/mnt/mkdos"),
        const_cast<char*>("-o"),
        const_cast<char*>("inverted,show_bad,show_deleted,verbose,offset=5,size=800"),
    };
    struct fuse_args args = FUSE_ARGS_INIT(5, argv);

    MountOptions options;
    assert(parse_mount_options(&args, options));
    assert(options.image == "disk.img");
    assert(options.inverted);
    assert(options.show_bad);
    assert(options.show_deleted);
    assert(options.verbose);
    assert(options.offset_blocks == 5);
    assert(options.size_blocks == 800);
    assert(!options.read_only);

    // The image is consumed, the mount point stays for libfuse
    assert(!has_arg(args, "disk.img"));
    assert(has_arg(args, "/mnt/mkdos"));
    fuse_opt_free_args(&args);
}

void defaults_and_read_only() {
    char* argv[] = {
        const_cast<char*>("mkdos-fuse"),
        const_cast<char*>("disk.img"),
        const_cast<char*>("/mnt/mkdos"),
        const_cast<char*>("-o"),
        const_cast<char*>("ro"),
    };
    struct fuse_args args = FUSE_ARGS_INIT(5, argv);

    MountOptions options;
    assert(parse_mount_options(&args, options));
    assert(options.read_only);
    assert(!options.inverted && !options.show_bad && !options.show_deleted && !options.verbose);
    assert(options.offset_blocks == 0 && options.size_blocks == 0);
    assert(!options.help && !options.version);
    fuse_opt_free_args(&args);
}

void help_and_version() {
    char* argv[] = {
        const_cast<char*>("mkdos-fuse"),
        const_cast<char*>("--help"),
        const_cast<char*>("-V"),
    };
    struct fuse_args args = FUSE_ARGS_INIT(3, argv);

    MountOptions options;
    assert(parse_mount_options(&args, options));
    assert(options.help);
    assert(options.version);
    assert(options.image.empty());
    fuse_opt_free_args(&args);
}

} // namespace

int main() {
    flags_and_numbers();
    defaults_and_read_only();
    help_and_version();
    return 0;
}
