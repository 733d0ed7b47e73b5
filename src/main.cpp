#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "dispatcher.h"
#include "fuse_bridge.h"
#include "log.h"
#include "options.h"
#include "volume.h"

namespace {

constexpr const char* MKDOS_FUSE_VERSION = "1.0";

int run_session(struct fuse_args* args, mkdos_fuse::Dispatcher& dispatcher) {
    char* mountpoint = nullptr;
    int multithreaded = 0;
    int foreground = 0;
    if (fuse_parse_cmdline(args, &mountpoint, &multithreaded, &foreground) == -1) {
        return 1;
    }
    if (!mountpoint) {
        std::cerr << "mkdos-fuse: missing mount point\n";
        return 1;
    }

    int err = 1;
    struct fuse_chan* ch = fuse_mount(mountpoint, args);
    if (ch) {
        const auto& ops = mkdos_fuse::lowlevel_operations();
        struct fuse_session* se = fuse_lowlevel_new(args, &ops, sizeof(ops), &dispatcher);
        if (se) {
            if (fuse_set_signal_handlers(se) != -1) {
                fuse_session_add_chan(se, ch);
                if (fuse_daemonize(foreground) != -1) {
                    err = multithreaded ? fuse_session_loop_mt(se) : fuse_session_loop(se);
                }
                fuse_remove_signal_handlers(se);
                fuse_session_remove_chan(ch);
            }
            fuse_session_destroy(se);
        }
        fuse_unmount(mountpoint, ch);
    }
    free(mountpoint);
    return err ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace mkdos_fuse;

    struct fuse_args args = FUSE_ARGS_INIT(argc, argv);
    MountOptions options;
    if (!parse_mount_options(&args, options)) {
        fuse_opt_free_args(&args);
        return 1;
    }

    if (options.help) {
        print_usage(argv[0]);
        fuse_opt_add_arg(&args, "-ho");
        char* mountpoint = nullptr;
        fuse_parse_cmdline(&args, &mountpoint, nullptr, nullptr);
        free(mountpoint);
        fuse_opt_free_args(&args);
        return 0;
    }
    if (options.version) {
        std::cout << "mkdos-fuse version " << MKDOS_FUSE_VERSION << "\n"
                  << "FUSE library version " << fuse_version() << "\n";
        fuse_opt_free_args(&args);
        return 0;
    }
    if (options.image.empty()) {
        print_usage(argv[0]);
        fuse_opt_free_args(&args);
        return 1;
    }

    if (options.verbose) {
        log::set_level(log::Level::debug);
    }

    ImageOptions image_options;
    image_options.read_only = options.read_only;
    image_options.offset_blocks = options.offset_blocks;
    image_options.size_blocks = options.size_blocks;
    image_options.inverted = options.inverted;

    Volume volume(options.image, image_options);
    Errc rc = volume.open();
    if (rc != Errc::ok) {
        std::cerr << "Failed to open MKDOS image " << options.image << ": " << describe(rc) << "\n";
        fuse_opt_free_args(&args);
        return 1;
    }

    std::cout << "Mounted MKDOS volume: " << options.image << " (" << volume.disk_size()
              << " blocks, " << volume.free_space_units() << " free)";
    if (volume.is_read_only()) {
        std::cout << " [READ-ONLY]";
    } else {
        std::cout << " [READ-WRITE]";
    }
    std::cout << "\n";

    fuse_opt_add_arg(&args, "-ofsname=mkdosfs,subtype=mkdos");
    if (volume.is_read_only() && !options.read_only) {
        fuse_opt_add_arg(&args, "-oro");
    }

    DispatcherOptions dispatcher_options;
    dispatcher_options.show_bad = options.show_bad;
    dispatcher_options.show_deleted = options.show_deleted;
    dispatcher_options.uid = getuid();
    dispatcher_options.gid = getgid();
    Dispatcher dispatcher(volume, dispatcher_options);

    int res = run_session(&args, dispatcher);

    if (volume.sync() != Errc::ok) {
        log::error("final sync of ", options.image, " failed");
        res = 1;
    }
    fuse_opt_free_args(&args);
    return res;
}
