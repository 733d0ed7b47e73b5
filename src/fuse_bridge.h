#pragma once

#define FUSE_USE_VERSION 26
#include <fuse_lowlevel.h>

namespace mkdos_fuse {

class Dispatcher;

// Low-level operation table; every callback expects the Dispatcher as
// session userdata
const struct fuse_lowlevel_ops& lowlevel_operations();

} // namespace mkdos_fuse
