#pragma once

#include <cerrno>

namespace mkdos_fuse {

// Error taxonomy shared by the volume library and the dispatcher
enum class Errc {
    ok = 0,
    stale_handle,
    not_found,
    already_exists,
    name_conflict,
    no_space,
    invalid_name,
    name_too_long,
    cross_directory,
    busy,
    io_error,
    read_only,
    not_directory,
    is_directory,
    not_empty,
    access_denied,
    bad_format,
    invalid_argument,
};

constexpr int to_errno(Errc e) noexcept {
    switch (e) {
    case Errc::ok:               return 0;
    case Errc::stale_handle:     return ENOENT;
    case Errc::not_found:        return ENOENT;
    case Errc::already_exists:   return EEXIST;
    case Errc::name_conflict:    return EEXIST;
    case Errc::no_space:         return ENOSPC;
    case Errc::invalid_name:     return EINVAL;
    case Errc::name_too_long:    return ENAMETOOLONG;
    case Errc::cross_directory:  return EXDEV;
    case Errc::busy:             return EBUSY;
    case Errc::io_error:         return EIO;
    case Errc::read_only:        return EROFS;
    case Errc::not_directory:    return ENOTDIR;
    case Errc::is_directory:     return EISDIR;
    case Errc::not_empty:        return ENOTEMPTY;
    case Errc::access_denied:    return EACCES;
    case Errc::bad_format:       return EINVAL;
    case Errc::invalid_argument: return EINVAL;
    }
    return EIO;
}

const char* describe(Errc e) noexcept;

} // namespace mkdos_fuse
