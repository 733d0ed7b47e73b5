#include "errors.h"

namespace mkdos_fuse {

const char* describe(Errc e) noexcept {
    switch (e) {
    case Errc::ok:               return "ok";
    case Errc::stale_handle:     return "stale handle";
    case Errc::not_found:        return "not found";
    case Errc::already_exists:   return "already exists";
    case Errc::name_conflict:    return "name conflict";
    case Errc::no_space:         return "no space left on volume";
    case Errc::invalid_name:     return "name cannot be represented on MKDOS";
    case Errc::name_too_long:    return "name too long";
    case Errc::cross_directory:  return "cross-directory rename unsupported";
    case Errc::busy:             return "another writer holds the file";
    case Errc::io_error:         return "i/o error";
    case Errc::read_only:        return "read-only volume";
    case Errc::not_directory:    return "not a directory";
    case Errc::is_directory:     return "is a directory";
    case Errc::not_empty:        return "directory not empty";
    case Errc::access_denied:    return "access denied";
    case Errc::bad_format:       return "not an MKDOS volume";
    case Errc::invalid_argument: return "invalid argument";
    }
    return "unknown error";
}

} // namespace mkdos_fuse
