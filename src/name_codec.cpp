#include "name_codec.h"

#include <iconv.h>

#include <optional>
#include <vector>

#include "log.h"

namespace mkdos_fuse {

namespace {

class Iconv {
public:
    Iconv(const char* to, const char* from) : cd_(iconv_open(to, from)) {}

    ~Iconv() {
        if (valid()) iconv_close(cd_);
    }

    Iconv(const Iconv&) = delete;
    Iconv& operator=(const Iconv&) = delete;

    bool valid() const {
        return cd_ != reinterpret_cast<iconv_t>(-1);
    }

    std::optional<std::string> convert(std::string_view input) {
        if (!valid()) return std::nullopt;

        std::vector<char> in(input.begin(), input.end());
        std::vector<char> out(input.size() * 4 + 4);

        char* in_ptr = in.data();
        size_t in_left = in.size();
        char* out_ptr = out.data();
        size_t out_left = out.size();

        if (iconv(cd_, &in_ptr, &in_left, &out_ptr, &out_left) == static_cast<size_t>(-1)) {
            return std::nullopt;
        }
        return std::string(out.data(), out.size() - out_left);
    }

private:
    iconv_t cd_;
};

size_t name_offset(bool directory) {
    return directory ? 1 : 0;
}

} // namespace

uint8_t NameCodec::fold(uint8_t c) noexcept {
    if (c >= 'a' && c <= 'z') return static_cast<uint8_t>(c - 'a' + 'A');
    // KOI8-R keeps lowercase Cyrillic in 0xC0-0xDF and uppercase in 0xE0-0xFF
    if (c >= 0xC0 && c <= 0xDF) return static_cast<uint8_t>(c + 0x20);
    if (c == 0xA3) return 0xB3;
    return c;
}

Errc NameCodec::encode(std::string_view name, bool directory, RawName& out) {
    if (name.empty() || name == "." || name == "..") return Errc::invalid_name;
    if (name.front() == ' ' || name.back() == ' ') return Errc::invalid_name;

    for (unsigned char c : name) {
        if (c < 0x20 || c == 0x7F || c == '/') return Errc::invalid_name;
    }

    Iconv to_koi8("KOI8-R", "UTF-8");
    auto encoded = to_koi8.convert(name);
    if (!encoded) return Errc::invalid_name;

    size_t offset = name_offset(directory);
    if (encoded->size() > NAME_SIZE - offset) return Errc::name_too_long;

    out.fill(' ');
    if (directory) out[0] = DIR_MARKER;
    for (size_t i = 0; i < encoded->size(); ++i) {
        out[offset + i] = static_cast<uint8_t>((*encoded)[i]);
    }
    return Errc::ok;
}

std::string NameCodec::decode(const RawName& raw, bool directory) {
    size_t offset = name_offset(directory);
    size_t end = NAME_SIZE;
    while (end > offset && (raw[end - 1] == ' ' || raw[end - 1] == 0)) {
        --end;
    }

    std::string koi8(reinterpret_cast<const char*>(raw.data()) + offset, end - offset);

    Iconv to_utf8("UTF-8", "KOI8-R");
    if (auto decoded = to_utf8.convert(koi8)) {
        return *decoded;
    }

    log::warn("cannot recode record name, keeping ASCII subset");
    for (auto& c : koi8) {
        if (static_cast<unsigned char>(c) >= 0x80) c = '?';
    }
    return koi8;
}

std::string NameCodec::key(const RawName& raw, bool directory) {
    size_t offset = name_offset(directory);
    size_t end = NAME_SIZE;
    while (end > offset && (raw[end - 1] == ' ' || raw[end - 1] == 0)) {
        --end;
    }

    std::string result;
    result.reserve(end - offset);
    for (size_t i = offset; i < end; ++i) {
        result.push_back(static_cast<char>(fold(raw[i])));
    }
    return result;
}

} // namespace mkdos_fuse
