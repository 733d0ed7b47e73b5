#include "name_codec.h"

#include <cassert>
#include <string>

using namespace mkdos_fuse;

namespace {

std::string raw_string(const RawName& raw) {
    return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
}

void plain_names() {
    RawName raw;
    assert(NameCodec::encode("HELLO.TXT", false, raw) == Errc::ok);
    assert(raw_string(raw) == "HELLO.TXT     ");
    assert(NameCodec::decode(raw, false) == "HELLO.TXT");

    // Full 14 bytes, no extension split enforced
    assert(NameCodec::encode("ABCDEFGHIJKLMN", false, raw) == Errc::ok);
    assert(NameCodec::decode(raw, false) == "ABCDEFGHIJKLMN");
    assert(NameCodec::encode("ABCDEFGHIJKLMNO", false, raw) == Errc::name_too_long);

    // Inner spaces are part of the name
    assert(NameCodec::encode("MY GAME", false, raw) == Errc::ok);
    assert(NameCodec::decode(raw, false) == "MY GAME");
}

void directory_names() {
    RawName raw;
    assert(NameCodec::encode("GAMES", true, raw) == Errc::ok);
    assert(raw[0] == DIR_MARKER);
    assert(raw_string(raw).substr(1) == "GAMES        ");
    assert(NameCodec::decode(raw, true) == "GAMES");

    assert(NameCodec::encode("ABCDEFGHIJKLM", true, raw) == Errc::ok);
    assert(NameCodec::encode("ABCDEFGHIJKLMN", true, raw) == Errc::name_too_long);
}

void rejected_names() {
    RawName raw;
    assert(NameCodec::encode("", false, raw) == Errc::invalid_name);
    assert(NameCodec::encode(".", false, raw) == Errc::invalid_name);
    assert(NameCodec::encode("..", true, raw) == Errc::invalid_name);
    assert(NameCodec::encode(" LEAD", false, raw) == Errc::invalid_name);
    assert(NameCodec::encode("TRAIL ", false, raw) == Errc::invalid_name);
    assert(NameCodec::encode("A/B", false, raw) == Errc::invalid_name);
    assert(NameCodec::encode(std::string("A\x01", 2), false, raw) == Errc::invalid_name);
    // No KOI8-R code for these
    assert(NameCodec::encode("\xE6\x97\xA5\xE6\x9C\xAC", false, raw) == Errc::invalid_name);
}

void cyrillic_names() {
    RawName raw;
    // "Привет" in UTF-8
    const std::string hello = "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82";
    assert(NameCodec::encode(hello, false, raw) == Errc::ok);
    assert(raw[0] == 0xF0);
    assert(raw[1] == 0xD2);
    assert(raw[2] == 0xC9);
    assert(raw[3] == 0xD7);
    assert(raw[4] == 0xC5);
    assert(raw[5] == 0xD4);
    assert(raw[6] == ' ');
    assert(NameCodec::decode(raw, false) == hello);

    // Two bytes of UTF-8 per letter, one byte on disk
    const std::string long_name = hello + hello + "\xD0\x90\xD0\x91";
    assert(NameCodec::encode(long_name, false, raw) == Errc::ok);
    assert(NameCodec::encode(long_name + "\xD0\x92", false, raw) == Errc::name_too_long);
}

void case_folding() {
    RawName upper, lower;
    assert(NameCodec::encode("README", false, upper) == Errc::ok);
    assert(NameCodec::encode("ReadMe", false, lower) == Errc::ok);
    assert(NameCodec::key(upper, false) == NameCodec::key(lower, false));

    // "ПРИВЕТ" and "привет"
    assert(NameCodec::encode("\xD0\x9F\xD0\xA0\xD0\x98\xD0\x92\xD0\x95\xD0\xA2", false, upper) == Errc::ok);
    assert(NameCodec::encode("\xD0\xBF\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82", false, lower) == Errc::ok);
    assert(NameCodec::key(upper, false) == NameCodec::key(lower, false));

    // "Ё" and "ё"
    assert(NameCodec::encode("\xD0\x81", false, upper) == Errc::ok);
    assert(NameCodec::encode("\xD1\x91", false, lower) == Errc::ok);
    assert(upper[0] == 0xB3 && lower[0] == 0xA3);
    assert(NameCodec::key(upper, false) == NameCodec::key(lower, false));

    // Same name as file and directory compares equal
    RawName dir, file;
    assert(NameCodec::encode("readme", true, dir) == Errc::ok);
    assert(NameCodec::encode("README", false, file) == Errc::ok);
    assert(NameCodec::key(dir, true) == NameCodec::key(file, false));

    assert(NameCodec::fold('a') == 'A');
    assert(NameCodec::fold('1') == '1');
    assert(NameCodec::fold(0xC1) == 0xE1);
    assert(NameCodec::fold(0xE1) == 0xE1);
}

} // namespace

int main() {
    plain_names();
    directory_names();
    rejected_names();
    cyrillic_names();
    case_folding();
    return 0;
}
