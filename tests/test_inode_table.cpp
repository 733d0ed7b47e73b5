#include "inode_table.h"

#include <cassert>
#include <memory>
#include <string>

#include "image_builder.h"

using namespace mkdos_fuse;
using mkdos_fuse::testing::ImageBuilder;
using mkdos_fuse::testing::TempDir;
using mkdos_fuse::testing::pattern;

namespace {

AttrContext context() {
    AttrContext ctx;
    ctx.uid = 1000;
    ctx.gid = 100;
    return ctx;
}

void root_is_bound() {
    InodeTable table(context());
    auto root = table.lookup(ROOT_INODE);
    assert(root);
    assert(S_ISDIR(root->attr.st_mode));
    assert(root->attr.st_ino == ROOT_INODE);
    assert(root->attr.st_uid == 1000);
    assert(root->attr.st_mtime == MKDOS_EPOCH);

    // The root cannot be retired
    table.invalidate(ROOT_INODE);
    assert(table.lookup(ROOT_INODE));
    assert(!table.lookup(ROOT_INODE + 1));
}

void handles_are_stable() {
    TempDir dir;
    std::string path = dir.file("inodes.img");
    ImageBuilder()
        .add_file("ONE", pattern(1000, 1))
        .add_file("TWO", pattern(10, 2), STATUS_PROTECTED)
        .add_directory("DIR", 1)
        .write(path);

    Volume volume(path);
    assert(volume.open() == Errc::ok);
    InodeTable table(context());

    auto entries = volume.list_entries(ROOT_DIR);
    assert(entries.size() == 3);

    InodeHandle one = table.resolve_or_create(entries[0]);
    InodeHandle two = table.resolve_or_create(entries[1]);
    InodeHandle sub = table.resolve_or_create(entries[2]);
    assert(one != two && two != sub && one != ROOT_INODE);
    assert(table.resolve_or_create(entries[0]) == one);
    assert(table.find(entries[0].position) == one);

    auto cached = table.lookup(one);
    assert(cached);
    assert(S_ISREG(cached->attr.st_mode));
    assert((cached->attr.st_mode & 0777) == 0644);
    assert(cached->attr.st_size == 1000);
    assert(cached->attr.st_blocks == 2);
    assert(cached->attr.st_nlink == 1);

    auto prot = table.lookup(two);
    assert((prot->attr.st_mode & 0777) == 0444);

    auto directory = table.lookup(sub);
    assert(S_ISDIR(directory->attr.st_mode));
    assert(directory->attr.st_nlink == 2);

    // Writes and renames keep the handle
    assert(volume.store(entries[0].position, pattern(3000, 3)) == Errc::ok);
    assert(volume.rename_entry(entries[0].position, ROOT_DIR, "UNO") == Errc::ok);
    table.refresh(one, *volume.entry(entries[0].position));
    cached = table.lookup(one);
    assert(cached->entry.name == "UNO");
    assert(cached->attr.st_size == 3000);
    assert(table.resolve_or_create(*volume.entry(entries[0].position)) == one);
}

void retired_handles_stay_dead() {
    TempDir dir;
    std::string path = dir.file("retire.img");
    ImageBuilder().add_file("GONE", pattern(100, 1)).add_file("STAY", pattern(100, 2)).write(path);

    Volume volume(path);
    assert(volume.open() == Errc::ok);
    InodeTable table(context());

    DirEntry gone;
    assert(volume.find(ROOT_DIR, "GONE", gone) == Errc::ok);
    InodeHandle handle = table.resolve_or_create(gone);
    assert(volume.release_chain(gone.position) == Errc::ok);
    table.invalidate(handle);
    assert(!table.lookup(handle));
    assert(!table.find(gone.position));

    // A new entry under the same name gets a fresh handle
    DirEntry fresh;
    assert(volume.allocate_entry(ROOT_DIR, "GONE", fresh) == Errc::ok);
    InodeHandle again = table.resolve_or_create(fresh);
    assert(again != handle);
    assert(again > handle);
}

void refresh_all_follows_volume() {
    TempDir dir;
    std::string path = dir.file("refresh.img");
    ImageBuilder(60, 20)
        .add_file("A", pattern(10 * BLOCK_SIZE, 1))
        .add_file("B", pattern(10 * BLOCK_SIZE, 2))
        .add_file("C", pattern(10 * BLOCK_SIZE, 3))
        .write(path);

    Volume volume(path);
    assert(volume.open() == Errc::ok);
    InodeTable table(context());

    DirEntry b, c;
    assert(volume.find(ROOT_DIR, "B", b) == Errc::ok);
    assert(volume.find(ROOT_DIR, "C", c) == Errc::ok);
    InodeHandle hb = table.resolve_or_create(b);
    InodeHandle hc = table.resolve_or_create(c);

    assert(volume.release_chain(b.position) == Errc::ok);
    assert(volume.squeeze() == 1);
    table.refresh_all(volume);

    assert(!table.lookup(hb));
    auto moved = table.lookup(hc);
    assert(moved);
    assert(moved->entry.start_block == 30);
    assert(table.lookup(ROOT_INODE));
    assert(table.size() == 2);
}

} // namespace

int main() {
    root_is_bound();
    handles_are_stable();
    retired_handles_stay_dead();
    refresh_all_follows_volume();
    return 0;
}
