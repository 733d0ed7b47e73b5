#include "dispatcher.h"

#include <fcntl.h>

#include <atomic>
#include <cassert>
#include <cerrno>
#include <string>
#include <thread>
#include <vector>

#include "image_builder.h"

using namespace mkdos_fuse;
using mkdos_fuse::testing::ImageBuilder;
using mkdos_fuse::testing::TempDir;
using mkdos_fuse::testing::pattern;

namespace {

constexpr int THREADS = 4;
constexpr int FILES_PER_THREAD = 10;

bool has_name(const std::vector<DirListing>& listings, const std::string& name) {
    for (const auto& l : listings) {
        if (l.name == name) return true;
    }
    return false;
}

// Readers see consistent data while other threads create and write files
void readers_alongside_writers() {
    TempDir dir;
    std::string path = dir.file("disk.img");
    const auto stable = pattern(3000, 42);
    ImageBuilder().add_file("STABLE", stable).write(path);

    Volume volume(path);
    assert(volume.open() == Errc::ok);
    Dispatcher fs(volume);

    std::atomic<bool> writers_done{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < THREADS; ++t) {
        writers.emplace_back([&fs, t] {
            for (int i = 0; i < FILES_PER_THREAD; ++i) {
                std::string name = "T" + std::to_string(t) + "F" + std::to_string(i);
                EntryReply reply;
                uint64_t fh;
                int res = fs.create(ROOT_INODE, name, O_WRONLY | O_CREAT, reply, fh);
                assert(res == 0);

                auto data = pattern(1024, static_cast<uint8_t>(t * 16 + i));
                res = fs.write(reply.ino, fh, 0, std::span<const uint8_t>(data));
                assert(res == 1024);
                assert(fs.flush(reply.ino, fh) == 0);
                assert(fs.release(reply.ino, fh) == 0);
            }
        });
    }

    std::vector<std::thread> readers;
    for (int t = 0; t < THREADS; ++t) {
        readers.emplace_back([&fs, &stable, &writers_done] {
            do {
                EntryReply reply;
                assert(fs.lookup(ROOT_INODE, "STABLE", reply) == 0);
                assert(reply.attr.st_size == 3000);

                uint64_t fh;
                assert(fs.open(reply.ino, O_RDONLY, fh) == 0);
                std::vector<uint8_t> out;
                assert(fs.read(reply.ino, fh, 0, 4096, out) == 0);
                assert(out == stable);
                assert(fs.release(reply.ino, fh) == 0);

                std::vector<DirListing> listings;
                assert(fs.readdir(ROOT_INODE, 0, listings) == 0);
                assert(listings.size() >= 3);
                assert(listings[0].name == "." && listings[1].name == "..");
                assert(has_name(listings, "STABLE"));

                struct statvfs sv;
                assert(fs.statfs(sv) == 0);
                assert(sv.f_bfree <= 774);
            } while (!writers_done.load());
        });
    }

    for (auto& w : writers) w.join();
    writers_done = true;
    for (auto& r : readers) r.join();

    std::vector<DirListing> listings;
    assert(fs.readdir(ROOT_INODE, 0, listings) == 0);
    assert(listings.size() == 2 + 1 + THREADS * FILES_PER_THREAD);

    for (int t = 0; t < THREADS; ++t) {
        for (int i = 0; i < FILES_PER_THREAD; ++i) {
            std::string name = "T" + std::to_string(t) + "F" + std::to_string(i);
            EntryReply reply;
            assert(fs.lookup(ROOT_INODE, name, reply) == 0);
            uint64_t fh;
            assert(fs.open(reply.ino, O_RDONLY, fh) == 0);
            std::vector<uint8_t> out;
            assert(fs.read(reply.ino, fh, 0, 2048, out) == 0);
            assert(out == pattern(1024, static_cast<uint8_t>(t * 16 + i)));
            assert(fs.release(reply.ino, fh) == 0);
        }
    }

    struct statvfs sv;
    assert(fs.statfs(sv) == 0);
    assert(sv.f_bfree == 780 - 6 - 2 * THREADS * FILES_PER_THREAD);
    assert(sv.f_ffree == 412 - 1 - THREADS * FILES_PER_THREAD);
    assert(fs.open_files().handle_count() == 0);
}

// Only the first writer of an inode gets through, whichever thread it is on
void writer_slot_across_threads() {
    TempDir dir;
    std::string path = dir.file("disk.img");
    ImageBuilder().write(path);

    Volume volume(path);
    assert(volume.open() == Errc::ok);
    Dispatcher fs(volume);

    EntryReply reply;
    uint64_t owner;
    assert(fs.create(ROOT_INODE, "SHARED", O_WRONLY | O_CREAT, reply, owner) == 0);
    InodeHandle ino = reply.ino;
    auto first = pattern(100, 1);
    assert(fs.write(ino, owner, 0, std::span<const uint8_t>(first)) == 100);

    std::atomic<int> busy{0};
    std::vector<std::thread> others;
    for (int t = 0; t < THREADS; ++t) {
        others.emplace_back([&fs, &busy, ino] {
            uint64_t fh;
            assert(fs.open(ino, O_WRONLY, fh) == 0);
            auto data = pattern(10, 9);
            if (fs.write(ino, fh, 0, std::span<const uint8_t>(data)) == -EBUSY) ++busy;
            assert(fs.release(ino, fh) == 0);
        });
    }
    for (auto& o : others) o.join();
    assert(busy == THREADS);

    assert(fs.release(ino, owner) == 0);

    // Once released, exactly one of the racing writers owns the slot
    std::vector<uint64_t> handles(THREADS);
    for (auto& fh : handles) assert(fs.open(ino, O_WRONLY, fh) == 0);

    std::atomic<int> winners{0};
    std::vector<std::thread> racers;
    for (int t = 0; t < THREADS; ++t) {
        racers.emplace_back([&fs, &winners, &handles, ino, t] {
            auto data = pattern(10, static_cast<uint8_t>(t));
            int res = fs.write(ino, handles[t], 0, std::span<const uint8_t>(data));
            if (res == 10) {
                ++winners;
            } else {
                assert(res == -EBUSY);
            }
        });
    }
    for (auto& r : racers) r.join();
    assert(winners == 1);

    for (auto fh : handles) assert(fs.release(ino, fh) == 0);

    struct stat st;
    assert(fs.getattr(ino, st) == 0);
    assert(st.st_size == 100);
}

} // namespace

int main() {
    readers_alongside_writers();
    writer_slot_across_threads();
    return 0;
}
