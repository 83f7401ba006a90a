#include "file_store.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>

using namespace filedrop::server;
using filedrop::test::expect;
using filedrop::test::read_file;
using filedrop::test::TempDir;
using filedrop::test::write_file;

namespace {

bool throws_invalid(const FileStore& store, const std::string& name) {
    try {
        store.resolve(name);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

std::size_t staging_entries(const FileStore& store) {
    const auto dir = store.root() / std::string(FileStore::kStagingDir);
    return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(dir),
                                                  std::filesystem::directory_iterator()));
}

}  // namespace

int main() {
    TempDir tmp("filedrop_store");
    std::cout << "File store test tempdir: " << tmp.path << std::endl;
    const auto root = tmp.path / "uploaded";
    FileStore store(root);

    if (!expect(std::filesystem::is_directory(root), "root created")) return 1;
    if (!expect(store.list().empty(), "fresh store lists nothing")) return 2;
    if (!expect(FileStore::is_reserved(".partial"), "staging directory name reserved")) return 3;

    // Containment.
    if (!expect(store.resolve("report.txt") == root / "report.txt", "resolve plain name")) return 4;
    if (!expect(throws_invalid(store, "../escape.txt"), "resolve rejects traversal")) return 5;
    if (!expect(throws_invalid(store, "a/b.txt"), "resolve rejects separators")) return 6;
    if (!expect(throws_invalid(store, ""), "resolve rejects empty")) return 7;

    // Staged write then commit.
    {
        auto upload = store.begin_upload("report.txt");
        if (!expect(upload->write("hello ") && upload->write("world"), "staged writes")) return 10;
        if (!expect(upload->bytes_written() == 11, "bytes counted")) return 11;
        if (!expect(!std::filesystem::exists(root / "report.txt"), "not visible before commit")) return 12;
        if (!expect(store.list().empty(), "staging file not listed")) return 13;
        upload->commit();
    }
    if (!expect(read_file(root / "report.txt") == "hello world", "committed content")) return 14;
    if (!expect(staging_entries(store) == 0, "staging emptied after commit")) return 15;

    // Overwrite replaces the whole file.
    {
        auto upload = store.begin_upload("report.txt");
        upload->write("v2");
        upload->commit();
    }
    if (!expect(read_file(root / "report.txt") == "v2", "overwrite replaces content")) return 16;

    // Dropping an upload without commit leaves no trace.
    {
        auto upload = store.begin_upload("abandoned.bin");
        upload->write("partial data");
    }
    if (!expect(!std::filesystem::exists(root / "abandoned.bin"), "abandoned upload not published")) return 17;
    if (!expect(staging_entries(store) == 0, "abandoned staging file removed")) return 18;
    {
        auto upload = store.begin_upload("discarded.bin");
        upload->write("x");
        if (!expect(upload->discard(), "explicit discard")) return 19;
        if (!expect(!std::filesystem::exists(upload->temp_path()), "discard removes staging file")) return 20;
    }

    bool reserved_rejected = false;
    try {
        store.begin_upload(".partial");
    } catch (const std::invalid_argument&) {
        reserved_rejected = true;
    }
    if (!expect(reserved_rejected, "upload to reserved name rejected")) return 21;

    // Listing: regular files only.
    write_file(root / "b.txt", "bbb");
    std::filesystem::create_directories(root / "subdir");
    auto records = store.list();
    std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) { return a.name < b.name; });
    if (!expect(records.size() == 2, "two regular files listed")) return 30;
    if (!expect(records[0].name == "b.txt" && records[0].size == 3, "b.txt record")) return 31;
    if (!expect(records[1].name == "report.txt" && records[1].size == 2, "report.txt record")) return 32;
    const auto now = std::chrono::system_clock::now();
    if (!expect(records[1].modified <= now && now - records[1].modified < std::chrono::minutes(5),
                "modification time is recent")) return 33;

    // Open.
    const auto small = store.open("b.txt");
    if (!expect(small && small->size() == 3, "open reports size")) return 40;
    if (!expect(!store.open("missing.txt"), "missing file does not open")) return 41;
    if (!expect(!store.open("subdir"), "directory does not open as a file")) return 42;
    auto reader = store.open("report.txt");
    if (!expect(reader != nullptr && reader->size() == 2, "open existing file")) return 43;
    char buf[8] = {};
    if (!expect(reader->read(1, buf, sizeof(buf)) == 1 && buf[0] == '2', "pread at offset")) return 44;
    if (!expect(reader->read(2, buf, sizeof(buf)) == 0, "read at end returns zero")) return 45;

    // A reader opened before an overwrite keeps the bytes it opened.
    {
        auto before = store.open("report.txt");
        auto replacement = store.begin_upload("report.txt");
        const std::string fresh = "replacement contents";
        if (!expect(replacement->write(fresh), "write replacement")) return 46;
        replacement->commit();
        char old_bytes[8] = {};
        if (!expect(before->size() == 2 && before->read(0, old_bytes, sizeof(old_bytes)) == 2 &&
                        std::string(old_bytes, 2) == "v2",
                    "open reader still sees the old file")) return 47;
        auto after = store.open("report.txt");
        std::string new_bytes(fresh.size(), '\0');
        if (!expect(after && after->size() == fresh.size() &&
                        after->read(0, new_bytes.data(), new_bytes.size()) == fresh.size() && new_bytes == fresh,
                    "fresh open sees the new file")) return 48;
    }

    // Stale staging files from an earlier run are purged.
    write_file(root / ".partial" / "deadbeefdeadbeef.part", "stale");
    if (!expect(store.purge_staging() == 1, "stale staging file purged")) return 50;
    if (!expect(staging_entries(store) == 0, "staging empty after purge")) return 51;

    std::cout << "All file store tests passed" << std::endl;
    return 0;
}
