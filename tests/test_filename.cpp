#include "filename.hpp"
#include "test_support.hpp"

#include <string>

using filedrop::server::is_safe_filename;
using filedrop::server::sanitize_filename;
using filedrop::test::expect;

namespace {
bool sanitizes_to(const std::string& raw, const std::string& wanted) {
    const auto result = sanitize_filename(raw);
    return result && *result == wanted;
}
}

int main() {
    if (!expect(sanitizes_to("report.txt", "report.txt"), "plain name kept")) return 1;
    if (!expect(sanitizes_to("docs/2024/report.txt", "report.txt"), "unix path reduced to last component")) return 2;
    if (!expect(sanitizes_to("C:\\Users\\me\\report.txt", "report.txt"), "windows path reduced to last component")) return 3;
    if (!expect(sanitizes_to("dir/", "dir"), "trailing separator ignored")) return 4;
    if (!expect(sanitizes_to("my file (1).tar.gz", "my file (1).tar.gz"), "spaces and dots kept")) return 5;
    if (!expect(sanitizes_to("\xe6\x8a\xa5\xe5\x91\x8a.pdf", "\xe6\x8a\xa5\xe5\x91\x8a.pdf"), "utf-8 name kept")) return 6;
    if (!expect(sanitizes_to(".hidden", ".hidden"), "leading dot allowed")) return 7;

    if (!expect(!sanitize_filename(""), "empty rejected")) return 10;
    if (!expect(!sanitize_filename("."), "dot rejected")) return 11;
    if (!expect(!sanitize_filename(".."), "dot-dot rejected")) return 12;
    if (!expect(!sanitize_filename("../etc/passwd"), "leading traversal rejected")) return 13;
    if (!expect(!sanitize_filename("a/../b.txt"), "embedded traversal rejected")) return 14;
    if (!expect(!sanitize_filename("..\\secret.txt"), "backslash traversal rejected")) return 15;
    if (!expect(!sanitize_filename("dir/."), "trailing dot component rejected")) return 16;
    if (!expect(!sanitize_filename("/"), "bare separator rejected")) return 17;
    if (!expect(!sanitize_filename("bad\nname.txt"), "control character rejected")) return 18;
    if (!expect(!sanitize_filename(std::string("nul\0byte", 8)), "NUL rejected")) return 19;

    if (!expect(is_safe_filename("report.txt"), "safe name accepted")) return 30;
    if (!expect(!is_safe_filename("a/b"), "separator is unsafe")) return 31;
    if (!expect(!is_safe_filename("a\\b"), "backslash is unsafe")) return 32;
    if (!expect(!is_safe_filename(".."), "dot-dot is unsafe")) return 33;

    std::cout << "All filename tests passed" << std::endl;
    return 0;
}
