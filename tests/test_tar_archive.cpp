#include <gtest/gtest.h>
#include <cstdlib>
#include "utils/TarArchive.hpp"
#include "utils/SubProcess.hpp"
#include "support/TestHelpers.hpp"

namespace evalbox {
namespace {

using testing_support::TempDir;
using testing_support::read_text;
using testing_support::write_text;

unsigned long parse_octal(const std::string& block, size_t offset, size_t width) {
    return std::strtoul(block.substr(offset, width).c_str(), nullptr, 8);
}

unsigned header_checksum(std::string block) {
    for (size_t i = 148; i < 156; ++i) block[i] = ' ';
    unsigned sum = 0;
    for (char c : block) sum += static_cast<unsigned char>(c);
    return sum;
}

TEST(TarArchiveTest, SingleFileLayout) {
    TarArchive archive;
    archive.add_file("run_tests.sh", "#!/bin/bash\necho hi\n", 0755);
    std::string bytes = archive.finish();

    // header + one data block + two zero blocks
    ASSERT_EQ(bytes.size(), 4 * TarArchive::BLOCK_SIZE);
    std::string header = bytes.substr(0, TarArchive::BLOCK_SIZE);
    EXPECT_EQ(header.substr(0, 12), "run_tests.sh");
    EXPECT_EQ(header.substr(257, 5), "ustar");
    EXPECT_EQ(header[156], '0');
    EXPECT_EQ(parse_octal(header, 124, 12), 20u);
    EXPECT_EQ(parse_octal(header, 100, 8), 0755u);
    EXPECT_EQ(parse_octal(header, 148, 8), header_checksum(header));

    EXPECT_EQ(bytes.substr(TarArchive::BLOCK_SIZE, 20), "#!/bin/bash\necho hi\n");
    EXPECT_EQ(bytes.substr(2 * TarArchive::BLOCK_SIZE), std::string(2 * TarArchive::BLOCK_SIZE, '\0'));
}

TEST(TarArchiveTest, DataIsPaddedToBlockBoundary) {
    TarArchive archive;
    archive.add_file("a", std::string(513, 'x'));
    archive.add_file("b", "");
    std::string bytes = archive.finish();
    // a: header + 2 blocks, b: header only, trailer: 2 blocks
    EXPECT_EQ(bytes.size(), 6 * TarArchive::BLOCK_SIZE);
    EXPECT_EQ(bytes.size() % TarArchive::BLOCK_SIZE, 0u);
}

TEST(TarArchiveTest, LongNamesUsePrefixField) {
    std::string dir(120, 'd');
    std::string name = dir + "/file.txt";
    TarArchive archive;
    archive.add_file(name, "x");
    std::string header = archive.finish().substr(0, TarArchive::BLOCK_SIZE);
    EXPECT_EQ(header.substr(0, 8), "file.txt");
    EXPECT_EQ(header.substr(345, 120), dir);
}

TEST(TarArchiveTest, RejectsUnrepresentableName) {
    TarArchive archive;
    EXPECT_THROW(archive.add_file(std::string(300, 'n'), "x"), std::runtime_error);
}

TEST(TarArchiveTest, PackedDirectoryExtractsWithSystemTar) {
    if (!testing_support::has_command("tar")) GTEST_SKIP() << "tar not available";

    TempDir src("evalbox_tar_src");
    write_text(src / "pkg/module.py", "print('hello')\n");
    write_text(src / "pkg/nested/data.txt", "line1\nline2\n");

    TempDir dst("evalbox_tar_dst");
    std::string bytes = TarArchive::pack(src / "pkg", "pkg");

    ProcessOptions options;
    options.stdin_data = bytes;
    auto res = SubProcess::run(std::vector<std::string>{"tar", "xf", "-", "-C", dst.str()}, options);
    ASSERT_TRUE(res.success) << res.output;

    EXPECT_EQ(read_text(dst / "pkg/module.py"), "print('hello')\n");
    EXPECT_EQ(read_text(dst / "pkg/nested/data.txt"), "line1\nline2\n");
}

TEST(TarArchiveTest, PackRenamesSingleFile) {
    if (!testing_support::has_command("tar")) GTEST_SKIP() << "tar not available";

    TempDir src("evalbox_tar_src");
    write_text(src / "host_name.patch", "diff --git a/x b/x\n");
    TempDir dst("evalbox_tar_dst");

    ProcessOptions options;
    options.stdin_data = TarArchive::pack(src / "host_name.patch", "sandbox_name.patch");
    auto res = SubProcess::run(std::vector<std::string>{"tar", "xf", "-", "-C", dst.str()}, options);
    ASSERT_TRUE(res.success) << res.output;
    EXPECT_EQ(read_text(dst / "sandbox_name.patch"), "diff --git a/x b/x\n");
}

} // namespace
} // namespace evalbox
