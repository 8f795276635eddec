#include <gtest/gtest.h>

#include "ap_probe.hpp"
#include "test_helpers.hpp"

using namespace asmprobe;
using asmprobe::test::ProbeTest;

namespace {
using Paths = std::vector<std::string>;
class SharedProbeTests : public ProbeTest {};
} // anonymous namespace

TEST_F(SharedProbeTests, UsesConfiguredSharedDirectory) {
    scratch_.Touch("shared/Foo.dll");

    ProbeOptions options;
    options.shared_dir = scratch_.root() / "shared";

    EXPECT_EQ(FindGlobalAssembly("Foo", options), Paths{ scratch_.Path("shared/Foo.dll") });
}

TEST_F(SharedProbeTests, MissingSharedDirectoryYieldsEmpty) {
    ProbeOptions options;
    options.shared_dir = scratch_.root() / "missing";

    Paths result;
    EXPECT_NO_THROW(result = FindGlobalAssembly("Foo", options));
    EXPECT_TRUE(result.empty());
}

TEST_F(SharedProbeTests, HonorsIgnoreFile) {
    scratch_.Touch("shared/Foo.dll");

    ProbeOptions options;
    options.shared_dir = scratch_.root() / "shared";
    options.ignore_file_name = "Foo.dll";

    EXPECT_TRUE(FindGlobalAssembly("Foo", options).empty());
}

TEST_F(SharedProbeTests, TracesSharedLocation) {
    scratch_.MakeDir("shared");

    std::vector<std::string> lines;
    ProbeOptions options;
    options.shared_dir = scratch_.root() / "shared";
    options.trace = [&](const std::string& line) { lines.push_back(line); };

    FindGlobalAssembly("Foo", options);

    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "shared location: " + scratch_.Path("shared"));
}

TEST(HostModuleTests, HostModuleDirectoryExists) {
    auto dir = HostModuleDirectory();
    ASSERT_TRUE(dir.has_value());
    EXPECT_TRUE(dir->is_absolute());

    std::error_code ec;
    EXPECT_TRUE(std::filesystem::is_directory(*dir, ec));
}

TEST(HostModuleTests, DefaultSharedLocationIsHostModuleDirectory) {
    auto dir = HostModuleDirectory();
    ASSERT_TRUE(dir.has_value());

    std::vector<std::string> lines;
    ProbeOptions options;
    options.trace = [&](const std::string& line) { lines.push_back(line); };

    EXPECT_NO_THROW(FindGlobalAssembly("NoSuchModule_6f1c2d", options));
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "shared location: " + dir->string());
}

#if defined(__linux__)
// The shared location must not follow the working directory, whatever
// argv[0] looked like when the test binary was started.
TEST_F(SharedProbeTests, HostModuleDirectoryIgnoresWorkingDirectory) {
    namespace fs = std::filesystem;

    std::error_code ec;
    const fs::path exe_dir = fs::read_symlink("/proc/self/exe", ec).parent_path();
    ASSERT_FALSE(ec) << ec.message();

    const fs::path saved_cwd = fs::current_path();
    scratch_.Touch("NoSuchModule_6f1c2d.dll");
    fs::current_path(scratch_.root());

    const auto dir = HostModuleDirectory();
    ProbeOptions options;
    const auto found = FindGlobalAssembly("NoSuchModule_6f1c2d", options);

    fs::current_path(saved_cwd);

    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(dir->string(), exe_dir.string());
    EXPECT_TRUE(found.empty());
}
#endif
