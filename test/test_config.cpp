#include <gtest/gtest.h>

#include "ap_config.hpp"
#include "test_helpers.hpp"

using namespace asmprobe;
using asmprobe::test::ProbeTest;

namespace {
using Paths = std::vector<std::string>;
class ConfigTests : public ProbeTest {};
} // anonymous namespace

TEST_F(ConfigTests, LoadsAllKeys) {
    auto file = scratch_.Touch("app/app.approbe.json", R"({
        "searchDirs": ["lib", "/opt/app/modules"],
        "ignoreFile": "host.dll",
        "sharedDir": "runtime"
    })");

    ResolverConfig cfg;
    std::string err;
    ASSERT_TRUE(LoadResolverConfig(file, cfg, err)) << err;

    EXPECT_EQ(cfg.search_dirs, (Paths{ scratch_.Path("app/lib"), "/opt/app/modules" }));
    EXPECT_EQ(cfg.probe.ignore_file_name, "host.dll");
    ASSERT_TRUE(cfg.probe.shared_dir.has_value());
    EXPECT_EQ(cfg.probe.shared_dir->string(), scratch_.Path("app/runtime"));
}

TEST_F(ConfigTests, EveryKeyIsOptional) {
    ResolverConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseResolverConfig("{}", scratch_.root(), cfg, err)) << err;

    EXPECT_TRUE(cfg.search_dirs.empty());
    EXPECT_TRUE(cfg.probe.ignore_file_name.empty());
    EXPECT_FALSE(cfg.probe.shared_dir.has_value());
}

TEST_F(ConfigTests, KeepsTraceCallback) {
    int calls = 0;
    ResolverConfig cfg;
    cfg.probe.trace = [&calls](const std::string&) { ++calls; };

    std::string err;
    ASSERT_TRUE(ParseResolverConfig(R"({"ignoreFile": "a.dll"})", {}, cfg, err)) << err;
    ASSERT_TRUE(static_cast<bool>(cfg.probe.trace));
    cfg.probe.trace("x");
    EXPECT_EQ(calls, 1);
}

TEST_F(ConfigTests, RejectsMalformedJson) {
    ResolverConfig cfg;
    std::string err;
    EXPECT_FALSE(ParseResolverConfig("{ \"searchDirs\": [", {}, cfg, err));
    EXPECT_EQ(err, "malformed JSON");
}

TEST_F(ConfigTests, RejectsNonObject) {
    ResolverConfig cfg;
    std::string err;
    EXPECT_FALSE(ParseResolverConfig("[]", {}, cfg, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(ConfigTests, RejectsWrongTypes) {
    ResolverConfig cfg;
    std::string err;
    EXPECT_FALSE(ParseResolverConfig(R"({"searchDirs": "lib"})", {}, cfg, err));
    EXPECT_NE(err.find("searchDirs"), std::string::npos);

    EXPECT_FALSE(ParseResolverConfig(R"({"searchDirs": ["lib", 3]})", {}, cfg, err));
    EXPECT_FALSE(ParseResolverConfig(R"({"ignoreFile": 1})", {}, cfg, err));
    EXPECT_FALSE(ParseResolverConfig(R"({"sharedDir": false})", {}, cfg, err));
}

TEST_F(ConfigTests, FailedParseLeavesConfigUntouched) {
    ResolverConfig cfg;
    cfg.search_dirs = { "keep" };

    std::string err;
    EXPECT_FALSE(ParseResolverConfig(R"({"searchDirs": ["a"], "ignoreFile": 1})", {}, cfg, err));
    EXPECT_EQ(cfg.search_dirs, Paths{ "keep" });
}

TEST_F(ConfigTests, MissingFileFails) {
    ResolverConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadResolverConfig(scratch_.root() / "none.approbe.json", cfg, err));
    EXPECT_EQ(err.rfind("cannot open: ", 0), 0u);
}

TEST_F(ConfigTests, ErrorNamesTheFile) {
    auto file = scratch_.Touch("bad.approbe.json", "nope");

    ResolverConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadResolverConfig(file, cfg, err));
    EXPECT_EQ(err, file.string() + ": malformed JSON");
}

TEST_F(ConfigTests, FindProbeFileSearchesRecursively) {
    scratch_.Touch("a/readme.json", "{}");
    auto file = scratch_.Touch("a/b/app.approbe.json", "{}");

    std::filesystem::path found;
    ASSERT_TRUE(FindProbeFile(scratch_.root(), found));
    EXPECT_EQ(found.string(), file.string());
}

TEST_F(ConfigTests, FindProbeFileWithoutMatch) {
    scratch_.Touch("a/.approbe.json", "{}");
    std::filesystem::path found;
    EXPECT_FALSE(FindProbeFile(scratch_.root(), found));
    EXPECT_FALSE(FindProbeFile(scratch_.root() / "missing", found));
}

TEST_F(ConfigTests, LoadedConfigDrivesResolver) {
    scratch_.Touch("app/lib/Foo.dll");
    scratch_.MakeDir("app/runtime");
    auto file = scratch_.Touch("app/app.approbe.json", R"({"searchDirs": ["lib"], "sharedDir": "runtime"})");

    ResolverConfig cfg;
    std::string err;
    ASSERT_TRUE(LoadResolverConfig(file, cfg, err)) << err;

    Resolver resolver(std::move(cfg));
    EXPECT_EQ(resolver.Resolve("Foo"), Paths{ scratch_.Path("app/lib/Foo.dll") });
}
