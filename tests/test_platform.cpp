#include <catch2/catch.hpp>
#include <lastgood/platform.hpp>

#include <algorithm>

using namespace lastgood;

using Set = std::unordered_set<std::string>;

TEST_CASE("tier-1 target list", "[platform]") {
    const auto& targets = tier1_targets();
    REQUIRE(targets.size() == 8);
    REQUIRE(std::find(targets.begin(), targets.end(), "x86_64-unknown-linux-gnu") != targets.end());
    REQUIRE(std::find(targets.begin(), targets.end(), "aarch64-apple-darwin") != targets.end());
}

TEST_CASE("host target is a known triple shape", "[platform]") {
    const auto& host = host_target();
    REQUIRE_FALSE(host.empty());
    REQUIRE(std::count(host.begin(), host.end(), '-') >= 2);
}

TEST_CASE("all targets ignores every platform-specific package", "[platform]") {
    for (const char* host : {"x86_64-apple-darwin", "x86_64-pc-windows-gnu",
                             "x86_64-unknown-linux-gnu"}) {
        REQUIRE(ignored_packages(TargetSelection::All, host) ==
                Set{"lldb-preview", "rust-mingw"});
    }
}

TEST_CASE("current target keeps packages shipped for the host", "[platform]") {
    REQUIRE(ignored_packages(TargetSelection::Current, "x86_64-apple-darwin") ==
            Set{"rust-mingw"});
    REQUIRE(ignored_packages(TargetSelection::Current, "i686-apple-darwin") ==
            Set{"rust-mingw"});
    REQUIRE(ignored_packages(TargetSelection::Current, "x86_64-pc-windows-gnu") ==
            Set{"lldb-preview"});
    REQUIRE(ignored_packages(TargetSelection::Current, "i686-pc-windows-gnu") ==
            Set{"lldb-preview"});
    REQUIRE(ignored_packages(TargetSelection::Current, "aarch64-apple-darwin") ==
            Set{"lldb-preview", "rust-mingw"});
    REQUIRE(ignored_packages(TargetSelection::Current, "x86_64-unknown-linux-gnu") ==
            Set{"lldb-preview", "rust-mingw"});
}

TEST_CASE("selected targets", "[platform]") {
    REQUIRE(selected_targets(TargetSelection::All, "x86_64-unknown-linux-gnu") == tier1_targets());
    REQUIRE(selected_targets(TargetSelection::Current, "x86_64-unknown-linux-gnu") ==
            std::vector<std::string>{"x86_64-unknown-linux-gnu"});
}
