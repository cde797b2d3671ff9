#include <catch2/catch.hpp>
#include <lastgood/filter.hpp>
#include <lastgood/platform.hpp>
#include "fake_http.hpp"

using namespace lastgood;
using testing::ManifestToml;

static Manifest parse_ok(const std::string& toml) {
    auto r = Manifest::parse(toml);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static const std::vector<std::string> LINUX_ONLY = {"x86_64-unknown-linux-gnu"};

TEST_CASE("fully available manifest is viable", "[filter]") {
    auto m = parse_ok(testing::complete_manifest("2024-01-09"));
    auto profile = m.profile_packages("default").value();
    REQUIRE(is_viable(m, profile, {}, tier1_targets()));
}

TEST_CASE("one unavailable pair makes the manifest non-viable", "[filter]") {
    auto m = parse_ok(testing::complete_manifest("2024-01-10", "rustc",
                                                 "x86_64-unknown-linux-gnu"));
    auto profile = m.profile_packages("default").value();
    REQUIRE_FALSE(is_viable(m, profile, {}, tier1_targets()));
    REQUIRE_FALSE(is_viable(m, profile, {}, LINUX_ONLY));
    REQUIRE(is_viable(m, profile, {}, {"aarch64-apple-darwin"}));
}

TEST_CASE("empty package selection is vacuously viable", "[filter]") {
    auto m = parse_ok(ManifestToml("2024-01-10")
        .package("rustc", "1.75.0").target("x86_64-unknown-linux-gnu", false)
        .profile("default", {"rustc"})
        .str());
    REQUIRE(is_viable(m, {}, {}, LINUX_ONLY));
    REQUIRE(is_viable(m, {"rustc"}, {"rustc"}, LINUX_ONLY));
}

TEST_CASE("pairs without an entry are skipped", "[filter]") {
    auto m = parse_ok(ManifestToml("2024-01-10")
        .package("rustc", "1.75.0").target("x86_64-unknown-linux-gnu", true)
        .package("rust-mingw", "1.75.0")
        .profile("default", {"rustc", "rust-mingw", "not-published"})
        .str());
    auto profile = m.profile_packages("default").value();

    // rust-mingw has no targets at all, not-published has no pkg entry
    REQUIRE(is_viable(m, profile, {}, tier1_targets()));
    // no explicit entry for any selected pair
    REQUIRE(is_viable(m, profile, {}, {"aarch64-apple-darwin"}));
}

TEST_CASE("absent pairs never flip a viable result", "[filter]") {
    auto base = ManifestToml("2024-01-10")
        .package("rustc", "1.75.0").target("x86_64-unknown-linux-gnu", true)
        .profile("default", {"rustc"});
    auto m = parse_ok(base.str());
    std::vector<std::string> targets = LINUX_ONLY;
    REQUIRE(is_viable(m, {"rustc"}, {}, targets));

    targets.push_back("riscv64gc-unknown-linux-gnu");
    targets.push_back("wasm32-unknown-unknown");
    REQUIRE(is_viable(m, {"rustc"}, {}, targets));
}

TEST_CASE("ignored packages never affect viability", "[filter]") {
    auto m = parse_ok(ManifestToml("2024-01-10")
        .package("rustc", "1.75.0").target("x86_64-unknown-linux-gnu", true)
        .package("lldb-preview", "").target("x86_64-unknown-linux-gnu", false)
        .package("rust-mingw", "").target("x86_64-unknown-linux-gnu", true)
        .profile("complete", {"rustc", "lldb-preview", "rust-mingw"})
        .str());
    auto profile = m.profile_packages("complete").value();

    REQUIRE_FALSE(is_viable(m, profile, {}, LINUX_ONLY));
    REQUIRE(is_viable(m, profile, {"lldb-preview"}, LINUX_ONLY));
    REQUIRE(is_viable(m, profile, {"lldb-preview", "rust-mingw"}, LINUX_ONLY));
}

TEST_CASE("packages outside the profile are not checked", "[filter]") {
    auto m = parse_ok(ManifestToml("2024-01-10")
        .package("rustc", "1.75.0").target("x86_64-unknown-linux-gnu", true)
        .package("miri", "").target("x86_64-unknown-linux-gnu", false)
        .profile("minimal", {"rustc"})
        .profile("complete", {"rustc", "miri"})
        .str());
    REQUIRE(is_viable(m, m.profile_packages("minimal").value(), {}, LINUX_ONLY));
    REQUIRE_FALSE(is_viable(m, m.profile_packages("complete").value(), {}, LINUX_ONLY));
}

TEST_CASE("is_viable is idempotent", "[filter]") {
    auto m = parse_ok(testing::complete_manifest("2024-01-10", "cargo",
                                                 "aarch64-pc-windows-msvc"));
    auto profile = m.profile_packages("default").value();
    bool first = is_viable(m, profile, {}, tier1_targets());
    for (int i = 0; i < 3; ++i) {
        REQUIRE(is_viable(m, profile, {}, tier1_targets()) == first);
    }
}
