#include <lastgood/manifest.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace lastgood {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<Date> parse_manifest_date(const toml::node_view<const toml::node>& node) {
    if (auto s = node.value<std::string>()) {
        return Date::parse(*s);
    }
    if (auto d = node.value<toml::date>()) {
        return Date::parse(Date{d->year, d->month, d->day}.to_string());
    }
    if (!node) {
        return LastgoodError{LastgoodError::Manifest, "missing field 'date'"};
    }
    return LastgoodError{LastgoodError::Manifest,
        "field 'date' must be a string or a date"};
}

static Result<PackageTargets> parse_package(const std::string& name,
                                            const toml::node& node) {
    auto tbl = node.as_table();
    if (!tbl) {
        return LastgoodError{LastgoodError::Manifest,
            "package '" + name + "' must be a table"};
    }

    PackageTargets pkg;
    if (auto v = (*tbl)["version"].value<std::string>()) {
        pkg.version = *v;
    } else {
        return LastgoodError{LastgoodError::Manifest,
            "package '" + name + "' is missing a string 'version'"};
    }

    auto targets = (*tbl)["target"].as_table();
    if (!targets) {
        return LastgoodError{LastgoodError::Manifest,
            "package '" + name + "' is missing its 'target' table"};
    }

    for (const auto& [key, val] : *targets) {
        std::string triple(key.str());
        auto available = val.is_table()
            ? (*val.as_table())["available"].value<bool>()
            : std::optional<bool>{};
        if (!available) {
            return LastgoodError{LastgoodError::Manifest,
                "target '" + triple + "' of package '" + name +
                "' is missing a boolean 'available'"};
        }
        pkg.targets[triple] = PackageInfo{*available};
    }

    return Result<PackageTargets>::ok(std::move(pkg));
}

static Result<std::vector<std::string>> parse_profile(const std::string& name,
                                                      const toml::node& node) {
    auto arr = node.as_array();
    if (!arr) {
        return LastgoodError{LastgoodError::Manifest,
            "profile '" + name + "' must be an array"};
    }
    std::vector<std::string> members;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return LastgoodError{LastgoodError::Manifest,
                "profile '" + name + "' must only contain strings"};
        }
        members.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(members));
}

// ---------------------------------------------------------------------------
// Manifest::parse
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return LastgoodError{LastgoodError::Parse,
            std::string("TOML parse error: ") + std::string(e.description())};
    }
    const toml::table& root = doc;

    Manifest m;

    auto date = parse_manifest_date(root["date"]);
    LASTGOOD_TRY(date);
    m.date = date.value();

    // [pkg.<name>] sections
    auto pkgs = root["pkg"].as_table();
    if (!pkgs) {
        return LastgoodError{LastgoodError::Manifest, "missing table 'pkg'"};
    }
    for (const auto& [key, val] : *pkgs) {
        std::string name(key.str());
        auto pkg = parse_package(name, val);
        LASTGOOD_TRY(pkg);
        m.packages[name] = std::move(pkg).value();
    }

    // [profiles] section
    auto profiles = root["profiles"].as_table();
    if (!profiles) {
        return LastgoodError{LastgoodError::Manifest, "missing table 'profiles'"};
    }
    for (const auto& [key, val] : *profiles) {
        std::string name(key.str());
        auto members = parse_profile(name, val);
        LASTGOOD_TRY(members);
        m.profiles[name] = std::move(members).value();
    }

    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LastgoodError{LastgoodError::IO,
            "cannot open manifest: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str()).with_context("error reading manifest " + path);
}

Result<std::vector<std::string>> Manifest::profile_packages(
    const std::string& profile) const
{
    auto it = profiles.find(profile);
    if (it == profiles.end()) {
        return LastgoodError{LastgoodError::Config,
            "profile '" + profile + "' not found in manifest for " + date.to_string()};
    }
    return Result<std::vector<std::string>>::ok(it->second);
}

} // namespace lastgood
