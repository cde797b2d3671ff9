#pragma once

#include <lastgood/result.hpp>
#include <lastgood/date.hpp>
#include <string>
#include <vector>
#include <unordered_map>

namespace lastgood {

// [pkg.<name>.target.<triple>] section
struct PackageInfo {
    bool available = false;
};

// [pkg.<name>] section
struct PackageTargets {
    std::string version;          // e.g. "1.75.0 (82e1608df 2023-12-21)"
    // Triples without an entry carry no availability information
    std::unordered_map<std::string, PackageInfo> targets;
};

// One day's channel-rust-<channel>.toml
struct Manifest {
    Date date;
    std::unordered_map<std::string, PackageTargets> packages;
    std::unordered_map<std::string, std::vector<std::string>> profiles;

    // Parse from TOML string
    static Result<Manifest> parse(const std::string& toml_str);

    // Parse from file path
    static Result<Manifest> load(const std::string& path);

    // Package list of a named profile; Config error if the profile is unknown
    Result<std::vector<std::string>> profile_packages(const std::string& profile) const;
};

} // namespace lastgood
