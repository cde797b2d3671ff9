#pragma once

#include <lastgood/result.hpp>
#include <lastgood/platform.hpp>
#include <lastgood/search.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lastgood {

// Upper bound on max-age from any configuration layer
constexpr int MAX_AGE_LIMIT = 100000;

enum class Profile { Complete, Default, Minimal };

const char* profile_name(Profile p);
Result<Profile> parse_profile(const std::string& s);

const char* target_selection_name(TargetSelection t);
Result<TargetSelection> parse_target_selection(const std::string& s);

// Fully resolved settings for one run
struct ResolverConfig {
    std::string channel = "stable";
    Profile profile = Profile::Default;
    int max_age = 90;
    TargetSelection targets = TargetSelection::All;
    bool force_date = false;
    std::string dist_server = DEFAULT_DIST_SERVER;
    long timeout_seconds = 0;
    std::vector<std::string> extra_ignored;

    // Search inputs for a build running on `host`
    SearchOptions search_options(const std::string& host) const;
};

// One configuration layer: defaults < config file < environment < flags.
// Unset fields defer to lower layers.
struct Config {
    std::optional<std::string> channel;
    std::optional<Profile> profile;
    std::optional<int> max_age;
    std::optional<TargetSelection> targets;
    std::optional<bool> force_date;
    std::optional<std::string> dist_server;
    std::optional<long> timeout_seconds;
    // [ignore] packages; accumulates across layers
    std::vector<std::string> ignored_packages;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // LASTGOOD_DIST_SERVER
    static Config from_env();

    // Merge another layer on top (other's set values override this)
    void merge(const Config& other);

    // Apply defaults and validate
    Result<ResolverConfig> resolve() const;
};

// Discover the global config file path: ~/.lastgood/config.toml
std::string global_config_path();

} // namespace lastgood
