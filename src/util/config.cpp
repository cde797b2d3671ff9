#include <lastgood/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace lastgood {

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::Complete: return "complete";
        case Profile::Default:  return "default";
        case Profile::Minimal:  return "minimal";
    }
    return "default";
}

Result<Profile> parse_profile(const std::string& s) {
    for (Profile p : {Profile::Complete, Profile::Default, Profile::Minimal}) {
        if (s == profile_name(p)) return Result<Profile>::ok(p);
    }
    return LastgoodError{LastgoodError::Config,
        "invalid profile '" + s + "'",
        "expected one of: complete, default, minimal"};
}

const char* target_selection_name(TargetSelection t) {
    return t == TargetSelection::All ? "all" : "current";
}

Result<TargetSelection> parse_target_selection(const std::string& s) {
    if (s == "all") return Result<TargetSelection>::ok(TargetSelection::All);
    if (s == "current") return Result<TargetSelection>::ok(TargetSelection::Current);
    return LastgoodError{LastgoodError::Config,
        "invalid target selection '" + s + "'",
        "expected one of: all, current"};
}

SearchOptions ResolverConfig::search_options(const std::string& host) const {
    SearchOptions opts;
    opts.channel = channel;
    opts.profile = profile_name(profile);
    opts.max_age = max_age;
    opts.ignored_packages = lastgood::ignored_packages(targets, host);
    opts.ignored_packages.insert(extra_ignored.begin(), extra_ignored.end());
    opts.targets = lastgood::selected_targets(targets, host);
    return opts;
}

// ---------------------------------------------------------------------------
// Config file
// ---------------------------------------------------------------------------

static LastgoodError type_error(const char* key, const char* expected) {
    return LastgoodError{LastgoodError::Config,
        std::string("config key '") + key + "' must be " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return LastgoodError{LastgoodError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }
    const toml::table& root = doc;

    Config cfg;

    if (auto node = root["channel"]) {
        auto v = node.value<std::string>();
        if (!v || v->empty()) return type_error("channel", "a non-empty string");
        cfg.channel = *v;
    }

    if (auto node = root["profile"]) {
        auto v = node.value<std::string>();
        if (!v) return type_error("profile", "a string");
        auto p = parse_profile(*v);
        LASTGOOD_TRY(p);
        cfg.profile = p.value();
    }

    if (auto node = root["max-age"]) {
        auto v = node.value<int64_t>();
        if (!v || *v <= 0 || *v > MAX_AGE_LIMIT) return type_error("max-age", "a positive integer");
        cfg.max_age = static_cast<int>(*v);
    }

    if (auto node = root["targets"]) {
        auto v = node.value<std::string>();
        if (!v) return type_error("targets", "a string");
        auto t = parse_target_selection(*v);
        LASTGOOD_TRY(t);
        cfg.targets = t.value();
    }

    if (auto node = root["force-date"]) {
        auto v = node.value_exact<bool>();
        if (!v) return type_error("force-date", "a boolean");
        cfg.force_date = *v;
    }

    if (auto node = root["dist-server"]) {
        auto v = node.value<std::string>();
        if (!v || v->empty()) return type_error("dist-server", "a non-empty string");
        cfg.dist_server = *v;
    }

    if (auto node = root["timeout"]) {
        auto v = node.value<int64_t>();
        if (!v || *v < 0) return type_error("timeout", "a non-negative integer");
        cfg.timeout_seconds = static_cast<long>(*v);
    }

    // [ignore] section
    if (auto ignore = root["ignore"].as_table()) {
        if (auto arr = (*ignore)["packages"].as_array()) {
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) return type_error("ignore.packages", "an array of strings");
                cfg.ignored_packages.push_back(*s);
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LastgoodError{LastgoodError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).with_context("error reading config file " + path);
}

Config Config::from_env() {
    Config cfg;
    const char* server = std::getenv("LASTGOOD_DIST_SERVER");
    if (server && *server) cfg.dist_server = std::string(server);
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.channel) channel = other.channel;
    if (other.profile) profile = other.profile;
    if (other.max_age) max_age = other.max_age;
    if (other.targets) targets = other.targets;
    if (other.force_date) force_date = other.force_date;
    if (other.dist_server) dist_server = other.dist_server;
    if (other.timeout_seconds) timeout_seconds = other.timeout_seconds;
    ignored_packages.insert(ignored_packages.end(),
                            other.ignored_packages.begin(),
                            other.ignored_packages.end());
}

Result<ResolverConfig> Config::resolve() const {
    ResolverConfig rc;
    if (channel) rc.channel = *channel;
    if (profile) rc.profile = *profile;
    if (max_age) rc.max_age = *max_age;
    if (targets) rc.targets = *targets;
    if (force_date) rc.force_date = *force_date;
    if (dist_server) rc.dist_server = *dist_server;
    if (timeout_seconds) rc.timeout_seconds = *timeout_seconds;
    rc.extra_ignored = ignored_packages;

    if (rc.channel.empty()) {
        return LastgoodError{LastgoodError::InvalidArg,
            "release channel must not be empty"};
    }
    if (rc.max_age <= 0) {
        return LastgoodError{LastgoodError::InvalidArg,
            "max-age must be a positive number of days, got " +
            std::to_string(rc.max_age)};
    }
    if (rc.max_age > MAX_AGE_LIMIT) {
        return LastgoodError{LastgoodError::InvalidArg,
            "max-age must be at most " + std::to_string(MAX_AGE_LIMIT) +
            " days, got " + std::to_string(rc.max_age)};
    }
    if (rc.timeout_seconds < 0) {
        return LastgoodError{LastgoodError::InvalidArg,
            "timeout must not be negative"};
    }
    return Result<ResolverConfig>::ok(std::move(rc));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.lastgood/config.toml";
}

} // namespace lastgood
