#include <lastgood/config.hpp>
#include <lastgood/http.hpp>
#include <lastgood/log.hpp>
#include <lastgood/platform.hpp>
#include <lastgood/search.hpp>
#include <lastgood/toolchain_name.hpp>

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <filesystem>
#include <iostream>
#include <string>

using namespace lastgood;

namespace {

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

Result<Config> config_from_flags(const cxxopts::ParseResult& args) {
    Config cfg;
    if (args.count("channel")) {
        cfg.channel = args["channel"].as<std::string>();
    }
    if (args.count("profile")) {
        auto p = parse_profile(args["profile"].as<std::string>());
        LASTGOOD_TRY(p);
        cfg.profile = p.value();
    }
    if (args.count("max-age")) {
        cfg.max_age = args["max-age"].as<int>();
    }
    if (args.count("targets")) {
        auto t = parse_target_selection(args["targets"].as<std::string>());
        LASTGOOD_TRY(t);
        cfg.targets = t.value();
    }
    if (args.count("force-date")) {
        cfg.force_date = true;
    }
    return Result<Config>::ok(std::move(cfg));
}

// Layers, lowest first: config file, environment, flags
Result<ResolverConfig> load_config(const cxxopts::ParseResult& args) {
    Config cfg;

    if (args.count("config")) {
        auto file = Config::load(args["config"].as<std::string>());
        LASTGOOD_TRY(file);
        cfg.merge(file.value());
    } else {
        std::string path = global_config_path();
        std::error_code ec;
        if (!path.empty() && std::filesystem::exists(path, ec)) {
            log::debug("loading config from %s", path.c_str());
            auto file = Config::load(path);
            LASTGOOD_TRY(file);
            cfg.merge(file.value());
        }
    }

    cfg.merge(Config::from_env());

    auto flags = config_from_flags(args);
    LASTGOOD_TRY(flags);
    cfg.merge(flags.value());

    return cfg.resolve();
}

Result<std::string> run(const cxxopts::ParseResult& args) {
    auto config = load_config(args);
    LASTGOOD_TRY(config);
    const ResolverConfig& rc = config.value();

    SearchOptions options = rc.search_options(host_target());
    log::debug("channel %s, profile %s, max-age %d, targets %s (%zu), host %s",
               options.channel.c_str(), options.profile.c_str(),
               options.max_age, target_selection_name(rc.targets),
               options.targets.size(), host_target().c_str());

    CurlHttpClient client(rc.timeout_seconds);
    ManifestSearch search(client, DistServer(rc.dist_server));

    auto found = search.find_latest_viable(options);
    if (found.is_err()) return std::move(found).error();
    if (!found.value()) {
        return LastgoodError{LastgoodError::NotFound,
            "no viable " + rc.channel + " build found",
            "try a larger --max-age or --targets current"};
    }

    return Result<std::string>::ok(
        make_toolchain_name(*found.value(), rc.channel, rc.force_date));
}

int run_cli(const cxxopts::Options& options, const cxxopts::ParseResult& args) {
    if (args.count("help")) {
        std::cout << options.help() << "\n";
        return 0;
    }

    if (args.count("log-level")) {
        auto level = log::parse_level(args["log-level"].as<std::string>());
        if (level.is_err()) {
            std::cerr << level.error().format() << "\n";
            return 2;
        }
        log::set_level(level.value());
    } else if (args.count("verbose")) {
        log::set_level(log::Debug);
    }

    auto result = run(args);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }

    std::cout << result.value() << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CurlGlobalInitializer curl_initializer;
    cxxopts::Options options("lastgood",
        "Determines the last known complete build of a Rust toolchain.");

    options.add_options()
        ("c,channel", "Release channel to use (default: stable)",
            cxxopts::value<std::string>())
        ("p,profile", "Package profile: complete, default or minimal (default: default)",
            cxxopts::value<std::string>())
        ("a,max-age", "Number of days back to search for viable builds, relative "
                      "to the latest release of the channel (default: 90)",
            cxxopts::value<int>())
        ("t,targets", "Targets to filter by: all Tier-1 targets or only the "
                      "current target (default: all)",
            cxxopts::value<std::string>())
        ("d,force-date", "Use date-stamped toolchains like stable-2019-04-25 "
                         "instead of version numbers for stable releases")
        ("config", "Config file (default: ~/.lastgood/config.toml)",
            cxxopts::value<std::string>())
        ("v,verbose", "Log each manifest fetched and rejected")
        ("log-level", "Log level: trace, debug, info, warn or error (default: warn)",
            cxxopts::value<std::string>())
        ("h,help", "Print help");

    try {
        auto args = options.parse(argc, argv);
        return run_cli(options, args);
    } catch (const cxxopts::exceptions::exception& e) {
        LastgoodError err{LastgoodError::InvalidArg, e.what(), "see lastgood --help"};
        std::cerr << err.format() << "\n";
        return 2;
    }
}
