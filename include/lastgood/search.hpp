#pragma once

#include <lastgood/result.hpp>
#include <lastgood/fetcher.hpp>
#include <lastgood/http.hpp>
#include <lastgood/manifest.hpp>

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace lastgood {

struct SearchOptions {
    std::string channel = "stable";
    std::string profile = "default";
    int max_age = 90;                               // days, anchor included
    std::unordered_set<std::string> ignored_packages;
    std::vector<std::string> targets;
};

// Walks a channel's manifests backwards from its latest published date.
class ManifestSearch {
public:
    ManifestSearch(HttpClient& client, DistServer server = DistServer());

    // Newest viable manifest within max_age days of the latest one, or
    // nullopt if none qualifies. Requests are issued one at a time and stop
    // at the first viable manifest.
    Result<std::optional<Manifest>> find_latest_viable(const SearchOptions& options);

private:
    HttpClient& client_;
    DistServer server_;

    Result<bool> check(const Manifest& manifest, const SearchOptions& options) const;
};

} // namespace lastgood
