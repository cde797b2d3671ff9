#pragma once

#include <lastgood/result.hpp>
#include <lastgood/http.hpp>
#include <lastgood/manifest.hpp>
#include <optional>
#include <string>

namespace lastgood {

constexpr const char* DEFAULT_DIST_SERVER = "https://static.rust-lang.org/dist";

// URL layout of a Rust distribution server
class DistServer {
public:
    explicit DistServer(std::string base_url = DEFAULT_DIST_SERVER);

    const std::string& base_url() const { return base_url_; }

    // <base>/channel-rust-<channel>.toml
    std::string latest_url(const std::string& channel) const;

    // <base>/<YYYY-MM-DD>/channel-rust-<channel>.toml
    std::string dated_url(const Date& date, const std::string& channel) const;

private:
    std::string base_url_;
};

// Fetch and parse one manifest. 404 yields nullopt; any other failure
// (transport, unexpected status, malformed body) is an error.
Result<std::optional<Manifest>> fetch_manifest(HttpClient& client,
                                               const std::string& url);

} // namespace lastgood
