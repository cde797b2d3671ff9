#include <lastgood/fetcher.hpp>
#include <lastgood/log.hpp>

namespace lastgood {

DistServer::DistServer(std::string base_url)
    : base_url_(std::move(base_url))
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string DistServer::latest_url(const std::string& channel) const {
    return base_url_ + "/channel-rust-" + channel + ".toml";
}

std::string DistServer::dated_url(const Date& date,
                                  const std::string& channel) const {
    return base_url_ + "/" + date.to_string() + "/channel-rust-" + channel + ".toml";
}

Result<std::optional<Manifest>> fetch_manifest(HttpClient& client,
                                               const std::string& url) {
    using R = Result<std::optional<Manifest>>;

    log::debug("fetching %s", url.c_str());
    auto response = client.get(url);
    if (response.is_err()) {
        return std::move(response).error().context("error making request");
    }

    const auto& res = response.value();
    if (res.status == 404) {
        log::debug("not found: %s", url.c_str());
        return R::ok(std::nullopt);
    }
    if (res.status != 200) {
        return LastgoodError{LastgoodError::Network,
            "error getting manifest from " + url + ": HTTP " +
            std::to_string(res.status)};
    }

    auto manifest = Manifest::parse(res.body);
    if (manifest.is_err()) {
        return std::move(manifest).error().context(
            "error reading manifest from " + url);
    }
    return R::ok(std::move(manifest).value());
}

} // namespace lastgood
