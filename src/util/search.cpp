#include <lastgood/search.hpp>
#include <lastgood/filter.hpp>
#include <lastgood/log.hpp>

namespace lastgood {

ManifestSearch::ManifestSearch(HttpClient& client, DistServer server)
    : client_(client), server_(std::move(server)) {}

Result<bool> ManifestSearch::check(const Manifest& manifest,
                                   const SearchOptions& options) const {
    auto packages = manifest.profile_packages(options.profile);
    LASTGOOD_TRY(packages);
    return Result<bool>::ok(is_viable(manifest, packages.value(),
                                      options.ignored_packages,
                                      options.targets));
}

Result<std::optional<Manifest>> ManifestSearch::find_latest_viable(
    const SearchOptions& options)
{
    using R = Result<std::optional<Manifest>>;

    auto latest = fetch_manifest(client_, server_.latest_url(options.channel));
    if (latest.is_err()) return std::move(latest).error();
    if (!latest.value()) {
        return LastgoodError{LastgoodError::NotFound,
            "no manifest found for release channel " + options.channel};
    }

    Manifest anchor = std::move(*latest.value());
    const Date start = anchor.date;
    log::info("latest %s manifest is from %s",
              options.channel.c_str(), start.to_string().c_str());

    auto viable = check(anchor, options);
    LASTGOOD_TRY(viable);
    if (viable.value()) {
        return R::ok(std::move(anchor));
    }

    for (int day = 1; day < options.max_age; ++day) {
        Date date = start.minus_days(day);
        auto fetched = fetch_manifest(client_, server_.dated_url(date, options.channel));
        if (fetched.is_err()) return std::move(fetched).error();
        if (!fetched.value()) {
            log::debug("no %s manifest published on %s",
                       options.channel.c_str(), date.to_string().c_str());
            continue;
        }

        auto ok = check(*fetched.value(), options);
        LASTGOOD_TRY(ok);
        if (ok.value()) {
            return R::ok(std::move(fetched).value());
        }
        log::debug("%s manifest for %s is incomplete",
                   options.channel.c_str(), date.to_string().c_str());
    }

    log::info("no viable %s manifest within %d days of %s",
              options.channel.c_str(), options.max_age,
              start.to_string().c_str());
    return R::ok(std::nullopt);
}

} // namespace lastgood
