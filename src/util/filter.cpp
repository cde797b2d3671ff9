#include <lastgood/filter.hpp>
#include <lastgood/log.hpp>

namespace lastgood {

bool is_viable(const Manifest& manifest,
               const std::vector<std::string>& profile_packages,
               const std::unordered_set<std::string>& ignored_packages,
               const std::vector<std::string>& targets) {
    for (const auto& name : profile_packages) {
        if (ignored_packages.count(name)) continue;

        auto pkg = manifest.packages.find(name);
        if (pkg == manifest.packages.end()) continue;

        for (const auto& target : targets) {
            auto info = pkg->second.targets.find(target);
            if (info == pkg->second.targets.end()) continue;
            if (!info->second.available) {
                log::debug("%s: %s unavailable for %s",
                           manifest.date.to_string().c_str(),
                           name.c_str(), target.c_str());
                return false;
            }
        }
    }
    return true;
}

} // namespace lastgood
