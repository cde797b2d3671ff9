#pragma once

#include <lastgood/manifest.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace lastgood {

// A manifest is viable when every non-ignored profile package is available
// on every listed target for which the manifest has an entry. Pairs without
// an entry are skipped, so a manifest with no matching entries is viable.
bool is_viable(const Manifest& manifest,
               const std::vector<std::string>& profile_packages,
               const std::unordered_set<std::string>& ignored_packages,
               const std::vector<std::string>& targets);

} // namespace lastgood
