#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace lastgood {

enum class TargetSelection {
    All,      // every Tier-1 target
    Current,  // only the target lastgood was built for
};

// Rust Tier-1 target triples
const std::vector<std::string>& tier1_targets();

// Target triple of this build
const std::string& host_target();

// Packages excluded from the availability check. Packages that only ship
// for a few platforms are ignored unless the selection is Current and the
// host is one of those platforms.
std::unordered_set<std::string> ignored_packages(TargetSelection selection,
                                                 const std::string& host);

std::vector<std::string> selected_targets(TargetSelection selection,
                                          const std::string& host);

} // namespace lastgood
