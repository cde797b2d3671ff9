#pragma once

#include <lastgood/manifest.hpp>
#include <optional>
#include <string>

namespace lastgood {

// Leading MAJOR.MINOR.PATCH of the "rust" package's version string,
// e.g. "1.75.0" from "1.75.0 (82e1608df 2023-12-21)".
std::optional<std::string> rust_version(const Manifest& manifest);

// Version number for stable releases unless force_date is set,
// otherwise "<channel>-<YYYY-MM-DD>".
std::string make_toolchain_name(const Manifest& manifest,
                                const std::string& channel,
                                bool force_date);

} // namespace lastgood
