#include <lastgood/toolchain_name.hpp>
#include <cctype>

namespace lastgood {

// Consume one or more ASCII digits starting at pos
static bool skip_digits(const std::string& s, size_t& pos) {
    size_t start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return pos > start;
}

std::optional<std::string> rust_version(const Manifest& manifest) {
    auto it = manifest.packages.find("rust");
    if (it == manifest.packages.end()) return std::nullopt;

    const std::string& v = it->second.version;
    size_t pos = 0;
    for (int component = 0; component < 3; ++component) {
        if (component > 0) {
            if (pos >= v.size() || v[pos] != '.') return std::nullopt;
            ++pos;
        }
        if (!skip_digits(v, pos)) return std::nullopt;
    }
    return v.substr(0, pos);
}

std::string make_toolchain_name(const Manifest& manifest,
                                const std::string& channel,
                                bool force_date) {
    if (!force_date && channel == "stable") {
        if (auto version = rust_version(manifest)) {
            return *version;
        }
    }
    return channel + "-" + manifest.date.to_string();
}

} // namespace lastgood
