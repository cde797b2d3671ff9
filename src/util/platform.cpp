#include <lastgood/platform.hpp>

namespace lastgood {

#if defined(LASTGOOD_HOST_TARGET)
#  define LASTGOOD_DETECTED_TARGET LASTGOOD_HOST_TARGET
#elif defined(__APPLE__) && defined(__aarch64__)
#  define LASTGOOD_DETECTED_TARGET "aarch64-apple-darwin"
#elif defined(__APPLE__) && defined(__x86_64__)
#  define LASTGOOD_DETECTED_TARGET "x86_64-apple-darwin"
#elif defined(_WIN32) && defined(__MINGW32__) && defined(__x86_64__)
#  define LASTGOOD_DETECTED_TARGET "x86_64-pc-windows-gnu"
#elif defined(_WIN32) && defined(__MINGW32__)
#  define LASTGOOD_DETECTED_TARGET "i686-pc-windows-gnu"
#elif defined(_WIN32) && defined(_M_ARM64)
#  define LASTGOOD_DETECTED_TARGET "aarch64-pc-windows-msvc"
#elif defined(_WIN32) && defined(_M_X64)
#  define LASTGOOD_DETECTED_TARGET "x86_64-pc-windows-msvc"
#elif defined(_WIN32)
#  define LASTGOOD_DETECTED_TARGET "i686-pc-windows-msvc"
#elif defined(__linux__) && defined(__aarch64__)
#  define LASTGOOD_DETECTED_TARGET "aarch64-unknown-linux-gnu"
#elif defined(__linux__) && defined(__x86_64__)
#  define LASTGOOD_DETECTED_TARGET "x86_64-unknown-linux-gnu"
#elif defined(__linux__) && defined(__i386__)
#  define LASTGOOD_DETECTED_TARGET "i686-unknown-linux-gnu"
#else
#  error "unknown host target; configure with -DLASTGOOD_HOST_TARGET=<triple>"
#endif

const std::vector<std::string>& tier1_targets() {
    static const std::vector<std::string> targets = {
        "aarch64-apple-darwin",
        "aarch64-pc-windows-msvc",
        "aarch64-unknown-linux-gnu",
        "i686-pc-windows-msvc",
        "i686-unknown-linux-gnu",
        "x86_64-pc-windows-gnu",
        "x86_64-pc-windows-msvc",
        "x86_64-unknown-linux-gnu",
    };
    return targets;
}

const std::string& host_target() {
    static const std::string host = LASTGOOD_DETECTED_TARGET;
    return host;
}

std::unordered_set<std::string> ignored_packages(TargetSelection selection,
                                                 const std::string& host) {
    std::unordered_set<std::string> ignored = {"lldb-preview", "rust-mingw"};
    if (selection != TargetSelection::Current) return ignored;

    if (host == "i686-apple-darwin" || host == "x86_64-apple-darwin") {
        ignored.erase("lldb-preview");
    } else if (host == "i686-pc-windows-gnu" || host == "x86_64-pc-windows-gnu") {
        ignored.erase("rust-mingw");
    }
    return ignored;
}

std::vector<std::string> selected_targets(TargetSelection selection,
                                          const std::string& host) {
    if (selection == TargetSelection::All) return tier1_targets();
    return {host};
}

} // namespace lastgood
