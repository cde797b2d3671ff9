#pragma once

#include <string>
#include <vector>

namespace lastgood {

struct LastgoodError {
    enum Code {
        IO,
        Parse,
        Config,
        Manifest,
        Network,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    // Underlying causes, outermost first
    std::vector<std::string> causes;

    LastgoodError() = default;
    LastgoodError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    LastgoodError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Wrap this error in a higher-level message; the current message
    // becomes the first cause.
    LastgoodError& context(std::string msg);

    // Append a lower-level cause (e.g. a library's what() string)
    LastgoodError& caused_by(std::string cause);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace lastgood
