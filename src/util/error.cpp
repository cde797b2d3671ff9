#include <lastgood/error.hpp>

namespace lastgood {

const char* LastgoodError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Manifest:   return "Manifest";
        case Network:    return "Network";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

LastgoodError& LastgoodError::context(std::string msg) {
    causes.insert(causes.begin(), std::move(message));
    message = std::move(msg);
    return *this;
}

LastgoodError& LastgoodError::caused_by(std::string cause) {
    causes.push_back(std::move(cause));
    return *this;
}

std::string LastgoodError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    for (const auto& cause : causes) {
        result += "\n\tcaused by: ";
        result += cause;
    }

    return result;
}

} // namespace lastgood
