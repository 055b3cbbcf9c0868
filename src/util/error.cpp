#include <stencil/error.hpp>

namespace stencil {

const char* StencilError::code_name(Code c) {
    switch (c) {
        case IO:                 return "IO";
        case Parse:              return "Parse";
        case Configuration:      return "Configuration";
        case SourceUnavailable:  return "SourceUnavailable";
        case Integrity:          return "IntegrityError";
        case TemplateNotFound:   return "TemplateNotFound";
        case TemplateProcessing: return "TemplateProcessing";
        case InvalidArg:         return "InvalidArg";
    }
    return "Unknown";
}

std::string StencilError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace stencil
