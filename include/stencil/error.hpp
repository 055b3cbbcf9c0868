#pragma once

#include <string>

namespace stencil {

struct StencilError {
    enum Code {
        IO,
        Parse,
        Configuration,
        SourceUnavailable,
        Integrity,
        TemplateNotFound,
        TemplateProcessing,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    StencilError() = default;
    StencilError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StencilError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Errors the template manager treats as "try the next registry entry"
    bool is_recoverable() const {
        return code == SourceUnavailable || code == TemplateNotFound;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace stencil
