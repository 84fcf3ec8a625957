#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace playrun {

// Custom injector template failed to parse or evaluate.
struct TemplateError : public std::runtime_error {
    explicit TemplateError(const std::string& msg) : std::runtime_error(msg) {}
};

// Credential could not be turned into env, files or arguments.
struct InjectorError : public std::runtime_error {
    explicit InjectorError(const std::string& msg) : std::runtime_error(msg) {}
};

struct OsError : public std::runtime_error {
    OsError(int error_number, std::string strerror_text, const std::string& context)
        : std::runtime_error(context + ": [Errno " + std::to_string(error_number) + "] " + strerror_text),
          error_number(error_number),
          strerror_text(std::move(strerror_text)) {}

    int error_number;
    std::string strerror_text;
};

struct SpawnError : public std::runtime_error {
    explicit SpawnError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace playrun
