#pragma once

#include <set>
#include <string>

#include "nlohmann/json.hpp"

namespace playrun::credentials {

struct RenderResult {
    std::string text;
    // Root variable names the template read.
    std::set<std::string> referenced;
};

// Renders "{{ expr }}" placeholders against a json object context.
// expr := primary ("." name | "." method "()")* ("|" filter)*
// Undefined names, unknown attributes and non-whitelisted calls throw TemplateError.
RenderResult RenderTemplate(const std::string& source, const nlohmann::json& context);

}  // namespace playrun::credentials
