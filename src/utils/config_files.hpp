#pragma once

#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

namespace playrun::utils {

// Ordered ini document: sections and keys keep insertion order.
class IniDocument {
public:
    void Set(const std::string& section, const std::string& key, const std::string& value);
    std::string Get(const std::string& section, const std::string& key) const;
    bool HasSection(const std::string& section) const;
    std::string Render() const;

    static IniDocument Parse(const std::string& text);

private:
    struct Section {
        std::string name;
        std::vector<std::pair<std::string, std::string>> entries;
    };

    Section& FindOrAdd(const std::string& section);

    std::vector<Section> sections_;
};

// Renders a json object as a block-style YAML document (mappings, scalars and lists).
std::string RenderYaml(const nlohmann::json& document);

// Renders a json scalar the way ini values are written: strings raw, bools as True/False.
std::string ScalarToString(const nlohmann::json& value);

}  // namespace playrun::utils
