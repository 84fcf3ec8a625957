#include "utils/config_files.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "utils/common.hpp"

namespace playrun::utils {
namespace {

bool NeedsYamlQuotes(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    static const std::vector<std::string> kReserved = {
        "true", "false", "yes", "no", "on", "off", "null", "~", "y", "n"
    };
    const auto lowered = ToLower(value);
    for (const auto& word : kReserved) {
        if (lowered == word) {
            return true;
        }
    }
    const bool numeric = std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
    });
    if (numeric) {
        return true;
    }
    if (std::string("!&*-?:,[]{}#|>@`\"'%").find(value.front()) != std::string::npos) {
        return true;
    }
    if (std::isspace(static_cast<unsigned char>(value.front())) ||
        std::isspace(static_cast<unsigned char>(value.back()))) {
        return true;
    }
    return value.find(": ") != std::string::npos || value.find(" #") != std::string::npos ||
           value.find('\n') != std::string::npos || value.back() == ':';
}

std::string YamlScalar(const nlohmann::json& value) {
    if (value.is_null()) {
        return "null";
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    const auto text = value.is_string() ? value.get<std::string>() : value.dump();
    if (!NeedsYamlQuotes(text)) {
        return text;
    }
    return "'" + ReplaceAll(text, "'", "''") + "'";
}

void EmitYaml(std::ostringstream& out, const nlohmann::json& node, int indent) {
    const std::string pad(static_cast<std::size_t>(indent), ' ');
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            const auto& child = it.value();
            out << pad << it.key() << ":";
            if ((child.is_object() || child.is_array()) && !child.empty()) {
                out << "\n";
                EmitYaml(out, child, indent + 2);
            } else if (child.is_object()) {
                out << " {}\n";
            } else if (child.is_array()) {
                out << " []\n";
            } else {
                out << " " << YamlScalar(child) << "\n";
            }
        }
        return;
    }
    if (node.is_array()) {
        for (const auto& item : node) {
            if (item.is_object() || item.is_array()) {
                out << pad << "-\n";
                EmitYaml(out, item, indent + 2);
            } else {
                out << pad << "- " << YamlScalar(item) << "\n";
            }
        }
        return;
    }
    out << pad << YamlScalar(node) << "\n";
}

}  // namespace

IniDocument::Section& IniDocument::FindOrAdd(const std::string& section) {
    for (auto& existing : sections_) {
        if (existing.name == section) {
            return existing;
        }
    }
    sections_.push_back(Section{section, {}});
    return sections_.back();
}

void IniDocument::Set(const std::string& section, const std::string& key, const std::string& value) {
    auto& target = FindOrAdd(section);
    for (auto& entry : target.entries) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    target.entries.emplace_back(key, value);
}

std::string IniDocument::Get(const std::string& section, const std::string& key) const {
    for (const auto& existing : sections_) {
        if (existing.name != section) {
            continue;
        }
        for (const auto& entry : existing.entries) {
            if (entry.first == key) {
                return entry.second;
            }
        }
    }
    return {};
}

bool IniDocument::HasSection(const std::string& section) const {
    for (const auto& existing : sections_) {
        if (existing.name == section) {
            return true;
        }
    }
    return false;
}

std::string IniDocument::Render() const {
    std::ostringstream out;
    for (const auto& section : sections_) {
        out << "[" << section.name << "]\n";
        for (const auto& [key, value] : section.entries) {
            out << key << " = " << value << "\n";
        }
        out << "\n";
    }
    return out.str();
}

IniDocument IniDocument::Parse(const std::string& text) {
    IniDocument doc;
    std::istringstream stream(text);
    std::string line;
    std::string current;
    while (std::getline(stream, line)) {
        const auto trimmed = Trim(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']') {
            current = trimmed.substr(1, trimmed.size() - 2);
            doc.FindOrAdd(current);
            continue;
        }
        const auto eq = trimmed.find('=');
        if (eq == std::string::npos || current.empty()) {
            continue;
        }
        doc.Set(current, Trim(trimmed.substr(0, eq)), Trim(trimmed.substr(eq + 1)));
    }
    return doc;
}

std::string RenderYaml(const nlohmann::json& document) {
    std::ostringstream out;
    EmitYaml(out, document, 0);
    return out.str();
}

std::string ScalarToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "True" : "False";
    }
    if (value.is_null()) {
        return "None";
    }
    return value.dump();
}

}  // namespace playrun::utils
