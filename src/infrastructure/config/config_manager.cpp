// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, overrides and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing YAML, les surcharges et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

extern char** environ;

namespace CIP {

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
        return "<unknown>";
    }, *value_);
}

std::string ConfigValue::rawText() const {
    return raw_text_ ? *raw_text_ : toString();
}

ConfigValue ConfigValue::parseScalar(const std::string& text) {
    if (text == "true" || text == "false") {
        ConfigValue value(text == "true");
        value.raw_text_ = text;
        return value;
    }

    if (!text.empty() && text.find_first_not_of("-0123456789") == std::string::npos &&
        text.find('-', 1) == std::string::npos) {
        try {
            size_t consumed = 0;
            int int_val = std::stoi(text, &consumed);
            if (consumed == text.size()) {
                ConfigValue value(int_val);
                value.raw_text_ = text;
                return value;
            }
        } catch (const std::exception&) {
            // EN: Out of range, keep as string. FR: Hors limites, garde en chaîne.
        }
    }

    if (!text.empty() && text.find_first_not_of("-0123456789.eE+") == std::string::npos) {
        try {
            size_t consumed = 0;
            double double_val = std::stod(text, &consumed);
            if (consumed == text.size()) {
                ConfigValue value(double_val);
                value.raw_text_ = text;
                return value;
            }
        } catch (const std::exception&) {
            // EN: Not a number. FR: Pas un nombre.
        }
    }

    return ConfigValue(text);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        mergeYamlDocument(yaml);

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        mergeYamlDocument(yaml);

        LOG_DEBUG("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::mergeYamlDocument(const YAML::Node& yaml) {
    if (!yaml.IsDefined() || yaml.IsNull()) {
        return;
    }
    if (!yaml.IsMap()) {
        throw std::runtime_error("configuration root must be a mapping");
    }

    // EN: Process YAML nodes and convert to ConfigSections.
    // FR: Traite les nœuds YAML et les convertit en ConfigSections.
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection& config_section = sections_[section_name];

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                std::string key = item.first.as<std::string>();
                config_section.set(key, parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }
    }
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsScalar()) {
        // EN: Quoted scalars stay strings ("2013" is a layout, not a number).
        // FR: Les scalaires entre guillemets restent des chaînes.
        if (node.Tag() == "!") {
            return ConfigValue(expandVariables(node.as<std::string>()));
        }
        ConfigValue value = ConfigValue::parseScalar(node.as<std::string>());
        if (auto str = value.tryAs<std::string>()) {
            return ConfigValue(expandVariables(*str));
        }
        return value;
    } else if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    } else if (node.IsNull()) {
        return ConfigValue(std::string());
    }

    throw std::runtime_error("nested mappings are not supported in configuration values");
}

// EN: CIP_RUN_LAYOUT=2020 overrides run.layout; the first underscore after the prefix splits section from key.
// FR: CIP_RUN_LAYOUT=2020 surcharge run.layout ; le premier underscore après le préfixe sépare section et clé.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t applied = 0;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        if (entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string name = entry.substr(prefix.size(), eq - prefix.size());
        std::string value = entry.substr(eq + 1);
        auto sep = name.find('_');
        if (sep == std::string::npos || sep == 0 || sep + 1 >= name.size()) {
            continue;
        }

        std::string section = name.substr(0, sep);
        std::string key = name.substr(sep + 1);
        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        section = lower(section);
        key = lower(key);

        sections_[section].set(key, ConfigValue::parseScalar(value));
        ++applied;
        LOG_DEBUG("config", "Environment override applied: " + section + "." + key);
    }

    if (applied > 0) {
        LOG_INFO("config", "Applied " + std::to_string(applied) + " environment overrides with prefix " + prefix);
    }
    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
    LOG_DEBUG("config", "Added " + std::to_string(rules.size()) + " validation rules");
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    errors.clear();

    std::vector<ValidationRule> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules = validation_rules_;
    }

    for (const auto& rule : rules) {
        ConfigValue value = getPath(rule.key);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& key) const {
    return get("default", key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }

    return ConfigValue();
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    set("default", key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

std::pair<std::string, std::string> ConfigManager::splitPath(const std::string& path) {
    size_t dot_pos = path.find('.');
    if (dot_pos == std::string::npos) {
        return {"default", path};
    }
    return {path.substr(0, dot_pos), path.substr(dot_pos + 1)};
}

ConfigValue ConfigManager::getPath(const std::string& path) const {
    auto [section, key] = splitPath(path);
    return get(section, key);
}

void ConfigManager::setPath(const std::string& path, const ConfigValue& value) {
    auto [section, key] = splitPath(path);
    set(section, key, value);
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // Type validation
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + ConfigValue(*rule.min_value).toString();
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + ConfigValue(*rule.max_value).toString();
            return false;
        }
    }

    // Allowed values validation
    if (!rule.allowed_values.empty()) {
        std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) {
    static const std::regex var_regex(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");

    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(value, last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        // EN: Leave unknown variables as-is. FR: Laisse les variables inconnues telles quelles.
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result.append(value, last, std::string::npos);
    return result;
}

} // namespace CIP
