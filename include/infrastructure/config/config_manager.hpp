#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace CIP {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    // EN: Get value as specific type (throws if type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    // EN: Check if value is valid (not empty).
    // FR: Vérifie si la valeur est valide (non vide).
    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

    // EN: Text the value was parsed from, or toString() for values built in code.
    //     "0042" parses to the int 42 but keeps "0042" here.
    // FR: Texte d'origine de la valeur, ou toString() pour les valeurs construites en code.
    //     "0042" devient l'int 42 mais garde "0042" ici.
    std::string rawText() const;

    // EN: Parse a scalar string into the narrowest matching type (bool, int, double, string).
    // FR: Analyse une chaîne scalaire vers le type le plus étroit (bool, int, double, string).
    static ConfigValue parseScalar(const std::string& text);

private:
    std::optional<ValueType> value_;
    std::optional<std::string> raw_text_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing, environment overrides and validation.
// FR: Gestionnaire de configuration principal avec parsing YAML, surcharges d'environnement et validation.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values.
    // FR: Structure de règle de validation pour les valeurs de configuration.
    struct ValidationRule {
        std::string key;  // "section.key"
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file (merged over current values).
    // FR: Charge la configuration depuis un fichier YAML (fusionnée sur les valeurs actuelles).
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string (merged over current values).
    // FR: Charge la configuration depuis une chaîne YAML (fusionnée sur les valeurs actuelles).
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply PREFIX_SECTION_KEY environment variables as overrides; returns count applied.
    // FR: Applique les variables PREFIX_SECTION_KEY comme surcharges ; retourne le nombre appliqué.
    size_t loadEnvironmentOverrides(const std::string& prefix = "CIP_");

    // EN: Add validation rules for configuration values.
    // FR: Ajoute des règles de validation pour les valeurs de configuration.
    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);

    // EN: Dotted-path accessors ("run.layout").
    // FR: Accesseurs par chemin pointé ("run.layout").
    ConfigValue getPath(const std::string& path) const;
    void setPath(const std::string& path, const ConfigValue& value);

    // EN: Reset all configuration data.
    // FR: Remet à zéro toutes les données de configuration.
    void reset();

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Merge a parsed YAML document into sections (caller holds the lock).
    // FR: Fusionne un document YAML analysé dans les sections (l'appelant détient le verrou).
    void mergeYamlDocument(const YAML::Node& yaml);

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} environment variables in configuration strings.
    // FR: Étend les variables d'environnement ${VAR} dans les chaînes de configuration.
    static std::string expandVariables(const std::string& value);

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    static std::pair<std::string, std::string> splitPath(const std::string& path);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

// EN: Template implementations.
// FR: Implémentations des templates.
template<typename T>
T ConfigValue::as() const {
    if (!value_) {
        throw std::runtime_error("ConfigValue is empty");
    }
    if (auto* v = std::get_if<T>(&*value_)) {
        return *v;
    }
    throw std::runtime_error("ConfigValue type mismatch");
}

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    if (auto* v = std::get_if<T>(&*value_)) {
        return *v;
    }
    return std::nullopt;
}

} // namespace CIP
