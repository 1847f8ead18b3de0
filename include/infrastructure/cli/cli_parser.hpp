// EN: Command-line parser for cipctl - maps options onto configuration overrides
// FR: Analyseur de ligne de commande pour cipctl - associe les options à des surcharges de configuration

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace CIP {
namespace CLI {

// EN: CLI option types
// FR: Types des options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Boolean flag / FR: Drapeau booléen
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING          // EN: String value / FR: Valeur chaîne
};

// EN: CLI option value constraints
// FR: Contraintes de valeur d'option CLI
enum class CliOptionConstraint {
    NONE,           // EN: No constraints / FR: Aucune contrainte
    POSITIVE,       // EN: Must be positive (>0) / FR: Doit être positif (>0)
    NON_NEGATIVE,   // EN: Must be non-negative (>=0) / FR: Doit être non-négatif (>=0)
    RANGE,          // EN: Must be within specified range / FR: Doit être dans la plage spécifiée
    REGEX_MATCH,    // EN: Must match regex pattern / FR: Doit correspondre au motif regex
    ENUM_VALUES     // EN: Must be one of predefined values / FR: Doit être l'une des valeurs prédéfinies
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Unknown option provided / FR: Option inconnue fournie
    MISSING_VALUE,          // EN: Required value missing / FR: Valeur requise manquante
    INVALID_VALUE,          // EN: Invalid value format / FR: Format de valeur invalide
    CONSTRAINT_VIOLATION,   // EN: Value constraint violation / FR: Violation de contrainte de valeur
    MISSING_COMMAND         // EN: No command given / FR: Aucune commande fournie
};

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                         // EN: Long option name (--layout) / FR: Nom d'option long (--layout)
    std::optional<char> short_name;                // EN: Short option name (-l) / FR: Nom d'option court (-l)
    CliOptionType type = CliOptionType::STRING;
    std::string description;
    std::string config_path;                       // EN: Configuration path (e.g., "run.layout") / FR: Chemin de configuration
    std::optional<std::string> default_value;      // EN: Shown in help only / FR: Affichée dans l'aide uniquement
    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::optional<double> min_value;
    std::optional<double> max_value;
    std::optional<std::string> regex_pattern;
    std::set<std::string> enum_values;
    std::string category = "General";
};

// EN: Parsed CLI option value
// FR: Valeur d'option CLI analysée
struct CliOptionValue {
    std::string option_name;
    CliOptionType type = CliOptionType::STRING;
    std::string raw_value;
    ConfigValue config_value;
    std::string config_path;
};

// EN: CLI parsing result containing the command, its operands and the configuration overrides
// FR: Résultat d'analyse CLI contenant la commande, ses opérandes et les surcharges de configuration
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::string command;                          // EN: First positional argument / FR: Premier argument positionnel
    std::vector<std::string> operands;            // EN: Remaining positional arguments / FR: Arguments positionnels restants
    std::vector<CliOptionValue> parsed_options;
    std::vector<std::string> errors;
    std::map<std::string, ConfigValue> overrides; // EN: config path -> value / FR: chemin -> valeur

    std::string help_text;
    std::string version_text;

    bool ok() const { return status == CliParseStatus::SUCCESS; }
};

// EN: Option parser. Options may appear anywhere; "--" ends option processing.
// FR: Analyseur d'options. Les options peuvent apparaître partout ; "--" termine le traitement des options.
class CliParser {
public:
    explicit CliParser(const std::string& program_name = "cipctl");
    ~CliParser();

    CliParser(const CliParser&) = delete;
    CliParser& operator=(const CliParser&) = delete;

    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);

    // EN: Register the full cipctl option set
    // FR: Enregistre l'ensemble complet des options cipctl
    void addStandardOptions();

    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    std::string generateVersionText() const;
    void setVersionInfo(const std::string& version);

    // EN: Apply parsed overrides to a configuration manager; returns the number applied
    // FR: Applique les surcharges analysées à un gestionnaire de configuration ; retourne le nombre appliqué
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

    std::optional<CliOptionDefinition> getOptionDefinition(const std::string& name) const;
    bool hasOption(const std::string& name) const;

private:
    class CliParserImpl;
    std::unique_ptr<CliParserImpl> impl_;
};

// EN: Utility functions for option handling
// FR: Fonctions utilitaires pour la gestion des options
namespace CliUtils {
    std::string cliOptionTypeToString(CliOptionType type);
    std::string cliParseStatusToString(CliParseStatus status);

    ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type);
    bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                          std::string& error_message);

    std::string formatOptionHelp(const CliOptionDefinition& option);

    bool isShortOption(const std::string& arg);
    bool isLongOption(const std::string& arg);
    std::string extractOptionName(const std::string& arg);
} // namespace CliUtils

} // namespace CLI
} // namespace CIP
