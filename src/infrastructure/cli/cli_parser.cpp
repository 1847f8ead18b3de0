// EN: Command-line parser implementation for cipctl
// FR: Implémentation de l'analyseur de ligne de commande pour cipctl

#include "infrastructure/cli/cli_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace CIP {
namespace CLI {

namespace {

CliOptionDefinition makeOption(const std::string& long_name, CliOptionType type,
                               const std::string& config_path, const std::string& description,
                               const std::string& category) {
    CliOptionDefinition def;
    def.long_name = long_name;
    def.type = type;
    def.config_path = config_path;
    def.description = description;
    def.category = category;
    return def;
}

CliOptionDefinition makeEnumOption(const std::string& long_name, const std::string& config_path,
                                   const std::string& description, const std::set<std::string>& values,
                                   const std::string& default_value, const std::string& category) {
    CliOptionDefinition def = makeOption(long_name, CliOptionType::STRING, config_path, description, category);
    def.constraint = CliOptionConstraint::ENUM_VALUES;
    def.enum_values = values;
    if (!default_value.empty()) {
        def.default_value = default_value;
    }
    return def;
}

} // namespace

// EN: CliParser implementation using PIMPL pattern
// FR: Implémentation CliParser utilisant le motif PIMPL
class CliParser::CliParserImpl {
public:
    explicit CliParserImpl(const std::string& program_name)
        : program_name_(program_name), version_("1.0.0") {
    }

    void addOption(const CliOptionDefinition& option_def) {
        if (option_def.long_name.empty()) {
            throw std::invalid_argument("Option long name cannot be empty");
        }
        if (options_by_long_name_.count(option_def.long_name) > 0) {
            throw std::invalid_argument("Option with long name '" + option_def.long_name + "' already exists");
        }
        if (option_def.short_name && options_by_short_name_.count(*option_def.short_name) > 0) {
            throw std::invalid_argument("Option with short name '-" + std::string(1, *option_def.short_name) +
                                        "' already exists");
        }

        options_by_long_name_[option_def.long_name] = option_definitions_.size();
        if (option_def.short_name) {
            options_by_short_name_[*option_def.short_name] = option_definitions_.size();
        }
        option_definitions_.push_back(option_def);
    }

    const CliOptionDefinition* findOption(const std::string& arg, const std::string& name) const {
        if (CliUtils::isLongOption(arg)) {
            auto it = options_by_long_name_.find(name);
            return it != options_by_long_name_.end() ? &option_definitions_[it->second] : nullptr;
        }
        if (name.size() == 1) {
            auto it = options_by_short_name_.find(name[0]);
            return it != options_by_short_name_.end() ? &option_definitions_[it->second] : nullptr;
        }
        return nullptr;
    }

    // EN: Main parsing implementation
    // FR: Implémentation d'analyse principale
    CliParseResult parse(const std::vector<std::string>& arguments) const {
        CliParseResult result;
        bool options_done = false;

        for (size_t i = 0; i < arguments.size(); ++i) {
            const std::string& arg = arguments[i];
            if (arg.empty()) {
                continue;
            }

            if (!options_done && arg == "--") {
                options_done = true;
                continue;
            }

            if (!options_done && (arg == "--help" || arg == "-h")) {
                result.status = CliParseStatus::HELP_REQUESTED;
                result.help_text = generateHelpText();
                return result;
            }

            if (!options_done && (arg == "--version" || arg == "-V")) {
                result.status = CliParseStatus::VERSION_REQUESTED;
                result.version_text = generateVersionText();
                return result;
            }

            if (options_done || !(CliUtils::isLongOption(arg) || CliUtils::isShortOption(arg))) {
                if (result.command.empty()) {
                    result.command = arg;
                } else {
                    result.operands.push_back(arg);
                }
                continue;
            }

            // EN: Split "--name=value" forms.
            // FR: Sépare les formes "--nom=valeur".
            std::string option_arg = arg;
            std::optional<std::string> inline_value;
            auto eq = arg.find('=');
            if (CliUtils::isLongOption(arg) && eq != std::string::npos) {
                option_arg = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }

            std::string name = CliUtils::extractOptionName(option_arg);
            const CliOptionDefinition* def = findOption(option_arg, name);
            if (!def) {
                fail(result, CliParseStatus::INVALID_OPTION, "Unknown option: " + option_arg);
                continue;
            }

            std::string raw_value;
            if (def->type == CliOptionType::BOOLEAN) {
                raw_value = inline_value ? *inline_value : "true";
            } else if (inline_value) {
                raw_value = *inline_value;
            } else if (i + 1 < arguments.size()) {
                raw_value = arguments[++i];
            } else {
                fail(result, CliParseStatus::MISSING_VALUE, "Option " + option_arg + " requires a value");
                continue;
            }

            std::string error;
            if (!checkType(raw_value, def->type, error)) {
                fail(result, CliParseStatus::INVALID_VALUE, "Invalid value for option " + option_arg + ": " + error);
                continue;
            }
            if (!CliUtils::validateCliValue(raw_value, *def, error)) {
                fail(result, CliParseStatus::CONSTRAINT_VIOLATION,
                     "Invalid value for option " + option_arg + ": " + error);
                continue;
            }

            CliOptionValue value;
            value.option_name = def->long_name;
            value.type = def->type;
            value.raw_value = raw_value;
            value.config_value = CliUtils::parseCliValue(raw_value, def->type);
            value.config_path = def->config_path;

            result.overrides[value.config_path] = value.config_value;
            result.parsed_options.push_back(std::move(value));
        }

        if (result.status == CliParseStatus::SUCCESS && result.command.empty()) {
            fail(result, CliParseStatus::MISSING_COMMAND, "No command given");
        }

        return result;
    }

    std::string generateHelpText() const {
        std::ostringstream help;

        help << "CI-Pipeline controller\n\n";
        help << "Usage: " << program_name_ << " COMMAND [OPTIONS]\n\n";
        help << "Commands:\n";
        help << "  run                           Execute the pipeline; exit code is the aggregate result\n";
        help << "  plan                          Print the dispatch plan as JSON without executing\n";
        help << "  aggregate STAGE=STATUS...     Reduce stage statuses and exit 0 or 1\n";
        help << "  artifacts list|prune          Inspect or prune stored artifacts\n\n";

        // EN: Group options by category, keeping registration order inside a category
        // FR: Groupe les options par catégorie, en gardant l'ordre d'enregistrement
        std::vector<std::string> categories;
        std::map<std::string, std::vector<const CliOptionDefinition*>> by_category;
        for (const auto& opt : option_definitions_) {
            if (by_category.find(opt.category) == by_category.end()) {
                categories.push_back(opt.category);
            }
            by_category[opt.category].push_back(&opt);
        }

        for (const auto& category : categories) {
            help << category << " Options:\n";
            for (const auto* opt : by_category[category]) {
                help << CliUtils::formatOptionHelp(*opt) << "\n";
            }
            help << "\n";
        }

        help << "Exit codes: 0 success, 1 pipeline failure, 2 usage or configuration error\n";
        return help.str();
    }

    std::string generateVersionText() const {
        return program_name_ + " " + version_ + "\n";
    }

    std::vector<CliOptionDefinition> option_definitions_;
    std::unordered_map<std::string, size_t> options_by_long_name_;
    std::unordered_map<char, size_t> options_by_short_name_;
    std::string program_name_;
    std::string version_;

private:
    static void fail(CliParseResult& result, CliParseStatus status, const std::string& message) {
        result.errors.push_back(message);
        // EN: Keep the first failure as the overall status.
        // FR: Garde le premier échec comme statut global.
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
    }

    static bool checkType(const std::string& raw_value, CliOptionType type, std::string& error) {
        switch (type) {
            case CliOptionType::BOOLEAN:
                if (raw_value != "true" && raw_value != "false") {
                    error = "expected true or false";
                    return false;
                }
                return true;
            case CliOptionType::INTEGER: {
                try {
                    size_t consumed = 0;
                    std::stoi(raw_value, &consumed);
                    if (consumed != raw_value.size()) {
                        error = "expected an integer";
                        return false;
                    }
                } catch (const std::exception&) {
                    error = "expected an integer";
                    return false;
                }
                return true;
            }
            case CliOptionType::STRING:
                return true;
        }
        return true;
    }
};

CliParser::CliParser(const std::string& program_name)
    : impl_(std::make_unique<CliParserImpl>(program_name)) {
}

CliParser::~CliParser() = default;

void CliParser::addOption(const CliOptionDefinition& option_def) {
    impl_->addOption(option_def);
}

void CliParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& def : option_defs) {
        impl_->addOption(def);
    }
}

// EN: The option set of cipctl; each option overrides one configuration path.
// FR: L'ensemble d'options de cipctl ; chaque option surcharge un chemin de configuration.
void CliParser::addStandardOptions() {
    const std::string run = "Run";
    const std::string paths = "Path";
    const std::string engine = "Engine";
    const std::string logging = "Logging";

    addOption(makeEnumOption("trigger", "run.trigger", "How the run was triggered",
                             {"dispatch", "call", "push"}, "dispatch", run));
    addOption(makeOption("branch", CliOptionType::STRING, "run.branch",
                         "Name of the triggering branch", run));
    addOption(makeEnumOption("wpt", "run.wpt", "Conformance mode passed to the fan-out stages",
                             {"test", "sync"}, "test", run));
    addOption(makeEnumOption("layout", "run.layout", "Layout suites to dispatch",
                             {"none", "2013", "2020", "all"}, "none", run));
    addOption(makeOption("unit-tests", CliOptionType::BOOLEAN, "run.unit_tests",
                         "Run the unit-test step", run));
    addOption(makeOption("upload", CliOptionType::BOOLEAN, "run.upload",
                         "Publish the nightly build", run));

    CliOptionDefinition release_id = makeOption("release-id", CliOptionType::STRING, "run.release_id",
                                                "Release id for the upload step (call trigger only)", run);
    release_id.constraint = CliOptionConstraint::REGEX_MATCH;
    release_id.regex_pattern = "[A-Za-z0-9._-]+";
    addOption(release_id);

    addOption(makeOption("repository-owner", CliOptionType::STRING, "run.repository_owner",
                         "Owner of the nightly builds repository", run));

    CliOptionDefinition config = makeOption("config", CliOptionType::STRING, "cli.config",
                                            "Settings file (YAML)", paths);
    config.short_name = 'c';
    addOption(config);
    addOption(makeOption("workflow", CliOptionType::STRING, "paths.workflow",
                         "Workflow definition file (YAML); built-in default otherwise", paths));
    addOption(makeOption("workspace", CliOptionType::STRING, "paths.workspace",
                         "Source tree the steps run in", paths));
    addOption(makeOption("artifact-dir", CliOptionType::STRING, "paths.artifact_dir",
                         "Artifact store root", paths));
    addOption(makeOption("log-dir", CliOptionType::STRING, "paths.log_dir",
                         "Per-step log root", paths));
    addOption(makeOption("report", CliOptionType::STRING, "paths.report",
                         "Write a JSON run report to this file", paths));
    addOption(makeOption("run", CliOptionType::STRING, "artifacts.run_id",
                         "Run id for 'artifacts list'", paths));

    CliOptionDefinition max_parallel = makeOption("max-parallel", CliOptionType::INTEGER,
                                                  "engine.max_parallel_stages",
                                                  "Maximum number of stages running at once", engine);
    max_parallel.constraint = CliOptionConstraint::RANGE;
    max_parallel.min_value = 1;
    max_parallel.max_value = 64;
    max_parallel.default_value = "4";
    addOption(max_parallel);

    CliOptionDefinition timeout = makeOption("timeout-minutes", CliOptionType::INTEGER,
                                             "engine.timeout_minutes",
                                             "Cancel the run after this many minutes (0 disables)", engine);
    timeout.constraint = CliOptionConstraint::NON_NEGATIVE;
    addOption(timeout);

    addOption(makeEnumOption("log-level", "logging.level", "Minimum log level",
                             {"debug", "info", "warn", "error"}, "info", logging));
    addOption(makeOption("log-file", CliOptionType::STRING, "logging.file",
                         "Write logs to this file instead of stderr", logging));
}

CliParseResult CliParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult CliParser::parse(const std::vector<std::string>& arguments) const {
    return impl_->parse(arguments);
}

std::string CliParser::generateHelpText() const {
    return impl_->generateHelpText();
}

std::string CliParser::generateVersionText() const {
    return impl_->generateVersionText();
}

void CliParser::setVersionInfo(const std::string& version) {
    impl_->version_ = version;
}

size_t CliParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;
    for (const auto& [path, value] : result.overrides) {
        config.setPath(path, value);
        LOG_DEBUG("cli", "Override " + path + " = " + value.toString());
        ++applied;
    }
    return applied;
}

std::optional<CliOptionDefinition> CliParser::getOptionDefinition(const std::string& name) const {
    auto it = impl_->options_by_long_name_.find(name);
    if (it == impl_->options_by_long_name_.end()) {
        return std::nullopt;
    }
    return impl_->option_definitions_[it->second];
}

bool CliParser::hasOption(const std::string& name) const {
    return impl_->options_by_long_name_.count(name) > 0;
}

namespace CliUtils {

std::string cliOptionTypeToString(CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: return "bool";
        case CliOptionType::INTEGER: return "int";
        case CliOptionType::STRING: return "string";
        default: return "unknown";
    }
}

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        case CliParseStatus::CONSTRAINT_VIOLATION: return "CONSTRAINT_VIOLATION";
        case CliParseStatus::MISSING_COMMAND: return "MISSING_COMMAND";
        default: return "UNKNOWN";
    }
}

ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN:
            return ConfigValue(raw_value == "true");
        case CliOptionType::INTEGER:
            return ConfigValue(std::stoi(raw_value));
        case CliOptionType::STRING:
        default:
            return ConfigValue(raw_value);
    }
}

bool validateCliValue(const std::string& raw_value, const CliOptionDefinition& definition,
                      std::string& error_message) {
    switch (definition.constraint) {
        case CliOptionConstraint::NONE:
            return true;

        case CliOptionConstraint::POSITIVE:
        case CliOptionConstraint::NON_NEGATIVE:
        case CliOptionConstraint::RANGE: {
            double numeric = 0.0;
            try {
                numeric = std::stod(raw_value);
            } catch (const std::exception&) {
                error_message = "expected a number";
                return false;
            }
            if (definition.constraint == CliOptionConstraint::POSITIVE && numeric <= 0) {
                error_message = "must be positive";
                return false;
            }
            if (definition.constraint == CliOptionConstraint::NON_NEGATIVE && numeric < 0) {
                error_message = "must not be negative";
                return false;
            }
            if (definition.min_value && numeric < *definition.min_value) {
                error_message = "must be >= " + ConfigValue(*definition.min_value).toString();
                return false;
            }
            if (definition.max_value && numeric > *definition.max_value) {
                error_message = "must be <= " + ConfigValue(*definition.max_value).toString();
                return false;
            }
            return true;
        }

        case CliOptionConstraint::REGEX_MATCH:
            if (definition.regex_pattern &&
                !std::regex_match(raw_value, std::regex(*definition.regex_pattern))) {
                error_message = "must match " + *definition.regex_pattern;
                return false;
            }
            return true;

        case CliOptionConstraint::ENUM_VALUES:
            if (definition.enum_values.count(raw_value) == 0) {
                error_message = "must be one of:";
                for (const auto& value : definition.enum_values) {
                    error_message += " " + value;
                }
                return false;
            }
            return true;
    }
    return true;
}

std::string formatOptionHelp(const CliOptionDefinition& option) {
    std::ostringstream help;

    std::string option_names = "  ";
    if (option.short_name) {
        option_names += "-" + std::string(1, *option.short_name) + ", ";
    }
    option_names += "--" + option.long_name;

    if (option.type != CliOptionType::BOOLEAN) {
        if (!option.enum_values.empty()) {
            std::string choices;
            for (const auto& value : option.enum_values) {
                choices += (choices.empty() ? "" : "|") + value;
            }
            option_names += " " + choices;
        } else {
            option_names += " <" + cliOptionTypeToString(option.type) + ">";
        }
    }

    size_t name_width = 32;
    if (option_names.length() > name_width - 2) {
        help << option_names << "\n" << std::string(name_width, ' ') << option.description;
    } else {
        help << std::left << std::setw(static_cast<int>(name_width)) << option_names << option.description;
    }

    if (option.default_value && !option.default_value->empty()) {
        help << " (default: " << *option.default_value << ")";
    }

    return help.str();
}

bool isShortOption(const std::string& arg) {
    return arg.length() >= 2 && arg[0] == '-' && arg[1] != '-' &&
           std::isalpha(static_cast<unsigned char>(arg[1]));
}

bool isLongOption(const std::string& arg) {
    return arg.length() >= 3 && arg.compare(0, 2, "--") == 0 &&
           std::isalpha(static_cast<unsigned char>(arg[2]));
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        return arg.substr(2);
    } else if (isShortOption(arg)) {
        return arg.substr(1);
    }
    return "";
}

} // namespace CliUtils

} // namespace CLI
} // namespace CIP
