// EN: Run inputs parsing and validation
// FR: Analyse et validation des entrées d'exécution

#include "orchestrator/run_inputs.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>

namespace CIP {
namespace Orchestrator {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string readString(const ConfigManager& config, const std::string& key, const std::string& fallback) {
    ConfigValue value = config.get("run", key);
    return value.isValid() ? value.rawText() : fallback;
}

bool readBool(const ConfigManager& config, const std::string& key) {
    ConfigValue value = config.get("run", key);
    if (!value.isValid()) {
        return false;
    }
    if (auto flag = value.tryAs<bool>()) {
        return *flag;
    }
    std::string text = toLower(value.rawText());
    if (text == "true" || text == "1") return true;
    if (text == "false" || text == "0" || text.empty()) return false;
    throw InputError("run." + key + " must be a boolean, got '" + value.rawText() + "'");
}

} // namespace

std::vector<std::string> RunInputs::validate(const std::vector<std::string>& push_branches) const {
    std::vector<std::string> errors;

    if (trigger == TriggerKind::BRANCH_PUSH) {
        if (branch.empty()) {
            errors.push_back("a push run needs a branch");
        } else if (std::find(push_branches.begin(), push_branches.end(), branch) == push_branches.end()) {
            errors.push_back("branch '" + branch + "' does not trigger the pipeline on push");
        }
        if (hasExplicitInputs()) {
            errors.push_back("a push run takes no inputs besides its branch");
        }
    }

    if (!branch.empty() && !RunInputsUtils::isValidBranchName(branch)) {
        errors.push_back("branch '" + branch + "' must match [A-Za-z0-9._/-]+");
    }
    if (!repository_owner.empty() && !RunInputsUtils::isValidRepositoryOwner(repository_owner)) {
        errors.push_back("repository owner '" + repository_owner + "' must match [A-Za-z0-9._-]+");
    }

    if (release_id) {
        if (trigger != TriggerKind::REUSABLE_CALL) {
            errors.push_back("a release id is only accepted from a reusable call");
        }
        if (!RunInputsUtils::isValidReleaseId(*release_id)) {
            errors.push_back("release id '" + *release_id + "' must match [A-Za-z0-9._-]+");
        }
    }

    return errors;
}

bool RunInputs::hasExplicitInputs() const {
    return wpt != WptMode::TEST || layout != LayoutSelector::NONE || unit_tests || upload || release_id.has_value();
}

RunInputs RunInputs::fromConfig(const ConfigManager& config) {
    RunInputs inputs;

    std::string trigger_text = readString(config, "trigger", "dispatch");
    auto trigger = RunInputsUtils::parseTrigger(trigger_text);
    if (!trigger) {
        throw InputError("unknown trigger '" + trigger_text + "' (expected dispatch, call or push)");
    }
    inputs.trigger = *trigger;

    std::string wpt_text = readString(config, "wpt", "test");
    auto wpt = RunInputsUtils::parseWptMode(wpt_text);
    if (!wpt) {
        throw InputError("unknown wpt mode '" + wpt_text + "' (expected test or sync)");
    }
    inputs.wpt = *wpt;

    std::string layout_text = readString(config, "layout", "none");
    auto layout = RunInputsUtils::parseLayout(layout_text);
    if (!layout) {
        throw InputError("unknown layout '" + layout_text + "' (expected none, 2013, 2020 or all)");
    }
    inputs.layout = *layout;

    inputs.branch = readString(config, "branch", "");
    inputs.unit_tests = readBool(config, "unit_tests");
    inputs.upload = readBool(config, "upload");
    inputs.repository_owner = readString(config, "repository_owner", "");

    std::string release_id = readString(config, "release_id", "");
    if (!release_id.empty()) {
        inputs.release_id = release_id;
    }

    if (inputs.trigger == TriggerKind::BRANCH_PUSH && inputs.hasExplicitInputs()) {
        LOG_WARN("inputs", "Push runs ignore explicit inputs; using defaults for branch " + inputs.branch);
        RunInputs defaults;
        defaults.trigger = inputs.trigger;
        defaults.branch = inputs.branch;
        defaults.repository_owner = inputs.repository_owner;
        inputs = defaults;
    }

    return inputs;
}

namespace RunInputsUtils {

std::string triggerToString(TriggerKind trigger) {
    switch (trigger) {
        case TriggerKind::MANUAL_DISPATCH: return "dispatch";
        case TriggerKind::REUSABLE_CALL: return "call";
        case TriggerKind::BRANCH_PUSH: return "push";
        default: return "unknown";
    }
}

std::optional<TriggerKind> parseTrigger(const std::string& text) {
    std::string value = toLower(text);
    if (value == "dispatch" || value == "workflow_dispatch") return TriggerKind::MANUAL_DISPATCH;
    if (value == "call" || value == "workflow_call") return TriggerKind::REUSABLE_CALL;
    if (value == "push") return TriggerKind::BRANCH_PUSH;
    return std::nullopt;
}

std::string wptModeToString(WptMode mode) {
    return mode == WptMode::SYNC ? "sync" : "test";
}

std::optional<WptMode> parseWptMode(const std::string& text) {
    std::string value = toLower(text);
    if (value == "test") return WptMode::TEST;
    if (value == "sync") return WptMode::SYNC;
    return std::nullopt;
}

std::string layoutToString(LayoutSelector layout) {
    switch (layout) {
        case LayoutSelector::NONE: return "none";
        case LayoutSelector::LAYOUT_2013: return "2013";
        case LayoutSelector::LAYOUT_2020: return "2020";
        case LayoutSelector::ALL: return "all";
        default: return "unknown";
    }
}

std::optional<LayoutSelector> parseLayout(const std::string& text) {
    std::string value = toLower(text);
    if (value.empty() || value == "none") return LayoutSelector::NONE;
    if (value == "2013") return LayoutSelector::LAYOUT_2013;
    if (value == "2020") return LayoutSelector::LAYOUT_2020;
    if (value == "all") return LayoutSelector::ALL;
    return std::nullopt;
}

bool isValidReleaseId(const std::string& release_id) {
    return !release_id.empty() &&
           std::all_of(release_id.begin(), release_id.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '.' || c == '_' || c == '-';
           });
}

bool isValidBranchName(const std::string& branch) {
    return !branch.empty() && branch.front() != '-' &&
           std::all_of(branch.begin(), branch.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == '/';
           });
}

bool isValidRepositoryOwner(const std::string& owner) {
    return isValidReleaseId(owner);
}

} // namespace RunInputsUtils

} // namespace Orchestrator
} // namespace CIP
