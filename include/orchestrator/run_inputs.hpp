#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace CIP {
namespace Orchestrator {

// EN: How a run was started
// FR: Comment une exécution a été démarrée
enum class TriggerKind {
    MANUAL_DISPATCH = 0,    // EN: Operator-started run with inputs / FR: Exécution manuelle avec entrées
    REUSABLE_CALL = 1,      // EN: Called by another pipeline / FR: Appelée par un autre pipeline
    BRANCH_PUSH = 2         // EN: Push to a configured branch / FR: Push sur une branche configurée
};

// EN: Conformance mode forwarded to the fan-out stages
// FR: Mode de conformité transmis aux étapes de fan-out
enum class WptMode {
    TEST = 0,
    SYNC = 1
};

// EN: Which layout suites a run asks for
// FR: Quelles suites de layout une exécution demande
enum class LayoutSelector {
    NONE = 0,
    LAYOUT_2013 = 1,
    LAYOUT_2020 = 2,
    ALL = 3
};

// EN: Inputs of one pipeline run. Built once, then shared read-only with every stage.
// FR: Entrées d'une exécution. Construites une fois, puis partagées en lecture seule avec chaque étape.
struct RunInputs {
    TriggerKind trigger = TriggerKind::MANUAL_DISPATCH;
    std::string branch;
    WptMode wpt = WptMode::TEST;
    LayoutSelector layout = LayoutSelector::NONE;
    bool unit_tests = false;
    bool upload = false;
    std::optional<std::string> release_id;
    std::string run_id;
    std::string repository_owner;

    // EN: Return every problem found; empty means valid.
    // FR: Retourne tous les problèmes trouvés ; vide signifie valide.
    std::vector<std::string> validate(const std::vector<std::string>& push_branches) const;

    // EN: True when any input differs from the defaults a push run uses.
    // FR: Vrai si une entrée diffère des valeurs par défaut d'un push.
    bool hasExplicitInputs() const;

    // EN: Build from the "run" configuration section. Throws InputError on unparsable values.
    //     A push run keeps only its branch; other inputs are reset to defaults with a warning.
    // FR: Construit depuis la section "run". Lance InputError sur valeurs non analysables.
    //     Un push ne garde que sa branche ; les autres entrées reviennent aux valeurs par défaut.
    static RunInputs fromConfig(const ConfigManager& config);
};

using RunInputsPtr = std::shared_ptr<const RunInputs>;

namespace RunInputsUtils {

    std::string triggerToString(TriggerKind trigger);
    std::optional<TriggerKind> parseTrigger(const std::string& text);

    std::string wptModeToString(WptMode mode);
    std::optional<WptMode> parseWptMode(const std::string& text);

    // EN: "none", "2013", "2020", "all"; an empty string parses to NONE
    // FR: "none", "2013", "2020", "all" ; une chaîne vide donne NONE
    std::string layoutToString(LayoutSelector layout);
    std::optional<LayoutSelector> parseLayout(const std::string& text);

    // EN: Release ids are substituted into shell commands: [A-Za-z0-9._-]+
    // FR: Les ids de release sont substitués dans des commandes shell : [A-Za-z0-9._-]+
    bool isValidReleaseId(const std::string& release_id);

    // EN: Branch and owner are substituted the same way; branches may also hold '/'
    // FR: Branche et propriétaire sont substitués de la même façon ; les branches peuvent contenir '/'
    bool isValidBranchName(const std::string& branch);
    bool isValidRepositoryOwner(const std::string& owner);

} // namespace RunInputsUtils

} // namespace Orchestrator
} // namespace CIP
