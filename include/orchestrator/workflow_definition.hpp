#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "orchestrator/pipeline_types.hpp"
#include "orchestrator/run_inputs.hpp"

namespace CIP {
namespace Orchestrator {

// EN: Conformance suites a fan-out stage can run
// FR: Suites de conformité qu'une étape de fan-out peut exécuter
enum class ConformanceSuite {
    LAYOUT_2020 = 0,
    LAYOUT_2013 = 1
};

// EN: STEPS stages are run by the stage driver; the AGGREGATE stage reduces upstream statuses
// FR: Les étapes STEPS sont exécutées par le driver ; l'étape AGGREGATE réduit les statuts amont
enum class StageKind {
    STEPS = 0,
    AGGREGATE = 1
};

enum class StepKind {
    COMMAND = 0,            // EN: Shell command / FR: Commande shell
    UPLOAD_ARTIFACT = 1,    // EN: Archive files into the store / FR: Archive des fichiers dans le stockage
    DOWNLOAD_ARTIFACT = 2   // EN: Restore a named artifact / FR: Restaure un artefact nommé
};

// EN: One clause of a step condition
// FR: Une clause d'une condition de step
struct ConditionClause {
    enum class Kind {
        INPUT_FLAG,     // EN: value is "unit-tests" or "upload" / FR: value vaut "unit-tests" ou "upload"
        BRANCH_EQUALS,
        LAYOUT_EQUALS,
        WPT_EQUALS
    };

    Kind kind = Kind::INPUT_FLAG;
    std::string value;

    bool evaluate(const RunInputs& inputs) const;
    std::string toString() const;
};

// EN: Disjunction of clauses; an empty condition always holds
// FR: Disjonction de clauses ; une condition vide est toujours vraie
struct StepCondition {
    std::vector<ConditionClause> any_of;

    bool empty() const { return any_of.empty(); }
    bool evaluate(const RunInputs& inputs) const;
    std::string toString() const;

    static StepCondition inputFlag(const std::string& flag);
    StepCondition& orBranch(const std::string& branch);
};

// EN: Artifact produced or consumed by a step
// FR: Artefact produit ou consommé par un step
struct ArtifactSpec {
    std::string name;
    std::string path;                       // EN: Glob pattern (upload) or destination (download) / FR: Motif glob (upload) ou destination (download)
    std::optional<int> retention_days;      // EN: Store default when unset / FR: Défaut du stockage si absent
};

// EN: Configuration for a single step
// FR: Configuration d'un step
struct PipelineStepConfig {
    std::string id;
    std::string name;
    StepKind kind = StepKind::COMMAND;
    std::string run;                                             // EN: May hold ${{ name }} placeholders / FR: Peut contenir des placeholders ${{ nom }}
    StepCondition condition;
    bool always = false;                                         // EN: Runs after failure or cancellation / FR: S'exécute après échec ou annulation
    std::vector<std::pair<std::string, std::string>> env;
    std::vector<std::string> secrets;
    std::optional<ArtifactSpec> artifact;
    std::optional<std::chrono::seconds> timeout;
};

// EN: Configuration for a single pipeline stage
// FR: Configuration pour une étape unique du pipeline
struct PipelineStageConfig {
    std::string id;
    std::string name;
    StageKind kind = StageKind::STEPS;
    std::vector<PipelineStepConfig> steps;
    std::vector<std::string> needs;              // EN: Upstream stage ids / FR: Ids des étapes amont
    std::optional<ConformanceSuite> suite;       // EN: Set for fan-out stages / FR: Défini pour les étapes de fan-out
    std::string working_directory;               // EN: Relative to the workspace / FR: Relatif au workspace
};

// EN: A complete workflow: stages plus the branches that trigger it on push
// FR: Un workflow complet : étapes plus les branches qui le déclenchent au push
struct WorkflowDefinition {
    std::string name;
    std::vector<std::string> push_branches;
    std::vector<PipelineStageConfig> stages;

    const PipelineStageConfig* findStage(const std::string& id) const;

    // EN: The Linux build, two conformance fan-outs and the result aggregator
    // FR: Le build Linux, deux fan-outs de conformité et l'agrégateur de résultats
    static WorkflowDefinition linuxDefault();
};

namespace WorkflowUtils {

    using PlaceholderValues = std::map<std::string, std::string>;

    std::string suiteToString(ConformanceSuite suite);
    std::optional<ConformanceSuite> parseSuite(const std::string& text);

    std::string stageKindToString(StageKind kind);
    std::optional<StageKind> parseStageKind(const std::string& text);

    std::string stepKindToString(StepKind kind);
    std::optional<StepKind> parseStepKind(const std::string& text);

    std::string clauseKindToString(ConditionClause::Kind kind);
    std::optional<ConditionClause::Kind> parseClauseKind(const std::string& text);

    // EN: Names accepted inside ${{ ... }}
    // FR: Noms acceptés dans ${{ ... }}
    const std::set<std::string>& knownPlaceholders();

    // EN: Names referenced by ${{ name }} in text, in order of appearance
    // FR: Noms référencés par ${{ nom }} dans le texte, dans l'ordre d'apparition
    std::vector<std::string> findPlaceholders(const std::string& text);

    // EN: Substitute placeholders. Throws WorkflowError for a name missing from values.
    // FR: Substitue les placeholders. Lance WorkflowError pour un nom absent des valeurs.
    std::string expandPlaceholders(const std::string& text, const PlaceholderValues& values);

} // namespace WorkflowUtils

} // namespace Orchestrator
} // namespace CIP
