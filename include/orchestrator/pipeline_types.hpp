#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace CIP {
namespace Orchestrator {

// EN: Status of a pipeline stage (also used for the steps inside a stage)
// FR: Statut d'une étape du pipeline (utilisé aussi pour les steps d'une étape)
enum class PipelineStageStatus {
    PENDING = 0,        // EN: Not yet resolved / FR: Pas encore résolu
    DISPATCHED = 1,     // EN: Handed to a worker / FR: Confié à un worker
    SUCCESS = 2,        // EN: Completed successfully / FR: Terminé avec succès
    FAILURE = 3,        // EN: A step failed / FR: Un step a échoué
    CANCELLED = 4,      // EN: Stopped by cancellation / FR: Arrêté par annulation
    SKIPPED = 5         // EN: Predicate false or dependency not satisfied / FR: Prédicat faux ou dépendance non satisfaite
};

// EN: Invalid workflow definition (cycles, unknown needs, duplicate ids, bad placeholders)
// FR: Définition de workflow invalide (cycles, needs inconnus, ids dupliqués, placeholders invalides)
class WorkflowError : public std::runtime_error {
public:
    explicit WorkflowError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Invalid run inputs
// FR: Entrées d'exécution invalides
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Artifact store failures (duplicate name, nothing matched, I/O)
// FR: Échecs du stockage d'artefacts (nom dupliqué, aucune correspondance, E/S)
class ArtifactError : public std::runtime_error {
public:
    explicit ArtifactError(const std::string& message) : std::runtime_error(message) {}
};

namespace PipelineUtils {

    // EN: Status conversion utilities ("success", "skipped", ...)
    // FR: Utilitaires de conversion de statut ("success", "skipped", ...)
    std::string statusToString(PipelineStageStatus status);
    std::optional<PipelineStageStatus> parseStatus(const std::string& text);

    bool isTerminal(PipelineStageStatus status);

} // namespace PipelineUtils

} // namespace Orchestrator
} // namespace CIP
