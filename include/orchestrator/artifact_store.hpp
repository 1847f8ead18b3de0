#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "orchestrator/pipeline_types.hpp"

namespace CIP {
namespace Orchestrator {

struct ArtifactFile {
    std::string path;       // EN: Relative to the upload root / FR: Relatif à la racine d'upload
    std::uintmax_t size = 0;
};

// EN: Content of <root>/<run_id>/<name>/manifest.json
// FR: Contenu de <root>/<run_id>/<name>/manifest.json
struct ArtifactManifest {
    std::string name;
    std::string run_id;
    std::string producer;   // EN: Stage id / FR: Id de l'étape
    std::vector<ArtifactFile> files;
    std::uintmax_t total_size = 0;
    std::chrono::system_clock::time_point created_at;
    int retention_days = 90;

    std::chrono::system_clock::time_point expiresAt() const;

    nlohmann::json toJson() const;
    static ArtifactManifest fromJson(const nlohmann::json& json);
};

// EN: Named file sets that outlive the stage that produced them.
//     Layout: <root>/<run_id>/<name>/manifest.json and <root>/<run_id>/<name>/files/...
// FR: Ensembles de fichiers nommés qui survivent à l'étape qui les a produits.
//     Disposition : <root>/<run_id>/<name>/manifest.json et <root>/<run_id>/<name>/files/...
class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path root, int default_retention_days = 90);

    // EN: Archive the files matching pattern under source_root.
    //     Throws ArtifactError on a duplicate name, when nothing matches, or on I/O failure.
    // FR: Archive les fichiers correspondant au motif sous source_root.
    //     Lance ArtifactError sur nom dupliqué, absence de correspondance ou erreur d'E/S.
    ArtifactManifest upload(const std::string& run_id, const std::string& name, const std::string& producer,
                            const std::filesystem::path& source_root, const std::string& pattern,
                            std::optional<int> retention_days = std::nullopt);

    // EN: Restore an artifact into destination, keeping relative paths. Returns the restored files.
    // FR: Restaure un artefact dans destination, en gardant les chemins relatifs. Retourne les fichiers restaurés.
    std::vector<std::filesystem::path> download(const std::string& run_id, const std::string& name,
                                                const std::filesystem::path& destination) const;

    bool exists(const std::string& run_id, const std::string& name) const;
    std::optional<ArtifactManifest> find(const std::string& run_id, const std::string& name) const;

    // EN: Manifests of one run, sorted by name
    // FR: Manifestes d'une exécution, triés par nom
    std::vector<ArtifactManifest> list(const std::string& run_id) const;
    std::vector<std::string> listRuns() const;

    // EN: Delete artifacts whose retention has passed at `now`; returns the number deleted
    // FR: Supprime les artefacts dont la rétention est dépassée à `now` ; retourne le nombre supprimé
    size_t pruneExpired(std::chrono::system_clock::time_point now);

    const std::filesystem::path& root() const { return root_; }
    int defaultRetentionDays() const { return default_retention_days_; }

    // EN: Glob match per path component with fnmatch(3); "**" spans directories.
    //     A matched directory contributes every regular file below it. Result is sorted and relative.
    // FR: Correspondance glob par composant avec fnmatch(3) ; "**" traverse les répertoires.
    //     Un répertoire trouvé apporte tous ses fichiers réguliers. Résultat trié et relatif.
    static std::vector<std::filesystem::path> matchFiles(const std::filesystem::path& source_root,
                                                         const std::string& pattern);

    static bool isValidName(const std::string& name);

private:
    std::filesystem::path artifactDir(const std::string& run_id, const std::string& name) const;
    std::optional<ArtifactManifest> readManifest(const std::filesystem::path& artifact_dir) const;

    std::filesystem::path root_;
    int default_retention_days_;
    mutable std::mutex mutex_;
};

} // namespace Orchestrator
} // namespace CIP
