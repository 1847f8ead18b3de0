// EN: Artifact store implementation - filesystem-backed named file sets with JSON manifests
// FR: Implémentation du stockage d'artefacts - ensembles de fichiers nommés sur disque avec manifestes JSON

#include "orchestrator/artifact_store.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <fnmatch.h>

namespace fs = std::filesystem;

namespace CIP {
namespace Orchestrator {

namespace {

constexpr const char* kManifestFile = "manifest.json";
constexpr const char* kFilesDir = "files";

bool hasWildcard(const std::string& part) {
    return part.find_first_of("*?[") != std::string::npos;
}

std::vector<std::string> splitPattern(const std::string& pattern) {
    std::vector<std::string> parts;
    std::stringstream ss(pattern);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
    }
    return parts;
}

void addTree(const fs::path& root, const fs::path& rel, std::set<fs::path>& out) {
    fs::path current = root / rel;
    std::error_code ec;
    if (fs::is_regular_file(current, ec)) {
        out.insert(rel);
        return;
    }
    if (!fs::is_directory(current, ec)) {
        return;
    }
    for (auto it = fs::recursive_directory_iterator(current, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            out.insert(rel / it->path().lexically_relative(current));
        }
    }
}

void collectMatches(const fs::path& root, const fs::path& rel, const std::vector<std::string>& parts,
                    size_t index, std::set<fs::path>& out) {
    fs::path current = root / rel;
    std::error_code ec;

    if (index == parts.size()) {
        addTree(root, rel, out);
        return;
    }

    const std::string& part = parts[index];

    if (part == "**") {
        collectMatches(root, rel, parts, index + 1, out);
        if (!fs::is_directory(current, ec)) {
            return;
        }
        for (auto it = fs::directory_iterator(current, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            if (it->is_directory(ec)) {
                collectMatches(root, rel / it->path().filename(), parts, index, out);
            }
        }
        return;
    }

    if (!hasWildcard(part)) {
        if (fs::exists(current / part, ec)) {
            collectMatches(root, rel / part, parts, index + 1, out);
        }
        return;
    }

    if (!fs::is_directory(current, ec)) {
        return;
    }
    for (auto it = fs::directory_iterator(current, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (::fnmatch(part.c_str(), name.c_str(), FNM_PERIOD) == 0) {
            collectMatches(root, rel / name, parts, index + 1, out);
        }
    }
}

std::string formatIso8601(std::chrono::system_clock::time_point tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

std::chrono::system_clock::time_point ArtifactManifest::expiresAt() const {
    return created_at + std::chrono::hours(24) * retention_days;
}

nlohmann::json ArtifactManifest::toJson() const {
    nlohmann::json json;
    json["name"] = name;
    json["run_id"] = run_id;
    json["producer"] = producer;
    json["files"] = nlohmann::json::array();
    for (const auto& file : files) {
        json["files"].push_back({{"path", file.path}, {"size", file.size}});
    }
    json["total_size"] = total_size;
    json["created_at"] = formatIso8601(created_at);
    json["created_at_unix"] = std::chrono::duration_cast<std::chrono::seconds>(
        created_at.time_since_epoch()).count();
    json["retention_days"] = retention_days;
    return json;
}

ArtifactManifest ArtifactManifest::fromJson(const nlohmann::json& json) {
    ArtifactManifest manifest;
    manifest.name = json.at("name").get<std::string>();
    manifest.run_id = json.value("run_id", "");
    manifest.producer = json.value("producer", "");
    if (json.contains("files")) {
        for (const auto& file : json.at("files")) {
            manifest.files.push_back({file.at("path").get<std::string>(), file.value("size", std::uintmax_t{0})});
        }
    }
    manifest.total_size = json.value("total_size", std::uintmax_t{0});
    manifest.created_at = std::chrono::system_clock::time_point(
        std::chrono::seconds(json.at("created_at_unix").get<long long>()));
    manifest.retention_days = json.value("retention_days", 90);
    return manifest;
}

ArtifactStore::ArtifactStore(fs::path root, int default_retention_days)
    : root_(std::move(root)), default_retention_days_(default_retention_days) {
    if (default_retention_days_ <= 0) {
        throw std::invalid_argument("artifact retention must be at least one day");
    }
}

bool ArtifactStore::isValidName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

fs::path ArtifactStore::artifactDir(const std::string& run_id, const std::string& name) const {
    return root_ / run_id / name;
}

std::vector<fs::path> ArtifactStore::matchFiles(const fs::path& source_root, const std::string& pattern) {
    std::set<fs::path> matches;
    collectMatches(source_root, fs::path(), splitPattern(pattern), 0, matches);
    return {matches.begin(), matches.end()};
}

ArtifactManifest ArtifactStore::upload(const std::string& run_id, const std::string& name, const std::string& producer,
                                       const fs::path& source_root, const std::string& pattern,
                                       std::optional<int> retention_days) {
    if (!isValidName(name)) {
        throw ArtifactError("invalid artifact name '" + name + "'");
    }
    if (pattern.empty() || pattern.front() == '/') {
        throw ArtifactError("artifact path '" + pattern + "' must be relative");
    }
    for (const auto& part : splitPattern(pattern)) {
        if (part == "..") {
            throw ArtifactError("artifact path '" + pattern + "' must stay inside the working directory");
        }
    }

    std::vector<fs::path> files = matchFiles(source_root, pattern);
    if (files.empty()) {
        throw ArtifactError("no files found matching '" + pattern + "' for artifact '" + name + "'");
    }

    fs::path dir = artifactDir(run_id, name);
    {
        // EN: Reserve the name; concurrent stages may upload at the same time.
        // FR: Réserve le nom ; des étapes concurrentes peuvent uploader en même temps.
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        fs::create_directories(dir.parent_path(), ec);
        if (ec) {
            throw ArtifactError("cannot create " + dir.parent_path().string() + ": " + ec.message());
        }
        if (!fs::create_directory(dir, ec)) {
            throw ArtifactError(ec ? "cannot create " + dir.string() + ": " + ec.message()
                                   : "artifact '" + name + "' already exists in run " + run_id);
        }
    }

    ArtifactManifest manifest;
    manifest.name = name;
    manifest.run_id = run_id;
    manifest.producer = producer;
    manifest.created_at = std::chrono::system_clock::now();
    manifest.retention_days = retention_days.value_or(default_retention_days_);

    try {
        for (const auto& rel : files) {
            fs::path target = dir / kFilesDir / rel;
            fs::create_directories(target.parent_path());
            fs::copy_file(source_root / rel, target, fs::copy_options::overwrite_existing);

            std::uintmax_t size = fs::file_size(target);
            manifest.files.push_back({rel.generic_string(), size});
            manifest.total_size += size;
        }

        std::ofstream out(dir / kManifestFile);
        if (!out) {
            throw ArtifactError("cannot write manifest for artifact '" + name + "'");
        }
        out << manifest.toJson().dump(2) << '\n';
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        throw ArtifactError("cannot store artifact '" + name + "': " + e.what());
    } catch (const ArtifactError&) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        throw;
    }

    LOG_INFO_META("artifacts", "Stored artifact " + name,
                  (std::unordered_map<std::string, std::string>{
                      {"run_id", run_id},
                      {"files", std::to_string(manifest.files.size())},
                      {"bytes", std::to_string(manifest.total_size)}}));
    return manifest;
}

std::vector<fs::path> ArtifactStore::download(const std::string& run_id, const std::string& name,
                                              const fs::path& destination) const {
    fs::path dir = artifactDir(run_id, name);
    if (!readManifest(dir)) {
        throw ArtifactError("artifact '" + name + "' not found in run " + run_id);
    }

    fs::path files_dir = dir / kFilesDir;
    std::vector<fs::path> restored;

    try {
        fs::create_directories(destination);
        for (const auto& entry : fs::recursive_directory_iterator(files_dir)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            fs::path rel = entry.path().lexically_relative(files_dir);
            fs::path target = destination / rel;
            fs::create_directories(target.parent_path());
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
            restored.push_back(target);
        }
    } catch (const fs::filesystem_error& e) {
        throw ArtifactError("cannot restore artifact '" + name + "': " + e.what());
    }

    std::sort(restored.begin(), restored.end());
    return restored;
}

bool ArtifactStore::exists(const std::string& run_id, const std::string& name) const {
    return readManifest(artifactDir(run_id, name)).has_value();
}

std::optional<ArtifactManifest> ArtifactStore::find(const std::string& run_id, const std::string& name) const {
    return readManifest(artifactDir(run_id, name));
}

std::optional<ArtifactManifest> ArtifactStore::readManifest(const fs::path& artifact_dir) const {
    std::ifstream in(artifact_dir / kManifestFile);
    if (!in) {
        return std::nullopt;
    }
    try {
        return ArtifactManifest::fromJson(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("artifacts", "Unreadable manifest in " + artifact_dir.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<ArtifactManifest> ArtifactStore::list(const std::string& run_id) const {
    std::vector<ArtifactManifest> manifests;
    std::error_code ec;
    fs::path run_dir = root_ / run_id;
    if (!fs::is_directory(run_dir, ec)) {
        return manifests;
    }

    for (auto it = fs::directory_iterator(run_dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (auto manifest = readManifest(it->path())) {
            manifests.push_back(std::move(*manifest));
        }
    }

    std::sort(manifests.begin(), manifests.end(),
              [](const ArtifactManifest& a, const ArtifactManifest& b) { return a.name < b.name; });
    return manifests;
}

std::vector<std::string> ArtifactStore::listRuns() const {
    std::vector<std::string> runs;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return runs;
    }
    for (auto it = fs::directory_iterator(root_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec)) {
            runs.push_back(it->path().filename().string());
        }
    }
    std::sort(runs.begin(), runs.end());
    return runs;
}

size_t ArtifactStore::pruneExpired(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;

    for (const auto& run_id : listRuns()) {
        for (const auto& manifest : list(run_id)) {
            if (manifest.expiresAt() > now) {
                continue;
            }
            std::error_code ec;
            fs::remove_all(artifactDir(run_id, manifest.name), ec);
            if (ec) {
                LOG_WARN("artifacts", "Cannot remove expired artifact " + manifest.name + ": " + ec.message());
                continue;
            }
            ++removed;
            LOG_INFO("artifacts", "Pruned expired artifact " + run_id + "/" + manifest.name);
        }

        std::error_code ec;
        fs::path run_dir = root_ / run_id;
        if (fs::is_empty(run_dir, ec) && !ec) {
            fs::remove(run_dir, ec);
        }
    }

    return removed;
}

} // namespace Orchestrator
} // namespace CIP
