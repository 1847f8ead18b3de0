// EN: Pipeline Dependency Resolver implementation - stage graph, cycles and topological order
// FR: Implémentation Pipeline Dependency Resolver - graphe des étapes, cycles et ordre topologique

#include "orchestrator/pipeline_engine.hpp"

#include <algorithm>

namespace CIP {
namespace Orchestrator {

PipelineDependencyResolver::PipelineDependencyResolver(const std::vector<PipelineStageConfig>& stages) {
    buildDependencyGraph(stages);
}

void PipelineDependencyResolver::buildDependencyGraph(const std::vector<PipelineStageConfig>& stages) {
    for (const auto& stage : stages) {
        if (dependency_graph_.count(stage.id) == 0) {
            order_.push_back(stage.id);
        }
        dependency_graph_[stage.id] = stage.needs;
        reverse_dependency_graph_[stage.id];
    }
    for (const auto& stage : stages) {
        for (const auto& need : stage.needs) {
            if (dependency_graph_.count(need) != 0) {
                reverse_dependency_graph_[need].push_back(stage.id);
            }
        }
    }
}

std::vector<std::string> PipelineDependencyResolver::getDependencies(const std::string& stage_id) const {
    auto it = dependency_graph_.find(stage_id);
    return it != dependency_graph_.end() ? it->second : std::vector<std::string>{};
}

std::vector<std::string> PipelineDependencyResolver::getDependents(const std::string& stage_id) const {
    auto it = reverse_dependency_graph_.find(stage_id);
    return it != reverse_dependency_graph_.end() ? it->second : std::vector<std::string>{};
}

bool PipelineDependencyResolver::canExecute(const std::string& stage_id,
                                            const std::set<std::string>& terminal_stages) const {
    auto it = dependency_graph_.find(stage_id);
    if (it == dependency_graph_.end()) {
        return false;
    }
    return std::all_of(it->second.begin(), it->second.end(),
                       [&terminal_stages](const std::string& dep) { return terminal_stages.count(dep) != 0; });
}

std::vector<std::string> PipelineDependencyResolver::getMissingDependencies() const {
    std::vector<std::string> missing;
    for (const auto& stage_id : order_) {
        for (const auto& need : dependency_graph_.at(stage_id)) {
            if (dependency_graph_.count(need) == 0) {
                missing.push_back(stage_id + " -> " + need);
            }
        }
    }
    return missing;
}

bool PipelineDependencyResolver::hasCircularDependency() const {
    return !getCircularDependencies().empty();
}

std::vector<std::string> PipelineDependencyResolver::getCircularDependencies() const {
    std::unordered_map<std::string, int> colors;
    std::vector<std::string> path;

    for (const auto& stage_id : order_) {
        if (colors[stage_id] == 0 && detectCircularDependencyDFS(stage_id, colors, path)) {
            return path;
        }
    }
    return {};
}

// EN: Cycle detection using colors (0=white, 1=gray, 2=black); path ends with the repeated node
// FR: Détection de cycles avec des couleurs (0=blanc, 1=gris, 2=noir) ; le chemin finit par le nœud répété
bool PipelineDependencyResolver::detectCircularDependencyDFS(const std::string& node,
                                                             std::unordered_map<std::string, int>& colors,
                                                             std::vector<std::string>& path) const {
    colors[node] = 1;
    path.push_back(node);

    auto it = dependency_graph_.find(node);
    if (it != dependency_graph_.end()) {
        for (const auto& dep : it->second) {
            if (dependency_graph_.count(dep) == 0) {
                continue;
            }
            int color = colors[dep];
            if (color == 1) {
                auto start = std::find(path.begin(), path.end(), dep);
                path.erase(path.begin(), start);
                path.push_back(dep);
                return true;
            }
            if (color == 0 && detectCircularDependencyDFS(dep, colors, path)) {
                return true;
            }
        }
    }

    colors[node] = 2;
    path.pop_back();
    return false;
}

std::vector<std::vector<std::string>> PipelineDependencyResolver::getExecutionLevels() const {
    if (hasCircularDependency()) {
        throw WorkflowError("circular dependency between stages");
    }

    std::vector<std::vector<std::string>> levels;
    std::set<std::string> placed;

    while (placed.size() < order_.size()) {
        std::vector<std::string> level;
        for (const auto& stage_id : order_) {
            if (placed.count(stage_id) != 0) {
                continue;
            }
            const auto& needs = dependency_graph_.at(stage_id);
            bool ready = std::all_of(needs.begin(), needs.end(), [&](const std::string& dep) {
                return placed.count(dep) != 0 || dependency_graph_.count(dep) == 0;
            });
            if (ready) {
                level.push_back(stage_id);
            }
        }
        if (level.empty()) {
            throw WorkflowError("stage dependencies cannot be ordered");
        }
        placed.insert(level.begin(), level.end());
        levels.push_back(std::move(level));
    }

    return levels;
}

std::vector<std::string> PipelineDependencyResolver::getExecutionOrder() const {
    std::vector<std::string> order;
    for (const auto& level : getExecutionLevels()) {
        order.insert(order.end(), level.begin(), level.end());
    }
    return order;
}

} // namespace Orchestrator
} // namespace CIP
