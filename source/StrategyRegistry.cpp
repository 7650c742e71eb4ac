#include "StrategyRegistry.h"
#include <functional>
#include <utility>

namespace {

using Factory = std::function<std::unique_ptr<SearchStrategy>()>;

// fixed name -> constructor table, read only after static init
const std::vector<std::pair<std::string, Factory>>& registry() {
    static const std::vector<std::pair<std::string, Factory>> table = {
        {"Example", [] { return std::make_unique<GreedyStrategy>(); }},
        {"DFS", [] { return std::make_unique<DepthFirstStrategy>(); }},
        {"BranchAndBound", [] { return std::make_unique<BranchAndBoundStrategy>(); }},
        {"AStar", [] { return std::make_unique<AStarStrategy>(); }},
    };
    return table;
}

std::string joinedNames() {
    std::string joined;
    for (const auto& name : availableStrategies()) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

}  // namespace

std::unique_ptr<SearchStrategy> createAgent(const std::string& name) {
    for (const auto& [registered, factory] : registry()) {
        if (registered == name) {
            return factory();
        }
    }
    throw UnknownStrategyError(name, joinedNames());
}

std::unique_ptr<SearchStrategy> createAgent(StrategyKind kind) {
    return createAgent(std::string(strategyName(kind)));
}

const std::vector<std::string>& availableStrategies() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& entry : registry()) {
            out.push_back(entry.first);
        }
        return out;
    }();
    return names;
}

const char* strategyName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Greedy:
            return "Example";
        case StrategyKind::DepthFirst:
            return "DFS";
        case StrategyKind::BranchAndBound:
            return "BranchAndBound";
        case StrategyKind::AStar:
            return "AStar";
        default:
            return "Unknown";
    }
}

bool isExplorer(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::DepthFirst:       // blind depth first traversal
        case StrategyKind::BranchAndBound:   // uniform cost, no goal heuristic
            return true;
        default:
            return false;
    }
}

bool isCostOptimal(StrategyKind kind) {
    return kind == StrategyKind::BranchAndBound || kind == StrategyKind::AStar;
}
