#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "SearchStrategy.h"

// thrown by createAgent for a name that is not registered
class UnknownStrategyError : public std::invalid_argument {
public:
    UnknownStrategyError(const std::string& name, const std::string& available)
        : std::invalid_argument("Unknown agent '" + name + "'. Available: " + available), name_(name) {}
    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// fresh strategy for a registered name ("Example", "DFS", "BranchAndBound", "AStar").
// throws UnknownStrategyError listing the valid names otherwise
std::unique_ptr<SearchStrategy> createAgent(const std::string& name);
std::unique_ptr<SearchStrategy> createAgent(StrategyKind kind);

// registered names in registration order
const std::vector<std::string>& availableStrategies();

const char* strategyName(StrategyKind kind);

// returns true if the strategy is uninformed (no goal heuristic in its ordering)
bool isExplorer(StrategyKind kind);

// returns true if the strategy guarantees a cost optimal path
bool isCostOptimal(StrategyKind kind);
