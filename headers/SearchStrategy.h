#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include "Grid.h"
#include "Path.h"

// the four strategies. the set is closed, the registry maps names onto these
enum class StrategyKind {
    Greedy,          // "Example": local descent on manhattan distance, random tie breaks
    DepthFirst,      // "DFS": path stack with permanent visited marks
    BranchAndBound,  // "BranchAndBound": cheapest partial path first, no heuristic
    AStar,           // "AStar": cheapest g + h first, manhattan heuristic
};

// bounds a caller can put on a single search
struct SearchLimits {
    size_t maxIterations = 0;                     // 0 = strategy default (unbounded except greedy)
    const std::atomic<bool>* cancel = nullptr;    // checked between iterations when set
};

// result of one search with the metrics the benchmark cares about
struct SearchResult {
    Path path;                   // empty when the goal was not reached
    bool found = false;
    int nodesExpanded = 0;       // loop iterations (pops, pushes or steps)
    int pathCost = 0;            // entry cost of every cell after the start
    double computeTimeMs = 0.0;
};

// thrown when a search stops before its own termination rule fired
class SearchAborted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SearchBudgetExceeded : public SearchAborted {
public:
    SearchBudgetExceeded(const std::string& strategy, size_t budget)
        : SearchAborted(strategy + ": iteration budget of " + std::to_string(budget) + " exceeded"),
          budget_(budget) {}
    size_t budget() const { return budget_; }

private:
    size_t budget_;
};

class SearchCancelled : public SearchAborted {
public:
    explicit SearchCancelled(const std::string& strategy)
        : SearchAborted(strategy + ": search cancelled") {}
};

// counts iterations of one search call and enforces the limits
class SearchBudget {
public:
    SearchBudget(const std::string& strategy, const SearchLimits& limits, size_t defaultMax = 0)
        : strategy_(strategy), limits_(limits),
          maxIterations_(limits.maxIterations != 0 ? limits.maxIterations : defaultMax) {}

    // call once per loop iteration
    void tick() {
        ++iterations_;
        if (maxIterations_ != 0 && iterations_ > maxIterations_) {
            throw SearchBudgetExceeded(strategy_, maxIterations_);
        }
        if (limits_.cancel && limits_.cancel->load(std::memory_order_relaxed)) {
            throw SearchCancelled(strategy_);
        }
    }

    size_t iterations() const { return iterations_; }

private:
    const std::string& strategy_;
    const SearchLimits& limits_;
    size_t maxIterations_;
    size_t iterations_ = 0;
};

// shared contract for all strategies
class SearchStrategy {
public:
    SearchStrategy(StrategyKind kind, std::string name) : kind_(kind), name_(std::move(name)) {}
    virtual ~SearchStrategy() = default;

    StrategyKind kind() const { return kind_; }
    const std::string& name() const { return name_; }

    void setLimits(const SearchLimits& limits) { limits_ = limits; }
    const SearchLimits& limits() const { return limits_; }

    // route from start to goal, empty when none was found.
    // throws std::out_of_range when start or goal is outside the grid and
    // SearchAborted when the limits stop the search
    Path findPath(const Grid& grid, const GridCell& start, const GridCell& goal) const;

    // same search, with timing and expansion counts
    SearchResult search(const Grid& grid, const GridCell& start, const GridCell& goal) const;

protected:
    // strategy specific loop, inputs already validated and start != goal
    virtual Path run(const Grid& grid, const GridCell& start, const GridCell& goal,
                     SearchBudget& budget) const = 0;

    // default iteration cap when the caller did not set one
    virtual size_t defaultIterationBudget(const Grid& /*grid*/) const { return 0; }

private:
    StrategyKind kind_;
    std::string name_;
    SearchLimits limits_;
};

// greedy local descent ("Example").
// no cycle detection: the walk can oscillate on plateaus or when the goal is
// unreachable, so it always runs under a step budget (4 * cells by default)
class GreedyStrategy : public SearchStrategy {
public:
    GreedyStrategy() : SearchStrategy(StrategyKind::Greedy, "Example") {}

    // fixes the tie break sequence, every call restarts from this seed
    void setSeed(uint32_t seed) { seed_ = seed; }
    void clearSeed() { seed_.reset(); }

protected:
    Path run(const Grid& grid, const GridCell& start, const GridCell& goal,
             SearchBudget& budget) const override;
    size_t defaultIterationBudget(const Grid& grid) const override;

private:
    std::optional<uint32_t> seed_;
};

// depth first search with backtracking ("DFS")
class DepthFirstStrategy : public SearchStrategy {
public:
    DepthFirstStrategy() : SearchStrategy(StrategyKind::DepthFirst, "DFS") {}

protected:
    Path run(const Grid& grid, const GridCell& start, const GridCell& goal,
             SearchBudget& budget) const override;
};

// uninformed branch and bound ("BranchAndBound")
class BranchAndBoundStrategy : public SearchStrategy {
public:
    BranchAndBoundStrategy() : SearchStrategy(StrategyKind::BranchAndBound, "BranchAndBound") {}

protected:
    Path run(const Grid& grid, const GridCell& start, const GridCell& goal,
             SearchBudget& budget) const override;
};

// A* with a manhattan heuristic ("AStar")
class AStarStrategy : public SearchStrategy {
public:
    AStarStrategy() : SearchStrategy(StrategyKind::AStar, "AStar") {}

protected:
    Path run(const Grid& grid, const GridCell& start, const GridCell& goal,
             SearchBudget& budget) const override;
};
