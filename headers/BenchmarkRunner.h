#pragma once
#include <atomic>
#include <ostream>
#include <string>
#include <vector>
#include <cstdint>
#include "Grid.h"
#include "SearchStrategy.h"

// statistics for a single strategy in the benchmark
struct StrategyStats {
    StrategyKind strategy = StrategyKind::AStar;
    std::string name;

    // progress
    int trials = 0;
    int completedTrials = 0;        // trials that returned without aborting
    bool found = false;

    // route quality (from the last completed trial)
    size_t pathLength = 0;          // cells on the path
    int pathCost = 0;

    // timing and effort averaged over completed trials
    double totalComputeTimeMs = 0.0;
    double avgComputeTimeMs = 0.0;
    long long totalNodesExpanded = 0;
    long long avgNodesExpanded = 0;

    std::string error;              // what() of the abort, empty when every trial completed

    // ranking
    int rank = 0;                   // 1 = fastest strategy that found the goal, 0 = unranked
};

// one point of the scaling experiment per strategy
struct ScalingResult {
    StrategyKind strategy;
    std::string name;
    int problemSize;           // N (open maze cells)
    double timeMs;             // average compute time, negative when aborted
    double ratio;              // T(level) / T(level - 1)
    std::string estimatedBigO; // estimated complexity
};

// runs several strategies against one read only grid, one async task per
// strategy (or per chunk of strategies when a thread count is given)
class BenchmarkRunner {
public:
    explicit BenchmarkRunner(size_t numThreads = 0);

    void setStrategies(const std::vector<StrategyKind>& strategies) { strategies_ = strategies; }
    void setTrials(int trials) { trials_ = trials < 1 ? 1 : trials; }
    int getTrials() const { return trials_; }
    void setMaxIterations(size_t maxIterations) { maxIterations_ = maxIterations; }
    void setGreedySeed(uint32_t seed) { greedySeed_ = seed; hasGreedySeed_ = true; }

    // all four strategies in registry order
    static const std::vector<StrategyKind>& allStrategies();

    // runs every strategy trials times, blocks until all tasks finished
    const std::vector<StrategyStats>& run(const Grid& grid, const GridCell& start, const GridCell& goal);

    // asks running searches to stop at their next iteration. safe to call from
    // another thread. a request made while no run is active stops the next one,
    // every run clears the request once its tasks have finished
    void cancel() { cancelRequested_.store(true); }

    // rebuilds mazes of growing size and measures how each strategy scales
    const std::vector<ScalingResult>& runScalingExperiment(int levels, uint32_t seed);

    void printReport(std::ostream& out) const;
    void printScalingReport(std::ostream& out) const;

    static std::string estimateBigO(double ratio);

private:
    size_t numThreads_;
    std::vector<StrategyKind> strategies_;
    int trials_ = 1;
    size_t maxIterations_ = 0;
    uint32_t greedySeed_ = 0;
    bool hasGreedySeed_ = false;

    std::atomic<bool> cancelRequested_{false};

    std::vector<StrategyStats> stats_;
    std::vector<ScalingResult> scalingResults_;

    StrategyStats runStrategy(StrategyKind kind, const Grid& grid, const GridCell& start,
                              const GridCell& goal) const;
    void updateRankings();
};
