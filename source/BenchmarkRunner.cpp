#include "BenchmarkRunner.h"
#include "StrategyRegistry.h"
#include <algorithm>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>

// maze sizes for the scaling experiment, each level roughly doubles N
static const int SCALING_MAZE_CELLS[][2] = {
    {8, 6},   // 48 cells
    {12, 9},  // 108 cells (~2.25x)
    {16, 12}, // 192 cells (~1.78x)
    {24, 18}, // 432 cells (~2.25x)
    {32, 24}, // 768 cells (~1.78x)
    {48, 36}, // 1728 cells (~2.25x)
    {64, 48}, // 3072 cells (~1.78x)
    {96, 72}  // 6912 cells (~2.25x)
};
static const int SCALING_LEVEL_COUNT = 8;

BenchmarkRunner::BenchmarkRunner(size_t numThreads)
    : numThreads_(numThreads), strategies_(allStrategies())
{
}

const std::vector<StrategyKind> &BenchmarkRunner::allStrategies()
{
    static const std::vector<StrategyKind> strategies = {
        StrategyKind::Greedy,
        StrategyKind::DepthFirst,
        StrategyKind::BranchAndBound,
        StrategyKind::AStar};
    return strategies;
}

StrategyStats BenchmarkRunner::runStrategy(StrategyKind kind, const Grid &grid, const GridCell &start,
                                           const GridCell &goal) const
{
    StrategyStats stat;
    stat.strategy = kind;
    stat.name = strategyName(kind);
    stat.trials = trials_;

    // each task owns its strategy object, the grid is shared read only
    std::unique_ptr<SearchStrategy> strategy = createAgent(kind);
    SearchLimits limits;
    limits.maxIterations = maxIterations_;
    limits.cancel = &cancelRequested_;
    strategy->setLimits(limits);

    if (hasGreedySeed_ && kind == StrategyKind::Greedy)
    {
        static_cast<GreedyStrategy &>(*strategy).setSeed(greedySeed_);
    }

    for (int t = 0; t < trials_; ++t)
    {
        try
        {
            SearchResult res = strategy->search(grid, start, goal);
            stat.completedTrials++;
            stat.found = res.found;
            stat.pathLength = res.path.size();
            stat.pathCost = res.pathCost;
            stat.totalComputeTimeMs += res.computeTimeMs;
            stat.totalNodesExpanded += res.nodesExpanded;
        }
        catch (const SearchAborted &e)
        {
            // an aborted trial is recorded and the remaining trials are skipped
            stat.error = e.what();
            break;
        }
    }

    if (stat.completedTrials > 0)
    {
        stat.avgComputeTimeMs = stat.totalComputeTimeMs / stat.completedTrials;
        stat.avgNodesExpanded = stat.totalNodesExpanded / stat.completedTrials;
    }
    return stat;
}

const std::vector<StrategyStats> &BenchmarkRunner::run(const Grid &grid, const GridCell &start, const GridCell &goal)
{
    // bad endpoints are a caller error, report them before spawning anything
    if (!grid.inBounds(start) || !grid.inBounds(goal))
    {
        throw std::out_of_range("BenchmarkRunner: start or goal is outside the grid");
    }

    stats_.assign(strategies_.size(), StrategyStats{});

    const size_t work = strategies_.size();
    if (work == 0)
    {
        cancelRequested_.store(false);
        return stats_;
    }

    // one task per strategy unless a thread count was given, then equal chunks
    const size_t taskCount = (numThreads_ == 0) ? work : std::min(numThreads_, work);
    const size_t chunkSize = (work + taskCount - 1) / taskCount;

    std::vector<std::future<void>> futures;
    futures.reserve(taskCount);

    for (size_t taskId = 0; taskId < taskCount; ++taskId)
    {
        size_t startIdx = taskId * chunkSize;
        size_t endIdx = std::min(startIdx + chunkSize, work);

        if (startIdx >= work)
            break;

        // every task writes only its own slice of stats_
        futures.emplace_back(std::async(std::launch::async, [this, &grid, start, goal, startIdx, endIdx]()
                                        {
            for (size_t i = startIdx; i < endIdx; ++i)
            {
                stats_[i] = runStrategy(strategies_[i], grid, start, goal);
            } }));
    }

    // waits for all tasks to complete, get() rethrows anything unexpected
    for (auto &future : futures)
    {
        future.get();
    }
    cancelRequested_.store(false);

    updateRankings();
    return stats_;
}

void BenchmarkRunner::updateRankings()
{
    // strategies that found the goal rank by average compute time, the rest stay unranked
    std::vector<size_t> indices;
    for (size_t i = 0; i < stats_.size(); i++)
    {
        stats_[i].rank = 0;
        if (stats_[i].found && stats_[i].error.empty())
            indices.push_back(i);
    }

    std::sort(indices.begin(), indices.end(), [this](size_t a, size_t b)
              {
        if (stats_[a].avgComputeTimeMs != stats_[b].avgComputeTimeMs) {
            return stats_[a].avgComputeTimeMs < stats_[b].avgComputeTimeMs;
        }
        return stats_[a].pathCost < stats_[b].pathCost; });

    int nextRank = 1;
    for (size_t idx : indices)
    {
        stats_[idx].rank = nextRank++;
    }
}

std::string BenchmarkRunner::estimateBigO(double ratio)
{
    // ratio of average times between consecutive maze levels. levels grow N by
    // about 2x, so linear work lands near 2 and quadratic near 4.
    // bands are wide, small mazes are noisy
    if (ratio < 1.2)
        return "O(1)";
    if (ratio < 1.5)
        return "O(log n)";
    if (ratio < 2.5)
        return "O(n)";
    if (ratio < 3.5)
        return "O(n log n)";
    if (ratio < 5.0)
        return "O(n^2)";
    return "O(n^2+)";
}

const std::vector<ScalingResult> &BenchmarkRunner::runScalingExperiment(int levels, uint32_t seed)
{
    scalingResults_.clear();
    levels = std::clamp(levels, 1, SCALING_LEVEL_COUNT);

    // same maze sequence for every strategy so the ratios are comparable
    std::vector<Grid> mazes;
    std::vector<MazeEnds> ends;
    for (int level = 0; level < levels; ++level)
    {
        Grid maze(1, 1);
        ends.push_back(maze.generateMaze(SCALING_MAZE_CELLS[level][0], SCALING_MAZE_CELLS[level][1],
                                         seed + static_cast<uint32_t>(level)));
        mazes.push_back(std::move(maze));
    }

    for (StrategyKind kind : strategies_)
    {
        double prevTime = 0.0;
        for (int level = 0; level < levels; ++level)
        {
            StrategyStats stat = runStrategy(kind, mazes[level], ends[level].entrance, ends[level].exit);
            int problemSize = SCALING_MAZE_CELLS[level][0] * SCALING_MAZE_CELLS[level][1];

            if (stat.completedTrials == 0)
            {
                // aborted (greedy usually runs out of budget in a maze)
                scalingResults_.push_back({kind, stat.name, problemSize, -1.0, 0.0, "aborted"});
                prevTime = 0.0;
                continue;
            }

            double avgMs = stat.avgComputeTimeMs;
            double ratio = (level == 0 || prevTime <= 0.0) ? 0.0 : avgMs / prevTime;
            std::string est = (ratio <= 0.0) ? "--" : estimateBigO(ratio);
            scalingResults_.push_back({kind, stat.name, problemSize, avgMs, ratio, est});
            prevTime = avgMs;
        }
    }
    cancelRequested_.store(false);

    return scalingResults_;
}

void BenchmarkRunner::printReport(std::ostream &out) const
{
    out << std::left << std::setw(16) << "Strategy"
        << std::setw(6) << "Rank"
        << std::setw(12) << "Search"
        << std::setw(9) << "Optimal"
        << std::setw(7) << "Found"
        << std::setw(8) << "Cells"
        << std::setw(8) << "Cost"
        << std::setw(12) << "Avg ms"
        << std::setw(12) << "Avg nodes"
        << "Note" << "\n";

    for (const auto &stat : stats_)
    {
        out << std::left << std::setw(16) << stat.name
            << std::setw(6) << (stat.rank > 0 ? std::to_string(stat.rank) : "-")
            << std::setw(12) << (isExplorer(stat.strategy) ? "uninformed" : "informed")
            << std::setw(9) << (isCostOptimal(stat.strategy) ? "yes" : "no")
            << std::setw(7) << (stat.found ? "yes" : "no")
            << std::setw(8) << stat.pathLength
            << std::setw(8) << stat.pathCost
            << std::setw(12) << std::fixed << std::setprecision(3) << stat.avgComputeTimeMs
            << std::setw(12) << stat.avgNodesExpanded
            << stat.error << "\n";
    }
}

void BenchmarkRunner::printScalingReport(std::ostream &out) const
{
    out << std::left << std::setw(16) << "Strategy"
        << std::setw(8) << "N"
        << std::setw(12) << "ms"
        << std::setw(8) << "ratio"
        << "estimate" << "\n";

    for (const auto &res : scalingResults_)
    {
        out << std::left << std::setw(16) << res.name
            << std::setw(8) << res.problemSize;
        if (res.timeMs < 0.0)
            out << std::setw(12) << "-";
        else
            out << std::setw(12) << std::fixed << std::setprecision(3) << res.timeMs;
        out << std::setw(8) << std::fixed << std::setprecision(2) << res.ratio
            << res.estimatedBigO << "\n";
    }
}
