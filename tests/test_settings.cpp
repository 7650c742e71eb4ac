#include <doctest/doctest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include "EngineSettings.h"
#include "GridBuilder.h"
#include "SearchStrategy.h"
#include "StrategyRegistry.h"

namespace {

std::string tempFile(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST_CASE("Settings/save then load keeps every field") {
    EngineSettings saved;
    saved.gridSource = EngineSettings::GridSource::Maze;
    saved.rows = 20;
    saved.cols = 30;
    saved.minCost = 2;
    saved.maxCost = 7;
    saved.obstacleCount = 11;
    saved.mazeCellsX = 12;
    saved.mazeCellsY = 9;
    saved.imagePath = "maps/level one.png";
    saved.seed = 4242;
    saved.strategy = "BranchAndBound";
    saved.startRow = 3;
    saved.goalCol = 25;
    saved.maxIterations = 5000;
    saved.trials = 5;
    saved.benchmarkThreads = 2;
    saved.scalingLevels = 6;

    const std::string path = tempFile("gridroute_settings_roundtrip.cfg");
    REQUIRE(saved.saveToFile(path));

    EngineSettings loaded;
    REQUIRE(loaded.loadFromFile(path));
    std::remove(path.c_str());

    CHECK(loaded.gridSource == EngineSettings::GridSource::Maze);
    CHECK(loaded.rows == 20);
    CHECK(loaded.cols == 30);
    CHECK(loaded.minCost == 2);
    CHECK(loaded.maxCost == 7);
    CHECK(loaded.obstacleCount == 11);
    CHECK(loaded.mazeCellsX == 12);
    CHECK(loaded.mazeCellsY == 9);
    CHECK(loaded.imagePath == "maps/level one.png");
    CHECK(loaded.seed == 4242);
    CHECK(loaded.strategy == "BranchAndBound");
    CHECK(loaded.startRow == 3);
    CHECK(loaded.goalCol == 25);
    CHECK(loaded.maxIterations == 5000);
    CHECK(loaded.trials == 5);
    CHECK(loaded.benchmarkThreads == 2);
    CHECK(loaded.scalingLevels == 6);
}

TEST_CASE("Settings/missing file is reported") {
    EngineSettings settings;
    CHECK_FALSE(settings.loadFromFile(tempFile("gridroute_settings_does_not_exist.cfg")));
    CHECK(settings.strategy == "AStar");
}

TEST_CASE("Settings/bad number fails the load") {
    const std::string path = tempFile("gridroute_settings_bad.cfg");
    {
        std::ofstream out(path);
        out << "# broken\n";
        out << "rows=twelve\n";
    }

    EngineSettings settings;
    CHECK_FALSE(settings.loadFromFile(path));
    std::remove(path.c_str());
}

TEST_CASE("Settings/comments and unknown keys are skipped") {
    const std::string path = tempFile("gridroute_settings_unknown.cfg");
    {
        std::ofstream out(path);
        out << "# comment line\n";
        out << "\n";
        out << "colour=blue\n";
        out << "strategy=DFS\n";
        out << "no equals sign here\n";
    }

    EngineSettings settings;
    CHECK(settings.loadFromFile(path));
    CHECK(settings.strategy == "DFS");
    std::remove(path.c_str());
}

TEST_CASE("Settings/validateAndClamp pulls values into range") {
    EngineSettings settings;
    settings.gridSource = EngineSettings::GridSource::Open;
    settings.rows = 0;
    settings.cols = 10;
    settings.minCost = 5;
    settings.maxCost = 2;
    settings.trials = 0;
    settings.scalingLevels = 20;
    settings.maxIterations = -4;
    settings.goalRow = 99;
    settings.goalCol = -3;
    settings.strategy.clear();

    settings.validateAndClamp();

    CHECK(settings.rows == 1);
    CHECK(settings.maxCost == 5);
    CHECK(settings.trials == 1);
    CHECK(settings.scalingLevels == 8);
    CHECK(settings.maxIterations == 0);
    CHECK(settings.goalRow == 0);
    CHECK(settings.goalCol == 0);
    CHECK(settings.strategy == "AStar");
}

TEST_CASE("Settings/image endpoints are left for the loaded grid to check") {
    EngineSettings settings;
    settings.gridSource = EngineSettings::GridSource::Image;
    settings.rows = 4;
    settings.goalRow = 40;

    settings.validateAndClamp();
    CHECK(settings.goalRow == 40);
    CHECK(std::string(EngineSettings::gridSourceName(settings.gridSource)) == "Image");
}

TEST_CASE("Settings/negative or oversized seed fails the load") {
    const std::string path = tempFile("gridroute_settings_seed.cfg");

    for (const char* value : {"-1", " -7", "4294967296"}) {
        CAPTURE(value);
        {
            std::ofstream out(path);
            out << "seed=" << value << "\n";
        }
        EngineSettings settings;
        CHECK_FALSE(settings.loadFromFile(path));
        CHECK(settings.seed == 1234);
    }

    {
        std::ofstream out(path);
        out << "seed=4294967295\n";
    }
    EngineSettings settings;
    CHECK(settings.loadFromFile(path));
    CHECK(settings.seed == 4294967295u);
    std::remove(path.c_str());
}

TEST_CASE("Settings/default grid is solved by the cost optimal strategies") {
    EngineSettings settings;
    settings.validateAndClamp();
    CHECK(settings.gridSource == EngineSettings::GridSource::Maze);

    // the open grid the defaults describe has to stay within the same cap
    EngineSettings open;
    open.gridSource = EngineSettings::GridSource::Open;
    open.validateAndClamp();

    for (const EngineSettings& config : {settings, open}) {
        CAPTURE(EngineSettings::gridSourceName(config.gridSource));
        Grid grid(1, 1);
        GridCell start{0, 0};
        GridCell goal{0, 0};
        REQUIRE(buildGrid(config, grid, start, goal));

        SearchLimits limits;
        limits.maxIterations = static_cast<size_t>(config.maxIterations);

        for (const char* name : {"BranchAndBound", "AStar"}) {
            CAPTURE(name);
            auto strategy = createAgent(name);
            strategy->setLimits(limits);
            SearchResult result = strategy->search(grid, start, goal);
            CHECK(result.found);
            CHECK_FALSE(result.path.empty());
        }
    }
}
