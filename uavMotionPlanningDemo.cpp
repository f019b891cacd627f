#include <vector>
#include <iostream>
#include <filesystem>
#include <chrono>
#include "uavMotionPlanning.hpp"
#include "elog.h"

using namespace uav_planner;

int main(int argc, char *argv[])
{
    // 用法: ./uavMotionPlanningDemo [config.yaml] [lattice|prm|rrt]
    std::string config_path = "../config/planner_config.yaml";
    if (argc > 1) config_path = argv[1];

    elog_init();
    elog_set_fmt(ELOG_LVL_ASSERT, ELOG_FMT_ALL);
    elog_set_fmt(ELOG_LVL_ERROR, ELOG_FMT_LVL | ELOG_FMT_TAG | ELOG_FMT_TIME);
    elog_set_fmt(ELOG_LVL_WARN, ELOG_FMT_LVL | ELOG_FMT_TAG | ELOG_FMT_TIME);
    elog_set_fmt(ELOG_LVL_INFO, ELOG_FMT_LVL | ELOG_FMT_TAG | ELOG_FMT_TIME);
    elog_set_fmt(ELOG_LVL_DEBUG, ELOG_FMT_ALL & ~ELOG_FMT_FUNC);
    elog_set_fmt(ELOG_LVL_VERBOSE, ELOG_FMT_ALL & ~ELOG_FMT_FUNC);
    elog_start();

    std::cout << "Using config file: " << config_path << std::endl;

    UavMotionPlanner planner;
    if (planner.loadConfig(config_path) != PlanStatus::Success) {
        std::cerr << "Failed to load config " << config_path << std::endl;
        return 1;
    }

    if (argc > 2) {
        PlannerConfig config = planner.config();
        config.planner.algorithm = argv[2];
        if (planner.setConfig(config) != PlanStatus::Success) {
            std::cerr << "Unknown algorithm: " << argv[2] << ". Please use one of: lattice, prm, rrt" << std::endl;
            return 1;
        }
    }

    // 障碍物文件和输出目录相对于配置文件所在目录
    std::filesystem::path base_dir = std::filesystem::path(config_path).parent_path().parent_path();
    PlannerConfig config = planner.config();
    if (std::filesystem::path(config.environment.obstacleFile).is_relative()) {
        config.environment.obstacleFile = (base_dir / config.environment.obstacleFile).string();
    }
    std::filesystem::path output_dir = config.trajectory.outputDirectory;
    if (output_dir.is_relative()) output_dir = base_dir / output_dir;
    if (planner.setConfig(config) != PlanStatus::Success) {
        return 1;
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    PlanStatus status = planner.run();
    auto end_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end_time - start_time;

    std::cout << "Planner: " << planner.config().planner.algorithm
              << ", status: " << planStatusToString(status)
              << ", time: " << elapsed.count() << "s" << std::endl;

    // 规划失败时仍输出带状态的 JSON
    json result_json;
    if (!planner.getPlan(result_json) && status == PlanStatus::Success) {
        std::cerr << "Failed to build plan output" << std::endl;
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "Cannot create output directory " << output_dir << ": " << ec.message() << std::endl;
        return 1;
    }
    if (!UavMotionPlanner::saveJsonToFile(result_json, (output_dir / "plan_output.json").string())) {
        return 1;
    }

    if (status != PlanStatus::Success) {
        std::cerr << "Failed to plan!" << std::endl;
        return 2;
    }

    std::cout << "Path waypoints: " << planner.path().size()
              << ", length: " << pathLength(planner.path()) << " m" << std::endl;
    std::cout << "Trajectory time: " << math_util::TrajectoryDuration(planner.segments())
              << " s, samples: " << planner.samples().size() << std::endl;

    if (!planner.savePathCsv((output_dir / "path.csv").string()) ||
        !planner.saveTrajectoryCsv((output_dir / "trajectory.csv").string())) {
        return 1;
    }
    return 0;
}
