#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>
#include "uavMotionPlanning.hpp"

using namespace uav_planner;

namespace {

const math_util::WGS84Coord kHome(-122.397450, 37.792480, 0.0);

// 两堵墙之间留出 y in (-2, 2) 的缺口, 墙高于栅格范围; 缺口上方 z in [8, 10] 有顶板
std::vector<Obstacle> corridorWorld() {
    return {{Point3(0, 11, 10), Point3(1, 9, 10)},
            {Point3(0, -11, 10), Point3(1, 9, 10)},
            {Point3(0, 0, 9), Point3(1, 2, 1)}};
}

// L 形航线, 拐角外侧 (y < 0) 有一块障碍物, 直线段本身无碰撞
const Path kLRoute = {Point3(0, 0, 2), Point3(10, 0, 2), Point3(10, 10, 2)};

std::vector<Obstacle> lRouteWorld() {
    return {{Point3(5, -2, 2), Point3(1.5, 0.5, 1.5)}};
}

PlannerConfig corridorConfig(double margin) {
    PlannerConfig config;
    config.environment.marginOfSafety = margin;
    config.planner.algorithm = "lattice";
    config.lattice.lattice.center = Point3(0, 0, 5);
    config.lattice.lattice.halfSizes = Point3(10, 10, 5);
    config.lattice.lattice.resolution = Point3::Constant(1.0);
    config.lattice.lattice.connectivity = LatticeConnectivity::Full;
    config.lattice.volumeFromObstacles = false;
    config.mission.startLocal = Point3(-8, 0, 2);
    config.mission.goalLocal = Point3(8, 0, 2);
    return config;
}

// 开阔空间中单个障碍物
PlannerConfig openConfig(const std::string &algorithm) {
    PlannerConfig config;
    config.environment.marginOfSafety = 0.5;
    config.planner.algorithm = algorithm;

    Box3 volume;
    volume.min = Point3(-10, -10, 0);
    volume.max = Point3(10, 10, 10);
    config.prm.roadmap.volume = volume;
    config.prm.roadmap.sampleCount = 300;
    config.prm.roadmap.neighbors = 8;
    config.prm.volumeFromObstacles = false;
    config.prm.seed = 42;

    config.rrt.rrt.volume = volume;
    config.rrt.rrt.stepSize = 1.5;
    config.rrt.rrt.goalTolerance = 1.0;
    config.rrt.rrt.maxIterations = 20000;
    config.rrt.rrt.goalBias = 0.05;
    config.rrt.volumeFromObstacles = false;
    config.rrt.seed = 7;

    config.mission.startLocal = Point3(-8, 0, 3);
    config.mission.goalLocal = Point3(8, 0, 3);
    return config;
}

void expectFlyable(const UavMotionPlanner &planner) {
    const Path &path = planner.path();
    ASSERT_GE(path.size(), 2u);
    EXPECT_EQ(path.front(), planner.start());
    EXPECT_EQ(path.back(), planner.goal());
    for (size_t i = 1; i < path.size(); ++i) {
        EXPECT_NE(path[i], path[i - 1]);
    }

    CollisionChecker checker(planner.map());
    EXPECT_TRUE(isPathFree(path, checker));
    ASSERT_FALSE(planner.samples().empty());
    for (const auto &s : planner.samples()) {
        EXPECT_TRUE(checker.isFree(s.position)) << "t = " << s.time;
    }
    EXPECT_NEAR((planner.samples().back().position - planner.goal()).norm(), 0.0, 1e-6);
}

}  // namespace

TEST(PlannerPipeline, LatticePassesThroughCorridor) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(corridorConfig(0.5)), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(corridorWorld(), kHome), PlanStatus::Success);

    ASSERT_EQ(planner.planPath(), PlanStatus::Success);
    EXPECT_EQ(planner.plannerName(), "lattice");
    ASSERT_EQ(planner.generateTrajectory(), PlanStatus::Success);
    expectFlyable(planner);

    // 轨迹航点以规划路径为骨架
    EXPECT_GE(planner.trajectoryWaypoints().size(), planner.path().size());
    EXPECT_EQ(planner.segments().size(), planner.trajectoryWaypoints().size() - 1);
}

TEST(PlannerPipeline, CeilingBlocksFlightOverGap) {
    PlannerConfig config = corridorConfig(0.5);
    config.mission.startLocal = Point3(-8, 0, 9);
    config.mission.goalLocal = Point3(8, 0, 9);
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(config), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(corridorWorld(), kHome), PlanStatus::Success);

    ASSERT_EQ(planner.planPath(), PlanStatus::Success);
    CollisionChecker checker(planner.map());
    EXPECT_FALSE(checker.isSegmentFree(planner.start(), planner.goal()));
    // 只能从顶板下方穿过缺口
    EXPECT_GT(planner.path().size(), 2u);
    EXPECT_TRUE(isPathFree(planner.path(), checker));
}

TEST(PlannerPipeline, InflatedWallsCloseCorridor) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(corridorConfig(2.5)), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(corridorWorld(), kHome), PlanStatus::Success);

    EXPECT_EQ(planner.planPath(), PlanStatus::NoPathFound);
    EXPECT_EQ(planner.lastStatus(), PlanStatus::NoPathFound);
    EXPECT_TRUE(planner.path().empty());
}

TEST(PlannerPipeline, StartInsideObstacleIsRejected) {
    PlannerConfig config = corridorConfig(0.5);
    config.mission.startLocal = Point3(0, 8, 2);
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(config), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(corridorWorld(), kHome), PlanStatus::Success);
    EXPECT_EQ(planner.planPath(), PlanStatus::ValidationError);
}

TEST(PlannerPipeline, PlanWithoutEnvironmentFails) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(corridorConfig(0.5)), PlanStatus::Success);
    EXPECT_EQ(planner.planPath(), PlanStatus::ValidationError);
}

TEST(PlannerPipeline, RoadmapInOpenSpace) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(openConfig("prm")), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment({{Point3(0, 0, 5), Point3(2, 2, 5)}}, kHome), PlanStatus::Success);

    ASSERT_EQ(planner.planPath(), PlanStatus::Success);
    EXPECT_EQ(planner.plannerName(), "prm");
    ASSERT_EQ(planner.generateTrajectory(), PlanStatus::Success);
    expectFlyable(planner);
}

TEST(PlannerPipeline, RrtInOpenSpace) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(openConfig("rrt")), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment({{Point3(0, 0, 5), Point3(2, 2, 5)}}, kHome), PlanStatus::Success);

    ASSERT_EQ(planner.planPath(), PlanStatus::Success);
    EXPECT_EQ(planner.plannerName(), "rrt");
    ASSERT_EQ(planner.generateTrajectory(), PlanStatus::Success);
    expectFlyable(planner);
}

TEST(PlannerPipeline, GeodeticMissionIsConvertedToLocal) {
    PlannerConfig config = corridorConfig(0.5);
    config.mission.useGps = true;
    config.mission.startGps = math_util::local_to_geodetic(Point3(-8, 0, 2), kHome);
    config.mission.goalGps = math_util::local_to_geodetic(Point3(8, 0, 2), kHome);

    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(config), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(corridorWorld(), kHome), PlanStatus::Success);
    ASSERT_EQ(planner.planPath(), PlanStatus::Success);
    EXPECT_NEAR((planner.start() - Point3(-8, 0, 2)).norm(), 0.0, 1e-3);
    EXPECT_NEAR((planner.goal() - Point3(8, 0, 2)).norm(), 0.0, 1e-3);
}

TEST(PlannerPipeline, PlanJsonDescribesResult) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(corridorConfig(0.5)), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(corridorWorld(), kHome), PlanStatus::Success);
    ASSERT_EQ(planner.planPath(), PlanStatus::Success);
    ASSERT_EQ(planner.generateTrajectory(), PlanStatus::Success);

    json out;
    ASSERT_TRUE(planner.getPlan(out));
    EXPECT_EQ(out["planner"], "lattice");
    EXPECT_EQ(out["status"], "Success");
    EXPECT_EQ(out["obstacle_count"], 3);
    EXPECT_EQ(out["path_local"].size(), planner.path().size());
    EXPECT_EQ(out["path_wgs84"].size(), planner.path().size());
    EXPECT_EQ(out["segment_durations"].size(), planner.segments().size());
    EXPECT_EQ(out["trajectory"]["sample_count"], planner.samples().size());
    EXPECT_GT(out["trajectory"]["max_speed"].get<double>(), 0.0);

    // 起点换算回经纬度后应接近 home
    const json &first = out["path_wgs84"][0];
    EXPECT_NEAR(first[0].get<double>(), kHome.lon, 1e-3);
    EXPECT_NEAR(first[1].get<double>(), kHome.lat, 1e-3);
}

TEST(PlannerPipeline, FailedPlanReportsStatus) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(corridorConfig(2.5)), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(corridorWorld(), kHome), PlanStatus::Success);
    ASSERT_EQ(planner.planPath(), PlanStatus::NoPathFound);

    json out;
    EXPECT_FALSE(planner.getPlan(out));
    EXPECT_EQ(out["status"], "NoPathFound");
    EXPECT_TRUE(out["path_local"].empty());
}

TEST(PlannerPipeline, TrajectoryRefinementInsertsMidpoints) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(corridorConfig(0.5)), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(lRouteWorld(), kHome), PlanStatus::Success);
    ASSERT_EQ(planner.setPath(kLRoute), PlanStatus::Success);
    EXPECT_EQ(planner.plannerName(), "waypoints");

    // 直接拟合时, 第一段在拐角前向 y < 0 外摆, 进入障碍物
    CollisionChecker checker(planner.map());
    math_util::TrajectoryGeneratorTool tool;
    std::vector<math_util::TrajectorySegment> segments;
    std::vector<math_util::MotionSample> samples;
    ASSERT_TRUE(tool.FitTrajectory(kLRoute, 2.0, 0.1, segments));
    ASSERT_TRUE(math_util::SampleTrajectory(segments, 0.1, samples));
    size_t hits = 0;
    for (const auto &s : samples) {
        if (!checker.isFree(s.position)) ++hits;
    }
    ASSERT_GT(hits, 0u);

    ASSERT_EQ(planner.generateTrajectory(), PlanStatus::Success);
    EXPECT_EQ(planner.path().size(), 3u);
    EXPECT_GT(planner.trajectoryWaypoints().size(), planner.path().size());
    ASSERT_EQ(planner.trajectoryWaypoints().size(), 4u);
    EXPECT_EQ(planner.trajectoryWaypoints()[1], Point3(5, 0, 2));
    EXPECT_EQ(planner.segments().size(), 3u);
    expectFlyable(planner);
}

TEST(PlannerPipeline, RefinementLimitGivesNoPath) {
    PlannerConfig config = corridorConfig(0.5);
    config.trajectory.maxRefinements = 0;
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(config), PlanStatus::Success);
    ASSERT_EQ(planner.loadEnvironment(lRouteWorld(), kHome), PlanStatus::Success);
    ASSERT_EQ(planner.setPath(kLRoute), PlanStatus::Success);

    EXPECT_EQ(planner.generateTrajectory(), PlanStatus::NoPathFound);
    EXPECT_EQ(planner.lastStatus(), PlanStatus::NoPathFound);
    EXPECT_TRUE(planner.segments().empty());
    EXPECT_TRUE(planner.samples().empty());
}

TEST(PlannerPipeline, SetPathRejectsBlockedRoute) {
    UavMotionPlanner planner;
    ASSERT_EQ(planner.setConfig(corridorConfig(0.5)), PlanStatus::Success);
    EXPECT_EQ(planner.setPath(kLRoute), PlanStatus::ValidationError);

    ASSERT_EQ(planner.loadEnvironment(lRouteWorld(), kHome), PlanStatus::Success);
    EXPECT_EQ(planner.setPath({Point3(5, 0, 2), Point3(5, -5, 2)}), PlanStatus::ValidationError);
    EXPECT_EQ(planner.setPath({Point3(1, 1, 1), Point3(1, 1, 1)}), PlanStatus::ValidationError);
    EXPECT_TRUE(planner.path().empty());
}

TEST(PlannerFactory, LatticePlannerKeepsSearchResult) {
    ObstacleMap map;
    ASSERT_EQ(ObstacleMap::load(corridorWorld(), 0.5, kHome, map), PlanStatus::Success);
    CollisionChecker checker(map);

    PlannerConfig config = corridorConfig(0.5);
    LatticePathPlanner planner(config.lattice.lattice, config.lattice.connectNeighbors, checker);
    Path path;
    ASSERT_EQ(planner.plan(Point3(-8, 0, 2), Point3(8, 0, 2), path), PlanStatus::Success);

    const SearchResult &search = planner.lastSearch();
    EXPECT_EQ(search.path, path);
    ASSERT_EQ(search.nodeIds.size(), path.size());
    EXPECT_EQ(planner.graph().node(search.nodeIds.front()).position, Point3(-8, 0, 2));
    EXPECT_EQ(planner.graph().node(search.nodeIds.back()).position, Point3(8, 0, 2));
    // 缺口中 y = 0, z = 2 一行栅格自由, 最短路为直线
    EXPECT_NEAR(search.cost, 16.0, 1e-9);
    EXPECT_NEAR(pathLength(path), search.cost, 1e-9);
    EXPECT_GT(search.expansions, 0u);
}

TEST(PlannerFactory, RoadmapPlannerKeepsSearchResult) {
    ObstacleMap map;
    ASSERT_EQ(ObstacleMap::load({{Point3(0, 0, 5), Point3(2, 2, 5)}}, 0.5, kHome, map), PlanStatus::Success);
    CollisionChecker checker(map);

    PlannerConfig config = openConfig("prm");
    RoadmapPathPlanner planner(config.prm.roadmap, config.prm.seed, checker);
    Path path;
    ASSERT_EQ(planner.plan(config.mission.startLocal, config.mission.goalLocal, path), PlanStatus::Success);

    // 300 个采样点加上接入的起终点
    EXPECT_EQ(planner.graph().nodeCount(), 302u);
    const SearchResult &search = planner.lastSearch();
    EXPECT_EQ(search.path, path);
    ASSERT_EQ(search.nodeIds.size(), path.size());
    EXPECT_EQ(search.nodeIds.front(), 300);
    EXPECT_EQ(search.nodeIds.back(), 301);
    EXPECT_NEAR(pathLength(path), search.cost, 1e-9);
}

TEST(PlannerFactory, TreePlannerKeepsTree) {
    ObstacleMap map;
    ASSERT_EQ(ObstacleMap::load({{Point3(0, 0, 5), Point3(2, 2, 5)}}, 0.5, kHome, map), PlanStatus::Success);
    CollisionChecker checker(map);

    PlannerConfig config = openConfig("rrt");
    TreePathPlanner planner(config.rrt.rrt, config.rrt.seed, checker);
    Path path;
    ASSERT_EQ(planner.plan(config.mission.startLocal, config.mission.goalLocal, path), PlanStatus::Success);

    const RrtPlanner &tree = planner.tree();
    EXPECT_EQ(tree.state(), RrtPlanner::State::GoalReached);
    EXPECT_GT(tree.iterations(), 0);
    ASSERT_FALSE(tree.nodes().empty());
    EXPECT_EQ(tree.nodes().front().position, config.mission.startLocal);
    EXPECT_EQ(tree.nodes().front().parent, -1);
    EXPECT_EQ(path.front(), config.mission.startLocal);
    EXPECT_EQ(path.back(), config.mission.goalLocal);
}

TEST(PlannerFactory, CreatesPlannerByName) {
    ObstacleMap map;
    ASSERT_EQ(ObstacleMap::load(corridorWorld(), 0.5, kHome, map), PlanStatus::Success);
    CollisionChecker checker(map);

    PlannerConfig config = openConfig("lattice");
    for (const char *name : {"lattice", "prm", "rrt"}) {
        config.planner.algorithm = name;
        std::unique_ptr<PathPlannerBase> planner = createPathPlanner(config, checker);
        ASSERT_NE(planner, nullptr);
        EXPECT_EQ(planner->name(), name);
    }
    config.planner.algorithm = "dijkstra";
    EXPECT_EQ(createPathPlanner(config, checker), nullptr);
}

TEST(PlannerConfig, LoadsYamlSections) {
    YAML::Node root = YAML::Load(
        "environment: {obstacle_file: foo.csv, margin_of_safety: 3.5}\n"
        "planner: {algorithm: prm, shortcut: false}\n"
        "lattice: {center: [1, 2, 3], halfsizes: 4, resolution: [1, 1, 2], connectivity: partial}\n"
        "prm: {density: 0.01, neighbors: 5, seed: 9}\n"
        "rrt: {lower: [0, 0, 0], upper: [10, 10, 5], step_size: 2.0, goal_bias: 0.1}\n"
        "mission: {start_local: [0, 0, 1], goal_local: [5, 5, 1]}\n"
        "trajectory: {average_speed: 3.0, sample_dt: 0.05, max_refinements: 4}\n");

    PlannerConfig config;
    ASSERT_TRUE(config.loadFromNode(root));
    EXPECT_EQ(config.environment.obstacleFile, "foo.csv");
    EXPECT_DOUBLE_EQ(config.environment.marginOfSafety, 3.5);
    EXPECT_EQ(config.planner.algorithm, "prm");
    EXPECT_FALSE(config.planner.shortcut);

    EXPECT_FALSE(config.lattice.volumeFromObstacles);
    EXPECT_EQ(config.lattice.lattice.center, Point3(1, 2, 3));
    EXPECT_EQ(config.lattice.lattice.halfSizes, Point3(4, 4, 4));
    EXPECT_EQ(config.lattice.lattice.resolution, Point3(1, 1, 2));
    EXPECT_EQ(config.lattice.lattice.connectivity, LatticeConnectivity::Face);

    EXPECT_TRUE(config.prm.volumeFromObstacles);
    EXPECT_DOUBLE_EQ(config.prm.roadmap.density, 0.01);
    EXPECT_EQ(config.prm.roadmap.neighbors, 5);
    EXPECT_EQ(config.prm.seed, 9u);

    EXPECT_FALSE(config.rrt.volumeFromObstacles);
    EXPECT_EQ(config.rrt.rrt.volume.max, Point3(10, 10, 5));
    EXPECT_DOUBLE_EQ(config.rrt.rrt.goalBias, 0.1);

    EXPECT_FALSE(config.mission.useGps);
    EXPECT_EQ(config.mission.goalLocal, Point3(5, 5, 1));
    EXPECT_DOUBLE_EQ(config.trajectory.averageSpeed, 3.0);
    EXPECT_DOUBLE_EQ(config.trajectory.minSegmentTime, 0.1);
    EXPECT_EQ(config.trajectory.maxRefinements, 4);
    EXPECT_EQ(config.validate(), PlanStatus::Success);
}

TEST(PlannerConfig, GeodeticMission) {
    PlannerConfig config;
    ASSERT_TRUE(config.loadFromNode(YAML::Load(
        "mission: {start_gps: [-122.3975, 37.7925, 5], goal_gps: [-122.3969, 37.7929, 5]}\n")));
    EXPECT_TRUE(config.mission.useGps);
    EXPECT_DOUBLE_EQ(config.mission.startGps.lat, 37.7925);
    EXPECT_DOUBLE_EQ(config.mission.goalGps.lon, -122.3969);
}

TEST(PlannerConfig, RejectsMalformedInput) {
    PlannerConfig missing_mission;
    EXPECT_FALSE(missing_mission.loadFromNode(YAML::Load("planner: {algorithm: rrt}\n")));

    PlannerConfig half_mission;
    EXPECT_FALSE(half_mission.loadFromNode(YAML::Load("mission: {start_local: [0, 0, 1]}\n")));

    PlannerConfig bad_connectivity;
    EXPECT_FALSE(bad_connectivity.loadFromNode(YAML::Load(
        "lattice: {connectivity: diagonal}\n"
        "mission: {start_local: [0, 0, 1], goal_local: [5, 5, 1]}\n")));

    PlannerConfig bad_vector;
    EXPECT_FALSE(bad_vector.loadFromNode(YAML::Load(
        "mission: {start_local: [0, 1], goal_local: [5, 5, 1]}\n")));

    PlannerConfig bad_type;
    EXPECT_FALSE(bad_type.loadFromNode(YAML::Load(
        "trajectory: {average_speed: fast}\n"
        "mission: {start_local: [0, 0, 1], goal_local: [5, 5, 1]}\n")));

    PlannerConfig missing_file;
    EXPECT_FALSE(missing_file.loadFromYAML("/nonexistent/planner_config.yaml"));
}

TEST(PlannerConfig, ValidateChecksRanges) {
    PlannerConfig config = corridorConfig(0.5);
    EXPECT_EQ(config.validate(), PlanStatus::Success);

    PlannerConfig negative_speed = config;
    negative_speed.trajectory.averageSpeed = -1.0;
    EXPECT_EQ(negative_speed.validate(), PlanStatus::ValidationError);

    PlannerConfig negative_margin = config;
    negative_margin.environment.marginOfSafety = -0.1;
    EXPECT_EQ(negative_margin.validate(), PlanStatus::ValidationError);

    PlannerConfig unknown = config;
    unknown.planner.algorithm = "dijkstra";
    EXPECT_EQ(unknown.validate(), PlanStatus::ValidationError);

    // 只检查选中算法的参数段
    PlannerConfig bad_bias = config;
    bad_bias.rrt.rrt.goalBias = 1.5;
    EXPECT_EQ(bad_bias.validate(), PlanStatus::Success);
    bad_bias.planner.algorithm = "rrt";
    EXPECT_EQ(bad_bias.validate(), PlanStatus::ValidationError);

    UavMotionPlanner planner;
    EXPECT_EQ(planner.setConfig(negative_speed), PlanStatus::ValidationError);
}
