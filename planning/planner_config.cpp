#include "planning/planner_config.hpp"

#include <yaml-cpp/yaml.h>
#include <cmath>

#define LOG_TAG "uav.config"
#include "elog.h"

namespace uav_planner {

namespace {

// 三维向量: 序列 [x, y, z] 或单个标量 (三个分量相同)
Point3 readVector3(const YAML::Node &node, const char *key) {
    if (node.IsScalar()) {
        return Point3::Constant(node.as<double>());
    }
    if (!node.IsSequence() || node.size() != 3) {
        throw YAML::Exception(node.Mark(), std::string(key) + " must be a scalar or a 3-element sequence");
    }
    return Point3(node[0].as<double>(), node[1].as<double>(), node[2].as<double>());
}

// 经纬高 [lon, lat, alt]
math_util::WGS84Coord readGeodetic(const YAML::Node &node, const char *key) {
    if (!node.IsSequence() || node.size() != 3) {
        throw YAML::Exception(node.Mark(), std::string(key) + " must be [lon, lat, alt]");
    }
    return {node[0].as<double>(), node[1].as<double>(), node[2].as<double>()};
}

bool validVolume(const Box3 &box) {
    return box.min.allFinite() && box.max.allFinite() && (box.max.array() >= box.min.array()).all();
}

}  // namespace

bool PlannerConfig::loadFromYAML(const std::string &yaml_path) {
    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        log_i("loading planner config '%s'", yaml_path.c_str());
        return loadFromNode(root);
    } catch (const std::exception &e) {
        log_e("failed to load planner config '%s': %s", yaml_path.c_str(), e.what());
        return false;
    }
}

bool PlannerConfig::loadFromNode(const YAML::Node &root) {
    try {
        if (const YAML::Node env = root["environment"]) {
            if (env["obstacle_file"]) environment.obstacleFile = env["obstacle_file"].as<std::string>();
            if (env["margin_of_safety"]) environment.marginOfSafety = env["margin_of_safety"].as<double>();
        }

        if (const YAML::Node pl = root["planner"]) {
            if (pl["algorithm"]) planner.algorithm = pl["algorithm"].as<std::string>();
            if (pl["shortcut"]) planner.shortcut = pl["shortcut"].as<bool>();
        }

        if (const YAML::Node lat = root["lattice"]) {
            if (lat["center"] || lat["halfsizes"]) {
                if (!lat["center"] || !lat["halfsizes"]) {
                    log_e("config: lattice needs both center and halfsizes");
                    return false;
                }
                lattice.lattice.center = readVector3(lat["center"], "lattice.center");
                lattice.lattice.halfSizes = readVector3(lat["halfsizes"], "lattice.halfsizes");
                lattice.volumeFromObstacles = false;
            }
            if (lat["resolution"]) lattice.lattice.resolution = readVector3(lat["resolution"], "lattice.resolution");
            if (lat["connectivity"]) {
                std::string text = lat["connectivity"].as<std::string>();
                if (!parseConnectivity(text, lattice.lattice.connectivity)) {
                    log_e("config: unknown lattice connectivity '%s' (full | partial | face)", text.c_str());
                    return false;
                }
            }
            if (lat["connect_neighbors"]) lattice.connectNeighbors = lat["connect_neighbors"].as<int>();
            if (lat["max_cells"]) lattice.lattice.maxCells = lat["max_cells"].as<double>();
        }

        if (const YAML::Node prmNode = root["prm"]) {
            if (prmNode["lower"] || prmNode["upper"]) {
                if (!prmNode["lower"] || !prmNode["upper"]) {
                    log_e("config: prm needs both lower and upper");
                    return false;
                }
                prm.roadmap.volume.min = readVector3(prmNode["lower"], "prm.lower");
                prm.roadmap.volume.max = readVector3(prmNode["upper"], "prm.upper");
                prm.volumeFromObstacles = false;
            }
            if (prmNode["density"]) prm.roadmap.density = prmNode["density"].as<double>();
            if (prmNode["sample_count"]) prm.roadmap.sampleCount = prmNode["sample_count"].as<int>();
            if (prmNode["neighbors"]) prm.roadmap.neighbors = prmNode["neighbors"].as<int>();
            if (prmNode["max_samples"]) prm.roadmap.maxSamples = prmNode["max_samples"].as<double>();
            if (prmNode["max_sample_attempts"]) prm.roadmap.maxSampleAttempts = prmNode["max_sample_attempts"].as<long>();
            if (prmNode["seed"]) prm.seed = prmNode["seed"].as<unsigned int>();
        }

        if (const YAML::Node rrtNode = root["rrt"]) {
            if (rrtNode["lower"] || rrtNode["upper"]) {
                if (!rrtNode["lower"] || !rrtNode["upper"]) {
                    log_e("config: rrt needs both lower and upper");
                    return false;
                }
                rrt.rrt.volume.min = readVector3(rrtNode["lower"], "rrt.lower");
                rrt.rrt.volume.max = readVector3(rrtNode["upper"], "rrt.upper");
                rrt.volumeFromObstacles = false;
            }
            if (rrtNode["step_size"]) rrt.rrt.stepSize = rrtNode["step_size"].as<double>();
            if (rrtNode["goal_tolerance"]) rrt.rrt.goalTolerance = rrtNode["goal_tolerance"].as<double>();
            if (rrtNode["max_iterations"]) rrt.rrt.maxIterations = rrtNode["max_iterations"].as<int>();
            if (rrtNode["goal_bias"]) rrt.rrt.goalBias = rrtNode["goal_bias"].as<double>();
            if (rrtNode["max_sample_retries"]) rrt.rrt.maxSampleRetries = rrtNode["max_sample_retries"].as<int>();
            if (rrtNode["seed"]) rrt.seed = rrtNode["seed"].as<unsigned int>();
        }

        const YAML::Node ms = root["mission"];
        if (!ms) {
            log_e("config: missing required section 'mission'");
            return false;
        }
        if (ms["start_gps"] && ms["goal_gps"]) {
            mission.useGps = true;
            mission.startGps = readGeodetic(ms["start_gps"], "mission.start_gps");
            mission.goalGps = readGeodetic(ms["goal_gps"], "mission.goal_gps");
        } else if (ms["start_local"] && ms["goal_local"]) {
            mission.useGps = false;
            mission.startLocal = readVector3(ms["start_local"], "mission.start_local");
            mission.goalLocal = readVector3(ms["goal_local"], "mission.goal_local");
        } else {
            log_e("config: mission needs start_gps/goal_gps or start_local/goal_local");
            return false;
        }

        if (const YAML::Node tr = root["trajectory"]) {
            if (tr["average_speed"]) trajectory.averageSpeed = tr["average_speed"].as<double>();
            if (tr["min_segment_time"]) trajectory.minSegmentTime = tr["min_segment_time"].as<double>();
            if (tr["sample_dt"]) trajectory.sampleDt = tr["sample_dt"].as<double>();
            if (tr["max_refinements"]) trajectory.maxRefinements = tr["max_refinements"].as<int>();
            if (tr["output_directory"]) trajectory.outputDirectory = tr["output_directory"].as<std::string>();
        }
    } catch (const YAML::Exception &e) {
        log_e("config: %s", e.what());
        return false;
    }
    return true;
}

PlanStatus PlannerConfig::validate() const {
    if (!std::isfinite(environment.marginOfSafety) || environment.marginOfSafety < 0.0) {
        log_e("config: environment.margin_of_safety %f must be non-negative", environment.marginOfSafety);
        return PlanStatus::ValidationError;
    }
    if (planner.algorithm != "lattice" && planner.algorithm != "prm" && planner.algorithm != "rrt") {
        log_e("config: unknown planner.algorithm '%s' (lattice | prm | rrt)", planner.algorithm.c_str());
        return PlanStatus::ValidationError;
    }

    // 只检查选中算法的参数段
    if (planner.algorithm == "lattice") {
        const LatticeConfig &lc = lattice.lattice;
        if (!lc.resolution.allFinite() || (lc.resolution.array() <= 0.0).any()) {
            log_e("config: lattice.resolution must be positive");
            return PlanStatus::ValidationError;
        }
        if (!lc.halfSizes.allFinite() || (lc.halfSizes.array() < 0.0).any()) {
            log_e("config: lattice.halfsizes must be non-negative");
            return PlanStatus::ValidationError;
        }
        if (lattice.connectNeighbors <= 0 || !(lc.maxCells > 0.0)) {
            log_e("config: lattice.connect_neighbors and lattice.max_cells must be positive");
            return PlanStatus::ValidationError;
        }
    }

    if (planner.algorithm == "prm") {
        const RoadmapConfig &rc = prm.roadmap;
        if (!prm.volumeFromObstacles && !validVolume(rc.volume)) {
            log_e("config: prm.lower must not exceed prm.upper");
            return PlanStatus::ValidationError;
        }
        if (rc.neighbors <= 0 || rc.sampleCount < 0 || rc.maxSampleAttempts < 0 || !(rc.maxSamples > 0.0) ||
            !std::isfinite(rc.density) || rc.density < 0.0 || (rc.sampleCount == 0 && rc.density <= 0.0)) {
            log_e("config: prm needs neighbors > 0 and a positive sample_count or density");
            return PlanStatus::ValidationError;
        }
    }

    if (planner.algorithm == "rrt") {
        const RrtConfig &tc = rrt.rrt;
        if (!rrt.volumeFromObstacles && !validVolume(tc.volume)) {
            log_e("config: rrt.lower must not exceed rrt.upper");
            return PlanStatus::ValidationError;
        }
        if (!(tc.stepSize > 0.0) || !(tc.goalTolerance >= 0.0) || tc.maxIterations <= 0 ||
            tc.maxSampleRetries <= 0 || !(tc.goalBias >= 0.0 && tc.goalBias <= 1.0)) {
            log_e("config: rrt needs step_size > 0, goal_tolerance >= 0, max_iterations > 0, goal_bias in [0, 1]");
            return PlanStatus::ValidationError;
        }
    }

    if (!mission.startLocal.allFinite() || !mission.goalLocal.allFinite()) {
        log_e("config: mission coordinates must be finite");
        return PlanStatus::ValidationError;
    }

    if (!(trajectory.averageSpeed > 0.0) || !(trajectory.minSegmentTime > 0.0) || !(trajectory.sampleDt > 0.0)) {
        log_e("config: trajectory.average_speed, min_segment_time and sample_dt must be positive");
        return PlanStatus::ValidationError;
    }
    if (trajectory.maxRefinements < 0) {
        log_e("config: trajectory.max_refinements must be non-negative");
        return PlanStatus::ValidationError;
    }
    return PlanStatus::Success;
}

}  // namespace uav_planner
