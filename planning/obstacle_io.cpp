#include "planning/obstacle_io.hpp"

#include <fstream>
#include <sstream>

#define LOG_TAG "uav.obstacle"
#include "elog.h"

namespace uav_planner {

namespace {

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// 整个字符串必须是一个数字
bool parseDouble(const std::string &text, double &value) {
    std::string t = trim(text);
    if (t.empty()) return false;
    try {
        size_t used = 0;
        value = std::stod(t, &used);
        return used == t.size();
    } catch (const std::exception &) {
        return false;
    }
}

// "lat0 37.792480, lon0 -122.397450"
bool parseHome(const std::string &line, math_util::WGS84Coord &home) {
    bool has_lat = false, has_lon = false;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        std::istringstream field(trim(token));
        std::string key, value;
        field >> key >> value;
        if (key == "lat0" && parseDouble(value, home.lat)) has_lat = true;
        if (key == "lon0" && parseDouble(value, home.lon)) has_lon = true;
    }
    home.alt = 0.0;
    return has_lat && has_lon;
}

}  // namespace

PlanStatus parseObstacleCsv(std::istream &in, std::vector<Obstacle> &records, math_util::WGS84Coord &home) {
    records.clear();

    std::string line;
    if (!std::getline(in, line) || !parseHome(line, home)) {
        log_e("obstacle csv line 1: expected 'lat0 <lat>, lon0 <lon>'");
        return PlanStatus::ValidationError;
    }
    if (!std::getline(in, line)) {
        log_e("obstacle csv line 2: missing header");
        return PlanStatus::ValidationError;
    }

    int line_no = 2;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        std::vector<double> values;
        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            double v = 0.0;
            if (!parseDouble(cell, v)) {
                log_e("obstacle csv line %d: '%s' is not a number", line_no, trim(cell).c_str());
                return PlanStatus::ValidationError;
            }
            values.push_back(v);
        }
        if (values.size() != 6) {
            log_e("obstacle csv line %d: expected 6 columns, got %zu", line_no, values.size());
            return PlanStatus::ValidationError;
        }

        Obstacle ob;
        ob.center = Point3(values[0], values[1], values[2]);
        ob.halfSize = Point3(values[3], values[4], values[5]);
        records.push_back(ob);
    }
    return PlanStatus::Success;
}

PlanStatus readObstacleCsv(const std::string &path, std::vector<Obstacle> &records, math_util::WGS84Coord &home) {
    std::ifstream file(path);
    if (!file.is_open()) {
        log_e("cannot open obstacle file '%s'", path.c_str());
        return PlanStatus::ValidationError;
    }
    PlanStatus status = parseObstacleCsv(file, records, home);
    if (status == PlanStatus::Success) {
        log_i("read %zu obstacles from '%s'", records.size(), path.c_str());
    }
    return status;
}

}  // namespace uav_planner
