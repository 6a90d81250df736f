/**
 * @file io_config.cpp
 * @brief Config file parsing and validation
 */

#include "pathsim/io_config.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pathsim {

bool parse_int_value(const std::string& s, int& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_seed_value(const std::string& s, std::uint32_t& out) {
    if (s.empty() || s[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v > UINT32_MAX) return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool parse_double_value(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (*end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_double_list(const std::string& s, std::vector<double>& out) {
    std::vector<double> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        double v = 0.0;
        if (!parse_double_value(item, v)) return false;
        result.push_back(v);
    }
    if (result.empty()) return false;
    out = result;
    return true;
}

bool parse_negative_shift(const std::string& s, NegativeShiftPolicy& out) {
    if (s == "clamp") out = NegativeShiftPolicy::CLAMP;
    else if (s == "reject") out = NegativeShiftPolicy::REJECT;
    else return false;
    return true;
}

bool load_config(const std::string& path, AppConfig& cfg, std::string& err) {
    std::ifstream f(path);
    if (!f.is_open()) {
        err = "config file not found: " + path;
        return false;
    }
    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        std::string sval;
        std::string extra;
        if (!(iss >> sval) || (iss >> extra)) {
            err = path + ":" + std::to_string(line_no) + ": '" + key + "' takes exactly one value";
            return false;
        }

        bool ok = true;
        if (key == "num_servers") ok = parse_int_value(sval, cfg.num_servers);
        else if (key == "max_time") ok = parse_double_value(sval, cfg.max_time);
        else if (key == "seed") ok = parse_seed_value(sval, cfg.seed);
        else if (key == "sigma") ok = parse_double_value(sval, cfg.sigma);
        else if (key == "replications") ok = parse_int_value(sval, cfg.replications);
        else if (key == "workers") ok = parse_int_value(sval, cfg.workers);
        else if (key == "props") ok = parse_double_list(sval, cfg.props);
        else if (key == "negative_shift") ok = parse_negative_shift(sval, cfg.negative_shift);
        else if (key == "data") cfg.data_path = sval;
        else if (key == "params") cfg.params_path = sval;
        else if (key == "out") cfg.out_dir = sval;
        else if (key == "log_level") cfg.log_level = sval;
        else if (key == "log") cfg.log_path = sval;
        else {
            err = path + ":" + std::to_string(line_no) + ": unknown key '" + key + "'";
            return false;
        }
        if (!ok) {
            err = path + ":" + std::to_string(line_no) + ": bad value for '" + key + "'";
            return false;
        }
    }
    return true;
}

bool validate_config(const AppConfig& cfg, std::string& err) {
    if (cfg.data_path.empty()) {
        err = "data: an admissions CSV is required";
        return false;
    }
    if (cfg.num_servers <= 0) {
        err = "num_servers: must be positive (or given by the params file)";
        return false;
    }
    if (!(cfg.max_time > 0.0)) {
        err = "max_time: must be positive";
        return false;
    }
    if (!(cfg.sigma > 0.0)) {
        err = "sigma: must be positive";
        return false;
    }
    for (std::size_t i = 0; i < cfg.props.size(); ++i) {
        if (!(cfg.props[i] > 0.0)) {
            err = "props[" + std::to_string(i) + "]: must be positive";
            return false;
        }
    }
    if (cfg.replications < 1) {
        err = "replications: must be at least 1";
        return false;
    }
    if (cfg.workers < 1) {
        err = "workers: must be at least 1";
        return false;
    }
    return true;
}

} // namespace pathsim
