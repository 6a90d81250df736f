/**
 * @file logger.cpp
 * @brief Levelled logger writing to stderr or a file
 */

#include "pathsim/logger.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace pathsim {

const char* level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "?";
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    if (name == "debug") level = LogLevel::DEBUG;
    else if (name == "info") level = LogLevel::INFO;
    else if (name == "warn" || name == "warning") level = LogLevel::WARN;
    else if (name == "error") level = LogLevel::ERROR;
    else return false;
    return true;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , out_(&std::cerr)
{
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(this->level());
}

void Logger::open(const std::string& path) {
    namespace fs = std::filesystem;

    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        out_ = &std::cerr;
        std::ostringstream oss;
        oss << "Cannot open log file: " << path;
        throw std::runtime_error(oss.str());
    }
    out_ = &file_;
}

void Logger::log(LogLevel level, const std::string& tag, const std::string& msg) {
    if (!enabled(level)) return;

    std::lock_guard<std::mutex> lk(mu_);
    (*out_) << "[" << level_str(level) << "] " << tag << ": " << msg << "\n";
    out_->flush();
}

void log_debug(const std::string& tag, const std::string& msg) {
    Logger::instance().log(LogLevel::DEBUG, tag, msg);
}

void log_info(const std::string& tag, const std::string& msg) {
    Logger::instance().log(LogLevel::INFO, tag, msg);
}

void log_warn(const std::string& tag, const std::string& msg) {
    Logger::instance().log(LogLevel::WARN, tag, msg);
}

void log_error(const std::string& tag, const std::string& msg) {
    Logger::instance().log(LogLevel::ERROR, tag, msg);
}

} // namespace pathsim
