/**
 * @file logger.hpp
 * @brief Process-wide levelled logger
 */

#ifndef PATHSIM_LOGGER_HPP
#define PATHSIM_LOGGER_HPP

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace pathsim {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* level_str(LogLevel level);

/**
 * @brief Parse "debug", "info", "warn" or "error"
 * @return false if the name is not recognised
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Line-oriented logger shared by the engine, the scenario runner and the CLI
 *
 * Writes go to std::cerr until open() redirects them to a file.
 * Each line is written under a mutex so worker threads do not interleave.
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    // Redirect output to path (truncated). Throws std::runtime_error on failure.
    void open(const std::string& path);

    void log(LogLevel level, const std::string& tag, const std::string& msg);

private:
    Logger();

    mutable std::mutex mu_;
    LogLevel level_;
    std::ofstream file_;
    std::ostream* out_;
};

void log_debug(const std::string& tag, const std::string& msg);
void log_info(const std::string& tag, const std::string& msg);
void log_warn(const std::string& tag, const std::string& msg);
void log_error(const std::string& tag, const std::string& msg);

} // namespace pathsim

#endif // PATHSIM_LOGGER_HPP
