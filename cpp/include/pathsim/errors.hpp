/**
 * @file errors.hpp
 * @brief Exception types raised by the patient-pathway simulator
 */

#ifndef PATHSIM_ERRORS_HPP
#define PATHSIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pathsim {

/**
 * @brief A class has too few historical records to estimate its parameters
 */
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief A rate, shift, server count, horizon or scaling knob is out of range
 */
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief A server was released while idle (engine bug, always fatal)
 */
class InvalidRelease : public std::logic_error {
public:
    explicit InvalidRelease(const std::string& what)
        : std::logic_error(what) {}
};

/**
 * @brief pop_next() was called on a scheduler with no pending events
 */
class EmptySchedule : public std::out_of_range {
public:
    EmptySchedule() : std::out_of_range("event schedule is empty") {}
};

} // namespace pathsim

#endif // PATHSIM_ERRORS_HPP
