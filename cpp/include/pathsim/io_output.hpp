/**
 * @file io_output.hpp
 * @brief CSV writers for the result tables
 */

#ifndef PATHSIM_IO_OUTPUT_HPP
#define PATHSIM_IO_OUTPUT_HPP

#include <string>
#include <vector>
#include "pathsim/statistics.hpp"

namespace pathsim {

// Both writers create out_dir if needed and overwrite existing files.
bool write_utilisations_csv(const std::string& out_dir, const std::vector<UtilisationRow>& rows, std::string& err);
bool write_system_times_csv(const std::string& out_dir, const std::vector<SystemTimeRow>& rows, std::string& err);

} // namespace pathsim

#endif // PATHSIM_IO_OUTPUT_HPP
