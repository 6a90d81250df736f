/**
 * @file io_data.hpp
 * @brief Loaders for the admissions CSV and the tuned parameter file
 */

#ifndef PATHSIM_IO_DATA_HPP
#define PATHSIM_IO_DATA_HPP

#include <string>
#include <vector>
#include "pathsim/estimator.hpp"

namespace pathsim {

// Reads admission_date, true_los and cluster columns; rows without a cluster are skipped.
bool load_admissions_csv(const std::string& path, std::vector<AdmissionRecord>& out, std::string& err);

// "p0 p1 ... pk num_servers score": props, then the server count; the trailing score is ignored.
bool load_params_file(const std::string& path, std::vector<double>& props, int& num_servers, std::string& err);

// "YYYY-MM-DD" with optional " HH:MM[:SS]" or "THH:MM[:SS]" -> days since 1970-01-01.
bool parse_date_days(const std::string& text, double& days);

// Split one CSV line. Quoted fields may hold commas; "" inside quotes is a literal quote.
// Returns false on an unterminated quote.
bool split_csv_line(const std::string& line, std::vector<std::string>& fields);

} // namespace pathsim

#endif // PATHSIM_IO_DATA_HPP
