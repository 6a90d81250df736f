/**
 * @file io_output.cpp
 * @brief Result table files
 */

#include "pathsim/io_output.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace pathsim {

namespace {

bool ensure_dir(const std::string& out_dir, std::string& err) {
    std::error_code ec;
    if (fs::exists(out_dir, ec)) {
        if (fs::is_directory(out_dir, ec)) return true;
        err = "out dir exists but is not a directory: " + out_dir;
        return false;
    }
    fs::create_directories(out_dir, ec);
    if (ec) {
        err = "cannot create out dir: " + ec.message();
        return false;
    }
    return true;
}

bool write_file(const std::string& out_dir, const std::string& name, const std::string& body, std::string& err) {
    if (!ensure_dir(out_dir, err)) return false;
    std::ofstream ofs(out_dir + "/" + name);
    if (!ofs.is_open()) { err = "cannot open " + name; return false; }
    ofs << body;
    if (!ofs) { err = "failed writing " + name; return false; }
    return true;
}

} // namespace

bool write_utilisations_csv(const std::string& out_dir, const std::vector<UtilisationRow>& rows, std::string& err) {
    return write_file(out_dir, "utilisations.csv", utilisations_to_csv(rows), err);
}

bool write_system_times_csv(const std::string& out_dir, const std::vector<SystemTimeRow>& rows, std::string& err) {
    return write_file(out_dir, "system_times.csv", system_times_to_csv(rows), err);
}

} // namespace pathsim
