/**
 * @file io_data.cpp
 * @brief Admissions CSV and params file parsing
 */

#include "pathsim/io_data.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pathsim {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool is_missing(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.empty() || lower == "nan" || lower == "na" || lower == "null";
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

// Days from 1970-01-01 to y-m-d in the proleptic Gregorian calendar
long days_from_civil(long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

bool parse_number(const std::string& s, double& value) {
    if (s.empty()) return false;
    char* end = nullptr;
    value = std::strtod(s.c_str(), &end);
    return end != s.c_str() && *end == '\0' && std::isfinite(value);
}

// Whole number within [lo, hi]; "3" and "3.0" pass, "3.7" does not
bool parse_integral(const std::string& s, long lo, long hi, long& value) {
    double v = 0.0;
    if (!parse_number(s, v)) return false;
    if (v != std::floor(v) || v < static_cast<double>(lo) || v > static_cast<double>(hi)) return false;
    value = static_cast<long>(v);
    return true;
}

} // namespace

bool split_csv_line(const std::string& line, std::vector<std::string>& fields) {
    fields.clear();
    std::string field;
    bool quoted = false;     // Inside a quoted section
    bool was_quoted = false; // Current field had quotes, keep its spaces

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
            was_quoted = true;
        } else if (c == ',') {
            fields.push_back(was_quoted ? field : trim(field));
            field.clear();
            was_quoted = false;
        } else {
            field += c;
        }
    }
    if (quoted) return false;
    fields.push_back(was_quoted ? field : trim(field));
    return true;
}

bool parse_date_days(const std::string& text, double& days) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    double sec = 0.0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%d-%d-%d%n", &y, &mo, &d, &consumed) != 3) {
        return false;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo)) return false;

    const char* p = text.c_str() + consumed;
    if (*p != '\0') {
        if (*p != ' ' && *p != 'T') return false;
        ++p;
        int used = 0;
        if (std::sscanf(p, "%d:%d%n", &h, &mi, &used) != 2) return false;
        p += used;
        if (*p == ':') {
            ++p;
            if (std::sscanf(p, "%lf%n", &sec, &used) != 1) return false;
            p += used;
        }
        if (*p != '\0') return false;
        if (h < 0 || h > 23 || mi < 0 || mi > 59 || !std::isfinite(sec) || sec < 0.0 || sec >= 61.0) {
            return false;
        }
    }

    days = static_cast<double>(days_from_civil(y, mo, d))
         + (h * 3600.0 + mi * 60.0 + sec) / (24.0 * 60.0 * 60.0);
    return true;
}

bool load_admissions_csv(const std::string& path, std::vector<AdmissionRecord>& out, std::string& err) {
    std::ifstream f(path);
    if (!f.is_open()) {
        err = "data file not found: " + path;
        return false;
    }

    std::string line;
    if (!std::getline(f, line)) {
        err = "data file is empty: " + path;
        return false;
    }

    std::vector<std::string> header;
    if (!split_csv_line(line, header)) {
        err = "line 1: unterminated quote";
        return false;
    }
    auto column = [&](const std::string& name) {
        auto it = std::find(header.begin(), header.end(), name);
        return it == header.end() ? -1 : static_cast<int>(it - header.begin());
    };
    int date_col = column("admission_date");
    int los_col = column("true_los");
    int cluster_col = column("cluster");
    if (date_col < 0 || los_col < 0 || cluster_col < 0) {
        err = "data file needs admission_date, true_los and cluster columns";
        return false;
    }
    std::size_t needed = static_cast<std::size_t>(std::max({date_col, los_col, cluster_col})) + 1;

    int line_no = 1;
    while (std::getline(f, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        std::vector<std::string> fields;
        if (!split_csv_line(line, fields)) {
            err = "line " + std::to_string(line_no) + ": unterminated quote";
            return false;
        }
        if (fields.size() < needed) {
            err = "line " + std::to_string(line_no) + ": expected at least "
                + std::to_string(needed) + " fields";
            return false;
        }
        if (is_missing(fields[cluster_col])) continue;

        AdmissionRecord r;
        long cluster = 0;
        if (!parse_date_days(fields[date_col], r.admission_day)) {
            err = "line " + std::to_string(line_no) + ": bad admission_date '" + fields[date_col] + "'";
            return false;
        }
        if (!parse_number(fields[los_col], r.length_of_stay)) {
            err = "line " + std::to_string(line_no) + ": bad true_los '" + fields[los_col] + "'";
            return false;
        }
        if (!parse_integral(fields[cluster_col], INT_MIN, INT_MAX, cluster)) {
            err = "line " + std::to_string(line_no) + ": bad cluster '" + fields[cluster_col] + "'";
            return false;
        }
        r.cluster = static_cast<int>(cluster);
        out.push_back(r);
    }
    return true;
}

bool load_params_file(const std::string& path, std::vector<double>& props, int& num_servers, std::string& err) {
    std::ifstream f(path);
    if (!f.is_open()) {
        err = "params file not found: " + path;
        return false;
    }

    std::vector<double> values;
    std::vector<std::string> tokens;
    std::string token;
    while (f >> token) {
        double v = 0.0;
        if (!parse_number(token, v)) {
            err = "params file: bad number '" + token + "'";
            return false;
        }
        values.push_back(v);
        tokens.push_back(token);
    }
    if (values.size() < 3) {
        err = "params file needs at least one prop, a server count and a score";
        return false;
    }

    long servers = 0;
    const std::string& servers_token = tokens[tokens.size() - 2];
    if (!parse_integral(servers_token, 1, INT_MAX, servers)) {
        err = "params file: num_servers must be a whole number >= 1, got '" + servers_token + "'";
        return false;
    }

    props.assign(values.begin(), values.end() - 2);
    num_servers = static_cast<int>(servers);
    return true;
}

} // namespace pathsim
