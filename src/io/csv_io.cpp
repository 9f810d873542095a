#include "io/csv_io.h"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/errors.h"

namespace qpscd {
namespace {

/// Split a string by a delimiter. Handles trailing delimiters correctly
/// (e.g. "a,,b," → ["a", "", "b", ""]).
std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    std::string::size_type end;
    while ((end = s.find(delim, start)) != std::string::npos) {
        tokens.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    tokens.push_back(s.substr(start));
    return tokens;
}

/// Trim leading and trailing whitespace (including \r).
std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

/// Strip UTF-8 BOM if present at the start of a string.
void strip_bom(std::string& s) {
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

/// Locale-safe parse of a whole cell. Trailing garbage is an error;
/// "inf" and "nan" are accepted as strtod spells them.
double parse_cell(const std::string& cell, const std::string& path,
                  int line_num) {
    const std::string t = trim(cell);
    const char* begin = t.c_str();
    char* end = nullptr;
    double val = std::strtod(begin, &end);
    if (t.empty() || end != begin + t.size()) {
        throw std::runtime_error(path + ":" + std::to_string(line_num) +
                                 ": cannot parse '" + t + "' as a number");
    }
    return val;
}

/// Parse every non-blank line into a row of doubles.
std::vector<std::vector<double>> parse_rows(const std::string& path,
                                            char delim) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    std::vector<std::vector<double>> rows;
    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        ++line_num;
        if (line_num == 1) strip_bom(line);
        auto trimmed = trim(line);
        if (trimmed.empty()) continue;  // skip blank lines

        auto tokens = split(trimmed, delim);
        // Tolerate one trailing delimiter ("1,2,3,").
        if (tokens.size() > 1 && trim(tokens.back()).empty()) {
            tokens.pop_back();
        }

        std::vector<double> row;
        row.reserve(tokens.size());
        for (const auto& tok : tokens) {
            row.push_back(parse_cell(tok, path, line_num));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace

RowMajorMatrixXd read_matrix_csv(const std::string& path, char delim) {
    auto rows = parse_rows(path, delim);
    if (rows.empty()) {
        throw std::runtime_error("Matrix file has no data rows: " + path);
    }

    const Index n_rows = static_cast<Index>(rows.size());
    const Index n_cols = static_cast<Index>(rows.front().size());
    RowMajorMatrixXd m(n_rows, n_cols);
    for (Index i = 0; i < n_rows; ++i) {
        if (static_cast<Index>(rows[i].size()) != n_cols) {
            throw std::runtime_error(
                path + ": row " + std::to_string(i + 1) + " has " +
                std::to_string(rows[i].size()) + " columns, expected " +
                std::to_string(n_cols));
        }
        for (Index j = 0; j < n_cols; ++j) {
            m(i, j) = rows[i][j];
        }
    }
    spdlog::debug("read_matrix_csv: {} ({} x {})", path, n_rows, n_cols);
    return m;
}

VectorXd read_vector_csv(const std::string& path, char delim) {
    auto rows = parse_rows(path, delim);

    std::vector<double> values;
    if (rows.size() == 1) {
        values = std::move(rows.front());
    } else {
        values.reserve(rows.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            if (rows[i].size() != 1) {
                throw std::runtime_error(
                    path + ": expected one value per line, data row " +
                    std::to_string(i + 1) + " has " +
                    std::to_string(rows[i].size()));
            }
            values.push_back(rows[i].front());
        }
    }

    VectorXd v(static_cast<Index>(values.size()));
    for (size_t i = 0; i < values.size(); ++i) {
        v(static_cast<Index>(i)) = values[i];
    }
    spdlog::debug("read_vector_csv: {} ({} values)", path, v.size());
    return v;
}

void write_vector_csv(const VectorXd& v, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("write_vector_csv: cannot open " + path);
    }

    ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (Index i = 0; i < static_cast<Index>(v.size()); ++i) {
        ofs << v(i) << "\n";
    }
    if (!ofs) {
        throw std::runtime_error("write_vector_csv: write failed for " + path);
    }
}

ProblemFiles read_problem_dir(const std::string& dir) {
    ProblemFiles files;
    files.Q = read_matrix_csv(dir + "/Q.csv");
    files.p = read_vector_csv(dir + "/p.csv");
    files.lb = read_vector_csv(dir + "/lb.csv");
    files.ub = read_vector_csv(dir + "/ub.csv");
    files.x0 = read_vector_csv(dir + "/x.csv");
    return files;
}

BoxQP make_box_qp(const ProblemFiles& files) {
    BoxQP bqp(files.Q, files.p, files.lb, files.ub);
    if (files.x0.size() != bqp.size()) {
        throw InvalidDimensions("make_box_qp", "x0", bqp.size(),
                                static_cast<Index>(files.x0.size()));
    }
    return bqp;
}

}  // namespace qpscd
