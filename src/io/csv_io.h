#pragma once

/// @file csv_io.h
/// @brief Delimited text I/O for problem matrices and vectors.
///
/// Matrix files hold one row per line:
/// @code
/// 4.0,1.0
/// 1.0,3.0
/// @endcode
/// Vector files hold one value per line; a single delimited line is also
/// accepted. Blank lines are skipped, a UTF-8 BOM and \r\n are tolerated.

#include <string>

#include "core/types.h"
#include "problem/box_qp.h"

namespace qpscd {

/// Read a dense matrix.
/// @throws std::runtime_error if the file cannot be read, is empty, has
///         ragged rows, or contains an unparseable cell.
RowMajorMatrixXd read_matrix_csv(const std::string& path, char delim = ',');

/// Read a dense vector.
/// @throws std::runtime_error if the file cannot be read or contains an
///         unparseable cell, or if it has several lines of several values.
VectorXd read_vector_csv(const std::string& path, char delim = ',');

/// Write a vector, one value per line, at full double precision.
/// @throws std::runtime_error if the file cannot be opened.
void write_vector_csv(const VectorXd& v, const std::string& path);

/// Problem data as read from an input directory.
struct ProblemFiles {
    RowMajorMatrixXd Q;
    VectorXd p;
    VectorXd lb;
    VectorXd ub;
    VectorXd x0;
};

/// Read Q.csv, p.csv, lb.csv, ub.csv and x.csv from dir.
/// @throws std::runtime_error on any read failure.
ProblemFiles read_problem_dir(const std::string& dir);

/// Build a BoxQP from the files, with diag = Q.diagonal().
/// @throws InvalidDimensions if the lengths are inconsistent (including x0).
BoxQP make_box_qp(const ProblemFiles& files);

}  // namespace qpscd
