#include "MathUtils.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kPivotEpsilon = 1e-12;

bool solveUpperTriangular(const MathUtils::Matrix& R,
                          size_t n,
                          const std::vector<double>& b,
                          std::vector<double>& x) {
    if (b.size() != n) return false;
    x.assign(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double rhs = b[i];
        for (size_t j = i + 1; j < n; ++j) {
            rhs -= R.data[i][j] * x[j];
        }
        const double diag = R.data[i][i];
        if (std::abs(diag) <= kPivotEpsilon) return false;
        x[i] = rhs / diag;
    }
    return true;
}
} // namespace

MathUtils::Matrix MathUtils::Matrix::identity(size_t n) {
    Matrix res(n, n);
    for (size_t i = 0; i < n; ++i) res.at(i, i) = 1.0;
    return res;
}

MathUtils::Matrix MathUtils::Matrix::transpose() const {
    Matrix result(cols, rows);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            result.at(c, r) = at(r, c);
        }
    }
    return result;
}

MathUtils::Matrix MathUtils::Matrix::multiply(const Matrix& other) const {
    if (cols != other.rows) throw std::invalid_argument("Matrix dimensions mismatch for multiplication.");
    Matrix result(rows, other.cols);
    Matrix otherT = other.transpose();

    for (size_t r = 0; r < rows; ++r) {
        const auto& leftRow = data[r];
        auto& outRow = result.data[r];
        for (size_t c = 0; c < other.cols; ++c) {
            const auto& rightRow = otherT.data[c];
            double sum = 0.0;
            #ifdef USE_OPENMP
            #pragma omp simd reduction(+:sum)
            #endif
            for (size_t k = 0; k < cols; ++k) {
                sum += leftRow[k] * rightRow[k];
            }
            outRow[c] = sum;
        }
    }
    return result;
}

/**
 * Householder QR: A = QR with Q orthogonal (m x m) and R upper triangular (m x n).
 */
void MathUtils::Matrix::qrDecomposition(Matrix& Q, Matrix& R) const {
    const size_t m = rows;
    const size_t n = cols;
    const double eps = kPivotEpsilon;
    Q = Matrix::identity(m);
    R = *this;
    if (m == 0) return;

    for (size_t k = 0; k < n && k < m - 1; ++k) {
        std::vector<double> x(m - k);
        double normX = 0;
        for (size_t i = k; i < m; ++i) {
            x[i - k] = R.data[i][k];
            normX += x[i - k] * x[i - k];
        }
        normX = std::sqrt(normX);

        if (normX <= eps) continue;

        // Sign choice avoids cancellation in u
        double alpha = (R.data[k][k] > 0 ? -1.0 : 1.0) * normX;
        std::vector<double> u = x;
        u[0] -= alpha;

        double normU = 0;
        for (double val : u) normU += val * val;
        normU = std::sqrt(normU);
        if (normU > eps) {
            for (double& val : u) val /= normU;
        } else {
            continue;
        }

        // R = (I - 2vv^T)R, only rows k..m and columns k..n change
        for (size_t j = k; j < n; ++j) {
            double dot = 0;
            for (size_t i = k; i < m; ++i) dot += u[i - k] * R.data[i][j];
            for (size_t i = k; i < m; ++i) R.data[i][j] -= 2.0 * u[i - k] * dot;
        }

        // Q = Q(I - 2vv^T)
        for (size_t i = 0; i < m; ++i) {
            double dot = 0;
            for (size_t j = k; j < m; ++j) dot += Q.data[i][j] * u[j - k];
            for (size_t j = k; j < m; ++j) Q.data[i][j] -= 2.0 * dot * u[j - k];
        }
    }
}

std::vector<double> MathUtils::multipleLinearRegression(const Matrix& X, const Matrix& Y) {
    if (X.rows != Y.rows) throw std::invalid_argument("X and Y row dimensions must match for MLR.");
    if (X.cols == 0 || X.rows < X.cols) return std::vector<double>(); // Underdetermined

    Matrix Q(0, 0), R(0, 0);
    X.qrDecomposition(Q, R);

    // Rank check on the diagonal of R
    double maxDiag = 0.0;
    double minDiag = std::numeric_limits<double>::max();
    for (size_t i = 0; i < X.cols; ++i) {
        const double val = std::abs(R.data[i][i]);
        maxDiag = std::max(maxDiag, val);
        minDiag = std::min(minDiag, val);
    }

    const double rankTol = std::max(kPivotEpsilon,
                                    std::numeric_limits<double>::epsilon() * std::max(1.0, maxDiag) * static_cast<double>(X.cols));
    if (minDiag <= rankTol) {
        return std::vector<double>();
    }

    // R * beta = Q^T * Y
    Matrix QTY = Q.transpose().multiply(Y);

    const size_t n = X.cols;
    std::vector<double> rhs(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        rhs[i] = QTY.data[i][0];
    }

    std::vector<double> beta;
    if (!solveUpperTriangular(R, n, rhs, beta)) {
        return std::vector<double>();
    }
    return beta;
}
