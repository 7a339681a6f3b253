#pragma once
#include <cstddef>
#include <vector>

class MathUtils {
public:
    // Basic Matrix operations for least-squares fits
    struct Matrix {
        size_t rows;
        size_t cols;
        std::vector<std::vector<double>> data;

        Matrix(size_t r, size_t c) : rows(r), cols(c), data(r, std::vector<double>(c, 0.0)) {}

        double& at(size_t r, size_t c) { return data[r][c]; }
        double at(size_t r, size_t c) const { return data[r][c]; }

        /**
         * @brief Builds identity matrix I(n).
         */
        static Matrix identity(size_t n);

        /**
         * @brief Returns transpose of current matrix.
         */
        Matrix transpose() const;

        /**
         * @brief Matrix multiplication this * other.
         * @pre this->cols == other.rows.
         * @throws std::invalid_argument on shape mismatch.
         */
        Matrix multiply(const Matrix& other) const;

        /**
         * @brief Computes Householder QR decomposition: A = Q*R.
         * @pre Q and R are output matrices and will be overwritten.
         */
        void qrDecomposition(Matrix& Q, Matrix& R) const;
    };

    /**
     * @brief Solves multiple linear regression coefficients from design matrix X and target Y.
     * @pre X.rows == Y.rows.
     * @post Returns empty vector for underdetermined or ill-conditioned problems.
     * @throws std::invalid_argument when row dimensions mismatch.
     */
    static std::vector<double> multipleLinearRegression(const Matrix& X, const Matrix& Y);
};
