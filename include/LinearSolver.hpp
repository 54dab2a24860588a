#ifndef LINEAR_SOLVER_HPP
#define LINEAR_SOLVER_HPP

#include <vector>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace wattsim {

class LinearSolver {
public:
    using Matrix = std::vector<std::vector<double>>;
    using Vector = std::vector<double>;

    struct Solution {
        Vector x;
        int singular_columns = 0; // unknowns left at 0 because no usable pivot was found
    };

    // Gaussian elimination with partial pivoting.
    // A column whose best pivot is below the tolerance is skipped during elimination
    // and back substitution, so its unknown stays 0. Never fails for a square system.
    static Solution solve(Matrix A, Vector b, double pivot_tolerance = 1e-10) {
        int n = A.size();
        Solution result;
        if (n == 0) return result;
        if (A[0].size() != static_cast<std::size_t>(n)) throw std::invalid_argument("Matrix must be square");
        if (b.size() != static_cast<std::size_t>(n)) throw std::invalid_argument("Vector dimension mismatch");

        // Forward elimination with partial pivoting
        for (int i = 0; i < n; i++) {
            // Pivot selection
            int pivot = i;
            for (int j = i + 1; j < n; j++) {
                if (std::abs(A[j][i]) > std::abs(A[pivot][i])) {
                    pivot = j;
                }
            }

            // Swap rows
            std::swap(A[i], A[pivot]);
            std::swap(b[i], b[pivot]);

            if (std::abs(A[i][i]) < pivot_tolerance) {
                // Floating node or a loop of ideal sources. Leave this unknown at 0.
                result.singular_columns++;
                continue;
            }

            // Eliminate
            for (int j = i + 1; j < n; j++) {
                double factor = A[j][i] / A[i][i];
                if (factor == 0.0) continue;
                b[j] -= factor * b[i];
                for (int k = i; k < n; k++) {
                    A[j][k] -= factor * A[i][k];
                }
            }
        }

        // Back substitution
        Vector& x = result.x;
        x.assign(n, 0.0);
        for (int i = n - 1; i >= 0; i--) {
            if (std::abs(A[i][i]) < pivot_tolerance) continue;
            double sum = 0;
            for (int j = i + 1; j < n; j++) {
                sum += A[i][j] * x[j];
            }
            x[i] = (b[i] - sum) / A[i][i];
        }

        return result;
    }

    static Vector solve_linear_system(Matrix A, Vector b, double pivot_tolerance = 1e-10) {
        return solve(std::move(A), std::move(b), pivot_tolerance).x;
    }
};

} // namespace wattsim

#endif // LINEAR_SOLVER_HPP
