#include "dabtps/v1/sqp.hpp"

#include <Eigen/LU>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

namespace dabtps::v1 {

namespace {

constexpr Real kMultiplierTolerance = 1e-12;
constexpr Real kPrimalTolerance = 1e-10;
constexpr Real kTinyStep = 1e-12;

using WorkingSetVisitor = std::function<void(const std::vector<Eigen::Index>&)>;

void enumerate_working_sets(Eigen::Index total, Eigen::Index max_size, std::vector<Eigen::Index>& current,
                            Eigen::Index start, const WorkingSetVisitor& visit) {
    visit(current);
    if (static_cast<Eigen::Index>(current.size()) == max_size) {
        return;
    }
    for (Eigen::Index i = start; i < total; ++i) {
        current.push_back(i);
        enumerate_working_sets(total, max_size, current, i + 1, visit);
        current.pop_back();
    }
}

std::string format_violation(Real value) {
    std::ostringstream oss;
    oss.precision(3);
    oss << std::scientific << value;
    return oss.str();
}

}  // namespace

std::optional<QpSolution> solve_active_set_qp(const Matrix& B, const Vector& g, const Matrix& A, const Vector& b,
                                              const Matrix& G, const Vector& h) {
    const Eigen::Index n = g.size();
    const Eigen::Index me = A.rows();
    const Eigen::Index max_size = std::max<Eigen::Index>(0, n - me);
    std::optional<QpSolution> best;

    std::vector<Eigen::Index> working;
    enumerate_working_sets(G.rows(), max_size, working, 0, [&](const std::vector<Eigen::Index>& active) {
        const Eigen::Index k = me + static_cast<Eigen::Index>(active.size());
        const Eigen::Index size = n + k;

        Matrix K = Matrix::Zero(size, size);
        Vector rhs = Vector::Zero(size);
        K.topLeftCorner(n, n) = B;
        rhs.head(n) = -g;
        for (Eigen::Index i = 0; i < me; ++i) {
            K.block(n + i, 0, 1, n) = A.row(i);
            K.block(0, n + i, n, 1) = A.row(i).transpose();
            rhs[n + i] = b[i];
        }
        for (std::size_t j = 0; j < active.size(); ++j) {
            const Eigen::Index row = n + me + static_cast<Eigen::Index>(j);
            K.block(row, 0, 1, n) = G.row(active[j]);
            K.block(0, row, n, 1) = G.row(active[j]).transpose();
            rhs[row] = h[active[j]];
        }

        Eigen::FullPivLU<Matrix> lu(K);
        if (!lu.isInvertible()) {
            return;
        }
        const Vector sol = lu.solve(rhs);
        const Vector p = sol.head(n);
        const Vector y = sol.tail(k);

        for (Eigen::Index j = me; j < k; ++j) {
            if (y[j] < -kMultiplierTolerance) {
                return;
            }
        }
        if (G.rows() > 0 && (G * p - h).maxCoeff() > kPrimalTolerance) {
            return;
        }

        const Real objective = 0.5 * p.dot(B * p) + g.dot(p);
        if (!best || objective < best->objective - 1e-15) {
            QpSolution candidate;
            candidate.step = p;
            candidate.equality_multipliers = y.head(me);
            candidate.objective = objective;
            best = std::move(candidate);
        }
    });

    return best;
}

SqpSolver::SqpSolver(SqpOptions options)
    : options_(options) {}

Vector SqpSolver::gradient(const std::function<Real(const Vector&)>& fn, const Vector& x) const {
    Vector grad(x.size());
    Vector xp = x;
    Vector xm = x;
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        xp[i] = x[i] + options_.fd_step;
        xm[i] = x[i] - options_.fd_step;
        grad[i] = (fn(xp) - fn(xm)) / (2.0 * options_.fd_step);
        xp[i] = x[i];
        xm[i] = x[i];
    }
    return grad;
}

SqpResult SqpSolver::solve(const SqpProblem& problem, const Vector& x0) const {
    SqpResult result;
    const Eigen::Index n = x0.size();
    const bool has_equality = static_cast<bool>(problem.equality);
    const auto& f = problem.objective;
    auto h = [&](const Vector& z) { return has_equality ? problem.equality(z) : 0.0; };

    // Linear rows G x + g <= 0, bounds appended as -x + lower <= 0 and x - upper <= 0
    const Eigen::Index m_lin = problem.inequality_matrix.rows();
    Matrix G = Matrix::Zero(m_lin + 2 * n, n);
    Vector g_off = Vector::Zero(m_lin + 2 * n);
    if (m_lin > 0) {
        G.topRows(m_lin) = problem.inequality_matrix;
        g_off.head(m_lin) = problem.inequality_offset;
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        G(m_lin + 2 * i, i) = -1.0;
        g_off[m_lin + 2 * i] = problem.lower[i];
        G(m_lin + 2 * i + 1, i) = 1.0;
        g_off[m_lin + 2 * i + 1] = -problem.upper[i];
    }

    Vector x = x0.cwiseMax(problem.lower).cwiseMin(problem.upper);
    Matrix B = Matrix::Identity(n, n);
    Real rho = 1.0;
    Real lambda = 0.0;
    const auto start = std::chrono::steady_clock::now();

    auto finish = [&](SqpStatus status, std::string message, int iterations) {
        result.x = x;
        result.objective = f(x);
        result.constraint_violation = std::abs(h(x));
        result.multiplier = lambda;
        result.iterations = iterations;
        result.status = status;
        result.message = std::move(message);
        return result;
    };

    for (int iter = 0; iter < options_.max_iterations; ++iter) {
        if (options_.time_budget_ms > 0.0) {
            const auto elapsed =
                std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            if (elapsed > options_.time_budget_ms) {
                return finish(SqpStatus::TimeBudgetExceeded,
                              "SQP time budget of " + std::to_string(options_.time_budget_ms) +
                                  " ms exceeded after " + std::to_string(iter) + " iterations",
                              iter);
            }
        }

        const Real fx = f(x);
        const Real cx = h(x);
        if (!std::isfinite(fx) || !std::isfinite(cx)) {
            return finish(SqpStatus::NumericalError, "Non-finite objective or constraint value", iter);
        }

        const Vector gf = gradient(f, x);
        const Vector gc = has_equality ? gradient(h, x) : Vector(Vector::Zero(n));
        const Vector hv = -(G * x + g_off);

        Matrix A(has_equality ? 1 : 0, n);
        Vector b(has_equality ? 1 : 0);
        if (has_equality) {
            A.row(0) = gc.transpose();
            b[0] = -cx;
        }

        Vector p;
        bool elastic = false;
        auto qp = solve_active_set_qp(B, gf, A, b, G, hv);
        if (qp) {
            p = qp->step;
            if (has_equality) {
                lambda = qp->equality_multipliers[0];
                rho = std::max(rho, 1.5 * std::abs(lambda) + 1e-3);
            }
        } else {
            // Linearized equality unreachable inside the region: trade it for a penalty
            elastic = true;
            const Matrix B_el = B + options_.elastic_penalty * gc * gc.transpose();
            const Vector g_el = gf + options_.elastic_penalty * cx * gc;
            qp = solve_active_set_qp(B_el, g_el, Matrix(0, n), Vector(0), G, hv);
            if (!qp) {
                return finish(SqpStatus::QpInfeasible, "QP subproblem infeasible at iteration " +
                                                           std::to_string(iter),
                              iter);
            }
            p = qp->step;
            lambda = 0.0;
        }

        const Real step_norm = p.lpNorm<Eigen::Infinity>();
        if (step_norm < options_.step_tolerance && std::abs(cx) < options_.constraint_tolerance) {
            return finish(SqpStatus::Success, "SQP converged in " + std::to_string(iter) + " iterations", iter);
        }

        // L1 merit backtracking
        auto merit = [&](const Vector& z) { return f(z) + rho * std::abs(h(z)); };
        const Real directional = gf.dot(p) - rho * std::abs(cx);
        const Real merit0 = merit(x);
        Real alpha = 1.0;
        while (alpha > options_.min_step_length) {
            if (merit(x + alpha * p) <= merit0 + options_.armijo * alpha * directional) {
                break;
            }
            alpha *= 0.5;
        }
        const Vector x_next = x + alpha * p;

        // Damped BFGS on the Lagrangian gradient
        const Vector gf_next = gradient(f, x_next);
        const Vector gc_next = has_equality ? gradient(h, x_next) : Vector(Vector::Zero(n));
        const Vector s = x_next - x;
        const Vector y = (gf_next + lambda * gc_next) - (gf + lambda * gc);
        const Vector Bs = B * s;
        const Real sBs = s.dot(Bs);
        const Real sy = s.dot(y);
        if (sBs > 1e-20) {
            const Real theta = sy >= 0.2 * sBs ? 1.0 : 0.8 * sBs / (sBs - sy);
            const Vector r = theta * y + (1.0 - theta) * Bs;
            B += -(Bs * Bs.transpose()) / sBs + (r * r.transpose()) / s.dot(r);
        }

        if (options_.track_history) {
            SqpIterationRecord record;
            record.iteration = iter;
            record.objective = fx;
            record.constraint_violation = std::abs(cx);
            record.step_norm = step_norm;
            record.step_length = alpha;
            record.elastic = elastic;
            result.history.push_back(record);
        }

        x = x_next;
        if (s.lpNorm<Eigen::Infinity>() < kTinyStep && std::abs(h(x)) < options_.constraint_tolerance) {
            return finish(SqpStatus::Success, "SQP converged in " + std::to_string(iter + 1) + " iterations",
                          iter + 1);
        }
    }

    return finish(SqpStatus::MaxIterationsReached,
                  "SQP did not converge in " + std::to_string(options_.max_iterations) +
                      " iterations (|h| = " + format_violation(std::abs(h(x))) + ")",
                  options_.max_iterations);
}

}  // namespace dabtps::v1
