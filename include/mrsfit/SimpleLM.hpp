#pragma once
#include <Eigen/Core>
#include <Eigen/Dense>
#include <vector>
#include <iostream>
#include <iomanip>
#include <limits>
#include <cmath>
#include <string>
#include <algorithm>

namespace mrsfit {

/* ---------------------------  user visible bits  --------------------------- */
/*  A value ≤ 0 means "determine automatically".                              */

struct LMSolverOptions {
    int    max_iterations        = 200;      // hard upper limit
    double gradient_tolerance    = 0;        // auto
    double step_tolerance        = 0;        // auto
    double chi2_tolerance        = 0;        // auto
    double initial_lambda        = 0;        // auto
    bool   verbose               = false;
    std::string tag              = "[LM]";
};

struct LMSolverSummary {
    int    iterations         = 0;
    double initial_chi2       = 0.0;
    double final_chi2         = 0.0;
    bool   converged          = false;
    bool   numerical_failure  = false;   // non-finite objective or step
    std::vector<double> param_uncertainties;   // 1-σ; 0 = fixed
};

/* --------------------  internal helper (column selection)  ----------------- */

inline
void build_free_index(const std::vector<bool>& mask,
                      Eigen::VectorXi&         map_full_to_reduced,
                      int&                     n_free)
{
    const int n = static_cast<int>(mask.size());
    map_full_to_reduced.resize(n);
    n_free = 0;
    for (int j = 0; j < n; ++j) {
        if (mask[j])
            map_full_to_reduced[j] = n_free++;
        else
            map_full_to_reduced[j] = -1;
    }
}

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*
 *  func(p, &r, &J) fills the residual vector and (if J != nullptr) the full
 *  Jacobian.  Frozen columns are ignored, bounds are enforced by projecting
 *  every trial point.  x always holds the best point seen so far, so hitting
 *  the iteration cap simply returns that point.
 */
template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                    func,
                    Eigen::VectorXd&             x,
                    const std::vector<bool>&     free_mask,
                    const std::vector<double>&   lower,
                    const std::vector<double>&   upper,
                    const LMSolverOptions&       user_opt = {})
{
    LMSolverSummary summ;
    const int n = static_cast<int>(x.size());
    LMSolverOptions opt = user_opt;

    Eigen::VectorXi col_index;
    int n_free = 0;
    build_free_index(free_mask, col_index, n_free);

    /* project the start point once */
    for (int j = 0; j < n; ++j) {
        if (!lower.empty()) x[j] = std::max(x[j], lower[j]);
        if (!upper.empty()) x[j] = std::min(x[j], upper[j]);
    }

    Eigen::VectorXd r;
    Eigen::MatrixXd J;
    func(x, &r, n_free > 0 ? &J : nullptr);

    const std::size_t m = static_cast<std::size_t>(r.size());
    double chi2 = r.squaredNorm();
    summ.initial_chi2 = chi2;
    summ.final_chi2   = chi2;
    summ.param_uncertainties.assign(n, 0.0);

    if (!std::isfinite(chi2)) {
        if (opt.verbose)
            std::cout << opt.tag << "  non-finite objective at the start point\n";
        summ.numerical_failure = true;
        return summ;
    }
    if (n_free == 0) {
        summ.converged = true;
        return summ;
    }

    /* --------------------------------------------------------------- */
    /*  automatic tolerances and initial λ                             */
    /* --------------------------------------------------------------- */
    const double eps  = std::numeric_limits<double>::epsilon();
    const double gmax0 = (J.transpose() * r).cwiseAbs().maxCoeff();

    if (opt.gradient_tolerance <= 0.0)
        opt.gradient_tolerance = gmax0 > 0.0 ? 1e-8 * gmax0 : 1e-12;
    if (opt.step_tolerance <= 0.0)
        opt.step_tolerance = 1e-10 * std::max(1.0, x.lpNorm<Eigen::Infinity>());
    if (opt.chi2_tolerance <= 0.0)
        opt.chi2_tolerance = 1e-12 * std::max(1.0, chi2);
    if (opt.initial_lambda <= 0.0) {
        opt.initial_lambda = 1e-3 * (J.transpose() * J).diagonal().maxCoeff();
        if (!(opt.initial_lambda > 0.0)) opt.initial_lambda = 1e-3;
    }
    double lambda = opt.initial_lambda;

    Eigen::MatrixXd Jf(m, n_free);
    Eigen::MatrixXd JTJ(n_free, n_free);
    Eigen::VectorXd diag_JTJ(n_free), g(n_free), dx_free(n_free), dx(n);

    auto reduce_jacobian = [&](const Eigen::MatrixXd& Jfull) {
        for (int j = 0; j < n; ++j) {
            const int col = col_index[j];
            if (col >= 0) Jf.col(col).noalias() = Jfull.col(j);
        }
    };

    /* --------------------------------------------------------------- */
    /*  main iteration loop                                            */
    /* --------------------------------------------------------------- */
    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;

        reduce_jacobian(J);
        g.noalias() = Jf.transpose() * r;
        if (!g.allFinite()) {
            summ.numerical_failure = true;
            break;
        }
        if (g.cwiseAbs().maxCoeff() < opt.gradient_tolerance) {
            summ.converged = true;
            break;
        }

        JTJ.setZero();
        JTJ.selfadjointView<Eigen::Lower>().rankUpdate(Jf.adjoint(), 1.0);
        JTJ.template triangularView<Eigen::StrictlyUpper>() = JTJ.transpose();
        diag_JTJ = JTJ.diagonal();

        /* (JᵀJ + λ·diag(JᵀJ)) Δx = −g    (Marquardt scaling, floor keeps
           columns that are momentarily flat solvable)                     */
        const double floor = 1e-12 * std::max(1.0, diag_JTJ.maxCoeff());
        JTJ.diagonal().array() += lambda * (diag_JTJ.array() + floor);
        dx_free = -JTJ.ldlt().solve(g);

        if (!dx_free.allFinite()) {
            if (opt.verbose)
                std::cout << opt.tag << "  Inf/NaN in normal equations, stopping\n";
            summ.numerical_failure = true;
            break;
        }

        dx.setZero();
        for (int j = 0; j < n; ++j) {
            const int col = col_index[j];
            if (col >= 0) dx[j] = dx_free[col];
        }

        Eigen::VectorXd x_try = x + dx;
        for (int j = 0; j < n; ++j) {
            if (!lower.empty()) x_try[j] = std::max(x_try[j], lower[j]);
            if (!upper.empty()) x_try[j] = std::min(x_try[j], upper[j]);
        }

        const Eigen::VectorXd dx_actual = x_try - x;
        if (dx_actual.cwiseAbs().maxCoeff() < opt.step_tolerance) {
            summ.converged = true;
            break;
        }
        for (int j = 0; j < n; ++j) {
            const int col = col_index[j];
            if (col >= 0) dx_free[col] = dx_actual[j];
        }

        Eigen::VectorXd r_try;
        Eigen::MatrixXd J_try;
        func(x_try, &r_try, &J_try);
        const double chi2_try = r_try.squaredNorm();

        /* ---- Powell's ρ: actual vs. predicted reduction ------------ */
        const Eigen::VectorXd tmp =
            lambda * (diag_JTJ.array() * dx_free.array()).matrix() - g;
        double pred_red = 0.5 * dx_free.dot(tmp);
        if (pred_red <= 0.0) pred_red = eps;

        const double rho    = (chi2 - chi2_try) / pred_red;
        const bool   accept = std::isfinite(chi2_try) && rho > 0.0 && chi2_try < chi2;

        if (accept) {
            const double improvement = chi2 - chi2_try;
            x.swap(x_try);
            r.swap(r_try);
            J.swap(J_try);
            chi2 = chi2_try;

            lambda *= std::max(1.0/3.0, 1.0 - std::pow(2.0*rho - 1.0, 3.0));
            lambda  = std::max(lambda, 1e-18);

            if (opt.verbose)
                std::cout << opt.tag << "  iter " << it
                          << "  rho=" << std::setprecision(3) << rho
                          << "  chi2=" << std::setprecision(6) << chi2
                          << "  lambda=" << std::setprecision(3) << lambda
                          << "  (accepted)\n";

            if (improvement < opt.chi2_tolerance) {
                summ.converged = true;
                break;
            }
        } else {
            lambda *= 2.0;
            if (opt.verbose)
                std::cout << opt.tag << "  iter " << it
                          << "  rho=" << std::setprecision(3) << rho
                          << "  lambda=" << std::setprecision(3) << lambda
                          << "  (rejected)\n";
            if (lambda > 1e16) {                 // nowhere left to go
                summ.converged = true;
                break;
            }
        }
    }

    summ.final_chi2 = chi2;

    /* ---------------------  propagate uncertainties  ---------------- */
    reduce_jacobian(J);
    JTJ.setZero();
    JTJ.selfadjointView<Eigen::Lower>().rankUpdate(Jf.adjoint(), 1.0);
    JTJ.template triangularView<Eigen::StrictlyUpper>() = JTJ.transpose();

    const double dof = static_cast<double>(
        std::max<std::ptrdiff_t>(static_cast<std::ptrdiff_t>(m) - n_free, 1));
    const Eigen::MatrixXd cov =
        JTJ.ldlt().solve(Eigen::MatrixXd::Identity(n_free, n_free)) * (chi2 / dof);

    for (int j = 0; j < n; ++j) {
        const int col = col_index[j];
        if (col >= 0) {
            const double v = cov(col, col);
            summ.param_uncertainties[j] = (std::isfinite(v) && v > 0.0) ? std::sqrt(v) : 0.0;
        }
    }
    return summ;
}

} // namespace mrsfit
