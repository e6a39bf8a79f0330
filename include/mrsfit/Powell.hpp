#pragma once
#include "SimpleLM.hpp"
#include <Eigen/Core>
#include <Eigen/Dense>
#include <vector>
#include <iostream>
#include <limits>
#include <cmath>
#include <algorithm>
#include <functional>
#include <tuple>

namespace mrsfit {

/* ---------------------------  user visible bits  --------------------------- */

struct PowellSolverOptions {
    int    max_iterations        = 200;      // hard upper limit
    int    max_function_evals    = 20000;
    double relative_tolerance    = 1e-6;
    double absolute_tolerance    = 1e-12;
    bool   verbose               = false;
};

struct PowellSolverSummary {
    int    iterations         = 0;
    int    function_evals     = 0;
    double initial_value      = 0.0;
    double final_value        = 0.0;
    bool   converged          = false;
};

namespace detail {

/*  one-dimensional slice  f(p + λ·ξ)  with hard walls at the bounds        */
struct LineSearchData {
    Eigen::VectorXd p;
    Eigen::VectorXd xi;
    const Eigen::VectorXd& min_p;
    const Eigen::VectorXd& max_p;
    std::function<double(const Eigen::VectorXd&)> func;

    double operator()(double lambda) const
    {
        const Eigen::VectorXd trial = p + lambda * xi;
        for (int i = 0; i < trial.size(); ++i)
            if (trial[i] < min_p[i] || trial[i] > max_p[i])
                return std::numeric_limits<double>::infinity();
        const double f = func(trial);
        return std::isfinite(f) ? f : std::numeric_limits<double>::infinity();
    }
};

inline std::tuple<double, double> lambda_bounds(const Eigen::VectorXd& p,
                                                const Eigen::VectorXd& xi,
                                                const Eigen::VectorXd& min_p,
                                                const Eigen::VectorXd& max_p)
{
    double lo = -std::numeric_limits<double>::infinity();
    double hi =  std::numeric_limits<double>::infinity();
    for (int i = 0; i < p.size(); ++i) {
        if (std::abs(xi[i]) <= std::numeric_limits<double>::epsilon()) continue;
        const double t1 = (min_p[i] - p[i]) / xi[i];
        const double t2 = (max_p[i] - p[i]) / xi[i];
        lo = std::max(lo, std::min(t1, t2));
        hi = std::min(hi, std::max(t1, t2));
    }
    return {lo, hi};
}

/*  bracket + golden section on [lo, hi]; returns (λ*, f(λ*))              */
inline std::tuple<double, double> line_minimize(const LineSearchData& f1d,
                                                double step,
                                                double f0,
                                                int&   nfe,
                                                int    max_nfe)
{
    auto [lo, hi] = lambda_bounds(f1d.p, f1d.xi, f1d.min_p, f1d.max_p);
    if (!(lo < hi)) return {0.0, f0};

    double best_x = 0.0, best_f = f0;
    auto probe = [&](double x) {
        const double f = f1d(x);
        ++nfe;
        if (f < best_f) { best_f = f; best_x = x; }
        return f;
    };

    /* probe both sides, then walk downhill until the value rises */
    const double xp = std::clamp( step, lo, hi);
    const double xm = std::clamp(-step, lo, hi);
    const double fp = probe(xp);
    const double fm = probe(xm);

    double a = std::min(xm, xp), b = std::max(xm, xp);
    if (fp < f0 || fm < f0) {
        double prev = 0.0;
        double cur  = (fp <= fm) ? xp : xm;
        double fcur = (fp <= fm) ? fp : fm;
        double next = cur;
        for (int k = 0; k < 40 && nfe < max_nfe; ++k) {
            next = std::clamp(cur + 2.0 * (cur - prev), lo, hi);
            if (next == cur) break;                 // wall reached
            const double fnext = probe(next);
            if (fnext >= fcur) break;
            prev = cur; cur = next; fcur = fnext;
        }
        a = std::min(prev, next);
        b = std::max(prev, next);
    }

    /* golden section within [a, b] */
    constexpr double g = 0.3819660112501051;
    double x1 = a + g * (b - a), x2 = b - g * (b - a);
    double f1 = probe(x1), f2 = probe(x2);
    for (int k = 0; k < 60 && nfe < max_nfe; ++k) {
        if (std::abs(b - a) <= 1e-10 * (1.0 + std::abs(best_x))) break;
        if (f1 < f2) { b = x2; x2 = x1; f2 = f1; x1 = a + g * (b - a); f1 = probe(x1); }
        else         { a = x1; x1 = x2; f1 = f2; x2 = b - g * (b - a); f2 = probe(x2); }
    }
    return {best_x, best_f};
}

inline bool converged(double f_old, double f_new, double reltol, double abstol)
{
    const double diff  = std::abs(f_new - f_old);
    const double scale = std::max(std::abs(f_old), std::abs(f_new));
    return diff <= abstol || diff <= reltol * scale;
}

} // namespace detail

/* -------------------  Powell's method driver routine  ---------------------- */
/*  Derivative-free.  Same functor convention as levenberg_marquardt; the   */
/*  Jacobian pointer is always nullptr.                                      */
template<typename Functor>
PowellSolverSummary
powell(Functor&&                    func,
       Eigen::VectorXd&             x,
       const std::vector<bool>&     free_mask,
       const std::vector<double>&   lower,
       const std::vector<double>&   upper,
       const PowellSolverOptions&   opt = {})
{
    PowellSolverSummary summ;
    const int n_full = static_cast<int>(x.size());

    Eigen::VectorXi col_index;
    int n_free = 0;
    build_free_index(free_mask, col_index, n_free);

    Eigen::VectorXd min_p(n_full), max_p(n_full);
    for (int i = 0; i < n_full; ++i) {
        min_p[i] = lower.empty() ? -1e10 : lower[i];
        max_p[i] = upper.empty() ?  1e10 : upper[i];
        x[i]     = std::clamp(x[i], min_p[i], max_p[i]);
    }

    auto objective = [&func](const Eigen::VectorXd& p) -> double {
        Eigen::VectorXd r;
        func(p, &r, nullptr);
        return r.squaredNorm();
    };

    double f0 = objective(x);
    summ.initial_value  = f0;
    summ.final_value    = f0;
    summ.function_evals = 1;
    if (n_free == 0 || !std::isfinite(f0)) {
        summ.converged = n_free == 0;
        return summ;
    }

    std::vector<Eigen::VectorXd> directions;
    std::vector<double>          steps;
    for (int j = 0; j < n_full; ++j) {
        if (col_index[j] < 0) continue;
        Eigen::VectorXd xi = Eigen::VectorXd::Zero(n_full);
        xi[j] = 1.0;
        directions.push_back(xi);
        const double span = max_p[j] - min_p[j];
        steps.push_back(std::isfinite(span) && span < 1e9 ? 0.05 * span
                                                          : 0.01 * (std::abs(x[j]) + 1.0));
    }

    Eigen::VectorXd p0 = x;
    for (int iter = 0; iter < opt.max_iterations; ++iter) {
        summ.iterations = iter + 1;
        if (summ.function_evals >= opt.max_function_evals) break;

        Eigen::VectorXd pn = p0;
        double fn = f0;
        for (int i = 0; i < n_free; ++i) {
            detail::LineSearchData ldata{pn, directions[i], min_p, max_p, objective};
            auto [lambda, f] = detail::line_minimize(ldata, steps[i], fn,
                                                     summ.function_evals,
                                                     opt.max_function_evals);
            if (lambda != 0.0) {
                pn += lambda * directions[i];
                steps[i] = std::max(std::abs(lambda), 1e-8);
                fn = f;
            }
        }

        /* extrapolated direction replaces the one with the largest step */
        Eigen::VectorXd new_dir = pn - p0;
        const double dir_norm = new_dir.norm();
        if (dir_norm > 1e-14) {
            new_dir /= dir_norm;
            detail::LineSearchData ldata{pn, new_dir, min_p, max_p, objective};
            auto [lambda, f] = detail::line_minimize(ldata, 0.5 * dir_norm, fn,
                                                     summ.function_evals,
                                                     opt.max_function_evals);
            if (lambda != 0.0) {
                pn += lambda * new_dir;
                fn  = f;
                const auto max_it = std::max_element(steps.begin(), steps.end());
                const auto idx    = std::distance(steps.begin(), max_it);
                directions[idx] = new_dir;
                steps[idx]      = std::abs(lambda);
            }
        }

        if (opt.verbose)
            std::cout << "[Powell] iter " << iter << " f=" << fn
                      << " nfe=" << summ.function_evals << '\n';

        const bool done = detail::converged(f0, fn, opt.relative_tolerance,
                                            opt.absolute_tolerance);
        p0 = pn;
        f0 = fn;
        if (done) {
            summ.converged = true;
            break;
        }
    }

    x = p0;
    summ.final_value = f0;
    return summ;
}

} // namespace mrsfit
