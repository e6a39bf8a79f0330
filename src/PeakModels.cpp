#include "mrsfit/PeakModels.hpp"
#include "mrsfit/SimpleLM.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace mrsfit {

namespace {

/*  parameter layout:  [A_0 … A_{k-1}, fwhm, x0, phi, c]                     */
struct MultipletCost {
    const Vector&              x;
    const Vector&              y;
    const std::vector<double>& offsets;

    Vector model(const Eigen::VectorXd& p) const
    {
        const int    k     = static_cast<int>(offsets.size());
        const double gamma = 0.5 * p[k];
        const double x0    = p[k + 1];
        const double cphi  = std::cos(p[k + 2]);
        const double sphi  = std::sin(p[k + 2]);

        Vector m = Vector::Constant(x.size(), p[k + 3]);
        for (int j = 0; j < k; ++j) {
            for (Eigen::Index i = 0; i < x.size(); ++i) {
                const double u   = (x0 + offsets[j]) - x[i];   // frequency sense
                const double den = gamma * gamma + u * u;
                m[i] += p[j] * (cphi * gamma * gamma + sphi * gamma * u) / den;
            }
        }
        return m;
    }

    void operator()(const Eigen::VectorXd& p,
                    Eigen::VectorXd*       r,
                    Eigen::MatrixXd*       J) const
    {
        const Vector r0 = model(p) - y;
        if (r) *r = r0;
        if (!J) return;

        J->resize(x.size(), p.size());
        for (int j = 0; j < p.size(); ++j) {
            const double h = 1e-6 * (std::abs(p[j]) + 1.0);
            Eigen::VectorXd pe = p;
            pe[j] += h;
            J->col(j) = (model(pe) - y - r0) / h;
        }
    }
};

} // namespace

double PeakFitResult::area() const
{
    double a = 0.0;
    for (double amp : amplitudes) a += amp;
    return M_PI * a * 0.5 * fwhm_ppm;
}

double linewidth_prior_hz(double b0_tesla)
{
    return std::max(2.0, 2.0 * b0_tesla);
}

PeakFitResult fit_lorentzians(const Vector&         ppm,
                              const Vector&         values,
                              double                lo_ppm,
                              double                hi_ppm,
                              const PeakFitOptions& opt)
{
    if (opt.offsets_ppm.empty())
        throw PreconditionError("fit_lorentzians: at least one peak required");

    const IndexRange win = ppm_range(ppm, lo_ppm, hi_ppm);
    if (win.count < static_cast<Eigen::Index>(opt.offsets_ppm.size()) + 4)
        throw PreconditionError("fit_lorentzians: window holds too few points");

    const Vector x = ppm.segment(win.first, win.count);
    const Vector y = values.segment(win.first, win.count);
    const int    k = static_cast<int>(opt.offsets_ppm.size());

    /* ---- seeds ------------------------------------------------------- */
    const double base0 = median(y);
    PeakLocation peak = find_peak(values, ppm, lo_ppm, hi_ppm);
    if (std::isfinite(opt.center_guess_ppm)) {
        Eigen::Index best = 0;
        (x.array() - opt.center_guess_ppm).abs().minCoeff(&best);
        peak.ppm   = opt.center_guess_ppm;
        peak.value = y[best];
    }

    Eigen::VectorXd p(k + 4);
    for (int j = 0; j < k; ++j) {
        const double pos = peak.ppm + opt.offsets_ppm[j];
        Eigen::Index best = 0;
        (x.array() - pos).abs().minCoeff(&best);
        p[j] = std::max(y[best] - base0, 0.0);
    }
    p[0]     = std::max(peak.value - base0, 1e-12);
    p[k]     = opt.fwhm_guess_ppm;
    p[k + 1] = peak.ppm;
    p[k + 2] = 0.0;
    p[k + 3] = base0;

    const double span  = std::abs(x[0] - x[x.size() - 1]);
    const double amax  = 10.0 * (y.maxCoeff() - y.minCoeff() + 1e-30);
    std::vector<double> lo(k + 4), hi(k + 4);
    for (int j = 0; j < k; ++j) { lo[j] = 0.0; hi[j] = amax; }
    lo[k]     = 1e-4;                     hi[k]     = span;
    lo[k + 1] = std::min(lo_ppm, hi_ppm); hi[k + 1] = std::max(lo_ppm, hi_ppm);
    lo[k + 2] = -M_PI;                    hi[k + 2] = M_PI;
    lo[k + 3] = -amax;                    hi[k + 3] = amax;

    std::vector<bool> free(k + 4, true);
    free[k + 2] = opt.free_phase;

    LMSolverOptions lm;
    lm.max_iterations = opt.max_iterations;
    lm.tag            = "[Peak]";

    MultipletCost cost{x, y, opt.offsets_ppm};
    const LMSolverSummary s = levenberg_marquardt(cost, p, free, lo, hi, lm);

    PeakFitResult out;
    out.amplitudes.assign(p.data(), p.data() + k);
    out.fwhm_ppm   = p[k];
    out.center_ppm = p[k + 1];
    out.phase_deg  = p[k + 2] * 180.0 / M_PI;
    out.baseline   = p[k + 3];
    out.chi2       = s.final_chi2;
    out.ok         = !s.numerical_failure && p.allFinite();
    return out;
}

Vector evaluate_lorentzians(const PeakFitResult&       fit,
                            const std::vector<double>& offsets_ppm,
                            const Vector&              ppm)
{
    const int k = static_cast<int>(offsets_ppm.size());
    Eigen::VectorXd p(k + 4);
    for (int j = 0; j < k; ++j)
        p[j] = j < static_cast<int>(fit.amplitudes.size()) ? fit.amplitudes[j] : 0.0;
    p[k]     = fit.fwhm_ppm;
    p[k + 1] = fit.center_ppm;
    p[k + 2] = fit.phase_deg * M_PI / 180.0;
    p[k + 3] = fit.baseline;

    const Vector zeros = Vector::Zero(ppm.size());
    MultipletCost cost{ppm, zeros, offsets_ppm};
    return cost.model(p);
}

} // namespace mrsfit
