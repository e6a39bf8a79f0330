#include "mrsfit/WaterRemoval.hpp"
#include "mrsfit/Retry.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  HSVD                                                                     */
/*                                                                           */
/*  Hankel matrix H(i,j) = x[i+j] of the first m points.  The signal         */
/*  subspace is spanned by the leading eigenvectors of H·Hᴴ; shift           */
/*  invariance of that subspace gives the poles, a Vandermonde least-squares */
/*  solve the complex amplitudes.                                            */
/* ------------------------------------------------------------------------- */
std::optional<std::vector<HsvdComponent>>
hsvd(const CVector& fid, const AcquisitionInfo& info, int order, double point_fraction)
{
    const Eigen::Index n = fid.size();
    if (order < 1 || n < 8)
        throw PreconditionError("hsvd: need order >= 1 and at least 8 samples");

    Eigen::Index m = static_cast<Eigen::Index>(std::round(point_fraction * n));
    m = std::clamp<Eigen::Index>(m, std::min<Eigen::Index>(n, 2 * order + 4), n);
    const Eigen::Index L    = m / 2;
    const Eigen::Index cols = m - L + 1;

    CMatrix H(L, cols);
    for (Eigen::Index j = 0; j < cols; ++j)
        H.col(j) = fid.segment(j, L);

    const CMatrix HH = H * H.adjoint();
    Eigen::SelfAdjointEigenSolver<CMatrix> sub(HH);
    if (sub.info() != Eigen::Success) return std::nullopt;

    /* eigenvalues come ascending; drop numerically empty directions */
    const Vector ev   = sub.eigenvalues();
    const double emax = ev[ev.size() - 1];
    if (!(emax > 0.0) || !std::isfinite(emax)) return std::nullopt;

    int rank = 0;
    for (Eigen::Index i = ev.size() - 1; i >= 0; --i)
        if (ev[i] > 1e-20 * emax) ++rank;
    const int K = std::max(1, std::min<int>(order, rank));

    const CMatrix U     = sub.eigenvectors().rightCols(K);
    const CMatrix U_top = U.topRows(L - 1);
    const CMatrix U_bot = U.bottomRows(L - 1);
    const CMatrix Z     = U_top.colPivHouseholderQr().solve(U_bot);
    if (!Z.allFinite()) return std::nullopt;

    Eigen::ComplexEigenSolver<CMatrix> poles(Z, false);
    if (poles.info() != Eigen::Success) return std::nullopt;
    const CVector z = poles.eigenvalues();

    CMatrix V(m, K);
    for (int k = 0; k < K; ++k) {
        Complex p(1.0, 0.0);
        for (Eigen::Index t = 0; t < m; ++t) {
            V(t, k) = p;
            p *= z[k];
        }
    }
    const CVector a = V.colPivHouseholderQr().solve(fid.head(m));
    if (!a.allFinite() || !V.allFinite()) return std::nullopt;

    const double dt = info.dwell_time;
    std::vector<HsvdComponent> comps(K);
    for (int k = 0; k < K; ++k) {
        comps[k].frequency_hz = std::arg(z[k]) / (2.0 * M_PI * dt);
        comps[k].damping      = -std::log(std::abs(z[k])) / dt;
        comps[k].amplitude    = a[k];
    }
    return comps;
}

std::optional<CVector>
hsvd_filter(const CVector& fid, const AcquisitionInfo& info, int order,
            double lo_ppm, double hi_ppm, double point_fraction)
{
    const auto comps = hsvd(fid, info, order, point_fraction);
    if (!comps) return std::nullopt;

    const double dt = info.dwell_time;
    CVector water = CVector::Zero(fid.size());
    for (const auto& c : *comps) {
        const double ppm = info.center_ppm - c.frequency_hz / info.txfrq_mhz;
        if (ppm < std::min(lo_ppm, hi_ppm) || ppm > std::max(lo_ppm, hi_ppm)) continue;

        const Complex step = std::exp(Complex(-c.damping * dt, 2.0 * M_PI * c.frequency_hz * dt));
        Complex p = c.amplitude;
        for (Eigen::Index t = 0; t < fid.size(); ++t) {
            water[t] += p;
            p *= step;
        }
    }

    CVector out = fid - water;
    if (!out.allFinite()) return std::nullopt;
    return out;
}

ProcessedSpectrum remove_water(const ProcessedSpectrum&   in,
                               const WaterRemovalOptions& opt,
                               ProgressObserver*          obs)
{
    const auto orders = descending_orders(opt.max_order, std::max(1, opt.min_order));

    auto outcome = retry_with_degradation(
        [&](int order) {
            return hsvd_filter(in.fid, in.info, order,
                               opt.lo_ppm, opt.hi_ppm, opt.point_fraction);
        },
        orders);

    if (!outcome) {
        std::ostringstream msg;
        msg << to_string(in.kind) << ": no finite HSVD result down to order "
            << outcome.parameter << ", water left in place";
        report(obs, "Water", msg.str());

        ProcessedSpectrum failed = in;
        failed.water_removal_failed = true;
        failed.water_removal_order  = 0;
        return failed;
    }

    if (outcome.attempts > 1) {
        std::ostringstream msg;
        msg << to_string(in.kind) << ": HSVD unstable, succeeded with "
            << outcome.parameter << " components";
        report(obs, "Water", msg.str());
    }

    CVector fid = std::move(*outcome.value);
    if (opt.recenter) fid = dc_correct_frequency(fid, opt.recenter_percent);

    ProcessedSpectrum out = in.with_fid(std::move(fid));
    out.water_removal_order  = outcome.parameter;
    out.water_removal_failed = false;
    return out;
}

} // namespace mrsfit
