#include "mrsfit/QualityMetrics.hpp"
#include "mrsfit/PeakModels.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <tuple>
#include <utility>

namespace mrsfit {
namespace {

// ============================================================================
//  Small helpers (local linkage)
// ============================================================================
double
standard_deviation(const Eigen::VectorXd& v)
{
    if (v.size() < 2) return 0.0;
    const double mu  = v.mean();
    const double var =
        (v.array() - mu).square().sum() / static_cast<double>(v.size() - 1);
    return std::sqrt(var);
}

// ----------------------------------------------------------------------------
//  Residual of a least-squares quadratic in x
// ----------------------------------------------------------------------------
Eigen::VectorXd
detrend_quadratic(const Eigen::VectorXd& x, const Eigen::VectorXd& y)
{
    const double xc = x.mean();
    Eigen::MatrixXd A(x.size(), 3);
    A.col(0).setOnes();
    A.col(1) = (x.array() - xc).matrix();
    A.col(2) = (x.array() - xc).square().matrix();
    const Eigen::VectorXd c = A.colPivHouseholderQr().solve(y);
    return y - A * c;
}

} // unnamed namespace


// ============================================================================
//  spectral_snr
// ============================================================================
SNRResult
spectral_snr(const ProcessedSpectrum& s,
             const PpmWindow&         signal_window,
             double                   noise_lo_ppm,
             double                   noise_hi_ppm)
{
    const Vector ppm = s.ppm();
    const Vector re  = s.spectrum().real();

    const IndexRange sig = ppm_range(ppm, signal_window.lo_ppm, signal_window.hi_ppm);
    const IndexRange noi = ppm_range(ppm, noise_lo_ppm, noise_hi_ppm);
    if (sig.empty())
        throw PreconditionError("spectral_snr: signal window outside the spectrum");
    if (noi.count < 4)
        throw PreconditionError("spectral_snr: noise window outside the spectrum");

    SNRResult out;
    out.signal = re.segment(sig.first, sig.count).maxCoeff();
    out.noise  = standard_deviation(detrend_quadratic(ppm.segment(noi.first, noi.count),
                                                      re.segment(noi.first, noi.count)));
    out.snr    = out.noise > 0.0
               ? out.signal / out.noise
               : std::numeric_limits<double>::infinity();
    return out;
}


// ============================================================================
//  der_snr_noise           (DER_SNR algorithm, order 3)
// ============================================================================
double
der_snr_noise(const Vector& values)
{
    const Eigen::Index n = values.size();
    constexpr int order   = 3;
    constexpr int npixmin = 2 * order;

    if (n < npixmin)
        throw PreconditionError("der_snr_noise: not enough data points.");

    // DER_SNR constant for order 3
    constexpr double f3 = 0.6052697319;

    const Eigen::Index m = n - 2 * order;
    Vector diffs(m);
    for (Eigen::Index i = 0; i < m; ++i) {
        const Eigen::Index idx = i + order;
        diffs[i] = 2.0 * values[idx] - values[idx - order] - values[idx + order];
    }
    return f3 * median(diffs.cwiseAbs());
}


// ============================================================================
//  linewidth
// ============================================================================
std::pair<double, double>
linewidth(const ProcessedSpectrum& s, const PpmWindow& window)
{
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();

    PeakFitOptions opt;
    opt.fwhm_guess_ppm = linewidth_prior_hz(s.info.b0_tesla) / s.info.txfrq_mhz;

    PeakFitResult fit;
    try {
        fit = fit_lorentzians(s.ppm(), s.spectrum().real(), window.lo_ppm, window.hi_ppm, opt);
    } catch (const PreconditionError&) {
        return {nan, nan};
    }
    if (!fit.ok) return {nan, nan};
    return {fit.fwhm_hz(s.info.txfrq_mhz), fit.fwhm_ppm};
}


// ============================================================================
//  measure_quality
// ============================================================================
QualityMetrics
measure_quality(const ProcessedSpectrum& s,
                const PpmWindow&         window,
                double                   landmark_ppm)
{
    QualityMetrics q;
    q.condition = s.kind;

    const SNRResult r = spectral_snr(s, window);
    q.snr = r.snr;

    {
        const Vector     ppm = s.ppm();
        const IndexRange noi = ppm_range(ppm, -2.0, 0.0);
        const double     dn  = der_snr_noise(s.spectrum().real().segment(noi.first, noi.count));
        q.der_snr = dn > 0.0 ? r.signal / dn : std::numeric_limits<double>::infinity();
    }

    std::tie(q.fwhm_hz, q.fwhm_ppm) = linewidth(s, window);

    q.ref_shift_hz = s.ref_shift_hz;

    const AlignmentRecord& a = s.alignment;
    q.drift_pre  = a.drift_pre;
    q.drift_post = a.drift_post;
    if (a.fs.size() > 0)
        q.mean_freq_shift_hz = a.fs.cwiseAbs().mean();
    if (a.drift_post.size() > 0)
        q.avg_delta_cr_ppm = (a.drift_post.array() - landmark_ppm).mean();
    return q;
}

} // namespace mrsfit
