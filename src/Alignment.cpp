#include "mrsfit/Alignment.hpp"
#include "mrsfit/SimpleLM.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace mrsfit {

namespace {

/*  p = [fs_hz, phs_deg]                                                     */
struct RegistrationCost {
    const CVector&     fid;
    const CVector&     target;
    const IndexRange&  win;
    double             dwell;

    Eigen::VectorXd residual(const Eigen::VectorXd& p) const
    {
        const CVector S = to_frequency_domain(apply_alignment(fid, p[0], p[1], dwell));
        const CVector d = S.segment(win.first, win.count) - target.segment(win.first, win.count);
        Eigen::VectorXd r(2 * win.count);
        r.head(win.count) = d.real();
        r.tail(win.count) = d.imag();
        return r;
    }

    void operator()(const Eigen::VectorXd& p,
                    Eigen::VectorXd*       r,
                    Eigen::MatrixXd*       J) const
    {
        const Eigen::VectorXd r0 = residual(p);
        if (r) *r = r0;
        if (!J) return;

        J->resize(r0.size(), 2);
        const double h[2] = {1e-3, 1e-3};
        for (int j = 0; j < 2; ++j) {
            Eigen::VectorXd pe = p;
            pe[j] += h[j];
            J->col(j) = (residual(pe) - r0) / h[j];
        }
    }
};

/*  element-wise median of the columns, real and imaginary part separately   */
CVector columnwise_median(const CMatrix& Y)
{
    CVector m(Y.rows());
    for (Eigen::Index i = 0; i < Y.rows(); ++i)
        m[i] = Complex(median(Y.row(i).real().transpose()),
                       median(Y.row(i).imag().transpose()));
    return m;
}

} // namespace

CVector apply_alignment(const CVector& fid, double fs_hz, double phs_deg, double dwell)
{
    return phase_shift(freq_shift(fid, fs_hz, dwell), phs_deg);
}

double measure_drift(const CVector& fid, const AcquisitionInfo& info,
                     double centre_ppm, double half_width)
{
    const CVector S   = to_frequency_domain(fid);
    const Vector  ppm = ppm_axis(info, static_cast<int>(S.size()));
    return find_peak(S.cwiseAbs(), ppm, centre_ppm - half_width,
                     centre_ppm + half_width).ppm;
}

Vector robust_weights(const Vector& distances)
{
    const Eigen::Index n = distances.size();
    Vector w = Vector::Ones(n);
    if (n == 0) return w;

    const double dmax  = distances.maxCoeff();
    const double floor = std::max(1e-12 * dmax, std::numeric_limits<double>::min());
    const Vector d     = distances.cwiseMax(floor);
    const double dmin  = d.minCoeff();
    for (Eigen::Index i = 0; i < n; ++i) {
        const double q = dmin / d[i];
        w[i] = std::isfinite(q) ? q * q : 0.0;
    }
    return w;
}

RegistrationResult register_to_target(const CVector&         fid,
                                      const CVector&         target_spectrum,
                                      const IndexRange&      window,
                                      const AcquisitionInfo& info,
                                      double fs0_hz, double phs0_deg,
                                      double max_shift_hz,
                                      int    max_iterations)
{
    RegistrationCost cost{fid, target_spectrum, window, info.dwell_time};

    Eigen::VectorXd p(2);
    p << fs0_hz, phs0_deg;
    const std::vector<bool>   free {true, true};
    const std::vector<double> lo {-max_shift_hz, -360.0};
    const std::vector<double> hi { max_shift_hz,  360.0};

    LMSolverOptions lm;
    lm.max_iterations = max_iterations;
    lm.tag            = "[Align]";
    const LMSolverSummary s = levenberg_marquardt(cost, p, free, lo, hi, lm);

    RegistrationResult out;
    out.fs_hz    = p[0];
    out.phs_deg  = p[1];
    out.residual = std::sqrt(s.final_chi2);
    out.ok       = !s.numerical_failure && p.allFinite() && std::isfinite(out.residual);
    return out;
}

/* ------------------------------------------------------------------------- */
/*  main driver                                                              */
/* ------------------------------------------------------------------------- */
ProcessedSpectrum average_and_align(const TimeDomainSignal& signal,
                                    ConditionKind           kind,
                                    const AlignmentOptions& opt,
                                    ProgressObserver*       progress)
{
    if (signal.n_averages() == 0 || signal.empty())
        throw PreconditionError("average_and_align: signal has no averages");
    if (signal.n_subspecs() != 1)
        throw PreconditionError("average_and_align: select a single sub-spectrum first");
    if (signal.averaged() && signal.n_averages() != 1)
        throw PreconditionError("average_and_align: averaged signal holds several columns");
    if (opt.coarse_peaks.empty())
        throw PreconditionError("average_and_align: no landmark peaks for the coarse step");

    const TimeDomainSignal sig = signal.n_coils() > 1 ? signal.combine_coils() : signal;
    const AcquisitionInfo& info = sig.info();
    const int    N     = sig.n_averages();
    const int    n     = sig.n_samples();
    const double dwell = info.dwell_time;
    const double drift_centre = opt.coarse_peaks.front().ppm;

    ProcessedSpectrum out;
    out.kind = kind;
    out.info = info;

    /* ---- identity: nothing to align ----------------------------------- */
    if (N == 1) {
        out.fid = sig.column(0);
        AlignmentRecord& a = out.alignment;
        a.fs      = Vector::Zero(1);
        a.phs     = Vector::Zero(1);
        a.weights = Vector::Ones(1);
        a.drift_pre  = Vector::Constant(1, measure_drift(out.fid, info, drift_centre,
                                                         opt.drift_half_width));
        a.drift_post = a.drift_pre;
        a.aligned = false;
        return out;
    }

    const Vector     ppm = ppm_axis(info, n);
    const IndexRange win = ppm_range(ppm, opt.reg_lo_ppm, opt.reg_hi_ppm);
    if (win.count < 4)
        throw PreconditionError("average_and_align: registration window outside the spectrum");

    const ReferenceSpec coarse_spec{opt.coarse_peaks, opt.coarse_lo_ppm,
                                    opt.coarse_hi_ppm, opt.max_lag_ppm};
    const double max_shift_hz = opt.max_lag_ppm * info.txfrq_mhz + 10.0;

    /* ---- 1. coarse estimate per package -------------------------------- */
    const int pkg = std::max(1, static_cast<int>(std::round(opt.package_fraction * N)));
    Vector coarse(N);
    for (int first = 0; first < N; first += pkg) {
        const int last = std::min(N, first + pkg);
        CVector mean = CVector::Zero(n);
        for (int i = first; i < last; ++i) mean += sig.column(i);
        mean /= static_cast<double>(last - first);
        const double shift = xcorr_shift_hz(to_frequency_domain(mean), info, coarse_spec);
        for (int i = first; i < last; ++i) coarse[i] = -shift;
    }

    /* ---- drift before alignment ---------------------------------------- */
    AlignmentRecord& rec = out.alignment;
    rec.drift_pre.resize(N);
    for (int i = 0; i < N; ++i)
        rec.drift_pre[i] = measure_drift(sig.column(i), info, drift_centre, opt.drift_half_width);

    /* ---- 2. initial target: average closest to the median -------------- */
    auto window_spectra = [&](const Vector& fs, const Vector& phs) {
        CMatrix Y(win.count, N);
        for (int i = 0; i < N; ++i)
            Y.col(i) = to_frequency_domain(apply_alignment(sig.column(i), fs[i], phs[i], dwell))
                           .segment(win.first, win.count);
        return Y;
    };
    auto median_distances = [&](const CMatrix& Y) {
        const CVector med = columnwise_median(Y);
        Vector d(N);
        for (int i = 0; i < N; ++i) d[i] = (Y.col(i) - med).norm();
        return d;
    };

    Vector fs  = coarse;
    Vector phs = Vector::Zero(N);
    Vector w   = Vector::Ones(N);

    CMatrix Y = window_spectra(fs, phs);
    Eigen::Index start = 0;
    median_distances(Y).minCoeff(&start);

    CVector target = CVector::Zero(n);
    target.segment(win.first, win.count) = Y.col(start);

    std::vector<char> degraded(N, 0);
    int pass = 0;
    for (; pass < opt.max_passes; ++pass) {
        const Vector fs_prev  = fs;
        const Vector phs_prev = phs;

        #pragma omp parallel for schedule(dynamic) if(opt.parallel)
        for (int i = 0; i < N; ++i) {
            const RegistrationResult r = register_to_target(
                sig.column(i), target, win, info, fs[i], phs[i],
                max_shift_hz, opt.lm_iterations);
            if (r.ok) {
                fs[i]  = r.fs_hz;
                phs[i] = r.phs_deg;
                degraded[i] = 0;
            } else {
                fs[i]  = coarse[i];
                phs[i] = 0.0;
                degraded[i] = 1;
            }
        }

        Y = window_spectra(fs, phs);
        w = robust_weights(median_distances(Y));

        target.setZero();
        target.segment(win.first, win.count) = (Y * w.cast<Complex>()) / w.sum();

        const double dfs  = (fs - fs_prev).cwiseAbs().maxCoeff();
        const double dphs = (phs - phs_prev).cwiseAbs().maxCoeff();
        if (dfs < opt.tol_hz && dphs < opt.tol_deg) {
            ++pass;
            break;
        }
    }

    /* ---- 3. weighted average ------------------------------------------- */
    CVector acc = CVector::Zero(n);
    rec.drift_post.resize(N);
    for (int i = 0; i < N; ++i) {
        const CVector a = apply_alignment(sig.column(i), fs[i], phs[i], dwell);
        acc += w[i] * a;
        rec.drift_post[i] = measure_drift(a, info, drift_centre, opt.drift_half_width);
    }
    out.fid = acc / w.sum();

    rec.fs       = fs;
    rec.phs      = phs;
    rec.weights  = w;
    rec.aligned  = true;
    rec.degraded = std::any_of(degraded.begin(), degraded.end(), [](char c) { return c != 0; });

    std::ostringstream msg;
    msg << to_string(kind) << ": " << N << " averages, " << pass << " passes, "
        << "min weight " << w.minCoeff()
        << (rec.degraded ? ", some averages kept the coarse estimate" : "");
    report(progress, "Align", msg.str());
    return out;
}

} // namespace mrsfit
