#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"
#include <unsupported/Eigen/FFT>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace mrsfit {

namespace {
constexpr double kTwoPi = 2.0 * M_PI;
}

/* ------------------------------------------------------------------------- */
/*  transforms                                                               */
/* ------------------------------------------------------------------------- */
CVector fftshift(const CVector& x)
{
    const Eigen::Index n = x.size();
    const Eigen::Index h = n / 2;
    CVector out(n);
    for (Eigen::Index k = 0; k < n; ++k)
        out[(k + h) % n] = x[k];
    return out;
}

CVector ifftshift(const CVector& x)
{
    const Eigen::Index n = x.size();
    const Eigen::Index h = n / 2;
    CVector out(n);
    for (Eigen::Index k = 0; k < n; ++k)
        out[k] = x[(k + h) % n];
    return out;
}

CVector to_frequency_domain(const CVector& fid)
{
    Eigen::FFT<double> fft;
    CVector spec(fid.size());
    fft.fwd(spec, fid);
    return fftshift(spec);
}

CVector to_time_domain(const CVector& spectrum)
{
    Eigen::FFT<double> fft;
    const CVector unshifted = ifftshift(spectrum);
    CVector fid(spectrum.size());
    fft.inv(fid, unshifted);                      // scaled by 1/n
    return fid;
}

/* ------------------------------------------------------------------------- */
/*  axes                                                                     */
/* ------------------------------------------------------------------------- */
Vector time_axis(const AcquisitionInfo& info, int n)
{
    return Vector::LinSpaced(n, 0.0, info.dwell_time * (n - 1));
}

Vector hz_axis(const AcquisitionInfo& info, int n)
{
    const double sw = info.spectral_width();
    Vector f(n);
    for (int k = 0; k < n; ++k)
        f[k] = (k - n / 2) * sw / n;
    return f;
}

Vector ppm_axis(const AcquisitionInfo& info, int n)
{
    if (info.txfrq_mhz <= 0.0)
        throw PreconditionError("ppm_axis: transmitter frequency must be positive");
    return (info.center_ppm - hz_axis(info, n).array() / info.txfrq_mhz).matrix();
}

IndexRange ppm_range(const Vector& ppm, double lo, double hi)
{
    if (lo > hi) std::swap(lo, hi);
    IndexRange r;
    for (Eigen::Index i = 0; i < ppm.size(); ++i) {
        if (ppm[i] >= lo && ppm[i] <= hi) {
            if (r.count == 0) r.first = i;
            ++r.count;
        }
    }
    return r;
}

/* ------------------------------------------------------------------------- */
/*  FID manipulation                                                         */
/* ------------------------------------------------------------------------- */
CVector freq_shift(const CVector& fid, double hz, double dwell)
{
    CVector out(fid.size());
    for (Eigen::Index k = 0; k < fid.size(); ++k)
        out[k] = fid[k] * std::polar(1.0, -kTwoPi * hz * dwell * static_cast<double>(k));
    return out;
}

CVector phase_shift(const CVector& fid, double deg)
{
    return fid * std::polar(1.0, deg * M_PI / 180.0);
}

CVector amplitude_scale(const CVector& fid, double factor)
{
    return fid * factor;
}

CVector zero_pad(const CVector& fid, int factor)
{
    if (factor < 1)
        throw PreconditionError("zero_pad: factor must be >= 1");
    CVector out = CVector::Zero(fid.size() * factor);
    out.head(fid.size()) = fid;
    return out;
}

CVector add_phase_ramp(const CVector& fid, const AcquisitionInfo& info,
                       double ph0_deg, double ph1_deg_per_ppm)
{
    CVector spec = to_frequency_domain(fid);
    const Vector ppm = ppm_axis(info, static_cast<int>(fid.size()));
    for (Eigen::Index k = 0; k < spec.size(); ++k) {
        const double deg = ph0_deg + ph1_deg_per_ppm * (ppm[k] - info.center_ppm);
        spec[k] *= std::polar(1.0, deg * M_PI / 180.0);
    }
    return to_time_domain(spec);
}

CVector dc_correct_time(const CVector& fid, double tail_fraction)
{
    const Eigen::Index n    = fid.size();
    const Eigen::Index tail = std::max<Eigen::Index>(
        1, static_cast<Eigen::Index>(std::round(tail_fraction * n)));
    if (n == 0) return fid;
    const Complex dc = fid.tail(std::min(tail, n)).mean();
    return (fid.array() - dc).matrix();
}

CVector dc_correct_frequency(const CVector& fid, double percent)
{
    CVector spec = to_frequency_domain(fid);
    const Eigen::Index n = spec.size();
    if (n == 0) return fid;

    percent = std::clamp(percent, 1.0, 100.0);
    const Eigen::Index width = std::max<Eigen::Index>(
        1, static_cast<Eigen::Index>(std::round(n * percent / 100.0)));
    const Eigen::Index first = (n - width) / 2;

    const Vector re = spec.segment(first, width).real();
    const Vector im = spec.segment(first, width).imag();
    const Complex offset(median(re), median(im));

    spec.array() -= offset;
    return to_time_domain(spec);
}

/* ------------------------------------------------------------------------- */
/*  small numerics                                                           */
/* ------------------------------------------------------------------------- */
double median(Vector v)
{
    const Eigen::Index n = v.size();
    if (n == 0)
        throw std::runtime_error("median(): empty vector");

    Eigen::Index k = n / 2;
    std::nth_element(v.data(), v.data() + k, v.data() + n);

    double m = v[k];
    if ((n & 1) == 0) {
        const double max_lo = *std::max_element(v.data(), v.data() + k);
        m = 0.5 * (m + max_lo);
    }
    return m;
}

Vector unwrap(const Vector& phase)
{
    Vector out = phase;
    double offset = 0.0;
    for (Eigen::Index i = 1; i < phase.size(); ++i) {
        const double d = phase[i] - phase[i - 1];
        if (d > M_PI)       offset -= kTwoPi * std::round(d / kTwoPi);
        else if (d < -M_PI) offset += kTwoPi * std::round(-d / kTwoPi);
        out[i] = phase[i] + offset;
    }
    return out;
}

PeakLocation find_peak(const Vector& values, const Vector& ppm,
                       double lo, double hi)
{
    const IndexRange r = ppm_range(ppm, lo, hi);
    if (r.empty())
        throw PreconditionError("find_peak: window outside the spectral range");

    Eigen::Index local = 0;
    values.segment(r.first, r.count).maxCoeff(&local);
    const Eigen::Index i = r.first + local;

    PeakLocation p;
    p.index = i;
    p.value = values[i];
    p.ppm   = ppm[i];

    /* three-point parabola through the maximum */
    if (i > 0 && i + 1 < values.size()) {
        const double ym = values[i - 1], y0 = values[i], yp = values[i + 1];
        const double den = ym - 2.0 * y0 + yp;
        if (den < 0.0) {
            const double delta = 0.5 * (ym - yp) / den;
            if (std::abs(delta) <= 1.0) {
                const double step = ppm[i + 1] - ppm[i];
                p.ppm   = ppm[i] + delta * step;
                p.value = y0 - 0.25 * (ym - yp) * delta;
            }
        }
    }
    return p;
}

} // namespace mrsfit
