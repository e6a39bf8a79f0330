#ifndef MRSFIT_QUALITY_METRICS_HPP
#define MRSFIT_QUALITY_METRICS_HPP
// -----------------------------------------------------------------------------
//  Signal-to-noise, linewidth and drift of processed spectra.  Arrays are
//  Eigen vectors on the descending ppm axis of the spectrum.
// -----------------------------------------------------------------------------
#include "Signal.hpp"
#include "AcquisitionProtocol.hpp"
#include <limits>
#include <utility>

namespace mrsfit {

// -----------------------------------------------------------------------------
//  Small return structures
// -----------------------------------------------------------------------------
struct SNRResult
{
    double signal {0.0};               // peak height
    double noise  {0.0};               // 1σ noise level
    double snr    {0.0};               // signal / noise
};

struct QualityMetrics
{
    ConditionKind condition = ConditionKind::OFF;

    double snr      = std::numeric_limits<double>::quiet_NaN();
    double der_snr  = std::numeric_limits<double>::quiet_NaN();   // DER_SNR noise
    double fwhm_hz  = std::numeric_limits<double>::quiet_NaN();
    double fwhm_ppm = std::numeric_limits<double>::quiet_NaN();

    Vector drift_pre;                  // ppm, per average
    Vector drift_post;
    double ref_shift_hz       = 0.0;   // shift applied by the referencing
    double mean_freq_shift_hz = 0.0;   // mean |fs| applied by the alignment
    double avg_delta_cr_ppm   = std::numeric_limits<double>::quiet_NaN();
};

// -----------------------------------------------------------------------------
//  Function prototypes
// -----------------------------------------------------------------------------

/*  max Re S in the signal window over the std. deviation of the
 *  quadratically detrended Re S in [noise_lo, noise_hi]                     */
SNRResult spectral_snr(const ProcessedSpectrum& s,
                       const PpmWindow&         signal_window,
                       double                   noise_lo_ppm = -2.0,
                       double                   noise_hi_ppm =  0.0);

/*  DER_SNR noise estimate of a real vector (order 3)                        */
double der_snr_noise(const Vector& values);

/*  Lorentzian fit in the window; returns (Hz, ppm), NaN on failure          */
std::pair<double, double> linewidth(const ProcessedSpectrum& s,
                                    const PpmWindow&         window);

/*  the full record for one condition                                        */
QualityMetrics measure_quality(const ProcessedSpectrum& s,
                               const PpmWindow&         window,
                               double                   landmark_ppm = 3.027);

} // namespace mrsfit
#endif // MRSFIT_QUALITY_METRICS_HPP
