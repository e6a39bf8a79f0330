#pragma once
#include "Signal.hpp"
#include "Referencing.hpp"
#include "SpectralOps.hpp"
#include "Progress.hpp"
#include <vector>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Averaging & alignment of the transients of one condition                 */
/*                                                                           */
/*    1. coarse frequency per package of averages (cross-correlation with    */
/*       synthetic landmark peaks)                                           */
/*    2. LM registration of (frequency, phase) per average against an        */
/*       evolving target; weights (d_min / d_i)² from the distance of each   */
/*       aligned average to the median of the aligned set                    */
/*    3. weighted mean of the corrected averages                             */
/* ------------------------------------------------------------------------- */
struct AlignmentOptions {
    std::vector<ReferencePeak> coarse_peaks {landmarks::Cr, landmarks::Cho};
    double coarse_lo_ppm    = 2.6;
    double coarse_hi_ppm    = 3.6;
    double max_lag_ppm      = 0.4;

    double reg_lo_ppm       = 1.8;
    double reg_hi_ppm       = 4.2;

    double drift_half_width = 0.15;     // around coarse_peaks.front()

    double package_fraction = 0.1;
    int    max_passes       = 10;
    int    lm_iterations    = 50;
    double tol_hz           = 1e-3;
    double tol_deg          = 1e-2;
    bool   parallel         = true;
};

/*  aligned = phase_shift(freq_shift(fid, fs_hz), phs_deg)                    */
CVector apply_alignment(const CVector& fid, double fs_hz, double phs_deg, double dwell);

/*  ppm of the |S| maximum in [centre − hw, centre + hw]                      */
double measure_drift(const CVector& fid, const AcquisitionInfo& info,
                     double centre_ppm, double half_width);

/*  (d_min / d_i)², max = 1                                                  */
Vector robust_weights(const Vector& distances);

struct RegistrationResult {
    double fs_hz    = 0.0;
    double phs_deg  = 0.0;
    double residual = 0.0;
    bool   ok       = false;
};

/*  frequency/phase registration of one FID onto the target spectrum; the
 *  residual is Re/Im of the spectral difference inside `window`.            */
RegistrationResult register_to_target(const CVector&         fid,
                                      const CVector&         target_spectrum,
                                      const IndexRange&      window,
                                      const AcquisitionInfo& info,
                                      double fs0_hz, double phs0_deg,
                                      double max_shift_hz,
                                      int    max_iterations);

ProcessedSpectrum average_and_align(const TimeDomainSignal& signal,
                                    ConditionKind           kind,
                                    const AlignmentOptions& opt      = {},
                                    ProgressObserver*       progress = nullptr);

} // namespace mrsfit
