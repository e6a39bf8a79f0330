#pragma once
#include "Signal.hpp"

namespace mrsfit {

struct EccResult {
    ProcessedSpectrum metabolite;
    ProcessedSpectrum reference;
    bool              applied = false;   // false: heuristic kept the input
    double            phase_before_deg = 0.0;
    double            phase_after_deg  = 0.0;
};

/*  Multiply both FIDs by exp(-i·unwrap(arg ref(t))).  The reference must
 *  already be a single transient (coils, sub-spectra and averages
 *  combined), otherwise PreconditionError.                                   */
EccResult eddy_current_correct(const ProcessedSpectrum& metabolite,
                               const TimeDomainSignal&  reference);

EccResult eddy_current_correct(const ProcessedSpectrum& metabolite,
                               const ProcessedSpectrum& reference);

/*  Same as above, but compares the phase of the landmark (magnitude maximum
 *  in [lo, hi] ppm) before and after.  The correction is kept only if
 *  2·|phase_before| > |phase_after|.                                        */
EccResult eddy_current_correct_checked(const ProcessedSpectrum& metabolite,
                                       const ProcessedSpectrum& reference,
                                       double lo_ppm = 1.8,
                                       double hi_ppm = 2.2);

/*  phase (deg) of the magnitude maximum inside [lo, hi]                      */
double landmark_phase_deg(const ProcessedSpectrum& s, double lo_ppm, double hi_ppm);

} // namespace mrsfit
