#pragma once
#include "Signal.hpp"
#include "PeakModels.hpp"
#include <limits>
#include <string>
#include <vector>

namespace mrsfit {

struct ReferencePeak {
    std::string name;
    double      ppm;
    double      weight = 1.0;    // relative height in synthetic templates
};

namespace landmarks {
inline const ReferencePeak NAA   {"NAA", 2.008};
inline const ReferencePeak Cr    {"Cr",  3.027};
inline const ReferencePeak Cho   {"Cho", 3.200};
inline const ReferencePeak Water {"H2O", 4.680};
inline const ReferencePeak MM09  {"MM09", 0.910};
} // namespace landmarks

enum class ReferenceMethod { CrCho, NAA, Cr, Water };

ReferenceMethod reference_method_from_string(const std::string& s);
const char*     to_string(ReferenceMethod m);

/*  landmark peaks, search window and max. coarse lag of a method            */
struct ReferenceSpec {
    std::vector<ReferencePeak> peaks;
    double lo_ppm      = 0.0;
    double hi_ppm      = 0.0;
    double max_lag_ppm = 0.0;
};
ReferenceSpec reference_spec(ReferenceMethod m);

struct ReferenceResult {
    double shift_hz = 0.0;                                       // observed − canonical
    double fwhm_hz  = std::numeric_limits<double>::quiet_NaN();
    bool   fitted   = false;                                     // false: coarse only
};

/*  absorption-mode Lorentzians at the template peaks                        */
Vector synthetic_landmark_spectrum(const Vector&                     ppm,
                                   const std::vector<ReferencePeak>& peaks,
                                   double                            fwhm_ppm);

/*  cross-correlation of |S| with the landmark template, integer lag
 *  refined by a parabola.  Returns observed − canonical in Hz.              */
double xcorr_shift_hz(const CVector&       spectrum,
                      const AcquisitionInfo& info,
                      const ReferenceSpec& spec);

/*  coarse shift + lineshape fit of the dominant landmark                    */
ReferenceResult reference_spectrum(const ProcessedSpectrum& s, ReferenceMethod m);

/*  coarse shift only (no lineshape fit)                                     */
ReferenceResult reference_coarse(const ProcessedSpectrum& s, ReferenceMethod m);

/*  shift by −result.shift_hz and book it in ref_shift_hz / ref_fwhm_hz      */
ProcessedSpectrum apply_reference(const ProcessedSpectrum& s, const ReferenceResult& r);

/*  Cr/Cho double Lorentzian with a free phase; the returned spectrum is
 *  rotated by the negative fitted phase.                                     */
ProcessedSpectrum phase_cr_cho(const ProcessedSpectrum& s, double* phase_deg = nullptr);

} // namespace mrsfit
