#pragma once
#include "Signal.hpp"

namespace mrsfit {

/*  |max Re S| − |min Re S| over [lo, hi] ppm; negative means inverted        */
double polarity_score(const ProcessedSpectrum& s, double lo_ppm, double hi_ppm);

/*  flips the FID when polarity_score() < 0 and sets polarity_flipped         */
ProcessedSpectrum correct_polarity(const ProcessedSpectrum& s,
                                   double lo_ppm, double hi_ppm);

} // namespace mrsfit
