#include "mrsfit/Polarity.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"
#include <cmath>

namespace mrsfit {

double polarity_score(const ProcessedSpectrum& s, double lo_ppm, double hi_ppm)
{
    const Vector re  = s.spectrum().real();
    const IndexRange r = ppm_range(s.ppm(), lo_ppm, hi_ppm);
    if (r.empty())
        throw PreconditionError("polarity check: window outside the spectral range");

    const auto seg = re.segment(r.first, r.count);
    return std::abs(seg.maxCoeff()) - std::abs(seg.minCoeff());
}

ProcessedSpectrum correct_polarity(const ProcessedSpectrum& s,
                                   double lo_ppm, double hi_ppm)
{
    if (polarity_score(s, lo_ppm, hi_ppm) >= 0.0)
        return s;

    ProcessedSpectrum out = s.with_fid(-s.fid);
    out.polarity_flipped = !s.polarity_flipped;
    return out;
}

} // namespace mrsfit
