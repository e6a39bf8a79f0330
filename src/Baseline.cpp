#include "mrsfit/Baseline.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace mrsfit {

double cubic_bspline(double u)
{
    const double a = std::abs(u);
    if (a < 1.0) return 2.0 / 3.0 - a * a + 0.5 * a * a * a;
    if (a < 2.0) {
        const double b = 2.0 - a;
        return b * b * b / 6.0;
    }
    return 0.0;
}

int bspline_count(double lo_ppm, double hi_ppm, double knot_spacing_ppm)
{
    if (!(knot_spacing_ppm > 0.0))
        throw PreconditionError("baseline knot spacing must be positive");
    if (lo_ppm > hi_ppm) std::swap(lo_ppm, hi_ppm);
    const int nseg = std::max(1, static_cast<int>(std::ceil((hi_ppm - lo_ppm) / knot_spacing_ppm - 1e-9)));
    return nseg + 3;
}

Matrix bspline_basis(const Vector& ppm, double lo_ppm, double hi_ppm,
                     double knot_spacing_ppm)
{
    if (lo_ppm > hi_ppm) std::swap(lo_ppm, hi_ppm);
    const int    K    = bspline_count(lo_ppm, hi_ppm, knot_spacing_ppm);
    const int    nseg = K - 3;
    const double h    = (hi_ppm - lo_ppm) / nseg;

    Matrix B(ppm.size(), K);
    for (int k = 0; k < K; ++k) {
        const double centre = lo_ppm + (k - 1) * h;
        for (Eigen::Index i = 0; i < ppm.size(); ++i)
            B(i, k) = cubic_bspline((ppm[i] - centre) / h);
    }
    return B;
}

} // namespace mrsfit
