#pragma once
#include "Types.hpp"

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Uniform cubic B-spline baseline on [lo, hi] ppm.                         */
/*                                                                           */
/*  nseg = ceil((hi − lo) / spacing) segments, nseg + 3 basis functions     */
/*  centred at lo + (k − 1)·h,  h = (hi − lo) / nseg.  The functions sum to  */
/*  one everywhere inside [lo, hi].                                          */
/* ------------------------------------------------------------------------- */
int    bspline_count(double lo_ppm, double hi_ppm, double knot_spacing_ppm);

/*  (ppm.size() × bspline_count) design matrix                               */
Matrix bspline_basis(const Vector& ppm, double lo_ppm, double hi_ppm,
                     double knot_spacing_ppm);

/*  cardinal cubic B-spline, support (−2, 2)                                 */
double cubic_bspline(double u);

} // namespace mrsfit
