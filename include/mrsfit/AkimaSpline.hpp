#pragma once

#include "Types.hpp"
#include <boost/math/interpolators/makima.hpp>
#include <vector>

namespace mrsfit {

/*  Modified Akima interpolant on a monotone abscissa.  Descending input
 *  (a ppm axis) is reversed internally; outside the knots the curve is
 *  continued linearly.                                                       */
class AkimaSpline {
private:
    mutable decltype(boost::math::interpolators::makima(
        std::vector<Real>(), std::vector<Real>())) spline_;

    Real x_min_, x_max_;
    Real y_min_, y_max_;
    Real deriv_min_, deriv_max_;

    static std::vector<Real> ascending(const Vector& v, bool reverse);

public:
    AkimaSpline(const Vector& x, const Vector& y);

    Real   operator()(Real x) const;
    Vector operator()(const Vector& x) const;

    Real x_min() const { return x_min_; }
    Real x_max() const { return x_max_; }
};

} // namespace mrsfit
