#include "mrsfit/AkimaSpline.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>

namespace mrsfit {

namespace {
bool is_descending(const Vector& x)
{
    return x.size() > 1 && x[0] > x[x.size() - 1];
}
} // namespace

std::vector<Real> AkimaSpline::ascending(const Vector& v, bool reverse)
{
    std::vector<Real> out(v.data(), v.data() + v.size());
    if (reverse) std::reverse(out.begin(), out.end());
    return out;
}

AkimaSpline::AkimaSpline(const Vector& x, const Vector& y)
    : spline_(ascending(x, is_descending(x)), ascending(y, is_descending(x))),
      x_min_(x.minCoeff()),
      x_max_(x.maxCoeff())
{
    if (x.size() != y.size() || x.size() < 4)
        throw PreconditionError("AkimaSpline: need >= 4 knots and matching sizes");

    y_min_ = spline_(x_min_);
    y_max_ = spline_(x_max_);

    // one-sided slopes for the linear continuation
    const Real h = 1e-6 * (x_max_ - x_min_);
    deriv_min_ = (spline_(x_min_ + h) - y_min_) / h;
    deriv_max_ = (y_max_ - spline_(x_max_ - h)) / h;
}

Real AkimaSpline::operator()(Real x) const
{
    if (x < x_min_)
        return y_min_ + deriv_min_ * (x - x_min_);
    if (x > x_max_)
        return y_max_ + deriv_max_ * (x - x_max_);
    return spline_(x);
}

Vector AkimaSpline::operator()(const Vector& x) const
{
    Vector out(x.size());
    for (int i = 0; i < x.size(); ++i)
        out[i] = operator()(x[i]);
    return out;
}

} // namespace mrsfit
