#include "mrsfit/SimpleLM.hpp"
#include "mrsfit/Powell.hpp"
#include "mrsfit/Retry.hpp"
#include "mrsfit/PeakModels.hpp"
#include "mrsfit/Baseline.hpp"
#include "mrsfit/AkimaSpline.hpp"
#include "mrsfit/Errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <optional>
#include <string>

using namespace mrsfit;

// ============================================================================
//  Levenberg-Marquardt / Powell
// ============================================================================
namespace {

/*  y = a·exp(−b·t)                                                          */
struct ExpDecay {
    Eigen::VectorXd t, y;

    void operator()(const Eigen::VectorXd& p, Eigen::VectorXd* r, Eigen::MatrixXd* J) const
    {
        const Eigen::ArrayXd e = (-p[1] * t.array()).exp();
        *r = (p[0] * e - y.array()).matrix();
        if (J) {
            J->resize(t.size(), 2);
            J->col(0) = e.matrix();
            J->col(1) = (-p[0] * t.array() * e).matrix();
        }
    }
};

/*  residuals (p0 − 3, p1 + 1)                                               */
struct Bowl {
    void operator()(const Eigen::VectorXd& p, Eigen::VectorXd* r, Eigen::MatrixXd* J) const
    {
        r->resize(2);
        (*r)[0] = p[0] - 3.0;
        (*r)[1] = p[1] + 1.0;
        if (J) *J = Eigen::MatrixXd::Identity(2, 2);
    }
};

} // namespace

TEST(LevenbergMarquardt, RecoversExponentialDecay)
{
    ExpDecay f;
    f.t = Eigen::VectorXd::LinSpaced(50, 0.0, 5.0);
    f.y = (2.5 * (-0.7 * f.t.array()).exp()).matrix();

    Eigen::VectorXd x(2);
    x << 1.0, 0.2;
    const LMSolverSummary s = levenberg_marquardt(f, x, {true, true}, {}, {});

    EXPECT_FALSE(s.numerical_failure);
    EXPECT_NEAR(x[0], 2.5, 1e-5);
    EXPECT_NEAR(x[1], 0.7, 1e-5);
    EXPECT_LT(s.final_chi2, s.initial_chi2);
}

TEST(LevenbergMarquardt, FrozenParameterStaysPut)
{
    ExpDecay f;
    f.t = Eigen::VectorXd::LinSpaced(50, 0.0, 5.0);
    f.y = (2.5 * (-0.7 * f.t.array()).exp()).matrix();

    Eigen::VectorXd x(2);
    x << 2.5, 0.2;
    levenberg_marquardt(f, x, {false, true}, {}, {});
    EXPECT_DOUBLE_EQ(x[0], 2.5);
    EXPECT_NEAR(x[1], 0.7, 1e-5);
}

TEST(LevenbergMarquardt, BoundsAreHonoured)
{
    Bowl f;
    Eigen::VectorXd x = Eigen::VectorXd::Zero(2);
    levenberg_marquardt(f, x, {true, true}, {-10.0, 0.0}, {2.0, 10.0});
    EXPECT_NEAR(x[0], 2.0, 1e-9);
    EXPECT_NEAR(x[1], 0.0, 1e-9);
}

TEST(Powell, BoundedQuadratic)
{
    Bowl f;
    Eigen::VectorXd x = Eigen::VectorXd::Zero(2);
    const PowellSolverSummary s = powell(f, x, {true, true}, {-10.0, -0.5}, {10.0, 10.0});

    EXPECT_NEAR(x[0], 3.0, 1e-4);
    EXPECT_NEAR(x[1], -0.5, 1e-4);
    EXPECT_LE(s.final_value, s.initial_value);
}

// ============================================================================
//  retry combinator
// ============================================================================
TEST(Retry, FirstUsableResultWins)
{
    std::vector<int> tried;
    const auto out = retry_with_degradation(
        [&](const int& order) -> std::optional<std::string> {
            tried.push_back(order);
            if (order > 3) return std::nullopt;
            return "order " + std::to_string(order);
        },
        descending_orders(6, 1));

    ASSERT_TRUE(out);
    EXPECT_EQ(*out.value, "order 3");
    EXPECT_EQ(out.parameter, 3);
    EXPECT_EQ(out.attempts, 4);
    EXPECT_EQ(tried, (std::vector<int>{6, 5, 4, 3}));
}

TEST(Retry, ExhaustedSequenceIsATypedFailure)
{
    const auto out = retry_with_degradation(
        [](const int&) -> std::optional<double> { return std::nullopt; },
        descending_orders(3, 1));

    EXPECT_FALSE(out);
    EXPECT_EQ(out.attempts, 3);
    EXPECT_EQ(out.parameter, 1);
}

TEST(Retry, DescendingOrders)
{
    EXPECT_EQ(descending_orders(20, 18), (std::vector<int>{20, 19, 18}));
    EXPECT_TRUE(descending_orders(1, 2).empty());
}

// ============================================================================
//  Lorentzian peak fit
// ============================================================================
TEST(PeakModels, SingleLorentzianRecovered)
{
    const Vector ppm = Vector::LinSpaced(400, 4.0, 0.0);
    const double gamma = 0.02;                               // half width
    Vector y(ppm.size());
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        const double u = ppm[i] - 2.01;
        y[i] = 5.0 * gamma * gamma / (gamma * gamma + u * u) + 0.3;
    }

    PeakFitOptions opt;
    opt.fwhm_guess_ppm = 0.06;
    const PeakFitResult fit = fit_lorentzians(ppm, y, 1.7, 2.3, opt);

    ASSERT_TRUE(fit.ok);
    EXPECT_NEAR(fit.center_ppm, 2.01, 1e-4);
    EXPECT_NEAR(fit.fwhm_ppm, 2.0 * gamma, 1e-4);
    EXPECT_NEAR(fit.amplitudes.front(), 5.0, 1e-2);
    EXPECT_NEAR(fit.baseline, 0.3, 1e-2);
    EXPECT_NEAR(fit.phase_deg, 0.0, 0.5);
}

TEST(PeakModels, TooNarrowWindowThrows)
{
    const Vector ppm = Vector::LinSpaced(100, 4.0, 0.0);
    const Vector y = Vector::Zero(100);
    EXPECT_THROW(fit_lorentzians(ppm, y, 2.00, 2.05), PreconditionError);
}

TEST(PeakModels, LinewidthPrior)
{
    EXPECT_DOUBLE_EQ(linewidth_prior_hz(0.5), 2.0);
    EXPECT_DOUBLE_EQ(linewidth_prior_hz(3.0), 6.0);
}

// ============================================================================
//  B-spline baseline
// ============================================================================
TEST(Baseline, CountFollowsKnotSpacing)
{
    EXPECT_EQ(bspline_count(0.2, 4.2, 0.4), 13);
    EXPECT_EQ(bspline_count(0.0, 1.0, 0.3), 7);
}

TEST(Baseline, PartitionOfUnity)
{
    const Vector ppm = Vector::LinSpaced(300, 4.2, 0.2);
    const Matrix B = bspline_basis(ppm, 0.2, 4.2, 0.4);

    ASSERT_EQ(B.cols(), bspline_count(0.2, 4.2, 0.4));
    for (Eigen::Index i = 0; i < B.rows(); ++i)
        EXPECT_NEAR(B.row(i).sum(), 1.0, 1e-12);
    EXPECT_GE(B.minCoeff(), 0.0);
}

TEST(Baseline, CardinalSplineSupport)
{
    EXPECT_NEAR(cubic_bspline(0.0), 2.0 / 3.0, 1e-15);
    EXPECT_NEAR(cubic_bspline(1.0), 1.0 / 6.0, 1e-15);
    EXPECT_DOUBLE_EQ(cubic_bspline(2.0), 0.0);
    EXPECT_DOUBLE_EQ(cubic_bspline(-2.5), 0.0);
}

// ============================================================================
//  Akima interpolation
// ============================================================================
TEST(AkimaSpline, ReproducesALineOnADescendingAxis)
{
    const Vector x = Vector::LinSpaced(20, 4.0, 0.0);
    const Vector y = (2.0 * x.array() - 1.0).matrix();
    const AkimaSpline s(x, y);

    EXPECT_NEAR(s(1.234), 2.0 * 1.234 - 1.0, 1e-12);
    EXPECT_NEAR(s(3.9), 6.8, 1e-12);
    EXPECT_NEAR(s.x_min(), 0.0, 1e-12);
    EXPECT_NEAR(s.x_max(), 4.0, 1e-12);

    /* linear continuation outside the knots */
    EXPECT_NEAR(s(5.0), 9.0, 1e-9);
}
