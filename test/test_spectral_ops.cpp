#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Synthetic.hpp"
#include "mrsfit/Errors.hpp"

#include <gtest/gtest.h>
#include <cmath>

using namespace mrsfit;

namespace {

Vector magnitude(const CVector& spec) { return spec.cwiseAbs(); }

} // namespace

TEST(SpectralOps, FftshiftEvenLength)
{
    CVector x(6);
    for (int i = 0; i < 6; ++i) x[i] = Complex(i, 0.0);

    const CVector y = fftshift(x);
    EXPECT_DOUBLE_EQ(y[0].real(), 3.0);
    EXPECT_DOUBLE_EQ(y[2].real(), 5.0);
    EXPECT_DOUBLE_EQ(y[3].real(), 0.0);

    const CVector z = ifftshift(y);
    EXPECT_LT((z - x).norm(), 1e-14);
}

TEST(SpectralOps, FrequencyDomainRoundTrip)
{
    const AcquisitionInfo info = synthetic_acquisition(512);
    const CVector fid = synthetic_fid(info, 512, {{3.027, 1.0, 4.0, 10.0},
                                                  {2.008, 2.0, 3.0, 0.0}});
    const CVector back = to_time_domain(to_frequency_domain(fid));
    EXPECT_LT((back - fid).norm(), 1e-10 * fid.norm());
}

TEST(SpectralOps, PpmAxisIsDescendingAroundCentre)
{
    const AcquisitionInfo info = synthetic_acquisition(1024);
    const Vector ppm = ppm_axis(info, 1024);

    ASSERT_EQ(ppm.size(), 1024);
    for (Eigen::Index i = 1; i < ppm.size(); ++i)
        ASSERT_LT(ppm[i], ppm[i - 1]);
    EXPECT_NEAR(ppm[512], info.center_ppm, 1e-12);

    const Vector hz = hz_axis(info, 1024);
    EXPECT_NEAR(hz[0], -0.5 * info.spectral_width(), 1e-9);
}

TEST(SpectralOps, PeakAppearsAtItsChemicalShift)
{
    const AcquisitionInfo info = synthetic_acquisition(2048);
    const CVector fid = synthetic_fid(info, 2048, {{2.008, 1.0, 4.0, 0.0}});
    const Vector ppm = ppm_axis(info, 2048);

    const PeakLocation p = find_peak(magnitude(to_frequency_domain(fid)), ppm, 1.5, 2.5);
    EXPECT_NEAR(p.ppm, 2.008, 0.005);
}

TEST(SpectralOps, FrequencyShiftMovesThePeak)
{
    const AcquisitionInfo info = synthetic_acquisition(2048);
    const CVector fid = synthetic_fid(info, 2048, {{2.0, 1.0, 4.0, 0.0}});
    const Vector ppm = ppm_axis(info, 2048);

    /* +0.5 ppm worth of Hz lowers the ppm position by 0.5 */
    const CVector moved = freq_shift(fid, -0.5 * info.txfrq_mhz, info.dwell_time);
    const PeakLocation p = find_peak(magnitude(to_frequency_domain(moved)), ppm, 1.0, 2.2);
    EXPECT_NEAR(p.ppm, 1.5, 0.01);

    const CVector back = freq_shift(moved, 0.5 * info.txfrq_mhz, info.dwell_time);
    EXPECT_LT((back - fid).norm(), 1e-9 * fid.norm());
}

TEST(SpectralOps, PhaseShiftRotatesEverySample)
{
    CVector x = CVector::Constant(8, Complex(1.0, 0.0));
    const CVector y = phase_shift(x, 90.0);
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        EXPECT_NEAR(y[i].real(), 0.0, 1e-12);
        EXPECT_NEAR(y[i].imag(), 1.0, 1e-12);
    }
}

TEST(SpectralOps, ZeroPadKeepsTheHead)
{
    CVector x(4);
    x << Complex(1, 1), Complex(2, 0), Complex(0, 3), Complex(4, 4);
    const CVector y = zero_pad(x, 2);
    ASSERT_EQ(y.size(), 8);
    EXPECT_LT((y.head(4) - x).norm(), 1e-15);
    EXPECT_LT(y.tail(4).norm(), 1e-15);
    EXPECT_THROW(zero_pad(x, 0), PreconditionError);
}

TEST(SpectralOps, MedianOddAndEven)
{
    Vector odd(3);
    odd << 3.0, 1.0, 2.0;
    EXPECT_DOUBLE_EQ(median(odd), 2.0);

    Vector even(4);
    even << 4.0, 1.0, 3.0, 2.0;
    EXPECT_DOUBLE_EQ(median(even), 2.5);
}

TEST(SpectralOps, UnwrapRemovesJumps)
{
    Vector ph(5);
    ph << 3.0, -3.0, -2.9, 3.1, -3.1;
    const Vector u = unwrap(ph);
    for (Eigen::Index i = 1; i < u.size(); ++i)
        EXPECT_LT(std::abs(u[i] - u[i - 1]), M_PI);
}

TEST(SpectralOps, PpmRangeAndEmptyWindow)
{
    const AcquisitionInfo info = synthetic_acquisition(1024);
    const Vector ppm = ppm_axis(info, 1024);

    const IndexRange r = ppm_range(ppm, 2.0, 3.0);
    ASSERT_FALSE(r.empty());
    EXPECT_LE(ppm[r.first], 3.0);
    EXPECT_GE(ppm[r.first + r.count - 1], 2.0);

    EXPECT_TRUE(ppm_range(ppm, 100.0, 101.0).empty());
    EXPECT_THROW(find_peak(ppm, ppm, 100.0, 101.0), PreconditionError);
}
