#include "mrsfit/Alignment.hpp"
#include "mrsfit/Synthetic.hpp"
#include "mrsfit/Errors.hpp"

#include <gtest/gtest.h>
#include <cmath>

using namespace mrsfit;

namespace {

std::vector<SyntheticPeak> brain_peaks()
{
    return {{2.008, 1.0, 4.0, 0.0},
            {3.027, 0.8, 4.0, 0.0},
            {3.200, 0.7, 4.0, 0.0}};
}

double spread(const Vector& v)
{
    return v.maxCoeff() - v.minCoeff();
}

} // namespace

TEST(Alignment, SingleAverageIsPassedThrough)
{
    const AcquisitionInfo info = synthetic_acquisition(1024);
    const CVector fid = synthetic_fid(info, 1024, brain_peaks());
    const TimeDomainSignal s = TimeDomainSignal::from_fid(info, fid);

    const ProcessedSpectrum out = average_and_align(s, ConditionKind::OFF);
    EXPECT_FALSE(out.alignment.aligned);
    EXPECT_LT((out.fid - fid).norm(), 1e-15);
    ASSERT_EQ(out.alignment.weights.size(), 1);
    EXPECT_DOUBLE_EQ(out.alignment.weights[0], 1.0);
    EXPECT_NEAR(out.alignment.drift_pre[0], 3.027, 0.01);
}

TEST(Alignment, RejectsUnusableSignals)
{
    const AcquisitionInfo info = synthetic_acquisition(256);

    const TimeDomainSignal none(info, CMatrix(256, 0), 0);
    EXPECT_THROW(average_and_align(none, ConditionKind::OFF), PreconditionError);

    const TimeDomainSignal two_subspecs(info, CMatrix::Ones(256, 2), 1, 1, 2);
    EXPECT_THROW(average_and_align(two_subspecs, ConditionKind::OFF), PreconditionError);

    const TimeDomainSignal pre_averaged(info, CMatrix::Ones(256, 2), 2, 1, 1, true);
    EXPECT_THROW(average_and_align(pre_averaged, ConditionKind::OFF), PreconditionError);

    AlignmentOptions opt;
    opt.coarse_peaks.clear();
    const TimeDomainSignal one(info, CMatrix::Ones(256, 1), 1);
    EXPECT_THROW(average_and_align(one, ConditionKind::OFF, opt), PreconditionError);
}

TEST(Alignment, RobustWeights)
{
    Vector d(3);
    d << 1.0, 2.0, 4.0;
    const Vector w = robust_weights(d);
    EXPECT_DOUBLE_EQ(w[0], 1.0);
    EXPECT_DOUBLE_EQ(w[1], 0.25);
    EXPECT_DOUBLE_EQ(w[2], 1.0 / 16.0);

    /* all-zero distances must not produce NaN */
    const Vector z = robust_weights(Vector::Zero(4));
    EXPECT_TRUE(z.allFinite());
    EXPECT_DOUBLE_EQ(z.maxCoeff(), 1.0);
}

TEST(Alignment, RegistersKnownFrequencyAndPhaseOffsets)
{
    const int n = 2048;
    const AcquisitionInfo info = synthetic_acquisition(n);
    const CVector fid = synthetic_fid(info, n, brain_peaks());

    const double df[]  = {0.0, 2.5, -3.0, 1.2, -1.7, 4.0};
    const double dph[] = {0.0, 8.0, -5.0, 3.0, 12.0, -9.0};
    const int N = 6;

    CMatrix m(n, N);
    for (int i = 0; i < N; ++i)
        m.col(i) = phase_shift(freq_shift(fid, df[i], info.dwell_time), dph[i]);
    const TimeDomainSignal s(info, m, N);

    AlignmentOptions opt;
    opt.parallel = false;
    const ProcessedSpectrum out = average_and_align(s, ConditionKind::OFF, opt);

    ASSERT_TRUE(out.alignment.aligned);
    EXPECT_FALSE(out.alignment.degraded);
    ASSERT_EQ(out.alignment.fs.size(), N);

    /* after correction every average sits at the same frequency and phase */
    Vector total_fs(N), total_ph(N);
    for (int i = 0; i < N; ++i) {
        total_fs[i] = df[i] + out.alignment.fs[i];
        total_ph[i] = dph[i] + out.alignment.phs[i];
    }
    EXPECT_LT(spread(total_fs), 0.05);
    EXPECT_LT(spread(total_ph), 0.5);

    EXPECT_NEAR(out.alignment.weights.maxCoeff(), 1.0, 1e-12);
    EXPECT_LT(spread(out.alignment.drift_post), spread(out.alignment.drift_pre) + 1e-12);
}

TEST(Alignment, AlignedAverageBeatsPlainMean)
{
    const int n = 2048;
    const AcquisitionInfo info = synthetic_acquisition(n);
    const CVector clean = synthetic_fid(info, n, brain_peaks());

    std::vector<CVector> subspec{clean};
    TransientOptions t;
    t.n_averages   = 16;
    t.freq_sd_hz   = 3.0;
    t.phase_sd_deg = 10.0;
    t.noise_sd     = 0.001;
    t.seed         = 7;
    const TimeDomainSignal s = synthetic_signal(info, subspec, t);

    AlignmentOptions opt;
    opt.parallel = false;
    const ProcessedSpectrum out = average_and_align(s, ConditionKind::OFF, opt);

    CVector plain = CVector::Zero(n);
    for (int i = 0; i < s.n_averages(); ++i) plain += s.column(i);
    plain /= static_cast<double>(s.n_averages());

    const double aligned_height = to_frequency_domain(out.fid).cwiseAbs().maxCoeff();
    const double plain_height   = to_frequency_domain(plain).cwiseAbs().maxCoeff();
    EXPECT_GT(aligned_height, plain_height);
}
