#include "mrsfit/ModelFit.hpp"
#include "mrsfit/Synthetic.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace mrsfit;

namespace {

constexpr int kPoints = 2048;

const std::vector<std::string> kNames {"NAA", "Cr", "GPC", "Ins"};
const std::vector<double>      kTruth {1.0, 0.8, 0.3, 0.5};

/*  records every progress line                                              */
class Recorder : public ProgressObserver {
public:
    void on_progress(const std::string& stage, const std::string& message) override
    {
        lines.push_back(stage + ": " + message);
    }
    std::vector<std::string> lines;
};

double true_baseline(double ppm)
{
    const double u = ppm - 2.0;
    return 20.0 + 10.0 * u - 5.0 * u * u;
}

/*  Σ a_j·basis_j with 2 Hz extra Lorentzian broadening plus a smooth baseline */
ProcessedSpectrum mixture(const AcquisitionInfo& info, const BasisSet& basis, double scale)
{
    const Vector t = time_axis(info, kPoints);
    CVector fid = CVector::Zero(kPoints);
    for (std::size_t j = 0; j < kNames.size(); ++j) {
        const CVector& b = basis[basis.index_of(kNames[j])].fid;
        for (int k = 0; k < kPoints; ++k)
            fid[k] += scale * kTruth[j] * b[k] * std::exp(-M_PI * 2.0 * t[k]);
    }

    CVector spec = to_frequency_domain(fid);
    const Vector ppm = ppm_axis(info, kPoints);
    for (int k = 0; k < kPoints; ++k)
        spec[k] += scale * true_baseline(ppm[k]);

    ProcessedSpectrum s;
    s.kind = ConditionKind::OFF;
    s.info = info;
    s.fid  = to_time_domain(spec);
    return s;
}

ModelFit::Config exact_config()
{
    ModelFit::Config cfg;
    cfg.zero_fill    = 1;
    cfg.ref_shift_hz = 0.0;
    return cfg;
}

} // namespace

// ============================================================================
//  construction
// ============================================================================
TEST(ModelFit, RejectsUnusableInput)
{
    const AcquisitionInfo info  = synthetic_acquisition(kPoints);
    const auto            basis = std::make_shared<const BasisSet>(synthetic_basis(info, kPoints, kNames));
    const ProcessedSpectrum s   = mixture(info, *basis, 1.0);

    EXPECT_THROW(ModelFit({}, exact_config()), PreconditionError);
    EXPECT_THROW(ModelFit({{s, nullptr}}, exact_config()), PreconditionError);

    ModelFit::Config cfg = exact_config();
    cfg.zero_fill = 0;
    EXPECT_THROW(ModelFit({{s, basis}}, cfg), PreconditionError);

    cfg = exact_config();
    cfg.fit_lo_ppm = 3.0;
    cfg.fit_hi_ppm = 2.0;
    EXPECT_THROW(ModelFit({{s, basis}}, cfg), PreconditionError);

    ProcessedSpectrum empty = s;
    empty.fid = CVector();
    EXPECT_THROW(ModelFit({{empty, basis}}, exact_config()), PreconditionError);
}

TEST(ModelFit, NarrowRangeHoldsTooFewPoints)
{
    const AcquisitionInfo info  = synthetic_acquisition(kPoints);
    const auto            basis = std::make_shared<const BasisSet>(synthetic_basis(info, kPoints, kNames));

    ModelFit::Config cfg = exact_config();
    cfg.fit_lo_ppm = 2.0;
    cfg.fit_hi_ppm = 2.05;
    ModelFit fit({{mixture(info, *basis, 1.0), basis}}, cfg);
    EXPECT_THROW(fit.run(), PreconditionError);
}

TEST(ModelFit, NonFiniteDataEndsInTheFailedState)
{
    const AcquisitionInfo info  = synthetic_acquisition(kPoints);
    const auto            basis = std::make_shared<const BasisSet>(synthetic_basis(info, kPoints, kNames));

    ProcessedSpectrum s = mixture(info, *basis, 1.0);
    s.fid[100] = Complex(std::numeric_limits<double>::quiet_NaN(), 0.0);

    Recorder progress;
    ModelFit fit({{s, basis}}, exact_config(), nullptr, &progress);
    EXPECT_NO_THROW(fit.run());

    EXPECT_EQ(fit.stage(), FitStage::Failed);
    ASSERT_EQ(fit.results().size(), 1u);
    const FitParameters& p = fit.results().front();
    EXPECT_TRUE(p.failed());
    EXPECT_EQ(p.condition, ConditionKind::OFF);
    EXPECT_FALSE(p.message.empty());
    ASSERT_FALSE(progress.lines.empty());
    EXPECT_NE(progress.lines.back().find("failed"), std::string::npos);
}

// ============================================================================
//  recovery of a known mixture
// ============================================================================
TEST(ModelFit, RecoversAmplitudesAndBaseline)
{
    const AcquisitionInfo info  = synthetic_acquisition(kPoints);
    const auto            basis = std::make_shared<const BasisSet>(synthetic_basis(info, kPoints, kNames));

    Recorder progress;
    ModelFit fit({{mixture(info, *basis, 1.0), basis}}, exact_config(), nullptr, &progress);
    EXPECT_EQ(fit.stage(), FitStage::Unfit);
    fit.run();

    ASSERT_EQ(fit.stage(), FitStage::Complete);
    ASSERT_EQ(fit.results().size(), 1u);
    const FitParameters& p = fit.results().front();
    EXPECT_FALSE(p.failed());
    EXPECT_EQ(p.names, kNames);

    for (std::size_t j = 0; j < kNames.size(); ++j)
        EXPECT_NEAR(p.amplitude(kNames[j]), kTruth[j], 0.01 * kTruth[j]) << kNames[j];
    for (Eigen::Index j = 0; j < p.lorentz_hz.size(); ++j)
        EXPECT_NEAR(p.lorentz_hz[j], 2.0, 0.1) << p.names[static_cast<std::size_t>(j)];
    EXPECT_NEAR(p.ph0_deg, 0.0, 0.5);
    EXPECT_DOUBLE_EQ(p.ref_shift_hz, 0.0);
    EXPECT_TRUE(std::isnan(p.amplitude("GABA")));

    /* curves cover the fit range and the model matches the data */
    const Vector& ppm = fit.ppm(0);
    ASSERT_GT(ppm.size(), 0);
    EXPECT_LE(ppm.maxCoeff(), 4.2);
    EXPECT_GE(ppm.minCoeff(), 0.2);
    EXPECT_LT((fit.model(0) - fit.data(0)).norm(), 0.01 * fit.data(0).norm());

    Vector truth(ppm.size());
    for (Eigen::Index i = 0; i < ppm.size(); ++i) truth[i] = true_baseline(ppm[i]);
    EXPECT_LT((fit.baseline(0) - truth).norm(), 0.05 * truth.norm());

    EXPECT_FALSE(progress.lines.empty());
    EXPECT_EQ(progress.lines.front().rfind("Fit: Stage 1", 0), 0u);
}

TEST(ModelFit, SkippingTheReducedStageStillConverges)
{
    const AcquisitionInfo info  = synthetic_acquisition(kPoints);
    const auto            basis = std::make_shared<const BasisSet>(synthetic_basis(info, kPoints, kNames));

    ModelFit::Config cfg = exact_config();
    cfg.skip_reduced = true;
    ModelFit fit({{mixture(info, *basis, 1.0), basis}}, cfg);
    fit.run();

    ASSERT_EQ(fit.stage(), FitStage::Complete);
    EXPECT_NEAR(fit.results().front().amplitude("NAA"), 1.0, 0.02);
    EXPECT_NEAR(fit.results().front().amplitude("Cr"),  0.8, 0.02);
}

TEST(ModelFit, SeparateStyleFitsEachInputOnItsOwn)
{
    const AcquisitionInfo info  = synthetic_acquisition(kPoints);
    const auto            basis = std::make_shared<const BasisSet>(synthetic_basis(info, kPoints, kNames));

    ProcessedSpectrum second = mixture(info, *basis, 2.0);
    second.kind = ConditionKind::SUM;

    ModelFit::Config cfg = exact_config();
    cfg.style = FitStyle::Separate;
    ModelFit fit({{mixture(info, *basis, 1.0), basis}, {second, basis}}, cfg);
    fit.run();

    ASSERT_EQ(fit.stage(), FitStage::Complete);
    ASSERT_EQ(fit.results().size(), 2u);
    EXPECT_EQ(fit.results()[0].condition, ConditionKind::OFF);
    EXPECT_EQ(fit.results()[1].condition, ConditionKind::SUM);

    const double r = fit.results()[1].amplitude("NAA") / fit.results()[0].amplitude("NAA");
    EXPECT_NEAR(r, 2.0, 0.02);
    EXPECT_EQ(fit.model(1).size(), fit.data(1).size());
}

TEST(ModelFit, ConcatenatedStyleSharesTheLineshape)
{
    const AcquisitionInfo info  = synthetic_acquisition(kPoints);
    const auto            basis = std::make_shared<const BasisSet>(synthetic_basis(info, kPoints, kNames));

    ModelFit::Config cfg = exact_config();
    cfg.style = FitStyle::Concatenated;
    ModelFit fit({{mixture(info, *basis, 1.0), basis}, {mixture(info, *basis, 0.5), basis}}, cfg);
    fit.run();

    ASSERT_EQ(fit.stage(), FitStage::Complete);
    const FitParameters& a = fit.results()[0];
    const FitParameters& b = fit.results()[1];
    EXPECT_DOUBLE_EQ(a.gauss, b.gauss);
    EXPECT_DOUBLE_EQ(a.ph0_deg, b.ph0_deg);
    EXPECT_LT((a.lorentz_hz - b.lorentz_hz).cwiseAbs().maxCoeff(), 1e-12);
    EXPECT_NEAR(b.amplitude("NAA") / a.amplitude("NAA"), 0.5, 0.01);
}

TEST(ModelFit, UsesTheSharedCacheForResampling)
{
    const AcquisitionInfo info  = synthetic_acquisition(kPoints);
    const auto            basis = std::make_shared<const BasisSet>(synthetic_basis(info, kPoints, kNames));

    BasisCache& cache = BasisCache::instance();
    cache.clear();
    ModelFit fit({{mixture(info, *basis, 1.0), basis}}, exact_config(), &cache);
    fit.run();

    EXPECT_EQ(fit.stage(), FitStage::Complete);
    EXPECT_TRUE(cache.try_get(BasisCache::key(*basis, info, kPoints)));
    cache.clear();
}
