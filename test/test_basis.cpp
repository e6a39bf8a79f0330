#include "mrsfit/BasisSet.hpp"
#include "mrsfit/BasisCache.hpp"
#include "mrsfit/Synthetic.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"

#include <gtest/gtest.h>
#include <atomic>

using namespace mrsfit;

// ============================================================================
//  BasisSet
// ============================================================================
TEST(BasisSet, RejectsDuplicateAndUnnamedFunctions)
{
    const AcquisitionInfo info = synthetic_acquisition(64);
    const CVector f = CVector::Ones(64);

    EXPECT_THROW(BasisSet(info, {{"NAA", f}, {"NAA", f}}), PreconditionError);
    EXPECT_THROW(BasisSet(info, {{"", f}}), PreconditionError);
    EXPECT_THROW(BasisSet(info, {{"NAA", f}, {"Cr", CVector::Ones(32)}}), PreconditionError);

    AcquisitionInfo bad = info;
    bad.txfrq_mhz = 0.0;
    EXPECT_THROW(BasisSet(bad, {{"NAA", f}}), PreconditionError);
}

TEST(BasisSet, SubsetKeepsTheSetOrder)
{
    const AcquisitionInfo info = synthetic_acquisition(256);
    const BasisSet b = synthetic_basis(info, 256, {"NAA", "Cr", "GPC", "Ins"});

    const BasisSet s = b.subset({"Ins", "NAA", "Missing"});
    EXPECT_EQ(s.names(), (std::vector<std::string>{"NAA", "Ins"}));
    EXPECT_EQ(b.index_of("GPC"), 2);
    EXPECT_EQ(b.index_of("GABA"), -1);
    EXPECT_TRUE(s.contains("Ins"));
    EXPECT_FALSE(s.contains("Cr"));
}

TEST(BasisSet, WithAppendsAndStillChecksNames)
{
    const AcquisitionInfo info = synthetic_acquisition(256);
    const BasisSet b = synthetic_basis(info, 256, {"NAA", "Cr"});

    const BasisSet w = b.with({{"Extra", CVector::Ones(256)}});
    EXPECT_EQ(w.size(), 3);
    EXPECT_EQ(w[2].name, "Extra");
    EXPECT_THROW(b.with({{"Cr", CVector::Ones(256)}}), PreconditionError);
}

TEST(BasisSet, NormalizedPeakIsOne)
{
    const AcquisitionInfo info = synthetic_acquisition(512);
    const BasisSet b = synthetic_basis(info, 512, {"NAA", "Cr"}).normalized();

    double peak = 0.0;
    for (const BasisFunction& f : b.functions())
        peak = std::max(peak, to_frequency_domain(f.fid).real().maxCoeff());
    EXPECT_NEAR(peak, 1.0, 1e-12);
}

TEST(BasisSet, FingerprintFollowsContent)
{
    const AcquisitionInfo info = synthetic_acquisition(256);
    const BasisSet a = synthetic_basis(info, 256, {"NAA", "Cr"});
    const BasisSet b = synthetic_basis(info, 256, {"NAA", "Cr"});
    const BasisSet c = synthetic_basis(info, 256, {"NAA", "Cr"}, 3.0);

    EXPECT_EQ(a.fingerprint(), b.fingerprint());
    EXPECT_NE(a.fingerprint(), c.fingerprint());
}

TEST(BasisSet, WaterBasisIsASingleSinglet)
{
    const AcquisitionInfo info = synthetic_acquisition(1024);
    const BasisSet w = water_basis(info, 1024);
    ASSERT_EQ(w.size(), 1);
    EXPECT_EQ(w[0].name, "H2O");

    const PeakLocation p = find_peak(to_frequency_domain(w[0].fid).cwiseAbs(), w.ppm(), 4.0, 5.4);
    EXPECT_NEAR(p.ppm, info.center_ppm, 0.01);
}

TEST(BasisSet, MacromoleculesNeedCreatine)
{
    const AcquisitionInfo info = synthetic_acquisition(2048);
    const BasisSet with_cr = synthetic_basis(info, 2048, {"NAA", "Cr"});

    const std::vector<BasisFunction> mm = macromolecule_basis(with_cr);
    ASSERT_EQ(mm.size(), 8u);
    EXPECT_EQ(mm.front().name, "MM09");
    EXPECT_EQ(mm.back().name, "Lip20");
    for (const BasisFunction& f : mm) {
        EXPECT_TRUE(f.fid.allFinite()) << f.name;
        EXPECT_GT(f.fid.norm(), 0.0) << f.name;
    }

    const BasisSet extended = with_cr.with(mm);
    const Vector spec = to_frequency_domain(extended[extended.index_of("MM09")].fid).real();
    EXPECT_NEAR(find_peak(spec, extended.ppm(), 0.5, 1.3).ppm, 0.91, 0.02);

    const BasisSet no_cr = synthetic_basis(info, 2048, {"NAA"});
    EXPECT_THROW(macromolecule_basis(no_cr), PreconditionError);
}

// ============================================================================
//  resampling
// ============================================================================
TEST(Resample, SameGridIsTheIdentity)
{
    const AcquisitionInfo info = synthetic_acquisition(512);
    const BasisSet b = synthetic_basis(info, 512, {"NAA", "Cr"});

    const ResampledBasis r = resample_basis(b, info, 512);
    ASSERT_EQ(r.fids.size(), 2u);
    EXPECT_EQ(r.names, b.names());
    EXPECT_EQ(r.n_points, 512);
    for (int i = 0; i < 2; ++i)
        EXPECT_LT((r.fids[i] - b[i].fid).norm(), 1e-9 * b[i].fid.norm());
}

TEST(Resample, ZeroFilledGridIsCovered)
{
    const AcquisitionInfo info = synthetic_acquisition(512);
    const BasisSet b = synthetic_basis(info, 512, {"NAA"});

    EXPECT_NO_THROW(check_basis_compatible(b, info, 1024));
    const ResampledBasis r = resample_basis(b, info, 1024);
    ASSERT_EQ(r.fids.front().size(), 1024);

    /* same spectrum, sampled twice as densely */
    const Vector ppm = ppm_axis(info, 1024);
    const PeakLocation p = find_peak(to_frequency_domain(r.fids.front()).real(), ppm, 1.8, 2.2);
    EXPECT_NEAR(p.ppm, 2.008, 0.01);
}

TEST(Resample, IncompatibleGeometriesAreRejected)
{
    const AcquisitionInfo info = synthetic_acquisition(512);
    const BasisSet b = synthetic_basis(info, 512, {"NAA"});

    /* wider spectral width than the basis covers */
    const AcquisitionInfo wide = synthetic_acquisition(512, 2.89, 4000.0);
    EXPECT_THROW(check_basis_compatible(b, wide, 512), PreconditionError);

    /* finer data than the basis resolves */
    const AcquisitionInfo fine = synthetic_acquisition(2048);
    EXPECT_THROW(check_basis_compatible(b, fine, 2048), PreconditionError);

    EXPECT_THROW(check_basis_compatible(BasisSet(), info, 512), PreconditionError);
}

// ============================================================================
//  BasisCache
// ============================================================================
namespace {

class BasisCacheTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        BasisCache::instance().clear();
        BasisCache::instance().set_capacity(2);
    }
    void TearDown() override
    {
        BasisCache::instance().clear();
        BasisCache::instance().set_capacity(64);
    }

    static ResampledBasis dummy(int n)
    {
        ResampledBasis r;
        r.n_points = n;
        return r;
    }
};

} // namespace

TEST_F(BasisCacheTest, ProducerRunsOncePerKey)
{
    BasisCache& cache = BasisCache::instance();
    std::atomic<int> calls{0};
    auto make = [&] { ++calls; return dummy(7); };

    const ResampledBasisPtr a = cache.insert_if_absent(11, make);
    const ResampledBasisPtr b = cache.insert_if_absent(11, make);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(cache.try_get(11)->n_points, 7);
    EXPECT_FALSE(cache.try_get(12));
}

TEST_F(BasisCacheTest, LeastRecentlyUsedIsEvicted)
{
    BasisCache& cache = BasisCache::instance();
    cache.insert_if_absent(1, [] { return dummy(1); });
    cache.insert_if_absent(2, [] { return dummy(2); });
    const ResampledBasisPtr held = cache.try_get(2);
    ASSERT_TRUE(cache.try_get(1));              // 2 is now the oldest

    cache.insert_if_absent(3, [] { return dummy(3); });

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.try_get(2));
    EXPECT_TRUE(cache.try_get(1));
    EXPECT_TRUE(cache.try_get(3));

    /* an evicted entry stays alive for its holder */
    ASSERT_TRUE(held);
    EXPECT_EQ(held->n_points, 2);
}

TEST_F(BasisCacheTest, CapacityZeroMeansOne)
{
    BasisCache& cache = BasisCache::instance();
    cache.insert_if_absent(1, [] { return dummy(1); });
    cache.insert_if_absent(2, [] { return dummy(2); });
    cache.set_capacity(0);
    EXPECT_EQ(cache.capacity(), 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(BasisCacheTest, ResampledUsesGeometryInTheKey)
{
    BasisCache& cache = BasisCache::instance();
    const AcquisitionInfo info = synthetic_acquisition(256);
    const BasisSet b = synthetic_basis(info, 256, {"NAA"});

    EXPECT_NE(BasisCache::key(b, info, 256), BasisCache::key(b, info, 512));

    const ResampledBasisPtr r1 = cache.resampled(b, info, 256);
    const ResampledBasisPtr r2 = cache.resampled(b, info, 256);
    EXPECT_EQ(r1.get(), r2.get());
    EXPECT_EQ(cache.size(), 1u);
}
