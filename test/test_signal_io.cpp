#include "mrsfit/Signal.hpp"
#include "mrsfit/SignalLoaders.hpp"
#include "mrsfit/Synthetic.hpp"
#include "mrsfit/Errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

using namespace mrsfit;
namespace fs = std::filesystem;

namespace {

/*  scratch directory removed with the fixture                               */
class SignalIO : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("mrsfit_io_") + info->name());
        fs::create_directories(dir_);
    }
    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    fs::path dir_;
};

CMatrix ramp(int n, int cols)
{
    CMatrix m(n, cols);
    for (int k = 0; k < cols; ++k)
        for (int i = 0; i < n; ++i)
            m(i, k) = Complex(i + 0.25 * k, -0.5 * i + k);
    return m;
}

} // namespace

// ============================================================================
//  TimeDomainSignal
// ============================================================================
TEST(TimeDomainSignal, ColumnIndexOrder)
{
    const AcquisitionInfo info = synthetic_acquisition(16);
    const TimeDomainSignal s(info, ramp(16, 3 * 2 * 2), 3, 2, 2);

    EXPECT_EQ(s.column_index(0, 0, 0), 0);
    EXPECT_EQ(s.column_index(2, 0, 0), 2);
    EXPECT_EQ(s.column_index(1, 1, 0), 4);
    EXPECT_EQ(s.column_index(1, 1, 1), 10);
    EXPECT_THROW(s.column_index(3, 0, 0), std::out_of_range);
    EXPECT_EQ(s.n_samples(), 16);
    EXPECT_EQ(s.info().n_samples, 16);
    EXPECT_FALSE(s.is_combined());
}

TEST(TimeDomainSignal, InvalidShapesThrow)
{
    const AcquisitionInfo info = synthetic_acquisition(16);
    EXPECT_THROW(TimeDomainSignal(info, ramp(16, 5), 2, 1, 2), PreconditionError);
    EXPECT_THROW(TimeDomainSignal(info, ramp(16, 2), -1), PreconditionError);

    AcquisitionInfo bad = info;
    bad.dwell_time = 0.0;
    EXPECT_THROW(TimeDomainSignal(bad, ramp(16, 1), 1), PreconditionError);

    /* zero averages is a valid, empty signal */
    const TimeDomainSignal empty(info, CMatrix(16, 0), 0);
    EXPECT_TRUE(empty.empty());
}

TEST(TimeDomainSignal, SelectSubspecKeepsAverages)
{
    const AcquisitionInfo info = synthetic_acquisition(8);
    const CMatrix m = ramp(8, 4 * 2);
    const TimeDomainSignal s(info, m, 4, 1, 2);

    const TimeDomainSignal second = s.select_subspec(1);
    EXPECT_EQ(second.n_averages(), 4);
    EXPECT_EQ(second.n_subspecs(), 1);
    EXPECT_LT((second.column(2) - m.col(6)).norm(), 1e-15);
    EXPECT_THROW(s.select_subspec(2), std::out_of_range);
}

TEST(TimeDomainSignal, CoilCombinationIsCoherent)
{
    const AcquisitionInfo info = synthetic_acquisition(256);
    const CVector f = synthetic_fid(info, 256, {{3.0, 1.0, 5.0, 0.0}});

    CMatrix m(256, 2);
    m.col(0) = f;
    m.col(1) = Complex(0.0, 2.0) * f;
    const TimeDomainSignal s(info, m, 1, 2, 1);

    const TimeDomainSignal c = s.combine_coils();
    ASSERT_EQ(c.n_coils(), 1);
    ASSERT_TRUE(c.is_combined());

    /* first point of f is real and 1, so the coils add up to √5·f */
    EXPECT_LT((c.column(0) - std::sqrt(5.0) * f).norm(), 1e-9 * f.norm());
}

TEST(TimeDomainSignal, ConditionNames)
{
    EXPECT_STREQ(to_string(ConditionKind::DIFF1), "DIFF1");
    EXPECT_EQ(condition_from_string("SUM"), ConditionKind::SUM);
    EXPECT_THROW(condition_from_string("DIFF3"), std::invalid_argument);
}

// ============================================================================
//  ASCII tables
// ============================================================================
TEST_F(SignalIO, ComplexColumnsRoundTrip)
{
    const CMatrix m = ramp(32, 3);
    write_complex_columns(path("fids.txt"), m, "three transients");

    const CMatrix back = read_complex_columns(path("fids.txt"));
    ASSERT_EQ(back.rows(), 32);
    ASSERT_EQ(back.cols(), 3);
    EXPECT_LT((back - m).norm(), 1e-12);
}

TEST_F(SignalIO, CommentsAndBlankLinesAreSkipped)
{
    {
        std::ofstream out(path("table.txt"));
        out << "# header\n\n  1 2\n# more\n3 4\n";
    }
    const CMatrix m = read_complex_columns(path("table.txt"));
    ASSERT_EQ(m.rows(), 2);
    EXPECT_EQ(m(1, 0), Complex(3.0, 4.0));
}

TEST_F(SignalIO, MalformedTablesThrow)
{
    {
        std::ofstream out(path("odd.txt"));
        out << "1 2 3\n";
    }
    {
        std::ofstream out(path("ragged.txt"));
        out << "1 2\n3 4 5 6\n";
    }
    {
        std::ofstream out(path("empty.txt"));
        out << "# nothing\n";
    }
    EXPECT_THROW(read_complex_columns(path("odd.txt")), PreconditionError);
    EXPECT_THROW(read_complex_columns(path("ragged.txt")), PreconditionError);
    EXPECT_THROW(read_complex_columns(path("empty.txt")), PreconditionError);
    EXPECT_THROW(read_complex_columns(path("missing.txt")), PreconditionError);
}

TEST_F(SignalIO, LoadSignalChecksTransientCount)
{
    const AcquisitionInfo info = synthetic_acquisition(32);
    write_complex_columns(path("met.txt"), ramp(32, 4));

    SignalSource src;
    src.path     = path("met.txt");
    src.averages = 2;
    src.subspecs = 2;
    const TimeDomainSignal s = load_signal(src, info);
    EXPECT_EQ(s.n_averages(), 2);
    EXPECT_EQ(s.n_subspecs(), 2);

    src.averages = 3;
    EXPECT_THROW(load_signal(src, info), PreconditionError);
}

TEST_F(SignalIO, LoadBasisTakesLengthFromTheFiles)
{
    AcquisitionInfo info = synthetic_acquisition(64);
    const BasisSet lib = synthetic_basis(info, 64, {"NAA", "Cr"});
    for (const BasisFunction& f : lib.functions())
        write_complex_columns(path(f.name + ".txt"), f.fid);

    BasisSource src;
    info.n_samples = 0;
    src.info  = info;
    src.files = {{"NAA", path("NAA.txt")}, {"Cr", path("Cr.txt")}};
    src.normalize = false;

    const BasisSet b = load_basis(src);
    EXPECT_EQ(b.size(), 2);
    EXPECT_EQ(b.info().n_samples, 64);
    EXPECT_LT((b[1].fid - lib[1].fid).norm(), 1e-12 * lib[1].fid.norm());

    src.files.clear();
    EXPECT_THROW(load_basis(src), PreconditionError);
}
