#include "mrsfit/Overview.hpp"
#include "mrsfit/ResultsExport.hpp"
#include "mrsfit/Synthetic.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace mrsfit;
namespace fs = std::filesystem;

namespace {

constexpr int kPoints = 4096;

DatasetResult result_with_naa_at(const std::string& label, double ppm)
{
    ProcessedSpectrum s;
    s.kind = ConditionKind::OFF;
    s.info = synthetic_acquisition(kPoints);
    s.fid  = synthetic_fid(s.info, kPoints, {{ppm, 1.0, 5.0, 0.0}, {3.027, 0.6, 5.0, 0.0}});

    DatasetResult r;
    r.label = label;
    r.spectra[ConditionKind::OFF] = s;
    return r;
}

std::string slurp(const fs::path& p)
{
    std::ifstream in(p);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

// ============================================================================
//  group overview
// ============================================================================
TEST(Overview, IdenticalDatasetsHaveZeroSpread)
{
    const std::vector<DatasetResult> results{result_with_naa_at("a", 2.008),
                                             result_with_naa_at("b", 2.008)};
    const auto g = group_overview(results);
    ASSERT_EQ(g.size(), 1u);

    const GroupSpectrum& off = g.at(ConditionKind::OFF);
    EXPECT_EQ(off.n_datasets, 2);
    EXPECT_EQ(off.ppm.size(), off.mean.size());
    EXPECT_GT(off.ppm[0], off.ppm[off.ppm.size() - 1]);
    EXPECT_NEAR(off.ppm[0], 4.5, 1e-12);
    EXPECT_LT(off.sd.maxCoeff(), 1e-9 * off.mean.maxCoeff());
}

TEST(Overview, SpectraAreAlignedOnNAA)
{
    const std::vector<DatasetResult> results{result_with_naa_at("a", 2.008),
                                             result_with_naa_at("b", 2.040)};
    OverviewOptions opt;
    opt.n_points = 2000;
    const GroupSpectrum off = group_overview(results, opt).at(ConditionKind::OFF);

    const PeakLocation p = find_peak(off.mean, off.ppm, 1.9, 2.1);
    EXPECT_NEAR(p.ppm, 2.008, 0.01);
    EXPECT_EQ(off.ppm.size(), 2000);
}

TEST(Overview, FailedDatasetsWithoutSpectraAreSkipped)
{
    DatasetResult failed;
    failed.label  = "broken";
    failed.failed = true;

    const std::vector<DatasetResult> results{result_with_naa_at("a", 2.008), failed};
    const auto g = group_overview(results);
    EXPECT_EQ(g.at(ConditionKind::OFF).n_datasets, 1);
    EXPECT_DOUBLE_EQ(g.at(ConditionKind::OFF).sd.maxCoeff(), 0.0);

    OverviewOptions bad;
    bad.lo_ppm = 3.0;
    bad.hi_ppm = 1.0;
    EXPECT_THROW(group_overview(results, bad), PreconditionError);
}

// ============================================================================
//  records and files
// ============================================================================
TEST(ResultsExport, NaNBecomesNull)
{
    const FitParameters failed = FitParameters::failed_result(ConditionKind::DIFF1, "boom");
    const nlohmann::json j = to_json(failed);

    EXPECT_EQ(j["condition"], "DIFF1");
    EXPECT_EQ(j["stage"], "Failed");
    EXPECT_EQ(j["message"], "boom");
    EXPECT_TRUE(j["chi2"].is_null());
    EXPECT_TRUE(j["ref_fwhm_hz"].is_null());
    EXPECT_TRUE(j["functions"].empty());
}

TEST(ResultsExport, DatasetRecord)
{
    DatasetResult r = result_with_naa_at("s01", 2.008);
    FitParameters p;
    p.condition  = ConditionKind::OFF;
    p.stage      = FitStage::Complete;
    p.names      = {"NAA", "Cr"};
    p.amplitudes = Vector::Constant(2, 1.5);
    r.fits[ConditionKind::OFF] = p;

    const nlohmann::json j = to_json(r);
    EXPECT_EQ(j["label"], "s01");
    EXPECT_EQ(j["spectra"]["OFF"]["n_samples"], kPoints);
    EXPECT_DOUBLE_EQ(j["fits"]["OFF"]["functions"]["Cr"]["amplitude"].get<double>(), 1.5);
    EXPECT_TRUE(j["fits"]["OFF"]["functions"]["Cr"]["sd"].is_null());
}

TEST(ResultsExport, WritesEveryTable)
{
    const fs::path dir = fs::temp_directory_path() / "mrsfit_export_test";
    fs::remove_all(dir);

    std::vector<DatasetResult> results{result_with_naa_at("s01", 2.008),
                                       result_with_naa_at("s02", 2.010)};
    for (auto& r : results) {
        QualityMetrics q;
        q.condition = ConditionKind::OFF;
        q.snr       = 42.0;
        q.ref_shift_hz       = -3.5;
        q.mean_freq_shift_hz = 0.25;
        r.quality[ConditionKind::OFF] = q;

        FitParameters p;
        p.condition  = ConditionKind::OFF;
        p.stage      = FitStage::Complete;
        p.names      = {"NAA"};
        p.amplitudes = Vector::Ones(1);
        r.fits[ConditionKind::OFF] = p;
    }

    write_results(dir.string(), results, group_overview(results));

    ASSERT_TRUE(fs::exists(dir / "results.json"));
    ASSERT_TRUE(fs::exists(dir / "quality.tsv"));
    ASSERT_TRUE(fs::exists(dir / "amplitudes_OFF.tsv"));
    ASSERT_TRUE(fs::exists(dir / "overview_OFF.tsv"));

    const nlohmann::json all = nlohmann::json::parse(slurp(dir / "results.json"));
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1]["label"], "s02");
    EXPECT_DOUBLE_EQ(all[1]["quality"]["OFF"]["ref_shift_hz"].get<double>(), -3.5);

    const std::string quality = slurp(dir / "quality.tsv");
    EXPECT_EQ(quality.rfind("dataset\tcondition\tSNR", 0), 0u);
    EXPECT_NE(quality.find("s02\tOFF\t42\tNaN"), std::string::npos);
    EXPECT_NE(quality.find("\tfreqShift_Hz\talignShift_Hz\t"), std::string::npos);
    EXPECT_NE(quality.find("s02\tOFF\t42\tNaN\tNaN\tNaN\t-3.5\t0.25\tNaN\n"), std::string::npos);

    const std::string amps = slurp(dir / "amplitudes_OFF.tsv");
    EXPECT_EQ(amps, "dataset\tNAA\ns01\t1\ns02\t1\n");

    std::error_code ec;
    fs::remove_all(dir, ec);
}
