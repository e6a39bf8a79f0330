#include "mrsfit/BatchRunner.hpp"
#include "mrsfit/Synthetic.hpp"
#include "mrsfit/Errors.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace mrsfit;

namespace {

constexpr int kPoints = 1024;

DatasetInput dataset(const std::string& label, unsigned seed)
{
    const AcquisitionInfo info = synthetic_acquisition(kPoints);
    const CVector fid = synthetic_fid(info, kPoints, {{2.02, 1.0, 4.0, 0.0},
                                                      {3.03, 0.8, 4.0, 0.0},
                                                      {3.21, 0.6, 4.0, 0.0}});
    TransientOptions t;
    t.n_averages = 4;
    t.freq_sd_hz = 1.0;
    t.noise_sd   = 1e-3;
    t.seed       = seed;

    DatasetInput in;
    in.label      = label;
    in.metabolite = synthetic_signal(info, {fid}, t);
    return in;
}

/*  pre-averaged data with two columns cannot be averaged again              */
DatasetInput broken(const std::string& label)
{
    DatasetInput in = dataset(label, 99);
    in.metabolite = TimeDomainSignal(in.metabolite.info(), in.metabolite.fids().leftCols(2), 2, 1, 1, true);
    return in;
}

ProcessingConfig batch_config()
{
    ProcessingConfig c = processing_config_from_json(nlohmann::json{{"reference", "NAA"}});
    c.eddy_current_correction = false;
    c.remove_water            = false;
    c.fit_metabolites         = false;
    c.fit_water               = false;
    c.alignment.parallel      = false;
    return c;
}

class Collect : public ProgressObserver {
public:
    void on_progress(const std::string& stage, const std::string& message) override
    {
        std::lock_guard lk(mtx);
        lines.push_back(stage + ": " + message);
    }
    std::mutex               mtx;
    std::vector<std::string> lines;
};

} // namespace

// ============================================================================
//  validation
// ============================================================================
TEST(Batch, ValidateRejectsPartialPairs)
{
    const UneditedProtocol protocol;
    const BasisLibrary     bases;
    const ProcessingConfig config = batch_config();

    std::vector<DatasetInput> inputs{dataset("a", 1), dataset("b", 2)};
    EXPECT_NO_THROW(validate_batch(inputs, protocol, bases, config));

    inputs[0].reference = inputs[0].metabolite;
    EXPECT_THROW(validate_batch(inputs, protocol, bases, config), DataInconsistencyError);

    inputs[1].reference = TimeDomainSignal::from_fid(synthetic_acquisition(512), CVector::Ones(512));
    EXPECT_THROW(validate_batch(inputs, protocol, bases, config), DataInconsistencyError);

    inputs[1].reference = inputs[1].metabolite;
    EXPECT_NO_THROW(validate_batch(inputs, protocol, bases, config));

    inputs[1].water = inputs[1].metabolite;
    EXPECT_THROW(validate_batch(inputs, protocol, bases, config), DataInconsistencyError);
}

TEST(Batch, ValidateComparesRawAverageCounts)
{
    const UneditedProtocol protocol;
    const BasisLibrary     bases;
    const ProcessingConfig config = batch_config();
    const AcquisitionInfo  info   = synthetic_acquisition(kPoints);
    const CVector          water  = synthetic_fid(info, kPoints, {{info.center_ppm, 50.0, 6.0, 0.0}});

    auto raw = [&](int n) {
        TransientOptions t;
        t.n_averages = n;
        return synthetic_signal(info, {water}, t);
    };

    std::vector<DatasetInput> inputs{dataset("a", 1), dataset("b", 2), dataset("c", 3)};
    inputs[0].reference = raw(4);
    inputs[1].reference = raw(4);
    inputs[2].reference = raw(4);
    EXPECT_NO_THROW(validate_batch(inputs, protocol, bases, config));

    inputs[2].reference = raw(2);
    try {
        validate_batch(inputs, protocol, bases, config);
        FAIL() << "expected DataInconsistencyError";
    } catch (const DataInconsistencyError& e) {
        EXPECT_NE(std::string(e.what()).find("c: reference has 2 averages, a has 4"), std::string::npos)
            << e.what();
    }

    /* an already averaged reference has no count to compare */
    inputs[2].reference = TimeDomainSignal::from_fid(info, water);
    EXPECT_NO_THROW(validate_batch(inputs, protocol, bases, config));

    inputs[0].water = raw(2);
    inputs[1].water = raw(2);
    inputs[2].water = raw(3);
    EXPECT_THROW(validate_batch(inputs, protocol, bases, config), DataInconsistencyError);
}

TEST(Batch, ValidatePairsTheMacromoleculeList)
{
    const UneditedProtocol protocol;
    const BasisLibrary     bases;
    const ProcessingConfig config = batch_config();

    std::vector<DatasetInput> inputs{dataset("a", 1), dataset("b", 2)};
    inputs[0].mm = inputs[0].metabolite;
    EXPECT_THROW(validate_batch(inputs, protocol, bases, config), DataInconsistencyError);

    inputs[1].mm = TimeDomainSignal::from_fid(synthetic_acquisition(512), CVector::Ones(512));
    EXPECT_THROW(validate_batch(inputs, protocol, bases, config), DataInconsistencyError);

    inputs[1].mm = inputs[1].metabolite;
    EXPECT_NO_THROW(validate_batch(inputs, protocol, bases, config));

    inputs[1].mm = TimeDomainSignal(inputs[1].metabolite.info(),
                                    inputs[1].metabolite.fids().leftCols(2), 2, 1, 1);
    EXPECT_THROW(validate_batch(inputs, protocol, bases, config), DataInconsistencyError);
}

TEST(Batch, ValidateChecksProtocolAndBasis)
{
    const ProcessingConfig    config = batch_config();
    std::vector<DatasetInput> inputs{dataset("a", 1)};

    const MegaProtocol mega(EditTarget::GABA);
    EXPECT_THROW(validate_batch(inputs, mega, BasisLibrary{}, config), DataInconsistencyError);

    /* a basis shorter than the data cannot resolve it */
    ProcessingConfig fitting = config;
    fitting.fit_metabolites = true;
    const AcquisitionInfo info = synthetic_acquisition(256);
    BasisLibrary coarse;
    coarse.fallback = std::make_shared<const BasisSet>(synthetic_basis(info, 256, {"NAA", "Cr"}));
    EXPECT_THROW(validate_batch(inputs, UneditedProtocol{}, coarse, fitting), DataInconsistencyError);
}

// ============================================================================
//  running
// ============================================================================
TEST(Batch, FailuresAreIsolatedAndOrderIsKept)
{
    const UneditedProtocol protocol;
    const BasisLibrary     bases;
    const ProcessingConfig config = batch_config();
    Collect progress;

    const std::vector<DatasetInput> inputs{dataset("first", 1), broken("second"),
                                           dataset("third", 3), dataset("fourth", 4)};
    const BatchRunner runner(protocol, bases, config, nullptr, &progress);
    const std::vector<DatasetResult> out = runner.run(inputs, 3);

    ASSERT_EQ(out.size(), inputs.size());
    for (std::size_t i = 0; i < out.size(); ++i)
        EXPECT_EQ(out[i].label, inputs[i].label);

    EXPECT_TRUE(out[1].failed);
    EXPECT_NE(out[1].message.find("averaged"), std::string::npos) << out[1].message;
    EXPECT_TRUE(out[1].spectra.empty());

    for (std::size_t i : {0u, 2u, 3u}) {
        EXPECT_FALSE(out[i].failed) << out[i].label << ": " << out[i].message;
        EXPECT_EQ(out[i].spectra.count(ConditionKind::OFF), 1u);
        EXPECT_EQ(out[i].quality.count(ConditionKind::OFF), 1u);
    }

    ASSERT_FALSE(progress.lines.empty());
    EXPECT_EQ(progress.lines.back(), "Batch: 4 datasets, 1 failed");
}

TEST(Batch, SingleThreadGivesTheSameSpectra)
{
    const UneditedProtocol protocol;
    const BasisLibrary     bases;
    const ProcessingConfig config = batch_config();

    const std::vector<DatasetInput> inputs{dataset("a", 1), dataset("b", 2)};
    const BatchRunner runner(protocol, bases, config);
    const auto serial   = runner.run(inputs, 1);
    const auto parallel = runner.run(inputs, 2);

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        const CVector& x = serial[i].spectra.at(ConditionKind::OFF).fid;
        const CVector& y = parallel[i].spectra.at(ConditionKind::OFF).fid;
        EXPECT_LT((x - y).norm(), 1e-12 * x.norm());
    }
}

TEST(Batch, CancelledTokenSkipsEveryDataset)
{
    const UneditedProtocol protocol;
    const BasisLibrary     bases;
    const ProcessingConfig config = batch_config();

    CancellationToken token;
    token.cancel();
    EXPECT_TRUE(token.cancelled());

    const std::vector<DatasetInput> inputs{dataset("a", 1), dataset("b", 2)};
    const auto out = BatchRunner(protocol, bases, config).run(inputs, 2, &token);
    ASSERT_EQ(out.size(), 2u);
    for (const auto& r : out) {
        EXPECT_TRUE(r.failed);
        EXPECT_EQ(r.message, "cancelled");
    }
}

TEST(Batch, EmptyBatch)
{
    const UneditedProtocol protocol;
    const BasisLibrary     bases;
    const ProcessingConfig config = batch_config();
    EXPECT_TRUE(BatchRunner(protocol, bases, config).run({}).empty());
}
