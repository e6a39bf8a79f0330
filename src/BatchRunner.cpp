#include "mrsfit/BatchRunner.hpp"
#include "mrsfit/ThreadPool.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>
#include <future>
#include <optional>
#include <sstream>
#include <thread>

namespace mrsfit {

namespace {

void check_pair(const DatasetInput& in, const TimeDomainSignal& other, const char* what)
{
    const TimeDomainSignal& met = in.metabolite;
    if (other.n_samples() != met.n_samples()) {
        std::ostringstream msg;
        msg << in.label << ": " << what << " has " << other.n_samples()
            << " samples, metabolite " << met.n_samples();
        throw DataInconsistencyError(msg.str());
    }
    if (other.info().dwell_time != met.info().dwell_time)
        throw DataInconsistencyError(in.label + ": " + what + " dwell time differs from the metabolite");
}

/*  raw members of one paired list share their average count                 */
void check_average_counts(const std::vector<DatasetInput>&                  inputs,
                          std::optional<TimeDomainSignal> DatasetInput::*   list,
                          const char*                                       what)
{
    const DatasetInput* first = nullptr;
    for (const DatasetInput& in : inputs) {
        const auto& s = in.*list;
        if (!s || s->averaged()) continue;
        if (!first) {
            first = &in;
            continue;
        }
        const int expected = (first->*list)->n_averages();
        if (s->n_averages() != expected) {
            std::ostringstream msg;
            msg << in.label << ": " << what << " has " << s->n_averages()
                << " averages, " << first->label << " has " << expected;
            throw DataInconsistencyError(msg.str());
        }
    }
}

} // namespace

/* ------------------------------------------------------------------------- */
void validate_batch(const std::vector<DatasetInput>& inputs,
                    const AcquisitionProtocol&       protocol,
                    const BasisLibrary&              bases,
                    const ProcessingConfig&          config)
{
    if (inputs.empty()) return;

    const bool with_ref   = inputs.front().reference.has_value();
    const bool with_water = inputs.front().water.has_value();
    const bool with_mm    = inputs.front().mm.has_value();

    for (const DatasetInput& in : inputs) {
        if (in.reference.has_value() != with_ref)
            throw DataInconsistencyError("reference list does not match the metabolite list");
        if (in.water.has_value() != with_water)
            throw DataInconsistencyError("water list does not match the metabolite list");
        if (in.mm.has_value() != with_mm)
            throw DataInconsistencyError("MM list does not match the metabolite list");

        if (in.reference) {
            check_pair(in, *in.reference, "reference");
            if (in.reference->n_subspecs() != 1)
                throw DataInconsistencyError(in.label + ": reference must have one sub-spectrum");
        }
        if (in.water) check_pair(in, *in.water, "water");
        if (in.mm)    check_pair(in, *in.mm, "MM");

        if (in.metabolite.n_subspecs() != protocol.n_subspectra()) {
            std::ostringstream msg;
            msg << in.label << ": " << in.metabolite.n_subspecs() << " sub-spectra, "
                << protocol.name() << " needs " << protocol.n_subspectra();
            throw DataInconsistencyError(msg.str());
        }

        if (!config.fit_metabolites) continue;
        AcquisitionInfo info = in.metabolite.info();
        info.n_samples = in.metabolite.n_samples();
        for (ConditionKind kind : protocol.fit_conditions()) {
            try {
                check_basis_compatible(*bases.for_condition(kind), info,
                                       info.n_samples * config.fit.zero_fill);
            } catch (const PreconditionError& e) {
                throw DataInconsistencyError(in.label + " (" + to_string(kind) + "): " + e.what());
            }
        }
    }

    check_average_counts(inputs, &DatasetInput::reference, "reference");
    check_average_counts(inputs, &DatasetInput::water,     "water");
    check_average_counts(inputs, &DatasetInput::mm,        "MM");
}

/* ------------------------------------------------------------------------- */
BatchRunner::BatchRunner(const AcquisitionProtocol& protocol,
                         const BasisLibrary&        bases,
                         const ProcessingConfig&    config,
                         BasisCache*                cache,
                         ProgressObserver*          progress)
    : protocol_(protocol)
    , bases_(bases)
    , config_(config)
    , cache_(cache)
    , progress_(progress)
{}

DatasetResult BatchRunner::run_one(const DatasetInput& input,
                                   const CancellationToken* cancel) const
{
    DatasetResult r;
    r.label = input.label;
    if (cancel && cancel->cancelled()) {
        r.failed  = true;
        r.message = "cancelled";
        return r;
    }

    LabelledProgress labelled(progress_, input.label);
    ProgressObserver* obs = progress_ ? &labelled : nullptr;
    try {
        r = process_dataset(input, protocol_, bases_, config_, cache_, obs);
    } catch (const std::exception& e) {
        r.failed  = true;
        r.message = e.what();
        report(obs, "Batch", std::string("failed: ") + e.what());
    }
    return r;
}

std::vector<DatasetResult> BatchRunner::run(const std::vector<DatasetInput>& inputs,
                                            unsigned                         nthreads,
                                            const CancellationToken*         cancel) const
{
    validate_batch(inputs, protocol_, bases_, config_);

    if (nthreads == 0) nthreads = std::thread::hardware_concurrency();

    std::vector<std::future<DatasetResult>> pending;
    {
        ThreadPool pool(std::min<unsigned>(nthreads, static_cast<unsigned>(inputs.size())));
        for (const DatasetInput& in : inputs)
            pending.push_back(pool.enqueue([this, &in, cancel] { return run_one(in, cancel); }));
    }

    std::vector<DatasetResult> out;
    out.reserve(pending.size());
    for (auto& f : pending) out.push_back(f.get());

    int failed = 0;
    for (const auto& r : out) failed += r.failed ? 1 : 0;
    std::ostringstream msg;
    msg << out.size() << " datasets, " << failed << " failed";
    report(progress_, "Batch", msg.str());
    return out;
}

} // namespace mrsfit
