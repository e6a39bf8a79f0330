#pragma once
#include "Pipeline.hpp"
#include <atomic>
#include <vector>

namespace mrsfit {

/*  cooperative cancellation, checked before a dataset starts               */
class CancellationToken {
public:
    void cancel() noexcept          { flag_.store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return flag_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

/*  DataInconsistencyError when the batch does not fit together:
 *  paired signals present for some datasets only, sample count or dwell
 *  mismatch inside a pair, raw paired signals whose average counts differ
 *  across datasets, or a basis that does not cover / resolve the data of
 *  a fitted condition.                                                      */
void validate_batch(const std::vector<DatasetInput>& inputs,
                    const AcquisitionProtocol&       protocol,
                    const BasisLibrary&              bases,
                    const ProcessingConfig&          config);

/* ------------------------------------------------------------------------- */
/*  Runs process_dataset() for every input on a thread pool.  A dataset     */
/*  that throws or fails numerically is recorded with failed = true and the */
/*  remaining datasets carry on.  Results keep the input order.             */
/* ------------------------------------------------------------------------- */
class BatchRunner {
public:
    BatchRunner(const AcquisitionProtocol& protocol,
                const BasisLibrary&        bases,
                const ProcessingConfig&    config,
                BasisCache*                cache    = nullptr,
                ProgressObserver*          progress = nullptr);

    std::vector<DatasetResult> run(const std::vector<DatasetInput>& inputs,
                                   unsigned                         nthreads = 0,
                                   const CancellationToken*         cancel   = nullptr) const;

private:
    DatasetResult run_one(const DatasetInput& input, const CancellationToken* cancel) const;

    const AcquisitionProtocol& protocol_;
    const BasisLibrary&        bases_;
    const ProcessingConfig&    config_;
    BasisCache*                cache_;
    ProgressObserver*          progress_;
};

} // namespace mrsfit
