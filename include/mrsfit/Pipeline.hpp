#pragma once
#include "Signal.hpp"
#include "BasisSet.hpp"
#include "BasisCache.hpp"
#include "FitParameters.hpp"
#include "QualityMetrics.hpp"
#include "AcquisitionProtocol.hpp"
#include "Config.hpp"
#include "Progress.hpp"
#include <map>
#include <optional>
#include <string>

namespace mrsfit {

/*  raw signals of one subject / session                                     */
struct DatasetInput {
    std::string                     label;
    TimeDomainSignal                metabolite;
    std::optional<TimeDomainSignal> reference;    // water-unsuppressed, same timing
    std::optional<TimeDomainSignal> water;        // short-TE water
    std::optional<TimeDomainSignal> mm;           // metabolite-nulled, same timing
};

/*  basis per fitted condition; conditions without an entry use `fallback`   */
struct BasisLibrary {
    BasisSetPtr                          fallback;
    std::map<ConditionKind, BasisSetPtr> per_condition;

    BasisSetPtr for_condition(ConditionKind kind) const;
};

struct DatasetResult {
    std::string                             label;
    ConditionMap                            spectra;
    std::map<ConditionKind, FitParameters>  fits;
    std::map<ConditionKind, QualityMetrics> quality;
    bool                                    failed = false;
    std::string                             message;
};

/* ------------------------------------------------------------------------- */
/*  Processing chain                                                         */
/*                                                                           */
/*  unedited :  average/align → ECC → polarity → water removal →             */
/*              referencing → Cr/Cho phasing                                 */
/*  edited   :  average/align per sub-spectrum → ECC → polarity → classify → */
/*              coarse Cr/Cho referencing and phasing → sub-spectrum          */
/*              alignment → combine → water removal → one referencing shift  */
/*              from SUM applied to every condition                          */
/*  REF/WATER:  average/align on water → ECC with itself → water referencing */
/*  MM       :  average/align on MM09 → ECC with the reference when the      */
/*              metabolite kept it → water removal → MM09 referencing        */
/* ------------------------------------------------------------------------- */
ConditionMap process_spectra(const DatasetInput&        input,
                             const AcquisitionProtocol& protocol,
                             const ProcessingConfig&    config,
                             ProgressObserver*          progress = nullptr);

/*  averaged, self-corrected and water-referenced REF or WATER spectrum;
 *  `uncorrected` receives the averaged FID before the self-correction        */
ProcessedSpectrum process_water_signal(const TimeDomainSignal& signal,
                                       ConditionKind           kind,
                                       const ProcessingConfig& config,
                                       ProgressObserver*       progress    = nullptr,
                                       ProcessedSpectrum*      uncorrected = nullptr);

/*  averaged metabolite-nulled spectrum; `ecc` carries the metabolite's
 *  eddy-current decision, `reference` the uncorrected averaged reference    */
ProcessedSpectrum process_mm_signal(const TimeDomainSignal&                 signal,
                                    const std::optional<ProcessedSpectrum>& reference,
                                    bool                                    ecc,
                                    const ProcessingConfig&                 config,
                                    ProgressObserver*                       progress = nullptr);

std::map<ConditionKind, FitParameters>
fit_spectra(const ConditionMap&        spectra,
            const AcquisitionProtocol& protocol,
            const BasisLibrary&        bases,
            const ProcessingConfig&    config,
            BasisCache*                cache    = nullptr,
            ProgressObserver*          progress = nullptr);

std::map<ConditionKind, QualityMetrics>
measure_spectra(const ConditionMap&        spectra,
                const AcquisitionProtocol& protocol,
                const ProcessingConfig&    config,
                ProgressObserver*          progress = nullptr);

/*  everything above for one dataset; exceptions propagate                   */
DatasetResult process_dataset(const DatasetInput&        input,
                              const AcquisitionProtocol& protocol,
                              const BasisLibrary&        bases,
                              const ProcessingConfig&    config,
                              BasisCache*                cache    = nullptr,
                              ProgressObserver*          progress = nullptr);

} // namespace mrsfit
