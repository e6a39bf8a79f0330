#include "mrsfit/Pipeline.hpp"
#include "mrsfit/Alignment.hpp"
#include "mrsfit/EddyCurrent.hpp"
#include "mrsfit/Polarity.hpp"
#include "mrsfit/WaterRemoval.hpp"
#include "mrsfit/Referencing.hpp"
#include "mrsfit/ModelFit.hpp"
#include "mrsfit/Errors.hpp"
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace mrsfit {

namespace {

AlignmentOptions water_alignment(const AlignmentOptions& base)
{
    const ReferenceSpec spec = reference_spec(ReferenceMethod::Water);
    AlignmentOptions o = base;
    o.coarse_peaks  = spec.peaks;
    o.coarse_lo_ppm = spec.lo_ppm;
    o.coarse_hi_ppm = spec.hi_ppm;
    o.max_lag_ppm   = spec.max_lag_ppm;
    o.reg_lo_ppm    = spec.lo_ppm;
    o.reg_hi_ppm    = spec.hi_ppm;
    return o;
}

const ReferenceSpec& mm_reference()
{
    static const ReferenceSpec spec{{landmarks::MM09}, 0.5, 1.3, 0.2};
    return spec;
}

AlignmentOptions mm_alignment(const AlignmentOptions& base)
{
    const ReferenceSpec& spec = mm_reference();
    AlignmentOptions o = base;
    o.coarse_peaks  = spec.peaks;
    o.coarse_lo_ppm = spec.lo_ppm;
    o.coarse_hi_ppm = spec.hi_ppm;
    o.max_lag_ppm   = spec.max_lag_ppm;
    o.reg_lo_ppm    = spec.lo_ppm;
    o.reg_hi_ppm    = 4.2;
    return o;
}

/*  ECC (when a reference exists) and polarity on one averaged spectrum      */
ProcessedSpectrum correct(ProcessedSpectrum                     s,
                          const std::optional<ProcessedSpectrum>& ref,
                          const PpmWindow&                      polarity,
                          const ProcessingConfig&               config,
                          ProgressObserver*                     progress,
                          bool*                                 ecc_kept = nullptr)
{
    if (config.eddy_current_correction && ref) {
        EccResult ecc = eddy_current_correct_checked(s, *ref);
        if (ecc_kept) *ecc_kept = ecc.applied;
        if (!ecc.applied) {
            std::ostringstream msg;
            msg << to_string(s.kind) << ": eddy-current correction discarded (phase "
                << ecc.phase_before_deg << " -> " << ecc.phase_after_deg << " deg)";
            report(progress, "ECC", msg.str());
        }
        s = std::move(ecc.metabolite);
    }
    if (config.correct_polarity) {
        s = correct_polarity(s, polarity.lo_ppm, polarity.hi_ppm);
        if (s.polarity_flipped)
            report(progress, "Polarity", std::string(to_string(s.kind)) + ": inverted");
    }
    return s;
}

ProcessedSpectrum phased(const ProcessedSpectrum& s, const ProcessingConfig& config)
{
    return config.phase_cr_cho ? phase_cr_cho(s) : s;
}

} // namespace

/* ------------------------------------------------------------------------- */
BasisSetPtr BasisLibrary::for_condition(ConditionKind kind) const
{
    const auto it = per_condition.find(kind);
    BasisSetPtr b = it != per_condition.end() ? it->second : fallback;
    if (!b)
        throw PreconditionError(std::string("no basis set for condition ") + to_string(kind));
    return b;
}

/* ------------------------------------------------------------------------- */
/*  water signals                                                            */
/* ------------------------------------------------------------------------- */
ProcessedSpectrum process_water_signal(const TimeDomainSignal& signal,
                                       ConditionKind           kind,
                                       const ProcessingConfig& config,
                                       ProgressObserver*       progress,
                                       ProcessedSpectrum*      uncorrected)
{
    ProcessedSpectrum avg = average_and_align(signal, kind,
                                              water_alignment(config.alignment), progress);
    if (uncorrected) *uncorrected = avg;

    ProcessedSpectrum s = avg;
    if (config.eddy_current_correction) {
        s      = eddy_current_correct(avg, avg).metabolite;
        s.kind = kind;
    }
    const ReferenceResult r = reference_spectrum(s, ReferenceMethod::Water);
    return apply_reference(s, r);
}

/* ------------------------------------------------------------------------- */
/*  metabolite-nulled signals                                                */
/* ------------------------------------------------------------------------- */
ProcessedSpectrum process_mm_signal(const TimeDomainSignal&                 signal,
                                    const std::optional<ProcessedSpectrum>& reference,
                                    bool                                    ecc,
                                    const ProcessingConfig&                 config,
                                    ProgressObserver*                       progress)
{
    ProcessedSpectrum s = average_and_align(signal, ConditionKind::MM,
                                            mm_alignment(config.alignment), progress);
    if (config.eddy_current_correction && reference && ecc) {
        s      = eddy_current_correct(s, *reference).metabolite;
        s.kind = ConditionKind::MM;
    }
    if (config.remove_water) s = remove_water(s, config.water, progress);

    ReferenceResult r;
    r.shift_hz = xcorr_shift_hz(s.spectrum(), s.info, mm_reference());
    return apply_reference(s, r);
}

/* ------------------------------------------------------------------------- */
/*  metabolite chain                                                         */
/* ------------------------------------------------------------------------- */
ConditionMap process_spectra(const DatasetInput&        input,
                             const AcquisitionProtocol& protocol,
                             const ProcessingConfig&    config,
                             ProgressObserver*          progress)
{
    const TimeDomainSignal& met = input.metabolite;
    if (met.empty())
        throw PreconditionError(input.label + ": metabolite signal has no averages");
    if (met.n_subspecs() != protocol.n_subspectra()) {
        std::ostringstream msg;
        msg << input.label << ": " << protocol.name() << " expects "
            << protocol.n_subspectra() << " sub-spectra, got " << met.n_subspecs();
        throw PreconditionError(msg.str());
    }

    ConditionMap out;

    /* ---- reference / water ------------------------------------------- */
    std::optional<ProcessedSpectrum> ref_raw;
    if (input.reference) {
        ProcessedSpectrum raw;
        out[ConditionKind::REF] = process_water_signal(*input.reference, ConditionKind::REF,
                                                       config, progress, &raw);
        ref_raw = std::move(raw);
    }
    if (input.water)
        out[ConditionKind::WATER] = process_water_signal(*input.water, ConditionKind::WATER,
                                                         config, progress);

    /* ---- averaging per sub-spectrum ----------------------------------- */
    std::vector<ProcessedSpectrum> subs;
    bool ecc_kept = true;
    for (int k = 0; k < met.n_subspecs(); ++k) {
        const TimeDomainSignal one = met.n_subspecs() > 1 ? met.select_subspec(k) : met;
        ProcessedSpectrum avg = average_and_align(one, ConditionKind::OFF,
                                                  config.alignment, progress);
        bool kept = true;
        subs.push_back(correct(std::move(avg), ref_raw, protocol.polarity_window(),
                               config, progress, &kept));
        if (k == 0) ecc_kept = kept;
    }

    /* the MM acquisition follows the ECC decision of the first sub-spectrum */
    if (input.mm)
        out[ConditionKind::MM] = process_mm_signal(*input.mm, ref_raw, ecc_kept, config, progress);

    EditedSubspectra edited = protocol.classify(std::move(subs));

    if (!protocol.edited()) {
        ProcessedSpectrum s = edited.spectra.front();
        if (config.remove_water) s = remove_water(s, config.water, progress);
        s = apply_reference(s, reference_spectrum(s, config.reference));
        s = phased(s, config);
        out[ConditionKind::OFF] = std::move(s);
        return out;
    }

    if (edited.switch_order)
        report(progress, "Edit", std::string(protocol.name()) + ": sub-spectra were acquired in swapped order");

    /* ---- coarse referencing and phasing per sub-spectrum -------------- */
    for (auto& s : edited.spectra) {
        s = apply_reference(s, reference_coarse(s, ReferenceMethod::CrCho));
        s = phased(s, config);
    }
    protocol.align(edited);
    /* registered onto the first sub-spectrum, so they share its frame */
    for (std::size_t k = 1; k < edited.spectra.size(); ++k)
        edited.spectra[k].ref_shift_hz = edited.spectra.front().ref_shift_hz;

    ConditionMap combined = protocol.combine(edited);
    if (config.remove_water)
        for (auto& [kind, s] : combined) s = remove_water(s, config.water, progress);

    /* ---- one shift for all conditions, measured on SUM ---------------- */
    const ReferenceResult shared = reference_spectrum(combined.at(ConditionKind::SUM),
                                                      config.reference);
    for (auto& [kind, s] : combined) out[kind] = apply_reference(s, shared);
    return out;
}

/* ------------------------------------------------------------------------- */
/*  model fitting                                                            */
/* ------------------------------------------------------------------------- */
std::map<ConditionKind, FitParameters>
fit_spectra(const ConditionMap&        spectra,
            const AcquisitionProtocol& protocol,
            const BasisLibrary&        bases,
            const ProcessingConfig&    config,
            BasisCache*                cache,
            ProgressObserver*          progress)
{
    std::map<ConditionKind, FitParameters> out;

    /* ---- metabolites --------------------------------------------------- */
    if (config.fit_metabolites) {
        std::map<const BasisSet*, BasisSetPtr> with_mm;
        std::vector<FitInput> inputs;
        for (ConditionKind kind : protocol.fit_conditions()) {
            const auto it = spectra.find(kind);
            if (it == spectra.end()) continue;

            BasisSetPtr basis = bases.for_condition(kind);
            if (config.add_macromolecules
                && (kind == ConditionKind::OFF || kind == ConditionKind::SUM)) {
                auto& mm = with_mm[basis.get()];
                if (!mm)
                    mm = std::make_shared<const BasisSet>(basis->with(macromolecule_basis(*basis)));
                basis = mm;
            }
            inputs.push_back({it->second, basis});
        }

        if (!inputs.empty()) {
            ModelFit::Config fc = config.fit;
            if (!protocol.edited()) fc.style = FitStyle::Separate;
            /* edited conditions already carry the shift measured on SUM */
            else if (!fc.ref_shift_hz) fc.ref_shift_hz = 0.0;

            ModelFit fit(inputs, fc, cache, progress);
            fit.run();
            for (const FitParameters& p : fit.results()) out[p.condition] = p;
        }
    }

    /* ---- water reference ---------------------------------------------- */
    if (config.fit_water) {
        for (ConditionKind kind : {ConditionKind::REF, ConditionKind::WATER}) {
            const auto it = spectra.find(kind);
            if (it == spectra.end()) continue;
            const ProcessedSpectrum& s = it->second;

            auto basis = std::make_shared<const BasisSet>(
                water_basis(s.info, static_cast<int>(s.fid.size())));
            ModelFit fit({{s, basis}}, config.water_fit, cache, progress);
            fit.run();
            FitParameters p = fit.results().front();
            p.condition = kind;
            out[kind]   = std::move(p);
        }
    }
    return out;
}

/* ------------------------------------------------------------------------- */
/*  quality                                                                  */
/* ------------------------------------------------------------------------- */
std::map<ConditionKind, QualityMetrics>
measure_spectra(const ConditionMap&        spectra,
                const AcquisitionProtocol& protocol,
                const ProcessingConfig&    config,
                ProgressObserver*          progress)
{
    const double metabolite = config.alignment.coarse_peaks.empty()
                            ? landmarks::Cr.ppm
                            : config.alignment.coarse_peaks.front().ppm;
    auto landmark = [&](ConditionKind kind) {
        switch (kind) {
            case ConditionKind::REF:
            case ConditionKind::WATER: return landmarks::Water.ppm;
            case ConditionKind::MM:    return landmarks::MM09.ppm;
            default:                   return metabolite;
        }
    };

    std::map<ConditionKind, QualityMetrics> out;
    for (const auto& [kind, s] : spectra) {
        try {
            out[kind] = measure_quality(s, protocol.quality_window(kind), landmark(kind));
        } catch (const PreconditionError& e) {
            report(progress, "QM", std::string(to_string(kind)) + ": " + e.what());
            QualityMetrics q;
            q.condition = kind;
            out[kind]   = q;
        }
    }
    return out;
}

/* ------------------------------------------------------------------------- */
DatasetResult process_dataset(const DatasetInput&        input,
                              const AcquisitionProtocol& protocol,
                              const BasisLibrary&        bases,
                              const ProcessingConfig&    config,
                              BasisCache*                cache,
                              ProgressObserver*          progress)
{
    DatasetResult r;
    r.label   = input.label;
    r.spectra = process_spectra(input, protocol, config, progress);
    r.quality = measure_spectra(r.spectra, protocol, config, progress);
    r.fits    = fit_spectra(r.spectra, protocol, bases, config, cache, progress);

    for (const auto& [kind, p] : r.fits) {
        if (!p.failed()) continue;
        r.failed = true;
        if (!r.message.empty()) r.message += "; ";
        r.message += std::string(to_string(kind)) + ": " + p.message;
    }
    return r;
}

} // namespace mrsfit
