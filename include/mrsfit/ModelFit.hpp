#pragma once
#include "Types.hpp"
#include "Signal.hpp"
#include "BasisSet.hpp"
#include "BasisCache.hpp"
#include "FitParameters.hpp"
#include "ParameterIndexer.hpp"
#include "Referencing.hpp"
#include "SimpleLM.hpp"
#include "SpectralOps.hpp"
#include "Progress.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mrsfit {

/*  one spectrum and the basis it is fitted with                            */
struct FitInput {
    ProcessedSpectrum spectrum;
    BasisSetPtr       basis;
};

/* ------------------------------------------------------------------------- */
/*  Staged linear-combination model fit                                      */
/*                                                                           */
/*    referencing  →  reduced fit (tied lineshape, core metabolites)         */
/*                 →  full fit (per-function lineshape)  →  packaging        */
/*                                                                           */
/*  Several inputs are fitted independently (Separate) or jointly with       */
/*  shared nonlinear parameters (Concatenated).                              */
/* ------------------------------------------------------------------------- */
class ModelFit {
public:
    struct Config
    {
        double   fit_lo_ppm        = 0.2;
        double   fit_hi_ppm        = 4.2;
        double   knot_spacing_ppm  = 0.4;
        int      zero_fill         = 2;
        FitStyle style             = FitStyle::Separate;

        int      reduced_iterations = 100;
        int      full_iterations    = 200;
        std::vector<std::string> reduced_subset {"Cr", "Glu", "Ins", "mI", "GPC", "NAA"};
        bool     skip_reduced      = false;

        /*  a supplied shift (Hz) replaces the cross-correlation search;
         *  the packaged shift adds it to the one already on the spectrum   */
        std::optional<double>      ref_shift_hz;
        std::vector<ReferencePeak> reference_peaks {landmarks::NAA, landmarks::Cr, landmarks::Cho};
        double   ref_lo_ppm        = 1.8;
        double   ref_hi_ppm        = 3.4;
        double   ref_max_lag_ppm   = 0.2;

        double   max_shift_hz      = 0.0;   // 0: 0.05 ppm
        double   max_lorentz_hz    = 0.0;   // 0: 10 × linewidth prior
        double   max_gauss         = 1.0e4; // 1/s²
        double   max_ph1           = 20.0;  // deg/ppm

        bool     verbose           = false;
    };

    ModelFit(std::vector<FitInput> inputs,
             const Config&          config,
             BasisCache*            cache    = nullptr,
             ProgressObserver*      progress = nullptr);

    void run();

    FitStage stage() const { return stage_; }
    const std::vector<FitParameters>& results() const { return results_; }
    const LMSolverSummary& get_summary() const { return summary_; }

    /*  curves over the fit range of input d (empty before run())            */
    const Vector& ppm(std::size_t d)      const { return curves_.at(d).ppm; }
    const Vector& data(std::size_t d)     const { return curves_.at(d).data; }
    const Vector& model(std::size_t d)    const { return curves_.at(d).model; }
    const Vector& baseline(std::size_t d) const { return curves_.at(d).baseline; }

private:
    struct Curves {
        Vector ppm, data, model, baseline;
    };

    void run_separately();
    void stage_reference();
    void stage_reduced();
    void stage_full();
    void package();
    void fail(const std::string& why);

    /*  one LM solve over the named functions of every input                 */
    bool solve_stage(const std::vector<std::vector<std::string>>& names,
                     bool tie_lineshape, int max_iterations, const char* label);

    std::vector<FitInput>  inputs_;
    Config                 config_;
    BasisCache*            cache_;
    ProgressObserver*      progress_;

    FitStage               stage_ = FitStage::Unfit;

    /* per input: referenced zero-filled spectrum, its grid, resampled basis */
    std::vector<AcquisitionInfo>    info_;
    std::vector<CVector>            spectra_;
    std::vector<Vector>             grid_;
    std::vector<IndexRange>         window_;
    std::vector<ResampledBasisPtr>  resampled_;
    std::vector<double>             ref_shift_;
    std::vector<double>             ref_fwhm_;

    /* state carried between stages, per input (and per function) */
    std::vector<double>              ph0_, ph1_, gauss_;
    std::vector<std::vector<double>> lorentz_, shift_;
    std::vector<std::vector<double>> amplitude_, amplitude_sd_;
    std::vector<Vector>              baseline_;
    std::vector<Curves>              curves_;

    LMSolverSummary            summary_;
    std::vector<FitParameters> results_;
};

} // namespace mrsfit
