#include "mrsfit/ModelFit.hpp"
#include "mrsfit/SpectralFitCost.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/PeakModels.hpp"
#include "mrsfit/Baseline.hpp"
#include "mrsfit/Errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>

namespace mrsfit {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

int index_in(const std::vector<std::string>& names, const std::string& n)
{
    const auto it = std::find(names.begin(), names.end(), n);
    return it == names.end() ? -1 : static_cast<int>(std::distance(names.begin(), it));
}

} // namespace

/* ------------------------------------------------------------------------- */
/*  constructor                                                              */
/* ------------------------------------------------------------------------- */
ModelFit::ModelFit(std::vector<FitInput> inputs,
                   const Config&          config,
                   BasisCache*            cache,
                   ProgressObserver*      progress)
    : inputs_(std::move(inputs))
    , config_(config)
    , cache_(cache)
    , progress_(progress)
{
    if (inputs_.empty())
        throw PreconditionError("ModelFit: nothing to fit");
    if (config_.zero_fill < 1)
        throw PreconditionError("ModelFit: zero-fill factor must be >= 1");
    if (!(config_.fit_hi_ppm > config_.fit_lo_ppm))
        throw PreconditionError("ModelFit: empty fit range");
    for (const auto& in : inputs_) {
        if (!in.basis || in.basis->empty())
            throw PreconditionError("ModelFit: missing basis set");
        if (in.spectrum.fid.size() == 0)
            throw PreconditionError("ModelFit: empty spectrum");
    }

    const std::size_t nd = inputs_.size();
    ph0_.assign(nd, 0.0);
    ph1_.assign(nd, 0.0);
    gauss_.assign(nd, 0.0);
    lorentz_.resize(nd);
    shift_.resize(nd);
    amplitude_.resize(nd);
    amplitude_sd_.resize(nd);
    baseline_.resize(nd);
    curves_.resize(nd);
    for (std::size_t d = 0; d < nd; ++d) {
        const auto nf = static_cast<std::size_t>(inputs_[d].basis->size());
        const double lz0 = 0.5 * linewidth_prior_hz(inputs_[d].spectrum.info.b0_tesla);
        lorentz_[d].assign(nf, lz0);
        shift_[d].assign(nf, 0.0);
        amplitude_[d].assign(nf, 0.0);
        amplitude_sd_[d].assign(nf, 0.0);
    }
}

/* ------------------------------------------------------------------------- */
/*  driver                                                                   */
/* ------------------------------------------------------------------------- */
void ModelFit::run()
{
    if (config_.style == FitStyle::Separate && inputs_.size() > 1) {
        run_separately();
        return;
    }

    stage_reference();
    if (stage_ == FitStage::Failed) return;
    stage_reduced();
    if (stage_ == FitStage::Failed) return;
    stage_full();
    if (stage_ == FitStage::Failed) return;
    package();
}

void ModelFit::run_separately()
{
    results_.clear();
    bool all_complete = true;
    for (std::size_t d = 0; d < inputs_.size(); ++d) {
        ModelFit single({inputs_[d]}, config_, cache_, progress_);
        single.run();
        results_.push_back(single.results().front());
        curves_[d] = single.curves_.front();
        all_complete = all_complete && single.stage() == FitStage::Complete;
    }
    stage_ = all_complete ? FitStage::Complete : FitStage::Failed;
}

void ModelFit::fail(const std::string& why)
{
    stage_ = FitStage::Failed;
    results_.clear();
    for (const auto& in : inputs_)
        results_.push_back(FitParameters::failed_result(in.spectrum.kind, why));
    report(progress_, "Fit", "failed: " + why);
}

/* ------------------------------------------------------------------------- */
/*  stage 1 : referencing and resampling                                     */
/* ------------------------------------------------------------------------- */
void ModelFit::stage_reference()
{
    const std::size_t nd = inputs_.size();
    info_.resize(nd);
    spectra_.resize(nd);
    grid_.resize(nd);
    window_.resize(nd);
    resampled_.resize(nd);
    ref_shift_.assign(nd, 0.0);
    ref_fwhm_.assign(nd, std::numeric_limits<double>::quiet_NaN());

    for (std::size_t d = 0; d < nd; ++d) {
        const ProcessedSpectrum& s = inputs_[d].spectrum;
        AcquisitionInfo info = s.info;
        info.n_samples = static_cast<int>(s.fid.size());
        info_[d] = info;

        /* ---- shift ---------------------------------------------------- */
        double shift = 0.0;
        if (config_.ref_shift_hz) {
            shift = *config_.ref_shift_hz;
        } else {
            const ReferenceSpec spec{config_.reference_peaks, config_.ref_lo_ppm,
                                     config_.ref_hi_ppm, config_.ref_max_lag_ppm};
            shift = xcorr_shift_hz(s.spectrum(), info, spec);
        }
        const CVector fid = freq_shift(s.fid, -shift, info.dwell_time);
        ref_shift_[d] = shift;

        /* ---- linewidth of the main landmark --------------------------- */
        if (!config_.reference_peaks.empty()) {
            const double centre = config_.reference_peaks.front().ppm;
            PeakFitOptions opt;
            opt.fwhm_guess_ppm   = linewidth_prior_hz(info.b0_tesla) / info.txfrq_mhz;
            opt.center_guess_ppm = centre;
            try {
                const PeakFitResult f = fit_lorentzians(ppm_axis(info, info.n_samples),
                                                        to_frequency_domain(fid).real(),
                                                        centre - 0.2, centre + 0.2, opt);
                if (f.ok) ref_fwhm_[d] = f.fwhm_hz(info.txfrq_mhz);
            } catch (const PreconditionError&) {
                /* landmark window off the axis: FWHM stays NaN */
            }
        }

        /* ---- zero-filled data on its grid ------------------------------ */
        const int N = info.n_samples * config_.zero_fill;
        spectra_[d] = to_frequency_domain(zero_pad(fid, config_.zero_fill));
        grid_[d]    = ppm_axis(info, N);
        window_[d]  = ppm_range(grid_[d], config_.fit_lo_ppm, config_.fit_hi_ppm);

        const int K = bspline_count(config_.fit_lo_ppm, config_.fit_hi_ppm,
                                    config_.knot_spacing_ppm);
        if (window_[d].count <= inputs_[d].basis->size() + K + 3)
            throw PreconditionError("ModelFit: fit range holds too few points");

        resampled_[d] = cache_ ? cache_->resampled(*inputs_[d].basis, info, N)
                               : std::make_shared<const ResampledBasis>(
                                     resample_basis(*inputs_[d].basis, info, N));

        std::ostringstream msg;
        msg << "Stage 1: " << to_string(s.kind) << " shift " << shift << " Hz";
        if (std::isfinite(ref_fwhm_[d])) msg << ", FWHM " << ref_fwhm_[d] << " Hz";
        report(progress_, "Fit", msg.str());
    }
    stage_ = FitStage::Referenced;
}

/* ------------------------------------------------------------------------- */
/*  one LM solve                                                             */
/* ------------------------------------------------------------------------- */
bool ModelFit::solve_stage(const std::vector<std::vector<std::string>>& names,
                           bool tie_lineshape, int max_iterations, const char* label)
{
    const int nd = static_cast<int>(inputs_.size());

    /* ---- a) datasets and bookkeeping --------------------------------- */
    std::vector<FitDataset>       sets;
    std::vector<std::vector<int>> full_index(nd);       // subset j -> basis index
    std::vector<int>              n_baseline;

    for (int d = 0; d < nd; ++d) {
        const ResampledBasis& rb = *resampled_[d];
        const IndexRange&     w  = window_[d];

        FitDataset ds;
        ds.window     = w;
        ds.ppm        = grid_[d].segment(w.first, w.count);
        ds.data       = spectra_[d].real().segment(w.first, w.count);
        ds.t          = time_axis(info_[d], rb.n_points);
        ds.baseline   = bspline_basis(ds.ppm, config_.fit_lo_ppm, config_.fit_hi_ppm,
                                      config_.knot_spacing_ppm);
        ds.centre_ppm = info_[d].center_ppm;
        for (const auto& n : names[d]) {
            const int j = index_in(rb.names, n);
            if (j < 0) continue;
            full_index[d].push_back(j);
            ds.basis.push_back(rb.fids[static_cast<std::size_t>(j)]);
        }
        n_baseline.push_back(static_cast<int>(ds.baseline.cols()));
        sets.push_back(std::move(ds));
    }

    std::vector<std::vector<std::string>> used(nd);
    for (int d = 0; d < nd; ++d)
        for (int j : full_index[d]) used[d].push_back(resampled_[d]->names[static_cast<std::size_t>(j)]);

    ParameterIndexer indexer;
    ParameterIndexer::Options iopt;
    iopt.tie_datasets  = config_.style == FitStyle::Concatenated && nd > 1;
    iopt.tie_lineshape = tie_lineshape;
    indexer.build(used, n_baseline, iopt);

    SpectralFitCost cost(std::move(sets), indexer);
    const int Npar = indexer.total();

    /* ---- b) start point and bounds ---------------------------------- */
    Eigen::VectorXd x = Eigen::VectorXd::Zero(Npar);
    std::vector<double> lo(Npar, -kInf), hi(Npar, kInf);

    for (int d = 0; d < nd; ++d) {
        const AcquisitionInfo& info = info_[d];
        const double max_shift = config_.max_shift_hz > 0.0 ? config_.max_shift_hz
                                                            : 0.05 * info.txfrq_mhz;
        const double max_lz    = config_.max_lorentz_hz > 0.0
                               ? config_.max_lorentz_hz
                               : 10.0 * linewidth_prior_hz(info.b0_tesla);

        int g = indexer.global(d, ParameterIndexer::kPh0);
        x[g] = ph0_[d];   lo[g] = -360.0;           hi[g] = 360.0;
        g = indexer.global(d, ParameterIndexer::kPh1);
        x[g] = ph1_[d];   lo[g] = -config_.max_ph1; hi[g] = config_.max_ph1;
        g = indexer.global(d, ParameterIndexer::kGauss);
        x[g] = gauss_[d]; lo[g] = 0.0;              hi[g] = config_.max_gauss;

        for (int j = 0; j < indexer.n_functions(d); ++j) {
            const auto jf = static_cast<std::size_t>(full_index[d][j]);
            g = indexer.lorentz(d, j);
            x[g] = lorentz_[d][jf]; lo[g] = 0.0;        hi[g] = max_lz;
            g = indexer.shift(d, j);
            x[g] = shift_[d][jf];   lo[g] = -max_shift; hi[g] = max_shift;
            lo[indexer.amplitude(d, j)] = 0.0;
        }
    }
    for (int i = 0; i < Npar; ++i) x[i] = std::clamp(x[i], lo[i], hi[i]);

    /* ---- c) linear start for amplitudes and baseline ----------------- */
    for (int d = 0; d < nd; ++d) {
        const FitDataset& ds = cost.dataset(d);
        const Matrix A  = cost.amplitude_design(d, x);
        const int    nf = static_cast<int>(A.cols());
        const int    K  = static_cast<int>(ds.baseline.cols());

        Matrix X(A.rows(), nf + K);
        X << A, ds.baseline;
        const Vector c = X.colPivHouseholderQr().solve(ds.data);

        Vector a = c.head(nf).cwiseMax(0.0);
        if (!a.allFinite()) a.setZero();
        const Vector bl = ds.baseline.colPivHouseholderQr().solve(ds.data - A * a);

        for (int j = 0; j < nf; ++j) x[indexer.amplitude(d, j)] = a[j];
        for (int k = 0; k < K; ++k)  x[indexer.baseline(d, k)]  = bl.allFinite() ? bl[k] : 0.0;
    }

    /* ---- d) Levenberg–Marquardt ------------------------------------- */
    std::vector<bool> free_mask(Npar, true);
    LMSolverOptions lm_opt;
    lm_opt.max_iterations = max_iterations;
    lm_opt.verbose        = config_.verbose;
    lm_opt.tag            = "[LM]";

    summary_ = levenberg_marquardt(cost, x, free_mask, lo, hi, lm_opt);
    if (summary_.numerical_failure || !std::isfinite(summary_.final_chi2) || !x.allFinite())
        return false;

    {
        std::ostringstream msg;
        msg << label << ": chi2 " << summary_.initial_chi2 << " -> " << summary_.final_chi2
            << " in " << summary_.iterations << " iterations"
            << (summary_.converged ? "" : " (iteration cap)");
        report(progress_, "Fit", msg.str());
    }

    /* ---- e) carry the state over ------------------------------------ */
    for (int d = 0; d < nd; ++d) {
        ph0_[d]   = x[indexer.global(d, ParameterIndexer::kPh0)];
        ph1_[d]   = x[indexer.global(d, ParameterIndexer::kPh1)];
        gauss_[d] = x[indexer.global(d, ParameterIndexer::kGauss)];

        std::fill(amplitude_[d].begin(), amplitude_[d].end(), 0.0);
        std::fill(amplitude_sd_[d].begin(), amplitude_sd_[d].end(), 0.0);
        for (int j = 0; j < indexer.n_functions(d); ++j) {
            const auto jf = static_cast<std::size_t>(full_index[d][j]);
            lorentz_[d][jf]      = x[indexer.lorentz(d, j)];
            shift_[d][jf]        = x[indexer.shift(d, j)];
            amplitude_[d][jf]    = x[indexer.amplitude(d, j)];
            amplitude_sd_[d][jf] = summary_.param_uncertainties[static_cast<std::size_t>(indexer.amplitude(d, j))];
        }
        if (tie_lineshape && indexer.n_functions(d) > 0) {
            /* every function starts the next stage from the tied lineshape */
            std::fill(lorentz_[d].begin(), lorentz_[d].end(), x[indexer.lorentz(d, 0)]);
            std::fill(shift_[d].begin(),   shift_[d].end(),   x[indexer.shift(d, 0)]);
        }

        const int K = indexer.baseline_count(d);
        baseline_[d] = x.segment(indexer.baseline(d, 0), K);

        Curves& c  = curves_[static_cast<std::size_t>(d)];
        c.ppm      = cost.dataset(d).ppm;
        c.data     = cost.dataset(d).data;
        c.model    = cost.model(d, x);
        c.baseline = cost.baseline_part(d, x);
    }
    return true;
}

/* ------------------------------------------------------------------------- */
/*  stages 2 and 3                                                           */
/* ------------------------------------------------------------------------- */
void ModelFit::stage_reduced()
{
    std::vector<std::vector<std::string>> names(inputs_.size());
    bool any = false;
    for (std::size_t d = 0; d < inputs_.size(); ++d) {
        for (const auto& n : inputs_[d].basis->names())
            if (index_in(config_.reduced_subset, n) >= 0) names[d].push_back(n);
        any = any || !names[d].empty();
    }

    if (config_.skip_reduced || !any) {
        report(progress_, "Fit", "Stage 2: reduced fit skipped");
        stage_ = FitStage::PreliminaryReduced;
        return;
    }

    if (!solve_stage(names, true, config_.reduced_iterations, "Stage 2 (reduced)")) {
        fail("non-finite objective in the reduced fit");
        return;
    }
    stage_ = FitStage::PreliminaryReduced;
}

void ModelFit::stage_full()
{
    std::vector<std::vector<std::string>> names(inputs_.size());
    for (std::size_t d = 0; d < inputs_.size(); ++d)
        names[d] = inputs_[d].basis->names();

    if (!solve_stage(names, false, config_.full_iterations, "Stage 3 (full)")) {
        fail("non-finite objective in the full fit");
        return;
    }
    stage_ = FitStage::PreliminaryFull;
}

/* ------------------------------------------------------------------------- */
/*  stage 4 : packaging                                                      */
/* ------------------------------------------------------------------------- */
void ModelFit::package()
{
    results_.clear();
    for (std::size_t d = 0; d < inputs_.size(); ++d) {
        FitParameters p;
        p.condition = inputs_[d].spectrum.kind;
        p.stage     = FitStage::Complete;
        p.names     = inputs_[d].basis->names();

        const auto nf = static_cast<Eigen::Index>(p.names.size());
        p.amplitudes   = Eigen::Map<const Vector>(amplitude_[d].data(), nf);
        p.amplitude_sd = Eigen::Map<const Vector>(amplitude_sd_[d].data(), nf);
        p.lorentz_hz   = Eigen::Map<const Vector>(lorentz_[d].data(), nf);
        p.shift_hz     = Eigen::Map<const Vector>(shift_[d].data(), nf);

        p.ph0_deg          = ph0_[d];
        p.ph1_deg_per_ppm  = ph1_[d];
        p.gauss            = gauss_[d];
        p.fit_lo_ppm       = config_.fit_lo_ppm;
        p.fit_hi_ppm       = config_.fit_hi_ppm;
        p.knot_spacing_ppm = config_.knot_spacing_ppm;
        p.baseline         = baseline_[d];
        p.ref_shift_hz     = inputs_[d].spectrum.ref_shift_hz + ref_shift_[d];
        p.ref_fwhm_hz      = std::isfinite(inputs_[d].spectrum.ref_fwhm_hz)
                           ? inputs_[d].spectrum.ref_fwhm_hz : ref_fwhm_[d];
        p.chi2             = summary_.final_chi2;
        p.iterations       = summary_.iterations;
        p.converged        = summary_.converged;
        results_.push_back(std::move(p));
    }
    stage_ = FitStage::Complete;
}

} // namespace mrsfit
