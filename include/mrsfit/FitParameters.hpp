#pragma once
#include "Signal.hpp"
#include <limits>
#include <string>
#include <vector>

namespace mrsfit {

/*  Unfit → Referenced → PreliminaryReduced → PreliminaryFull → Complete;
 *  Failed is absorbing.                                                     */
enum class FitStage { Unfit, Referenced, PreliminaryReduced, PreliminaryFull, Complete, Failed };

const char* to_string(FitStage s);

enum class FitStyle { Separate, Concatenated };

FitStyle    fit_style_from_string(const std::string& s);
const char* to_string(FitStyle s);

struct FitParameters {
    ConditionKind condition = ConditionKind::OFF;
    FitStage      stage     = FitStage::Unfit;

    std::vector<std::string> names;
    Vector amplitudes;               // ≥ 0
    Vector amplitude_sd;             // 1-σ from the covariance
    Vector lorentz_hz;
    Vector shift_hz;

    double ph0_deg         = 0.0;
    double ph1_deg_per_ppm = 0.0;
    double gauss           = 0.0;    // 1/s², exp(−g t²)
    double gauss_fwhm_hz() const;

    double fit_lo_ppm       = 0.0;
    double fit_hi_ppm       = 0.0;
    double knot_spacing_ppm = 0.0;
    Vector baseline;                 // B-spline coefficients

    double ref_shift_hz = 0.0;
    double ref_fwhm_hz  = std::numeric_limits<double>::quiet_NaN();

    double chi2       = std::numeric_limits<double>::quiet_NaN();
    int    iterations = 0;
    bool   converged  = false;
    std::string message;

    bool   failed() const { return stage == FitStage::Failed; }
    double amplitude(const std::string& name) const;   // NaN if absent

    static FitParameters failed_result(ConditionKind kind, std::string why);
};

} // namespace mrsfit
