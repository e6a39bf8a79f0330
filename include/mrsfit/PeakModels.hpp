#pragma once
#include "Types.hpp"
#include <limits>
#include <vector>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Lorentzian multiplets on the ppm axis                                    */
/*                                                                           */
/*      y(x) = Σ_k A_k [cos φ·γ²/(γ²+u_k²) + sin φ·γ·u_k/(γ²+u_k²)] + c       */
/*      u_k  = (x0 + offset_k) − x,   γ = fwhm/2                             */
/*                                                                           */
/*  u runs with frequency, so φ is the zero-order phase of the data.        */
/*                                                                           */
/*  All peaks share width, phase and baseline; the offsets are fixed, so a   */
/*  single Lorentzian is the one-offset case and Cr/Cho the two-offset case. */
/* ------------------------------------------------------------------------- */
struct PeakFitResult {
    std::vector<double> amplitudes;
    double fwhm_ppm   = std::numeric_limits<double>::quiet_NaN();
    double center_ppm = std::numeric_limits<double>::quiet_NaN();
    double phase_deg  = 0.0;
    double baseline   = 0.0;
    double chi2       = std::numeric_limits<double>::quiet_NaN();
    bool   ok         = false;

    double fwhm_hz(double txfrq_mhz) const { return fwhm_ppm * txfrq_mhz; }
    /* ∫ A γ²/(γ²+u²) du = π A γ, summed over the multiplet */
    double area() const;
};

struct PeakFitOptions {
    std::vector<double> offsets_ppm {0.0};
    double fwhm_guess_ppm = 0.05;
    double center_guess_ppm = std::numeric_limits<double>::quiet_NaN();  // NaN: window maximum
    bool   free_phase     = true;
    int    max_iterations = 200;
};

PeakFitResult fit_lorentzians(const Vector&         ppm,
                              const Vector&         values,
                              double                lo_ppm,
                              double                hi_ppm,
                              const PeakFitOptions& opt = {});

Vector evaluate_lorentzians(const PeakFitResult&       fit,
                            const std::vector<double>& offsets_ppm,
                            const Vector&              ppm);

/* linewidth prior used to seed peak fits: ~2 Hz per Tesla */
double linewidth_prior_hz(double b0_tesla);

} // namespace mrsfit
