#pragma once
#include "Types.hpp"
#include "SpectralOps.hpp"
#include "ParameterIndexer.hpp"
#include <Eigen/Core>
#include <vector>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Everything needed from one spectrum being fitted                         */
/* ------------------------------------------------------------------------- */
struct FitDataset {
    IndexRange           window;     // fit range on the (zero-filled) grid
    Vector               ppm;        // ppm inside the window
    Vector               data;       // Re(spectrum) inside the window
    Vector               t;          // time axis of the basis FIDs
    std::vector<CVector> basis;      // resampled basis FIDs, full length
    Matrix               baseline;   // (window × K) B-spline design
    double               centre_ppm = 4.68;
};

/* ------------------------------------------------------------------------- */
/*  Residual functor for all fitted spectra at once                          */
/*                                                                           */
/*    M = Re{ e^{iφ(ppm)} Σ_j a_j F_j } + B c                                */
/*    F_j = FFT[b_j(t) · exp(−π l_j t − g t² − i2π s_j t)]                   */
/*    φ   = (ph0 + ph1·(ppm − centre))·π/180                                 */
/*                                                                           */
/*  Amplitude, baseline and phase columns of the Jacobian are analytic;      */
/*  lorentz, shift and gauss use forward differences that recompute only     */
/*  the functions a parameter touches.                                       */
/* ------------------------------------------------------------------------- */
class SpectralFitCost {
public:
    SpectralFitCost(std::vector<FitDataset> datasets,
                    const ParameterIndexer& indexer);

    int numResiduals() const { return num_residuals_; }
    int numParameters() const { return indexer_.total(); }

    void operator()(const Eigen::VectorXd& parameters,
                    Eigen::VectorXd*       residuals,
                    Eigen::MatrixXd*       jacobians) const;

    /*  windowed F_j under the current nonlinear parameters                  */
    CVector component(int d, int j, const Eigen::VectorXd& p) const;

    /*  Re{e^{iφ} F_j}, one column per basis function                        */
    Matrix amplitude_design(int d, const Eigen::VectorXd& p) const;

    Vector model(int d, const Eigen::VectorXd& p) const;
    Vector baseline_part(int d, const Eigen::VectorXd& p) const;

    const FitDataset& dataset(int d) const { return datasets_[d]; }
    int n_datasets() const { return static_cast<int>(datasets_.size()); }
    int row_offset(int d) const { return row_offset_[d]; }

private:
    CVector component_with(int d, int j, double lorentz, double gauss, double shift) const;
    CVector phase_factor(int d, const Eigen::VectorXd& p) const;

    std::vector<FitDataset> datasets_;
    const ParameterIndexer& indexer_;
    std::vector<int>        row_offset_;
    int                     num_residuals_ = 0;
};

} // namespace mrsfit
