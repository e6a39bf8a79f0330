#pragma once
#include "Types.hpp"
#include "Signal.hpp"

namespace mrsfit {

/* ---------------------------  transforms  --------------------------------- */
CVector fftshift (const CVector& x);
CVector ifftshift(const CVector& x);

/*  fftshift(fft(fid))  and its inverse                                        */
CVector to_frequency_domain(const CVector& fid);
CVector to_time_domain     (const CVector& spectrum);

/* ---------------------------  axes  --------------------------------------- */
Vector time_axis(const AcquisitionInfo& info, int n);
Vector hz_axis  (const AcquisitionInfo& info, int n);
Vector ppm_axis (const AcquisitionInfo& info, int n);     // descending

struct IndexRange {
    Eigen::Index first = 0;
    Eigen::Index count = 0;
    bool empty() const { return count == 0; }
};

/*  contiguous block of indices with lo ≤ ppm ≤ hi                              */
IndexRange ppm_range(const Vector& ppm, double lo, double hi);

/* ---------------------------  FID manipulation  --------------------------- */
CVector freq_shift     (const CVector& fid, double hz, double dwell);
CVector phase_shift    (const CVector& fid, double deg);
CVector amplitude_scale(const CVector& fid, double factor);
CVector zero_pad       (const CVector& fid, int factor);

/*  spectrum · exp(i(ph0 + ph1·(ppm − centre))), degrees and degrees/ppm      */
CVector add_phase_ramp (const CVector& fid, const AcquisitionInfo& info,
                        double ph0_deg, double ph1_deg_per_ppm);

/*  subtract the mean of the last `tail_fraction` of the FID                   */
CVector dc_correct_time(const CVector& fid, double tail_fraction = 0.25);

/*  re-centre the spectrum on the median of the central `percent` % of its
 *  points (real and imaginary part separately); returns a FID               */
CVector dc_correct_frequency(const CVector& fid, double percent = 100.0);

/* ---------------------------  small numerics  ----------------------------- */
double median(Vector v);
Vector unwrap(const Vector& phase);

struct PeakLocation {
    Eigen::Index index = -1;
    double       ppm   = 0.0;     // parabolic refinement
    double       value = 0.0;
};

/*  largest entry of `values` inside [lo, hi] ppm                               */
PeakLocation find_peak(const Vector& values, const Vector& ppm,
                       double lo, double hi);

} // namespace mrsfit
