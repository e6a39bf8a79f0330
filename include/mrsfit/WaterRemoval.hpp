#pragma once
#include "Signal.hpp"
#include "Progress.hpp"
#include <optional>
#include <vector>

namespace mrsfit {

struct WaterRemovalOptions {
    double lo_ppm         = 4.5;
    double hi_ppm         = 4.9;
    int    max_order      = 20;     // number of HSVD components
    int    min_order      = 1;      // retry floor
    double point_fraction = 0.75;   // share of the FID used for the Hankel matrix
    bool   recenter       = true;   // frequency-domain DC pass afterwards
    double recenter_percent = 100.0;
};

struct HsvdComponent {
    double  frequency_hz = 0.0;
    double  damping      = 0.0;     // 1/s, positive = decaying
    Complex amplitude    {0.0, 0.0};
};

/*  Decompose the FID into `order` damped exponentials.  nullopt if the
 *  decomposition or the reconstruction is not finite.                       */
std::optional<std::vector<HsvdComponent>>
hsvd(const CVector& fid, const AcquisitionInfo& info, int order, double point_fraction);

/*  FID with every component inside [lo, hi] ppm subtracted (nullopt on
 *  non-finite output)                                                       */
std::optional<CVector>
hsvd_filter(const CVector& fid, const AcquisitionInfo& info, int order,
            double lo_ppm, double hi_ppm, double point_fraction);

/*  HSVD water filter with the bounded order walk-down.  When every order
 *  fails the input comes back unchanged with water_removal_failed set.      */
ProcessedSpectrum remove_water(const ProcessedSpectrum&   in,
                               const WaterRemovalOptions& opt = {},
                               ProgressObserver*          obs = nullptr);

} // namespace mrsfit
