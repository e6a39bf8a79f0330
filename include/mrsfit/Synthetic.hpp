#pragma once
#include "Signal.hpp"
#include "BasisSet.hpp"
#include <random>
#include <string>
#include <vector>

namespace mrsfit {

/*  one damped complex exponential, placed by chemical shift                */
struct SyntheticPeak {
    double ppm;
    double amplitude;
    double lw_hz     = 4.0;      // Lorentzian FWHM
    double phase_deg = 0.0;
};

/*  dwell 1/sw, txfrq = 42.577·b0                                            */
AcquisitionInfo synthetic_acquisition(int n = 2048, double b0_tesla = 2.89,
                                      double sw_hz = 2000.0);

CVector synthetic_fid(const AcquisitionInfo& info, int n,
                      const std::vector<SyntheticPeak>& peaks);

/*  circular complex Gaussian noise, σ per real/imaginary component          */
CVector add_noise(const CVector& fid, double sigma, std::mt19937& rng);

struct TransientOptions {
    int      n_averages   = 1;
    double   freq_sd_hz   = 0.0;   // per-average frequency jitter
    double   phase_sd_deg = 0.0;
    double   noise_sd     = 0.0;
    unsigned seed         = 1;
};

/*  repeated acquisitions of each sub-spectrum FID with jitter and noise     */
TimeDomainSignal synthetic_signal(const AcquisitionInfo&      info,
                                  const std::vector<CVector>& subspectra,
                                  const TransientOptions&     opt);

/*  resonances of a small metabolite library (unit amplitude per proton)    */
std::vector<SyntheticPeak> metabolite_peaks(const std::string& name, double lw_hz = 2.0);
std::vector<std::string>   synthetic_metabolites();

/*  BasisSet of the library above (or of `names`) at the given geometry     */
BasisSet synthetic_basis(const AcquisitionInfo& info, int n,
                         const std::vector<std::string>& names = {},
                         double lw_hz = 2.0);

} // namespace mrsfit
