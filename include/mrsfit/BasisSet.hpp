#pragma once
#include "Signal.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mrsfit {

struct BasisFunction {
    std::string name;
    CVector     fid;
};

/* ------------------------------------------------------------------------- */
/*  Named metabolite basis sharing one acquisition geometry.  Names are      */
/*  unique; construction throws PreconditionError otherwise.                 */
/* ------------------------------------------------------------------------- */
class BasisSet {
public:
    BasisSet() = default;
    BasisSet(AcquisitionInfo info, std::vector<BasisFunction> functions);

    const AcquisitionInfo&            info()      const { return info_; }
    const std::vector<BasisFunction>& functions() const { return functions_; }
    int                               size()      const { return static_cast<int>(functions_.size()); }
    bool                              empty()     const { return functions_.empty(); }
    const BasisFunction& operator[](int i)        const { return functions_[static_cast<std::size_t>(i)]; }

    std::vector<std::string> names() const;
    int  index_of(const std::string& name) const;      // -1 if absent
    bool contains(const std::string& name) const { return index_of(name) >= 0; }

    /*  members of `wanted` present in this set, in this set's order         */
    BasisSet subset(const std::vector<std::string>& wanted) const;
    BasisSet with(std::vector<BasisFunction> extra) const;

    /*  divide every function by the largest real spectral value of the set  */
    BasisSet normalized() const;

    Vector ppm() const;
    double ppm_min() const;
    double ppm_max() const;
    double ppm_step() const;

    /*  content hash used as cache key                                       */
    std::size_t fingerprint() const { return fingerprint_; }

private:
    AcquisitionInfo            info_;
    std::vector<BasisFunction> functions_;
    std::size_t                fingerprint_ = 0;
};

using BasisSetPtr = std::shared_ptr<const BasisSet>;

/* ------------------------------------------------------------------------- */
/*  Generated basis functions                                                */
/* ------------------------------------------------------------------------- */

/*  Gaussian singlet, FWHM in Hz, centred at `ppm`                            */
CVector gaussian_singlet(const AcquisitionInfo& info, int n, double ppm,
                         double fwhm_hz, double amplitude);

/*  Lorentzian singlet, FWHM in Hz, centred at `ppm`                          */
CVector lorentzian_singlet(const AcquisitionInfo& info, int n, double ppm,
                           double fwhm_hz, double amplitude);

/*  MM09 … Lip20 macromolecule/lipid Gaussians, scaled against the area of
 *  the 3.027 ppm singlet of the "Cr" function (one proton = area / 3).      */
std::vector<BasisFunction> macromolecule_basis(const BasisSet& metabolites);

/*  single water singlet at the centre frequency                             */
BasisSet water_basis(const AcquisitionInfo& info, int n);

/* ------------------------------------------------------------------------- */
/*  Resampling onto a data grid                                              */
/* ------------------------------------------------------------------------- */
struct ResampledBasis {
    std::vector<std::string> names;
    std::vector<CVector>     fids;     // time domain, n_points each
    int                      n_points = 0;
};

/*  Akima interpolation of each basis spectrum onto the ppm grid of an
 *  n_points acquisition with `target` geometry, then back to the time
 *  domain.  Throws PreconditionError if the basis does not cover the grid.  */
ResampledBasis resample_basis(const BasisSet& basis,
                              const AcquisitionInfo& target,
                              int n_points);

/*  coverage and resolution check without doing the work                     */
void check_basis_compatible(const BasisSet& basis,
                            const AcquisitionInfo& target,
                            int n_points);

} // namespace mrsfit
