#include "mrsfit/BasisSet.hpp"
#include "mrsfit/AkimaSpline.hpp"
#include "mrsfit/PeakModels.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Hashing.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace mrsfit {

namespace {

constexpr double kGyroProton = 42.577;      // MHz/T

/*  (ppm, FWHM ppm, protons) Gaussians of one MM/lipid function              */
struct GaussComponent { double ppm, fwhm_ppm, protons; };
struct MMDefinition   { const char* name; std::vector<GaussComponent> parts; };

const std::vector<MMDefinition>& mm_table()
{
    static const std::vector<MMDefinition> table = {
        {"MM09",  {{0.91, 0.14, 3.0}}},
        {"MM12",  {{1.21, 0.15, 2.0}}},
        {"MM14",  {{1.43, 0.17, 2.0}}},
        {"MM17",  {{1.67, 0.15, 2.0}}},
        {"MM20",  {{2.08, 0.15, 1.33}, {2.25, 0.20, 0.33},
                   {1.95, 0.15, 0.33}, {3.00, 0.20, 0.40}}},
        {"Lip09", {{0.89, 0.14, 3.0}}},
        {"Lip13", {{1.28, 0.15, 2.0}, {1.28, 0.89, 2.0}}},
        {"Lip20", {{2.04, 0.15, 1.33}, {2.25, 0.15, 0.67}, {2.80, 0.20, 0.87}}}
    };
    return table;
}

std::size_t compute_fingerprint(const AcquisitionInfo& info,
                                const std::vector<BasisFunction>& fns)
{
    std::size_t h = hash_double(info.dwell_time);
    h = hash_combine(h, hash_double(info.txfrq_mhz));
    h = hash_combine(h, hash_double(info.center_ppm));
    for (const auto& f : fns) {
        h = hash_combine(h, hash_string(f.name));
        h = hash_combine(h, static_cast<std::size_t>(f.fid.size()));
        for (Eigen::Index k = 0; k < f.fid.size(); ++k) {
            h = hash_combine(h, hash_double(f.fid[k].real()));
            h = hash_combine(h, hash_double(f.fid[k].imag()));
        }
    }
    return h;
}

double hz_per_ppm_for_width(const AcquisitionInfo& info)
{
    return info.b0_tesla > 0.0 ? info.b0_tesla * kGyroProton : info.txfrq_mhz;
}

} // namespace

/* ------------------------------------------------------------------------- */
/*  BasisSet                                                                 */
/* ------------------------------------------------------------------------- */
BasisSet::BasisSet(AcquisitionInfo info, std::vector<BasisFunction> functions)
    : info_(std::move(info))
    , functions_(std::move(functions))
{
    if (info_.dwell_time <= 0.0 || info_.txfrq_mhz <= 0.0)
        throw PreconditionError("BasisSet: dwell time and transmitter frequency must be positive");

    std::set<std::string> seen;
    for (const auto& f : functions_) {
        if (f.name.empty())
            throw PreconditionError("BasisSet: unnamed basis function");
        if (!seen.insert(f.name).second)
            throw PreconditionError("BasisSet: duplicate basis function '" + f.name + "'");
        if (f.fid.size() != functions_.front().fid.size())
            throw PreconditionError("BasisSet: basis functions differ in length");
    }
    if (!functions_.empty())
        info_.n_samples = static_cast<int>(functions_.front().fid.size());
    fingerprint_ = compute_fingerprint(info_, functions_);
}

std::vector<std::string> BasisSet::names() const
{
    std::vector<std::string> out;
    out.reserve(functions_.size());
    for (const auto& f : functions_) out.push_back(f.name);
    return out;
}

int BasisSet::index_of(const std::string& name) const
{
    for (std::size_t i = 0; i < functions_.size(); ++i)
        if (functions_[i].name == name) return static_cast<int>(i);
    return -1;
}

BasisSet BasisSet::subset(const std::vector<std::string>& wanted) const
{
    std::vector<BasisFunction> keep;
    for (const auto& f : functions_)
        if (std::find(wanted.begin(), wanted.end(), f.name) != wanted.end())
            keep.push_back(f);
    return BasisSet(info_, std::move(keep));
}

BasisSet BasisSet::with(std::vector<BasisFunction> extra) const
{
    std::vector<BasisFunction> all = functions_;
    for (auto& f : extra) all.push_back(std::move(f));
    return BasisSet(info_, std::move(all));
}

BasisSet BasisSet::normalized() const
{
    double scale = 0.0;
    for (const auto& f : functions_)
        scale = std::max(scale, to_frequency_domain(f.fid).real().maxCoeff());
    if (!(scale > 0.0)) return *this;

    std::vector<BasisFunction> out = functions_;
    for (auto& f : out) f.fid /= scale;
    return BasisSet(info_, std::move(out));
}

Vector BasisSet::ppm() const
{
    return ppm_axis(info_, info_.n_samples);
}

double BasisSet::ppm_min() const { return ppm().minCoeff(); }
double BasisSet::ppm_max() const { return ppm().maxCoeff(); }

double BasisSet::ppm_step() const
{
    return info_.spectral_width() / info_.n_samples / info_.txfrq_mhz;
}

/* ------------------------------------------------------------------------- */
/*  generated functions                                                      */
/* ------------------------------------------------------------------------- */
CVector gaussian_singlet(const AcquisitionInfo& info, int n, double ppm,
                         double fwhm_hz, double amplitude)
{
    const Vector t  = time_axis(info, n);
    const double f  = (info.center_ppm - ppm) * info.txfrq_mhz;
    const double c  = M_PI * fwhm_hz;
    CVector fid(n);
    for (int k = 0; k < n; ++k) {
        const double env = std::exp(-(c * t[k]) * (c * t[k]) / (4.0 * std::log(2.0)));
        fid[k] = amplitude * env * std::polar(1.0, 2.0 * M_PI * f * t[k]);
    }
    return fid;
}

CVector lorentzian_singlet(const AcquisitionInfo& info, int n, double ppm,
                           double fwhm_hz, double amplitude)
{
    const Vector t = time_axis(info, n);
    const double f = (info.center_ppm - ppm) * info.txfrq_mhz;
    CVector fid(n);
    for (int k = 0; k < n; ++k)
        fid[k] = amplitude * std::exp(-M_PI * fwhm_hz * t[k])
                           * std::polar(1.0, 2.0 * M_PI * f * t[k]);
    return fid;
}

std::vector<BasisFunction> macromolecule_basis(const BasisSet& metabolites)
{
    const int cr = metabolites.index_of("Cr");
    if (cr < 0)
        throw PreconditionError("macromolecule_basis: no basis function named 'Cr'");

    const AcquisitionInfo& info  = metabolites.info();
    const int              n     = info.n_samples;
    const double           hzppm = hz_per_ppm_for_width(info);
    const Vector           ppm   = metabolites.ppm();

    /* ---- area of the Cr CH3 singlet ----------------------------------- */
    const Vector cr_real = to_frequency_domain(metabolites[cr].fid).real();
    PeakFitOptions opt;
    opt.fwhm_guess_ppm   = (5.0 * info.b0_tesla / 3.0) / hzppm;
    opt.center_guess_ppm = 3.027;
    if (!(opt.fwhm_guess_ppm > 0.0)) opt.fwhm_guess_ppm = 0.02;

    const double lo = 3.027 - 0.4, hi = 3.027 + 0.4;
    PeakFitResult fit = fit_lorentzians(ppm, cr_real, lo, hi, opt);
    if (!fit.ok)
        throw PreconditionError("macromolecule_basis: Cr singlet fit failed");
    fit.baseline = 0.0;

    const IndexRange win     = ppm_range(ppm, lo, hi);
    const Vector     curve   = evaluate_lorentzians(fit, opt.offsets_ppm, ppm);
    const double     cr_area = curve.segment(win.first, win.count).sum();
    const double     one_proton = cr_area / 3.0;

    /* ---- area of a unit Gaussian -------------------------------------- */
    const double gauss_area =
        to_frequency_domain(gaussian_singlet(info, n, info.center_ppm, 0.1 * hzppm, 1.0))
            .real().sum();
    if (!(std::abs(gauss_area) > 0.0))
        throw PreconditionError("macromolecule_basis: degenerate Gaussian area");

    std::vector<BasisFunction> out;
    for (const auto& def : mm_table()) {
        CVector fid = CVector::Zero(n);
        for (const auto& g : def.parts)
            fid += gaussian_singlet(info, n, g.ppm, g.fwhm_ppm * hzppm,
                                    g.protons * one_proton / gauss_area);
        out.push_back({def.name, std::move(fid)});
    }
    return out;
}

BasisSet water_basis(const AcquisitionInfo& info, int n)
{
    AcquisitionInfo wi = info;
    wi.n_samples = n;
    return BasisSet(wi, {{"H2O", lorentzian_singlet(wi, n, wi.center_ppm, 1.0, 1.0)}});
}

/* ------------------------------------------------------------------------- */
/*  resampling                                                               */
/* ------------------------------------------------------------------------- */
void check_basis_compatible(const BasisSet& basis,
                            const AcquisitionInfo& target,
                            int n_points)
{
    if (basis.empty())
        throw PreconditionError("basis set is empty");

    const Vector grid = ppm_axis(target, n_points);
    const double tol  = 0.5 * basis.ppm_step() * (1.0 + 1e-6);
    if (grid.minCoeff() < basis.ppm_min() - tol || grid.maxCoeff() > basis.ppm_max() + tol)
        throw PreconditionError("basis set does not cover the ppm range of the data");

    const int    n_raw     = target.n_samples > 0 ? target.n_samples : n_points;
    const double data_step = target.spectral_width() / n_raw / target.txfrq_mhz;
    if (basis.ppm_step() > data_step * (1.0 + 1e-9))
        throw PreconditionError("basis set is coarser than the data");
}

ResampledBasis resample_basis(const BasisSet& basis,
                              const AcquisitionInfo& target,
                              int n_points)
{
    check_basis_compatible(basis, target, n_points);

    const Vector src  = basis.ppm();
    const Vector grid = ppm_axis(target, n_points);

    ResampledBasis out;
    out.n_points = n_points;
    for (const auto& f : basis.functions()) {
        const CVector S = to_frequency_domain(f.fid);
        const AkimaSpline re(src, S.real());
        const AkimaSpline im(src, S.imag());

        const Vector r = re(grid);
        const Vector i = im(grid);
        CVector Si(n_points);
        for (int k = 0; k < n_points; ++k) Si[k] = Complex(r[k], i[k]);

        out.names.push_back(f.name);
        out.fids.push_back(to_time_domain(Si));
    }
    return out;
}

} // namespace mrsfit
