#include "mrsfit/Synthetic.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"
#include <cmath>
#include <map>

namespace mrsfit {

namespace {

/*  (ppm, protons) per metabolite                                           */
const std::map<std::string, std::vector<std::pair<double, double>>>& library()
{
    static const std::map<std::string, std::vector<std::pair<double, double>>> lib = {
        {"NAA",  {{2.008, 3.0}, {2.49, 1.0}, {2.67, 1.0}, {4.38, 1.0}}},
        {"Cr",   {{3.027, 3.0}, {3.913, 2.0}}},
        {"GPC",  {{3.212, 9.0}, {3.66, 2.0}, {4.29, 2.0}}},
        {"Glu",  {{2.04, 1.0}, {2.12, 1.0}, {2.34, 2.0}, {3.74, 1.0}}},
        {"Ins",  {{3.27, 1.0}, {3.52, 2.0}, {3.61, 2.0}, {4.05, 1.0}}},
        {"GABA", {{1.89, 2.0}, {2.28, 2.0}, {3.01, 2.0}}},
        {"Lac",  {{1.31, 3.0}, {4.10, 1.0}}},
        {"GSH",  {{2.95, 1.0}, {3.77, 2.0}, {4.56, 1.0}}}
    };
    return lib;
}

} // namespace

AcquisitionInfo synthetic_acquisition(int n, double b0_tesla, double sw_hz)
{
    AcquisitionInfo info;
    info.dwell_time = 1.0 / sw_hz;
    info.n_samples  = n;
    info.b0_tesla   = b0_tesla;
    info.txfrq_mhz  = 42.577 * b0_tesla;
    info.te_ms      = 30.0;
    info.tr_ms      = 2000.0;
    return info;
}

CVector synthetic_fid(const AcquisitionInfo& info, int n,
                      const std::vector<SyntheticPeak>& peaks)
{
    const Vector t = time_axis(info, n);
    CVector fid = CVector::Zero(n);
    for (const auto& p : peaks) {
        const double f = (info.center_ppm - p.ppm) * info.txfrq_mhz;
        const double phi = p.phase_deg * M_PI / 180.0;
        for (int k = 0; k < n; ++k)
            fid[k] += p.amplitude * std::exp(-M_PI * p.lw_hz * t[k])
                                  * std::polar(1.0, 2.0 * M_PI * f * t[k] + phi);
    }
    return fid;
}

CVector add_noise(const CVector& fid, double sigma, std::mt19937& rng)
{
    if (sigma <= 0.0) return fid;
    std::normal_distribution<double> N(0.0, sigma);
    CVector out = fid;
    for (Eigen::Index k = 0; k < out.size(); ++k)
        out[k] += Complex(N(rng), N(rng));
    return out;
}

TimeDomainSignal synthetic_signal(const AcquisitionInfo&      info,
                                  const std::vector<CVector>& subspectra,
                                  const TransientOptions&     opt)
{
    if (subspectra.empty())
        throw PreconditionError("synthetic_signal: no sub-spectra");

    const int n  = static_cast<int>(subspectra.front().size());
    const int na = opt.n_averages;
    const int ns = static_cast<int>(subspectra.size());

    std::mt19937 rng(opt.seed);
    std::normal_distribution<double> df(0.0, opt.freq_sd_hz);
    std::normal_distribution<double> dp(0.0, opt.phase_sd_deg);

    CMatrix fids(n, static_cast<Eigen::Index>(na) * ns);
    for (int s = 0; s < ns; ++s) {
        if (subspectra[s].size() != n)
            throw PreconditionError("synthetic_signal: sub-spectra differ in length");
        for (int a = 0; a < na; ++a) {
            const double fs  = opt.freq_sd_hz   > 0.0 ? df(rng) : 0.0;
            const double phs = opt.phase_sd_deg > 0.0 ? dp(rng) : 0.0;
            CVector fid = phase_shift(freq_shift(subspectra[s], fs, info.dwell_time), phs);
            fids.col(a + na * s) = add_noise(fid, opt.noise_sd, rng);
        }
    }
    AcquisitionInfo i = info;
    i.n_samples = n;
    return TimeDomainSignal(i, std::move(fids), na, 1, ns);
}

std::vector<SyntheticPeak> metabolite_peaks(const std::string& name, double lw_hz)
{
    const auto it = library().find(name);
    if (it == library().end())
        throw PreconditionError("unknown synthetic metabolite '" + name + "'");
    std::vector<SyntheticPeak> peaks;
    for (const auto& [ppm, protons] : it->second)
        peaks.push_back({ppm, protons, lw_hz, 0.0});
    return peaks;
}

std::vector<std::string> synthetic_metabolites()
{
    std::vector<std::string> names;
    for (const auto& [name, peaks] : library()) names.push_back(name);
    return names;
}

BasisSet synthetic_basis(const AcquisitionInfo& info, int n,
                         const std::vector<std::string>& names, double lw_hz)
{
    AcquisitionInfo bi = info;
    bi.n_samples = n;

    std::vector<BasisFunction> functions;
    for (const auto& name : names.empty() ? synthetic_metabolites() : names)
        functions.push_back({name, synthetic_fid(bi, n, metabolite_peaks(name, lw_hz))});
    return BasisSet(bi, std::move(functions));
}

} // namespace mrsfit
