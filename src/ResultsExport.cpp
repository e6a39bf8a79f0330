#include "mrsfit/ResultsExport.hpp"
#include "mrsfit/Errors.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

namespace fs = std::filesystem;
using nlohmann::json;

/* ===================================================================== */
/*            H e l p e r s   f o r   t a b l e   f o r m a t t i n g     */
/* ===================================================================== */
namespace mrsfit {

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

static json number(double v)
{
    return std::isfinite(v) ? json(v) : json(nullptr);     // NaN is not JSON
}

static json array(const Vector& v)
{
    json a = json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) a.push_back(number(v[i]));
    return a;
}

static std::ofstream open_or_throw(const fs::path& p)
{
    std::ofstream out(p);
    if (!out)
        throw PreconditionError("cannot write '" + p.string() + "'");
    out << std::setprecision(10);
    return out;
}

static std::string tsv_number(double v)
{
    if (!std::isfinite(v)) return "NaN";
    std::ostringstream s;
    s << std::setprecision(8) << v;
    return s.str();
}

/* ===================================================================== */
/*                       J S O N   r e c o r d s                         */
/* ===================================================================== */
json to_json(const AlignmentRecord& a)
{
    return {
        {"fs_hz",      array(a.fs)},
        {"phs_deg",    array(a.phs)},
        {"weights",    array(a.weights)},
        {"drift_pre",  array(a.drift_pre)},
        {"drift_post", array(a.drift_post)},
        {"aligned",    a.aligned},
        {"degraded",   a.degraded}
    };
}

json to_json(const ProcessedSpectrum& s)
{
    return {
        {"condition",            to_string(s.kind)},
        {"n_samples",            s.fid.size()},
        {"dwell_time",           s.info.dwell_time},
        {"txfrq_mhz",            s.info.txfrq_mhz},
        {"ref_shift_hz",         number(s.ref_shift_hz)},
        {"ref_fwhm_hz",          number(s.ref_fwhm_hz)},
        {"switch_order",         s.switch_order},
        {"ecc_applied",          s.ecc_applied},
        {"polarity_flipped",     s.polarity_flipped},
        {"water_removal_failed", s.water_removal_failed},
        {"water_removal_order",  s.water_removal_order},
        {"alignment",            to_json(s.alignment)}
    };
}

json to_json(const FitParameters& p)
{
    json amps = json::object();
    for (std::size_t j = 0; j < p.names.size(); ++j) {
        const auto k = static_cast<Eigen::Index>(j);
        amps[p.names[j]] = {
            {"amplitude",  number(p.amplitudes[k])},
            {"sd",         number(p.amplitude_sd.size() > k ? p.amplitude_sd[k] : kNaN)},
            {"lorentz_hz", number(p.lorentz_hz.size() > k ? p.lorentz_hz[k] : kNaN)},
            {"shift_hz",   number(p.shift_hz.size() > k ? p.shift_hz[k] : kNaN)}
        };
    }
    return {
        {"condition",        to_string(p.condition)},
        {"stage",            to_string(p.stage)},
        {"message",          p.message},
        {"functions",        amps},
        {"ph0_deg",          number(p.ph0_deg)},
        {"ph1_deg_per_ppm",  number(p.ph1_deg_per_ppm)},
        {"gauss",            number(p.gauss)},
        {"gauss_fwhm_hz",    number(p.gauss_fwhm_hz())},
        {"fit_range_ppm",    {number(p.fit_lo_ppm), number(p.fit_hi_ppm)}},
        {"knot_spacing_ppm", number(p.knot_spacing_ppm)},
        {"baseline",         array(p.baseline)},
        {"ref_shift_hz",     number(p.ref_shift_hz)},
        {"ref_fwhm_hz",      number(p.ref_fwhm_hz)},
        {"chi2",             number(p.chi2)},
        {"iterations",       p.iterations},
        {"converged",        p.converged}
    };
}

json to_json(const QualityMetrics& q)
{
    return {
        {"condition",          to_string(q.condition)},
        {"snr",                number(q.snr)},
        {"der_snr",            number(q.der_snr)},
        {"fwhm_hz",            number(q.fwhm_hz)},
        {"fwhm_ppm",           number(q.fwhm_ppm)},
        {"ref_shift_hz",       number(q.ref_shift_hz)},
        {"mean_freq_shift_hz", number(q.mean_freq_shift_hz)},
        {"avg_delta_cr_ppm",   number(q.avg_delta_cr_ppm)},
        {"drift_pre",          array(q.drift_pre)},
        {"drift_post",         array(q.drift_post)}
    };
}

json to_json(const DatasetResult& r)
{
    json j = {
        {"label",   r.label},
        {"failed",  r.failed},
        {"message", r.message}
    };
    json spectra = json::object(), fits = json::object(), quality = json::object();
    for (const auto& [k, s] : r.spectra) spectra[to_string(k)] = to_json(s);
    for (const auto& [k, p] : r.fits)    fits[to_string(k)]    = to_json(p);
    for (const auto& [k, q] : r.quality) quality[to_string(k)] = to_json(q);
    j["spectra"] = spectra;
    j["fits"]    = fits;
    j["quality"] = quality;
    return j;
}

/* ===================================================================== */
/*                            T a b l e s                                */
/* ===================================================================== */
void write_quality_table(const std::string& out_path,
                         const std::vector<DatasetResult>& results)
{
    auto out = open_or_throw(out_path);
    out << "dataset\tcondition\tSNR\tDER_SNR\tFWHM_Hz\tFWHM_ppm\tfreqShift_Hz\talignShift_Hz\tAvgDeltaCr_ppm\n";
    for (const DatasetResult& r : results) {
        for (const auto& [kind, q] : r.quality) {
            out << r.label << '\t' << to_string(kind) << '\t'
                << tsv_number(q.snr)      << '\t' << tsv_number(q.der_snr)  << '\t'
                << tsv_number(q.fwhm_hz)  << '\t' << tsv_number(q.fwhm_ppm) << '\t'
                << tsv_number(q.ref_shift_hz)       << '\t'
                << tsv_number(q.mean_freq_shift_hz) << '\t'
                << tsv_number(q.avg_delta_cr_ppm)   << '\n';
        }
    }
}

static void write_amplitude_table(const fs::path& path, ConditionKind kind,
                                  const std::vector<DatasetResult>& results)
{
    /* union of names, first-seen order */
    std::vector<std::string> names;
    std::set<std::string>    seen;
    for (const auto& r : results) {
        const auto it = r.fits.find(kind);
        if (it == r.fits.end()) continue;
        for (const auto& n : it->second.names)
            if (seen.insert(n).second) names.push_back(n);
    }

    auto out = open_or_throw(path);
    out << "dataset";
    for (const auto& n : names) out << '\t' << n;
    out << '\n';
    for (const auto& r : results) {
        const auto it = r.fits.find(kind);
        if (it == r.fits.end()) continue;
        out << r.label;
        for (const auto& n : names) out << '\t' << tsv_number(it->second.amplitude(n));
        out << '\n';
    }
}

void write_results(const std::string&                            out_dir,
                   const std::vector<DatasetResult>&             results,
                   const std::map<ConditionKind, GroupSpectrum>& overview)
{
    fs::create_directories(out_dir);
    const fs::path dir(out_dir);

    /* ---------------------------  (1) JSON  ----------------------------*/
    {
        json all = json::array();
        for (const auto& r : results) all.push_back(to_json(r));
        auto out = open_or_throw(dir / "results.json");
        out << all.dump(2) << '\n';
    }

    /* ---------------------------  (2) quality table  -------------------*/
    write_quality_table((dir / "quality.tsv").string(), results);

    /* ---------------------------  (3) amplitudes  ----------------------*/
    std::set<ConditionKind> fitted;
    for (const auto& r : results)
        for (const auto& [k, p] : r.fits) fitted.insert(k);
    for (ConditionKind k : fitted)
        write_amplitude_table(dir / (std::string("amplitudes_") + to_string(k) + ".tsv"),
                              k, results);

    /* ---------------------------  (4) group overview  ------------------*/
    for (const auto& [k, g] : overview) {
        auto out = open_or_throw(dir / (std::string("overview_") + to_string(k) + ".tsv"));
        out << "ppm\tmean\tsd\n";
        for (Eigen::Index i = 0; i < g.ppm.size(); ++i)
            out << g.ppm[i] << '\t' << g.mean[i] << '\t' << g.sd[i] << '\n';
    }
}

} // namespace mrsfit
