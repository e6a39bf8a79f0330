#include "mrsfit/Overview.hpp"
#include "mrsfit/AkimaSpline.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace mrsfit {

std::map<ConditionKind, GroupSpectrum>
group_overview(const std::vector<DatasetResult>& results, const OverviewOptions& opt)
{
    if (!(opt.hi_ppm > opt.lo_ppm))
        throw PreconditionError("group_overview: empty ppm range");

    /* ---- collect the aligned, regridded spectra per condition ---------- */
    std::map<ConditionKind, std::vector<Vector>> rows;
    std::map<ConditionKind, Vector>              grids;

    for (const DatasetResult& r : results) {
        if (r.failed && r.spectra.empty()) continue;
        for (const auto& [kind, s] : r.spectra) {
            const Vector ppm = s.ppm();
            const Vector re  = s.spectrum().real();

            auto g = grids.find(kind);
            if (g == grids.end()) {
                int n = opt.n_points;
                if (n <= 0) n = std::max<int>(2, static_cast<int>(
                                    ppm_range(ppm, opt.lo_ppm, opt.hi_ppm).count));
                g = grids.emplace(kind, Vector::LinSpaced(n, opt.hi_ppm, opt.lo_ppm)).first;
            }

            double offset = 0.0;
            if (!ppm_range(ppm, opt.search_lo, opt.search_hi).empty())
                offset = opt.align_ppm - find_peak(re, ppm, opt.search_lo, opt.search_hi).ppm;

            const AkimaSpline spline((ppm.array() + offset).matrix(), re);
            rows[kind].push_back(spline(g->second));
        }
    }

    /* ---- statistics ---------------------------------------------------- */
    std::map<ConditionKind, GroupSpectrum> out;
    for (auto& [kind, list] : rows) {
        GroupSpectrum gs;
        gs.kind       = kind;
        gs.ppm        = grids.at(kind);
        gs.n_datasets = static_cast<int>(list.size());

        gs.mean = Vector::Zero(gs.ppm.size());
        for (const Vector& v : list) gs.mean += v;
        gs.mean /= static_cast<double>(list.size());

        gs.sd = Vector::Zero(gs.ppm.size());
        if (list.size() > 1) {
            for (const Vector& v : list) gs.sd.array() += (v - gs.mean).array().square();
            gs.sd = (gs.sd / static_cast<double>(list.size() - 1)).cwiseSqrt();
        }
        out.emplace(kind, std::move(gs));
    }
    return out;
}

} // namespace mrsfit
