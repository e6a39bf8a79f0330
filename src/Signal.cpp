#include "mrsfit/Signal.hpp"
#include "mrsfit/Errors.hpp"
#include "mrsfit/SpectralOps.hpp"
#include <cmath>
#include <utility>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  ConditionKind <-> text                                                   */
/* ------------------------------------------------------------------------- */
const char* to_string(ConditionKind kind)
{
    switch (kind) {
        case ConditionKind::OFF:   return "OFF";
        case ConditionKind::ON:    return "ON";
        case ConditionKind::DIFF1: return "DIFF1";
        case ConditionKind::DIFF2: return "DIFF2";
        case ConditionKind::SUM:   return "SUM";
        case ConditionKind::REF:   return "REF";
        case ConditionKind::WATER: return "WATER";
        case ConditionKind::MM:    return "MM";
    }
    return "?";
}

ConditionKind condition_from_string(const std::string& name)
{
    static const std::map<std::string, ConditionKind> lut = {
        {"OFF", ConditionKind::OFF},     {"ON", ConditionKind::ON},
        {"DIFF1", ConditionKind::DIFF1}, {"DIFF2", ConditionKind::DIFF2},
        {"SUM", ConditionKind::SUM},     {"REF", ConditionKind::REF},
        {"WATER", ConditionKind::WATER}, {"MM", ConditionKind::MM}
    };
    auto it = lut.find(name);
    if (it == lut.end())
        throw std::invalid_argument("unknown condition '" + name + "'");
    return it->second;
}

/* ------------------------------------------------------------------------- */
/*  TimeDomainSignal                                                         */
/* ------------------------------------------------------------------------- */
TimeDomainSignal::TimeDomainSignal(AcquisitionInfo info,
                                   CMatrix         fids,
                                   int             n_averages,
                                   int             n_coils,
                                   int             n_subspecs,
                                   bool            averaged)
    : info_(std::move(info))
    , fids_(std::move(fids))
    , n_averages_(n_averages)
    , n_coils_(n_coils)
    , n_subspecs_(n_subspecs)
    , averaged_(averaged)
{
    if (n_averages_ < 0 || n_coils_ < 1 || n_subspecs_ < 1)
        throw PreconditionError("TimeDomainSignal: invalid axis sizes");
    if (fids_.cols() != static_cast<Eigen::Index>(n_averages_) * n_coils_ * n_subspecs_)
        throw PreconditionError(
            "TimeDomainSignal: column count does not match averages x coils x subspecs");
    if (info_.dwell_time <= 0.0)
        throw PreconditionError("TimeDomainSignal: dwell time must be positive");
    info_.n_samples = static_cast<int>(fids_.rows());
}

TimeDomainSignal TimeDomainSignal::from_fid(const AcquisitionInfo& info,
                                            const CVector&         fid)
{
    CMatrix m = fid;                               // one column
    return TimeDomainSignal(info, std::move(m), 1, 1, 1, true);
}

bool TimeDomainSignal::is_combined() const
{
    return n_averages_ == 1 && n_coils_ == 1 && n_subspecs_ == 1;
}

int TimeDomainSignal::column_index(int avg, int coil, int subspec) const
{
    if (avg < 0 || avg >= n_averages_ || coil < 0 || coil >= n_coils_ ||
        subspec < 0 || subspec >= n_subspecs_)
        throw std::out_of_range("TimeDomainSignal: transient index out of range");
    return avg + n_averages_ * (coil + n_coils_ * subspec);
}

CVector TimeDomainSignal::column(int avg, int coil, int subspec) const
{
    return fids_.col(column_index(avg, coil, subspec));
}

TimeDomainSignal TimeDomainSignal::select_subspec(int subspec) const
{
    const int per_subspec = n_averages_ * n_coils_;
    if (subspec < 0 || subspec >= n_subspecs_)
        throw std::out_of_range("select_subspec: index out of range");
    CMatrix block = fids_.middleCols(static_cast<Eigen::Index>(subspec) * per_subspec,
                                     per_subspec);
    return TimeDomainSignal(info_, std::move(block), n_averages_, n_coils_, 1, averaged_);
}

/* coils are phased on the first point of the first average and weighted
   by that point's magnitude (normalised to unit energy)                     */
TimeDomainSignal TimeDomainSignal::combine_coils() const
{
    if (n_coils_ == 1) return *this;

    std::vector<Complex> w(n_coils_);
    double norm = 0.0;
    for (int c = 0; c < n_coils_; ++c) {
        const Complex p = fids_(0, column_index(0, c, 0));
        norm += std::norm(p);
        w[c]  = std::conj(p);                      // |p| · e^{-i arg p}
    }
    if (norm <= 0.0)
        throw PreconditionError("combine_coils: first point is zero on every coil");
    for (auto& wc : w) wc /= std::sqrt(norm);

    CMatrix out = CMatrix::Zero(fids_.rows(),
                                static_cast<Eigen::Index>(n_averages_) * n_subspecs_);
    for (int s = 0; s < n_subspecs_; ++s)
        for (int a = 0; a < n_averages_; ++a)
            for (int c = 0; c < n_coils_; ++c)
                out.col(a + n_averages_ * s) += w[c] * fids_.col(column_index(a, c, s));

    return TimeDomainSignal(info_, std::move(out), n_averages_, 1, n_subspecs_, averaged_);
}

TimeDomainSignal TimeDomainSignal::with_fids(CMatrix fids, bool averaged) const
{
    const int n_avg = static_cast<int>(fids.cols()) / (n_coils_ * n_subspecs_);
    return TimeDomainSignal(info_, std::move(fids), n_avg, n_coils_, n_subspecs_, averaged);
}

/* ------------------------------------------------------------------------- */
/*  ProcessedSpectrum                                                        */
/* ------------------------------------------------------------------------- */
CVector ProcessedSpectrum::spectrum() const
{
    return to_frequency_domain(fid);
}

Vector ProcessedSpectrum::ppm() const
{
    return ppm_axis(info, static_cast<int>(fid.size()));
}

ProcessedSpectrum ProcessedSpectrum::with_fid(CVector new_fid) const
{
    ProcessedSpectrum out = *this;
    out.fid = std::move(new_fid);
    out.info.n_samples = static_cast<int>(out.fid.size());
    return out;
}

} // namespace mrsfit
