#include "mrsfit/EddyCurrent.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Errors.hpp"
#include <cmath>

namespace mrsfit {

namespace {

CVector conj_phase_trajectory(const CVector& ref)
{
    Vector phase(ref.size());
    for (Eigen::Index i = 0; i < ref.size(); ++i)
        phase[i] = std::arg(ref[i]);
    const Vector unwrapped = unwrap(phase);

    CVector out(ref.size());
    for (Eigen::Index i = 0; i < ref.size(); ++i)
        out[i] = std::polar(1.0, -unwrapped[i]);
    return out;
}

} // namespace

EccResult eddy_current_correct(const ProcessedSpectrum& metabolite,
                               const TimeDomainSignal&  reference)
{
    if (reference.empty())
        throw PreconditionError("eddy-current correction: empty reference");
    if (!reference.is_combined())
        throw PreconditionError(
            "eddy-current correction: reference must have coils, sub-spectra "
            "and averages combined first");
    if (reference.n_samples() != metabolite.fid.size())
        throw PreconditionError(
            "eddy-current correction: reference and metabolite sample counts differ");

    const CVector ref    = reference.column(0);
    const CVector factor = conj_phase_trajectory(ref);

    EccResult out;
    out.metabolite = metabolite.with_fid(metabolite.fid.cwiseProduct(factor));
    out.metabolite.ecc_applied = true;

    out.reference      = ProcessedSpectrum{};
    out.reference.kind = ConditionKind::REF;
    out.reference.info = reference.info();
    out.reference.fid  = ref.cwiseProduct(factor);
    out.reference.ecc_applied = true;
    out.applied = true;
    return out;
}

EccResult eddy_current_correct(const ProcessedSpectrum& metabolite,
                               const ProcessedSpectrum& reference)
{
    EccResult out = eddy_current_correct(
        metabolite, TimeDomainSignal::from_fid(reference.info, reference.fid));
    /* keep the reference's own provenance */
    ProcessedSpectrum ref = reference.with_fid(out.reference.fid);
    ref.ecc_applied = true;
    out.reference   = std::move(ref);
    return out;
}

double landmark_phase_deg(const ProcessedSpectrum& s, double lo_ppm, double hi_ppm)
{
    const CVector spec = s.spectrum();
    const Vector  ppm  = s.ppm();
    const PeakLocation peak = find_peak(spec.cwiseAbs(), ppm, lo_ppm, hi_ppm);
    return std::arg(spec[peak.index]) * 180.0 / M_PI;
}

EccResult eddy_current_correct_checked(const ProcessedSpectrum& metabolite,
                                       const ProcessedSpectrum& reference,
                                       double lo_ppm,
                                       double hi_ppm)
{
    EccResult out = eddy_current_correct(metabolite, reference);

    out.phase_before_deg = landmark_phase_deg(metabolite,     lo_ppm, hi_ppm);
    out.phase_after_deg  = landmark_phase_deg(out.metabolite, lo_ppm, hi_ppm);

    if (!(2.0 * std::abs(out.phase_before_deg) > std::abs(out.phase_after_deg))) {
        out.metabolite = metabolite;
        out.reference  = reference;
        out.applied    = false;
    }
    return out;
}

} // namespace mrsfit
