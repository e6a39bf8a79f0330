#include "mrsfit/AcquisitionProtocol.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/Powell.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>
#include <array>
#include <map>
#include <numeric>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  enum <-> text                                                            */
/* ------------------------------------------------------------------------- */
SequenceKind sequence_from_string(const std::string& s)
{
    static const std::map<std::string, SequenceKind> lut = {
        {"unedited", SequenceKind::Unedited}, {"MEGA", SequenceKind::MEGA},
        {"HERMES", SequenceKind::HERMES},     {"HERCULES", SequenceKind::HERCULES}
    };
    auto it = lut.find(s);
    if (it == lut.end())
        throw std::invalid_argument("unknown sequence '" + s + "'");
    return it->second;
}

EditTarget edit_target_from_string(const std::string& s)
{
    static const std::map<std::string, EditTarget> lut = {
        {"none", EditTarget::None}, {"GABA", EditTarget::GABA},
        {"GSH", EditTarget::GSH},   {"GABA+GSH", EditTarget::GABA_GSH}
    };
    auto it = lut.find(s);
    if (it == lut.end())
        throw std::invalid_argument("unknown editing target '" + s + "'");
    return it->second;
}

const char* to_string(SequenceKind s)
{
    switch (s) {
        case SequenceKind::Unedited: return "unedited";
        case SequenceKind::MEGA:     return "MEGA";
        case SequenceKind::HERMES:   return "HERMES";
        case SequenceKind::HERCULES: return "HERCULES";
    }
    return "?";
}

const char* to_string(EditTarget t)
{
    switch (t) {
        case EditTarget::None:     return "none";
        case EditTarget::GABA:     return "GABA";
        case EditTarget::GSH:      return "GSH";
        case EditTarget::GABA_GSH: return "GABA+GSH";
    }
    return "?";
}

namespace {

double window_peak(const ProcessedSpectrum& s, const PpmWindow& w)
{
    return find_peak(s.spectrum().cwiseAbs(), s.ppm(), w.lo_ppm, w.hi_ppm).value;
}

/*  max over the window of |S_a| − |S_b|                                     */
double max_abs_difference(const ProcessedSpectrum& a,
                          const ProcessedSpectrum& b,
                          const PpmWindow&         w)
{
    const Vector     ppm = a.ppm();
    const IndexRange r   = ppm_range(ppm, w.lo_ppm, w.hi_ppm);
    if (r.empty())
        throw PreconditionError("classification window outside the spectral range");
    const Vector d = a.spectrum().segment(r.first, r.count).cwiseAbs()
                   - b.spectrum().segment(r.first, r.count).cwiseAbs();
    return d.maxCoeff();
}

void check_subspectra(const std::vector<ProcessedSpectrum>& s, int expected, const char* who)
{
    if (static_cast<int>(s.size()) != expected)
        throw PreconditionError(std::string(who) + ": expected "
                                + std::to_string(expected) + " sub-spectra, got "
                                + std::to_string(s.size()));
    for (const auto& x : s)
        if (x.fid.size() != s.front().fid.size())
            throw PreconditionError(std::string(who) + ": sub-spectra differ in length");
}

AlignmentRecord merge_alignment(const std::vector<const AlignmentRecord*>& parts)
{
    AlignmentRecord out;
    auto cat = [&](Vector AlignmentRecord::*field) {
        Eigen::Index n = 0;
        for (auto* p : parts) n += (p->*field).size();
        Vector v(n);
        Eigen::Index k = 0;
        for (auto* p : parts) {
            v.segment(k, (p->*field).size()) = p->*field;
            k += (p->*field).size();
        }
        out.*field = v;
    };
    cat(&AlignmentRecord::fs);
    cat(&AlignmentRecord::phs);
    cat(&AlignmentRecord::weights);
    cat(&AlignmentRecord::drift_pre);
    cat(&AlignmentRecord::drift_post);
    for (auto* p : parts) {
        out.aligned  = out.aligned  || p->aligned;
        out.degraded = out.degraded || p->degraded;
    }
    return out;
}

ProcessedSpectrum derived(ConditionKind            kind,
                          const ProcessedSpectrum& base,
                          CVector                  fid,
                          const AlignmentRecord&   alignment,
                          bool                     switch_order)
{
    ProcessedSpectrum out = base.with_fid(std::move(fid));
    out.kind         = kind;
    out.alignment    = alignment;
    out.switch_order = switch_order;
    return out;
}

/*  p = [fs_hz, phs_deg]; residual Re(S_fixed − S_moving(p)) in the window   */
struct SubspecCost {
    const CVector&    fixed;
    const CVector&    moving;
    const IndexRange& win;
    double            dwell;

    void operator()(const Eigen::VectorXd& p,
                    Eigen::VectorXd*       r,
                    Eigen::MatrixXd*       /*J*/) const
    {
        const CVector S = to_frequency_domain(phase_shift(freq_shift(moving, p[0], dwell), p[1]));
        *r = (fixed.segment(win.first, win.count) - S.segment(win.first, win.count)).real();
    }
};

} // namespace

/* ------------------------------------------------------------------------- */
SubspecAlignment align_subspectrum(const ProcessedSpectrum& fixed,
                                   ProcessedSpectrum&       moving,
                                   const PpmWindow&         reporter)
{
    const IndexRange win = ppm_range(fixed.ppm(), reporter.lo_ppm, reporter.hi_ppm);
    if (win.count < 4)
        throw PreconditionError("align_subspectrum: reporter window outside the spectrum");

    const CVector Sf = fixed.spectrum();
    SubspecCost cost{Sf, moving.fid, win, moving.info.dwell_time};

    Eigen::VectorXd p = Eigen::VectorXd::Zero(2);
    const std::vector<bool>   free {true, true};
    const std::vector<double> lo {-20.0, -180.0};
    const std::vector<double> hi { 20.0,  180.0};

    const PowellSolverSummary s = powell(cost, p, free, lo, hi);

    SubspecAlignment out;
    out.fs_hz     = p[0];
    out.phs_deg   = p[1];
    out.converged = s.converged;
    moving = moving.with_fid(phase_shift(freq_shift(moving.fid, p[0], moving.info.dwell_time), p[1]));
    return out;
}

PpmWindow AcquisitionProtocol::quality_window(ConditionKind kind) const
{
    switch (kind) {
        case ConditionKind::OFF:   return {1.8, 2.2};
        case ConditionKind::REF:
        case ConditionKind::WATER: return {4.2, 5.2};
        case ConditionKind::MM:    return {0.7, 1.1};
        default:                   return {2.8, 3.2};
    }
}

std::unique_ptr<AcquisitionProtocol> make_protocol(SequenceKind seq, EditTarget target)
{
    switch (seq) {
        case SequenceKind::Unedited:
            return std::make_unique<UneditedProtocol>();
        case SequenceKind::MEGA:
            if (target != EditTarget::GABA && target != EditTarget::GSH)
                throw UnsupportedError(std::string("MEGA editing of ") + to_string(target));
            return std::make_unique<MegaProtocol>(target);
        case SequenceKind::HERMES:
        case SequenceKind::HERCULES:
            if (target != EditTarget::GABA_GSH)
                throw UnsupportedError(std::string(to_string(seq)) + " editing of "
                                       + to_string(target));
            return std::make_unique<HermesProtocol>(seq == SequenceKind::HERCULES);
    }
    throw UnsupportedError("sequence");
}

/* ------------------------------------------------------------------------- */
/*  unedited                                                                 */
/* ------------------------------------------------------------------------- */
EditedSubspectra UneditedProtocol::classify(std::vector<ProcessedSpectrum> s) const
{
    check_subspectra(s, 1, "unedited");
    EditedSubspectra e;
    e.spectra = std::move(s);
    e.spectra.front().kind = ConditionKind::OFF;
    return e;
}

ConditionMap UneditedProtocol::combine(const EditedSubspectra& e) const
{
    return {{ConditionKind::OFF, e.spectra.front()}};
}

/* ------------------------------------------------------------------------- */
/*  MEGA                                                                     */
/* ------------------------------------------------------------------------- */
MegaProtocol::MegaProtocol(EditTarget target) : target_(target)
{
    if (target_ != EditTarget::GABA && target_ != EditTarget::GSH)
        throw UnsupportedError(std::string("MEGA editing of ") + to_string(target_));
}

PpmWindow MegaProtocol::classification_window() const
{
    return target_ == EditTarget::GABA ? PpmWindow{1.7, 2.3} : PpmWindow{4.5, 4.9};
}

PpmWindow MegaProtocol::reporter_window() const
{
    return target_ == EditTarget::GABA ? PpmWindow{2.8, 3.3} : PpmWindow{1.8, 2.2};
}

EditedSubspectra MegaProtocol::classify(std::vector<ProcessedSpectrum> s) const
{
    check_subspectra(s, 2, "MEGA");
    const PpmWindow w = classification_window();

    /* the OFF spectrum carries the larger signal in the window */
    const bool a_is_off = max_abs_difference(s[0], s[1], w) > max_abs_difference(s[1], s[0], w);

    EditedSubspectra e;
    e.switch_order = !a_is_off;
    if (a_is_off) e.spectra = {std::move(s[0]), std::move(s[1])};
    else          e.spectra = {std::move(s[1]), std::move(s[0])};
    e.spectra[0].kind = ConditionKind::OFF;
    e.spectra[1].kind = ConditionKind::ON;
    for (auto& x : e.spectra) x.switch_order = e.switch_order;
    return e;
}

void MegaProtocol::align(EditedSubspectra& e) const
{
    check_subspectra(e.spectra, 2, "MEGA");
    align_subspectrum(e.spectra[0], e.spectra[1], reporter_window());
}

ConditionMap MegaProtocol::combine(const EditedSubspectra& e) const
{
    check_subspectra(e.spectra, 2, "MEGA");
    const ProcessedSpectrum& off = e.spectra[0];
    const ProcessedSpectrum& on  = e.spectra[1];
    const AlignmentRecord    all = merge_alignment({&off.alignment, &on.alignment});

    ConditionMap out;
    out[ConditionKind::OFF]   = off;
    out[ConditionKind::ON]    = on;
    out[ConditionKind::SUM]   = derived(ConditionKind::SUM,   off, off.fid + on.fid, all, e.switch_order);
    out[ConditionKind::DIFF1] = derived(ConditionKind::DIFF1, off, on.fid - off.fid, all, e.switch_order);
    out[ConditionKind::OFF].switch_order = e.switch_order;
    out[ConditionKind::ON].switch_order  = e.switch_order;
    return out;
}

std::vector<ConditionKind> MegaProtocol::conditions() const
{
    return {ConditionKind::OFF, ConditionKind::ON, ConditionKind::DIFF1, ConditionKind::SUM};
}

std::vector<ConditionKind> MegaProtocol::fit_conditions() const
{
    return {ConditionKind::DIFF1, ConditionKind::SUM};
}

/* ------------------------------------------------------------------------- */
/*  HERMES / HERCULES                                                        */
/* ------------------------------------------------------------------------- */
EditedSubspectra HermesProtocol::classify(std::vector<ProcessedSpectrum> s) const
{
    check_subspectra(s, 4, name());

    std::array<double, 4> naa{}, water{};
    for (int i = 0; i < 4; ++i) {
        naa[i]   = window_peak(s[i], {1.9, 2.1});
        water[i] = window_peak(s[i], {4.5, 4.9});
    }

    /* the two smallest NAA peaks are GABA-on, the two smallest water peaks GSH-on */
    auto two_smallest = [](const std::array<double, 4>& v) {
        std::array<int, 4> idx{0, 1, 2, 3};
        std::stable_sort(idx.begin(), idx.end(), [&](int a, int b) { return v[a] < v[b]; });
        std::array<bool, 4> on{};
        on[idx[0]] = on[idx[1]] = true;
        return on;
    };
    const auto gaba_on = two_smallest(naa);
    const auto gsh_on  = two_smallest(water);

    /* slot = 1·GABA-on + 2·GSH-on  ->  A, B, C, D */
    std::array<int, 4> slot_of{};
    std::array<int, 4> used{};
    for (int i = 0; i < 4; ++i) {
        slot_of[i] = (gaba_on[i] ? 1 : 0) + (gsh_on[i] ? 2 : 0);
        ++used[slot_of[i]];
    }
    for (int k = 0; k < 4; ++k)
        if (used[k] != 1)
            throw PreconditionError(std::string(name())
                                    + ": sub-spectra do not follow the Hadamard editing scheme");

    EditedSubspectra e;
    e.spectra.resize(4);
    for (int i = 0; i < 4; ++i) {
        if (slot_of[i] != i) e.switch_order = true;
        e.spectra[slot_of[i]] = std::move(s[i]);
    }
    e.spectra[0].kind = ConditionKind::OFF;
    for (int k = 1; k < 4; ++k) e.spectra[k].kind = ConditionKind::ON;
    for (auto& x : e.spectra) x.switch_order = e.switch_order;
    return e;
}

void HermesProtocol::align(EditedSubspectra& e) const
{
    check_subspectra(e.spectra, 4, name());
    for (int k = 1; k < 4; ++k)
        align_subspectrum(e.spectra[0], e.spectra[k], {2.8, 3.3});
}

ConditionMap HermesProtocol::combine(const EditedSubspectra& e) const
{
    check_subspectra(e.spectra, 4, name());
    const auto& A = e.spectra[0];
    const auto& B = e.spectra[1];
    const auto& C = e.spectra[2];
    const auto& D = e.spectra[3];
    const AlignmentRecord all = merge_alignment({&A.alignment, &B.alignment,
                                                 &C.alignment, &D.alignment});

    ConditionMap out;
    out[ConditionKind::OFF]   = A;
    out[ConditionKind::OFF].switch_order = e.switch_order;
    out[ConditionKind::DIFF1] = derived(ConditionKind::DIFF1, A,
                                        (B.fid + D.fid) - (A.fid + C.fid), all, e.switch_order);
    out[ConditionKind::DIFF2] = derived(ConditionKind::DIFF2, A,
                                        (C.fid + D.fid) - (A.fid + B.fid), all, e.switch_order);
    out[ConditionKind::SUM]   = derived(ConditionKind::SUM, A,
                                        A.fid + B.fid + C.fid + D.fid, all, e.switch_order);
    return out;
}

std::vector<ConditionKind> HermesProtocol::conditions() const
{
    return {ConditionKind::OFF, ConditionKind::DIFF1, ConditionKind::DIFF2, ConditionKind::SUM};
}

std::vector<ConditionKind> HermesProtocol::fit_conditions() const
{
    return {ConditionKind::DIFF1, ConditionKind::DIFF2, ConditionKind::SUM};
}

} // namespace mrsfit
