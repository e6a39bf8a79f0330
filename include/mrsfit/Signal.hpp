#pragma once
#include "Types.hpp"
#include <array>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Acquisition metadata shared by every transient of one acquisition        */
/* ------------------------------------------------------------------------- */
struct VoxelGeometry {
    std::array<double,3> size_mm   {0.0, 0.0, 0.0};
    std::array<double,3> center_mm {0.0, 0.0, 0.0};
};

struct AcquisitionInfo {
    double        dwell_time = 0.0;     // s
    int           n_samples  = 0;
    double        txfrq_mhz  = 0.0;     // transmitter frequency
    double        b0_tesla   = 0.0;
    double        te_ms      = 0.0;
    double        tr_ms      = 0.0;
    double        center_ppm = 4.68;    // ppm at 0 Hz offset
    VoxelGeometry voxel;

    double spectral_width() const { return 1.0 / dwell_time; }
    double hz_per_ppm()     const { return txfrq_mhz; }
};

/* ------------------------------------------------------------------------- */
/*  Spectral conditions                                                      */
/* ------------------------------------------------------------------------- */
enum class ConditionKind { OFF, ON, DIFF1, DIFF2, SUM, REF, WATER, MM };

const char*   to_string(ConditionKind kind);
ConditionKind condition_from_string(const std::string& name);

/* ------------------------------------------------------------------------- */
/*  Raw multi-transient signal                                               */
/*                                                                           */
/*  Samples live in one (n_samples × averages·coils·subspecs) matrix; the    */
/*  column of (avg, coil, subspec) is  avg + A·(coil + C·subspec).  The      */
/*  axis order never changes after construction.                             */
/* ------------------------------------------------------------------------- */
class TimeDomainSignal {
public:
    TimeDomainSignal() = default;
    TimeDomainSignal(AcquisitionInfo info,
                     CMatrix         fids,
                     int             n_averages,
                     int             n_coils    = 1,
                     int             n_subspecs = 1,
                     bool            averaged   = false);

    static TimeDomainSignal from_fid(const AcquisitionInfo& info,
                                     const CVector&         fid);

    const AcquisitionInfo& info() const { return info_; }
    const CMatrix&         fids() const { return fids_; }

    int  n_samples()  const { return static_cast<int>(fids_.rows()); }
    int  n_averages() const { return n_averages_; }
    int  n_coils()    const { return n_coils_; }
    int  n_subspecs() const { return n_subspecs_; }

    /* averages were already combined by whoever produced the signal */
    bool averaged()    const { return averaged_; }
    /* exactly one transient left on every non-time axis */
    bool is_combined() const;
    bool empty()       const { return n_averages_ == 0 || fids_.size() == 0; }

    int     column_index(int avg, int coil = 0, int subspec = 0) const;
    CVector column(int avg, int coil = 0, int subspec = 0) const;

    TimeDomainSignal select_subspec(int subspec) const;
    TimeDomainSignal combine_coils() const;
    TimeDomainSignal with_fids(CMatrix fids, bool averaged) const;

private:
    AcquisitionInfo info_;
    CMatrix         fids_;
    int             n_averages_ = 0;
    int             n_coils_    = 1;
    int             n_subspecs_ = 1;
    bool            averaged_   = false;
};

/* ------------------------------------------------------------------------- */
/*  Per-average bookkeeping of the alignment stage                           */
/* ------------------------------------------------------------------------- */
struct AlignmentRecord {
    Vector fs;            // Hz, one per average
    Vector phs;           // deg
    Vector weights;       // [0,1], max == 1
    Vector drift_pre;     // landmark position, ppm
    Vector drift_post;
    bool   aligned = false;
    bool   degraded = false;   // at least one average kept its coarse guess
};

/* ------------------------------------------------------------------------- */
/*  Single-average, corrected spectrum of one condition                      */
/* ------------------------------------------------------------------------- */
struct ProcessedSpectrum {
    ConditionKind   kind = ConditionKind::OFF;
    AcquisitionInfo info;
    CVector         fid;

    AlignmentRecord alignment;
    double ref_shift_hz         = 0.0;
    double ref_fwhm_hz          = std::numeric_limits<double>::quiet_NaN();
    bool   switch_order         = false;
    bool   ecc_applied          = false;
    bool   polarity_flipped     = false;
    bool   water_removal_failed = false;
    int    water_removal_order  = 0;

    CVector spectrum() const;
    Vector  ppm() const;

    /* copy of *this carrying a new FID (provenance untouched) */
    ProcessedSpectrum with_fid(CVector new_fid) const;
};

using ConditionMap = std::map<ConditionKind, ProcessedSpectrum>;

} // namespace mrsfit
