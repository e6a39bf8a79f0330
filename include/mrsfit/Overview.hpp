#pragma once
#include "Pipeline.hpp"
#include <map>
#include <vector>

namespace mrsfit {

/*  mean and standard deviation of one condition across a group            */
struct GroupSpectrum {
    ConditionKind kind = ConditionKind::OFF;
    Vector ppm;          // common descending axis
    Vector mean;         // Re spectrum
    Vector sd;
    int    n_datasets = 0;
};

struct OverviewOptions {
    double lo_ppm     = 0.0;
    double hi_ppm     = 4.5;
    int    n_points   = 0;       // 0: resolution of the first dataset
    double align_ppm  = 2.008;   // NAA
    double search_lo  = 1.9;
    double search_hi  = 2.1;
};

/*  every condition present in at least one non-failed dataset.  Each real
 *  spectrum is shifted so its NAA maximum sits at align_ppm and regridded
 *  with an Akima spline.                                                    */
std::map<ConditionKind, GroupSpectrum>
group_overview(const std::vector<DatasetResult>& results,
               const OverviewOptions&            opt = {});

} // namespace mrsfit
