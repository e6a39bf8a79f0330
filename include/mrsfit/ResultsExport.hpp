#pragma once
#include "Pipeline.hpp"
#include "Overview.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mrsfit {

/* --------------------------------------------------------------------- */
/*                      J S O N   r e c o r d s                          */
/* --------------------------------------------------------------------- */
nlohmann::json to_json(const AlignmentRecord& a);
nlohmann::json to_json(const ProcessedSpectrum& s);     // provenance, no samples
nlohmann::json to_json(const FitParameters& p);
nlohmann::json to_json(const QualityMetrics& q);
nlohmann::json to_json(const DatasetResult& r);

/* --------------------------------------------------------------------- */
/*      High-level helper:  write every result file of a batch           */
/*                                                                       */
/*   results.json        one record per dataset                          */
/*   quality.tsv         dataset × condition quality table               */
/*   amplitudes_<C>.tsv  dataset × basis function, per fitted condition  */
/*   overview_<C>.tsv    ppm, mean, sd of the group spectra              */
/* --------------------------------------------------------------------- */
void write_results(const std::string&                            out_dir,
                   const std::vector<DatasetResult>&             results,
                   const std::map<ConditionKind, GroupSpectrum>& overview = {});

void write_quality_table(const std::string&                out_path,
                         const std::vector<DatasetResult>& results);

} // namespace mrsfit
