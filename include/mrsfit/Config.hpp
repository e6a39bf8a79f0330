#pragma once
#include "Signal.hpp"
#include "AcquisitionProtocol.hpp"
#include "Alignment.hpp"
#include "WaterRemoval.hpp"
#include "ModelFit.hpp"
#include "Referencing.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Everything that controls the processing of one dataset                   */
/* ------------------------------------------------------------------------- */
struct ProcessingConfig {
    SequenceKind    sequence  = SequenceKind::Unedited;
    EditTarget      target    = EditTarget::None;
    ReferenceMethod reference = ReferenceMethod::CrCho;

    bool eddy_current_correction = true;
    bool remove_water            = true;
    bool correct_polarity        = true;
    bool phase_cr_cho            = true;
    bool add_macromolecules      = false;
    bool fit_metabolites         = true;
    bool fit_water               = true;

    AlignmentOptions    alignment;
    WaterRemovalOptions water;
    ModelFit::Config    fit;
    ModelFit::Config    water_fit = default_water_fit();

    /*  [2.0, 7.4] ppm, a single H2O function, no reduced stage              */
    static ModelFit::Config default_water_fit();
};

/*  keys missing in `j` keep their defaults; unknown enum strings throw      */
ProcessingConfig processing_config_from_json(const nlohmann::json& j);

/* ------------------------------------------------------------------------- */
/*  Job file: where the data lives                                           */
/* ------------------------------------------------------------------------- */
struct SignalSource {
    std::string path;
    int  averages = 1;
    int  coils    = 1;
    int  subspecs = 1;
    bool averaged = false;
};

struct DatasetSource {
    std::string                 label;
    SignalSource                metabolite;
    std::optional<SignalSource> reference;
    std::optional<SignalSource> water;
    std::optional<SignalSource> mm;
};

struct BasisSource {
    AcquisitionInfo info;                                      // n_samples from the files
    std::vector<std::pair<std::string, std::string>> files;    // name -> path
    bool normalize = true;
};

struct JobConfig {
    AcquisitionInfo            acquisition;
    std::vector<DatasetSource> datasets;
    BasisSource                basis;
    ProcessingConfig           processing;
    std::string                output_dir = ".";
};

AcquisitionInfo acquisition_from_json(const nlohmann::json& j);
JobConfig       job_config_from_json(const nlohmann::json& j);

} // namespace mrsfit
