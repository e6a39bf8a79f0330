#include "mrsfit/Config.hpp"
#include "mrsfit/JsonUtils.hpp"
#include "mrsfit/Errors.hpp"

namespace mrsfit {

namespace {

using nlohmann::json;

void read_range(const json& j, const char* key, double& lo, double& hi)
{
    const auto it = j.find(key);
    if (it == j.end()) return;
    const auto r = it->get<std::vector<double>>();
    if (r.size() != 2 || !(r[0] < r[1]))
        throw PreconditionError(std::string("'") + key + "' must be [low, high]");
    lo = r[0];
    hi = r[1];
}

void read_fit(const json& j, ModelFit::Config& c)
{
    read_range(j, "range", c.fit_lo_ppm, c.fit_hi_ppm);
    c.knot_spacing_ppm   = value_or(j, "knotSpacing",       c.knot_spacing_ppm);
    c.zero_fill          = value_or(j, "zeroFill",          c.zero_fill);
    c.reduced_iterations = value_or(j, "reducedIterations", c.reduced_iterations);
    c.full_iterations    = value_or(j, "fullIterations",    c.full_iterations);
    c.skip_reduced       = value_or(j, "skipReduced",       c.skip_reduced);
    c.max_shift_hz       = value_or(j, "maxShiftHz",        c.max_shift_hz);
    c.max_lorentz_hz     = value_or(j, "maxLorentzHz",      c.max_lorentz_hz);
    c.verbose            = value_or(j, "verbose",           c.verbose);
    if (j.contains("style"))
        c.style = fit_style_from_string(j["style"].get<std::string>());
    if (j.contains("reducedSubset"))
        c.reduced_subset = j["reducedSubset"].get<std::vector<std::string>>();
    if (j.contains("refShiftHz"))
        c.ref_shift_hz = j["refShiftHz"].get<double>();

    if (c.knot_spacing_ppm <= 0.0)
        throw PreconditionError("fit: knotSpacing must be positive");
    if (c.zero_fill < 1)
        throw PreconditionError("fit: zeroFill must be >= 1");
}

SignalSource signal_from_json(const json& j)
{
    SignalSource s;
    s.path     = j.at("file").get<std::string>();
    s.averages = value_or(j, "averages", s.averages);
    s.coils    = value_or(j, "coils",    s.coils);
    s.subspecs = value_or(j, "subspecs", s.subspecs);
    s.averaged = value_or(j, "averaged", s.averaged);
    return s;
}

} // namespace

ModelFit::Config ProcessingConfig::default_water_fit()
{
    ModelFit::Config c;
    c.fit_lo_ppm      = 2.0;
    c.fit_hi_ppm      = 7.4;
    c.skip_reduced    = true;
    c.ref_shift_hz    = 0.0;
    c.reference_peaks = {landmarks::Water};
    c.ref_lo_ppm      = 4.2;
    c.ref_hi_ppm      = 5.2;
    return c;
}

ProcessingConfig processing_config_from_json(const json& j)
{
    ProcessingConfig c;
    if (j.contains("sequence"))  c.sequence  = sequence_from_string(j["sequence"].get<std::string>());
    if (j.contains("target"))    c.target    = edit_target_from_string(j["target"].get<std::string>());
    if (j.contains("reference")) c.reference = reference_method_from_string(j["reference"].get<std::string>());

    c.eddy_current_correction = value_or(j, "ecc",               c.eddy_current_correction);
    c.remove_water            = value_or(j, "waterRemoval",      c.remove_water);
    c.correct_polarity        = value_or(j, "polarity",          c.correct_polarity);
    c.phase_cr_cho            = value_or(j, "phaseCrCho",        c.phase_cr_cho);
    c.add_macromolecules      = value_or(j, "macromolecules",    c.add_macromolecules);
    c.fit_metabolites         = value_or(j, "fitMetabolites",    c.fit_metabolites);
    c.fit_water               = value_or(j, "fitWater",          c.fit_water);

    /* the coarse alignment follows the referencing landmarks */
    const ReferenceSpec ref = reference_spec(c.reference);
    c.alignment.coarse_peaks  = ref.peaks;
    c.alignment.coarse_lo_ppm = ref.lo_ppm;
    c.alignment.coarse_hi_ppm = ref.hi_ppm;
    c.alignment.max_lag_ppm   = ref.max_lag_ppm;

    if (j.contains("alignment")) {
        const json& a = j["alignment"];
        read_range(a, "registrationRange", c.alignment.reg_lo_ppm, c.alignment.reg_hi_ppm);
        c.alignment.max_passes       = value_or(a, "maxPasses",       c.alignment.max_passes);
        c.alignment.package_fraction = value_or(a, "packageFraction", c.alignment.package_fraction);
        c.alignment.parallel         = value_or(a, "parallel",        c.alignment.parallel);
    }
    if (j.contains("water")) {
        const json& w = j["water"];
        read_range(w, "range", c.water.lo_ppm, c.water.hi_ppm);
        c.water.max_order = value_or(w, "order",    c.water.max_order);
        c.water.min_order = value_or(w, "minOrder", c.water.min_order);
        if (c.water.min_order < 1 || c.water.min_order > c.water.max_order)
            throw PreconditionError("water: need 1 <= minOrder <= order");
    }
    if (j.contains("fit"))      read_fit(j["fit"], c.fit);
    if (j.contains("waterFit")) read_fit(j["waterFit"], c.water_fit);

    /* validates the sequence / target combination */
    make_protocol(c.sequence, c.target);
    return c;
}

AcquisitionInfo acquisition_from_json(const json& j)
{
    AcquisitionInfo info;
    info.dwell_time = j.at("dwellTime").get<double>();
    info.txfrq_mhz  = j.at("txfrq").get<double>();
    info.b0_tesla   = value_or(j, "b0",        info.txfrq_mhz / 42.577);
    info.te_ms      = value_or(j, "te",        info.te_ms);
    info.tr_ms      = value_or(j, "tr",        info.tr_ms);
    info.center_ppm = value_or(j, "centerPpm", info.center_ppm);
    if (j.contains("voxelSize"))
        info.voxel.size_mm = j["voxelSize"].get<std::array<double, 3>>();
    if (j.contains("voxelCenter"))
        info.voxel.center_mm = j["voxelCenter"].get<std::array<double, 3>>();
    if (info.dwell_time <= 0.0 || info.txfrq_mhz <= 0.0)
        throw PreconditionError("acquisition: dwellTime and txfrq must be positive");
    return info;
}

JobConfig job_config_from_json(const json& j)
{
    JobConfig job;
    job.acquisition = acquisition_from_json(j.at("acquisition"));
    job.processing  = processing_config_from_json(value_or(j, "processing", json::object()));
    job.output_dir  = value_or(j, "output", job.output_dir);

    for (const auto& d : j.at("datasets")) {
        DatasetSource ds;
        ds.metabolite = signal_from_json(d.at("metabolite"));
        ds.label      = value_or(d, "label", ds.metabolite.path);
        if (d.contains("reference")) ds.reference = signal_from_json(d["reference"]);
        if (d.contains("water"))     ds.water     = signal_from_json(d["water"]);
        if (d.contains("mm"))        ds.mm        = signal_from_json(d["mm"]);
        job.datasets.push_back(std::move(ds));
    }

    const json& b = j.at("basis");
    job.basis.info      = b.contains("acquisition") ? acquisition_from_json(b["acquisition"])
                                                    : job.acquisition;
    job.basis.normalize = value_or(b, "normalize", job.basis.normalize);
    for (const auto& [name, path] : b.at("functions").items())
        job.basis.files.emplace_back(name, path.get<std::string>());
    return job;
}

} // namespace mrsfit
