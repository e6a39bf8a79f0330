// src/mock_data_generator.cpp

#include "mrsfit/Synthetic.hpp"
#include "mrsfit/SignalLoaders.hpp"
#include "mrsfit/SpectralOps.hpp"
#include "mrsfit/AcquisitionProtocol.hpp"
#include "mrsfit/JsonUtils.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <random>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <algorithm>
#include <thread>
#include <mutex>
#include <atomic>
#include <map>
#include <sstream>
#include <stdexcept>
#include <iostream>

namespace fs = std::filesystem;
using namespace mrsfit;

// Parameter distribution types
enum class DistributionType {
    Fixed,
    Gaussian,
    Uniform
};

// Parameter configuration
struct ParameterConfig {
    DistributionType type = DistributionType::Fixed;
    double value = 0.0;
    double error = 0.0;  // for Gaussian
    double min = 0.0;    // for Uniform
    double max = 0.0;    // for Uniform

    double sample(std::mt19937& rng) const {
        switch(type) {
            case DistributionType::Fixed:
                return value;
            case DistributionType::Gaussian: {
                std::normal_distribution<> dist(value, error);
                return dist(rng);
            }
            case DistributionType::Uniform: {
                std::uniform_real_distribution<> dist(min, max);
                return dist(rng);
            }
        }
        return value;
    }

    static ParameterConfig from_string(const std::string& str) {
        ParameterConfig config;
        if (str.find(',') != std::string::npos) {
            // Gaussian: mean,sigma
            auto pos = str.find(',');
            config.type = DistributionType::Gaussian;
            config.value = std::stod(str.substr(0, pos));
            config.error = std::stod(str.substr(pos + 1));
        } else if (str.find(':') != std::string::npos) {
            // Uniform: min:max
            auto pos = str.find(':');
            config.type = DistributionType::Uniform;
            config.min = std::stod(str.substr(0, pos));
            config.max = std::stod(str.substr(pos + 1));
        } else {
            config.type = DistributionType::Fixed;
            config.value = std::stod(str);
        }
        return config;
    }

    std::string to_string() const {
        switch(type) {
            case DistributionType::Fixed:
                return "Fixed(" + std::to_string(value) + ")";
            case DistributionType::Gaussian:
                return "Gaussian(" + std::to_string(value) + "±" + std::to_string(error) + ")";
            case DistributionType::Uniform:
                return "Uniform[" + std::to_string(min) + "," + std::to_string(max) + "]";
        }
        return "";
    }
};

// Main configuration structure
struct MockDataConfig {
    int num_datasets = 4;

    // Acquisition
    int    n_points = 2048;
    double b0       = 2.89;
    double sw       = 2000.0;
    int    averages = 32;

    SequenceKind sequence = SequenceKind::Unedited;
    EditTarget   target   = EditTarget::None;
    bool shuffle_subspectra = true;     // random OFF/ON order per dataset

    // Transient jitter
    ParameterConfig noise{DistributionType::Uniform, 0.0, 0.0, 0.5, 2.0};
    ParameterConfig freq_sd{DistributionType::Fixed, 2.0};
    ParameterConfig phase_sd{DistributionType::Fixed, 5.0};
    ParameterConfig linewidth{DistributionType::Uniform, 0.0, 0.0, 3.0, 6.0};
    ParameterConfig water{DistributionType::Fixed, 50.0};   // residual water amplitude
    ParameterConfig drift{DistributionType::Gaussian, 0.0, 3.0};   // Hz, whole dataset

    // Concentrations (protons scale with the library)
    std::map<std::string, ParameterConfig> concentrations = {
        {"NAA",  {DistributionType::Gaussian, 10.0, 1.0}},
        {"Cr",   {DistributionType::Gaussian,  8.0, 0.8}},
        {"GPC",  {DistributionType::Gaussian,  2.0, 0.2}},
        {"Glu",  {DistributionType::Gaussian,  9.0, 1.0}},
        {"Ins",  {DistributionType::Gaussian,  6.0, 0.6}},
        {"GABA", {DistributionType::Gaussian,  1.5, 0.2}},
        {"Lac",  {DistributionType::Fixed,     0.5}},
        {"GSH",  {DistributionType::Gaussian,  1.5, 0.2}}
    };

    bool   with_reference     = true;
    double reference_amplitude = 5000.0;

    std::string output_dir = "./mock_data/";
    unsigned    seed       = 0;      // 0: random device
    bool verbose = false;
    int  num_threads = 1;
};

// Progress tracking
struct GenerationProgress {
    std::atomic<int> current{0};
    std::atomic<int> total{0};
    std::atomic<bool> failed{false};
    std::mutex status_mutex;
    std::string status_message;
    std::string error_message;
    bool verbose = false;

    void fail(const std::string& msg) {
        std::lock_guard<std::mutex> lock(status_mutex);
        if (!failed.exchange(true)) error_message = msg;
    }

    void update_status(const std::string& msg) {
        std::lock_guard<std::mutex> lock(status_mutex);
        status_message = msg;
        if (verbose) {
            std::cout << "\r" << msg << std::flush;
        }
    }
};

// True parameters of one dataset
struct DatasetTruth {
    std::map<std::string, double> concentrations;
    double linewidth_hz = 4.0;
    double noise_sd     = 1.0;
    double freq_sd_hz   = 0.0;
    double phase_sd_deg = 0.0;
    double drift_hz     = 0.0;
    double water        = 0.0;
    bool   swapped      = false;
    unsigned seed       = 1;
};

// Peaks seen in the OFF acquisition
std::vector<SyntheticPeak> off_peaks(const DatasetTruth& truth) {
    std::vector<SyntheticPeak> peaks;
    for (const auto& [name, conc] : truth.concentrations) {
        for (auto p : metabolite_peaks(name, truth.linewidth_hz)) {
            p.amplitude *= conc;
            peaks.push_back(p);
        }
    }
    if (truth.water > 0.0)
        peaks.push_back({4.68, truth.water, 2.0 * truth.linewidth_hz, 0.0});
    return peaks;
}

// Editing pulse: the target resonance under the pulse is saturated and its
// coupled partner flips sign, so it survives in ON - OFF.
std::vector<SyntheticPeak> on_peaks(const DatasetTruth& truth, EditTarget target) {
    std::vector<SyntheticPeak> peaks = off_peaks(truth);
    auto edit = [&](const std::string& name, double pulse_ppm, double partner_ppm) {
        if (!truth.concentrations.count(name)) return;
        for (auto& p : peaks) {
            if (std::abs(p.ppm - pulse_ppm) < 1e-6)   p.amplitude = 0.0;
            if (std::abs(p.ppm - partner_ppm) < 1e-6) p.amplitude = -p.amplitude;
        }
    };
    if (target == EditTarget::GABA || target == EditTarget::GABA_GSH) {
        edit("GABA", 1.89, 3.01);
        // NAA aspartyl protons sit under the 1.9 ppm pulse as well
        for (auto& p : peaks)
            if (std::abs(p.ppm - 2.008) < 1e-6) p.amplitude *= 0.5;
    }
    if (target == EditTarget::GSH || target == EditTarget::GABA_GSH) {
        edit("GSH", 4.56, 2.95);
        // the 4.56 ppm pulse clips the residual water
        for (auto& p : peaks)
            if (std::abs(p.ppm - 4.68) < 1e-6) p.amplitude *= 0.5;
    }
    return peaks;
}

std::vector<CVector> build_subspectra(const AcquisitionInfo& info, int n,
                                      const DatasetTruth& truth,
                                      const MockDataConfig& config) {
    const CVector off = synthetic_fid(info, n, off_peaks(truth));
    std::vector<CVector> subs;
    switch (config.sequence) {
        case SequenceKind::Unedited:
            subs = {off};
            break;
        case SequenceKind::MEGA:
            subs = {off, synthetic_fid(info, n, on_peaks(truth, config.target))};
            break;
        case SequenceKind::HERMES:
        case SequenceKind::HERCULES:
            // A = off/off, B = GABA-on, C = GSH-on, D = on/on
            subs = {off,
                    synthetic_fid(info, n, on_peaks(truth, EditTarget::GABA)),
                    synthetic_fid(info, n, on_peaks(truth, EditTarget::GSH)),
                    synthetic_fid(info, n, on_peaks(truth, EditTarget::GABA_GSH))};
            break;
    }
    if (truth.swapped) std::reverse(subs.begin(), subs.end());

    for (auto& s : subs) s = freq_shift(s, truth.drift_hz, info.dwell_time);
    return subs;
}

nlohmann::json signal_entry(const std::string& file, int averages, int subspecs) {
    return {{"file", file}, {"averages", averages}, {"coils", 1}, {"subspecs", subspecs}};
}

// Write one dataset directory
void generate_dataset(
    const MockDataConfig& config,
    const AcquisitionInfo& info,
    const DatasetTruth& truth,
    int set_idx,
    int n_sub
) {
    std::stringstream ss;
    ss << config.output_dir << "/" << std::setfill('0') << std::setw(4) << (set_idx + 1);
    const std::string set_dir = ss.str();
    fs::create_directories(set_dir);

    TransientOptions opt;
    opt.n_averages   = config.averages;
    opt.freq_sd_hz   = truth.freq_sd_hz;
    opt.phase_sd_deg = truth.phase_sd_deg;
    opt.noise_sd     = truth.noise_sd;
    opt.seed         = truth.seed;

    const TimeDomainSignal metab =
        synthetic_signal(info, build_subspectra(info, config.n_points, truth, config), opt);
    write_complex_columns(set_dir + "/metabolite.txt", metab.fids(),
                          "metabolite FIDs, " + std::to_string(config.averages)
                          + " averages x " + std::to_string(n_sub) + " sub-spectra");

    nlohmann::json metadata;
    metadata["set_index"]      = set_idx + 1;
    metadata["concentrations"] = truth.concentrations;
    metadata["linewidth_hz"]   = truth.linewidth_hz;
    metadata["noise_sd"]       = truth.noise_sd;
    metadata["freq_sd_hz"]     = truth.freq_sd_hz;
    metadata["phase_sd_deg"]   = truth.phase_sd_deg;
    metadata["drift_hz"]       = truth.drift_hz;
    metadata["water"]          = truth.water;
    metadata["swapped"]        = truth.swapped;
    metadata["metabolite"]     = signal_entry(set_dir + "/metabolite.txt",
                                              config.averages, n_sub);

    if (config.with_reference) {
        TransientOptions ropt;
        ropt.n_averages = 1;
        ropt.noise_sd   = truth.noise_sd;
        ropt.seed       = truth.seed + 1;
        const CVector ref = freq_shift(
            synthetic_fid(info, config.n_points,
                          {{4.68, config.reference_amplitude, truth.linewidth_hz, 0.0}}),
            truth.drift_hz, info.dwell_time);
        write_complex_columns(set_dir + "/reference.txt",
                              synthetic_signal(info, {ref}, ropt).fids(),
                              "unsuppressed water reference");
        metadata["reference"] = signal_entry(set_dir + "/reference.txt", 1, 1);
    }

    std::ofstream meta_file(set_dir + "/metadata.json");
    meta_file << std::setw(2) << metadata;
    meta_file.close();
}

// Worker thread for generation
void generation_worker(
    const MockDataConfig& config,
    const AcquisitionInfo& info,
    const std::vector<DatasetTruth>& truths,
    GenerationProgress& progress,
    int thread_id,
    int start_idx,
    int end_idx
) {
    const int n_sub = make_protocol(config.sequence, config.target)->n_subspectra();

    for(int set_idx = start_idx; set_idx < end_idx; ++set_idx) {
        if (progress.failed) break;
        try {
            generate_dataset(config, info, truths[set_idx], set_idx, n_sub);
        } catch (const std::exception& e) {
            progress.fail("set " + std::to_string(set_idx + 1) + ": " + e.what());
            break;
        }

        progress.current++;
        std::stringstream status;
        status << "Thread " << thread_id << ": Set " << (set_idx + 1)
               << "/" << truths.size()
               << " (" << (100 * progress.current / progress.total) << "%)";
        progress.update_status(status.str());
    }
}

// Load configuration from JSON file
MockDataConfig load_config_from_json(const std::string& filename) {
    MockDataConfig config;
    nlohmann::json j = load_json(filename);
    expand_env(j);

    if (j.contains("num_datasets")) config.num_datasets = j["num_datasets"];
    if (j.contains("n_points")) config.n_points = j["n_points"];
    if (j.contains("b0")) config.b0 = j["b0"];
    if (j.contains("sw")) config.sw = j["sw"];
    if (j.contains("averages")) config.averages = j["averages"];
    if (j.contains("sequence")) config.sequence = sequence_from_string(j["sequence"]);
    if (j.contains("target")) config.target = edit_target_from_string(j["target"]);
    if (j.contains("shuffle_subspectra")) config.shuffle_subspectra = j["shuffle_subspectra"];

    if (j.contains("parameters")) {
        auto& p = j["parameters"];
        if (p.contains("noise")) config.noise = ParameterConfig::from_string(p["noise"]);
        if (p.contains("freq_sd")) config.freq_sd = ParameterConfig::from_string(p["freq_sd"]);
        if (p.contains("phase_sd")) config.phase_sd = ParameterConfig::from_string(p["phase_sd"]);
        if (p.contains("linewidth")) config.linewidth = ParameterConfig::from_string(p["linewidth"]);
        if (p.contains("water")) config.water = ParameterConfig::from_string(p["water"]);
        if (p.contains("drift")) config.drift = ParameterConfig::from_string(p["drift"]);
    }

    if (j.contains("concentrations")) {
        config.concentrations.clear();
        for (const auto& [name, dist] : j["concentrations"].items()) {
            metabolite_peaks(name);    // throws on unknown names
            config.concentrations[name] = ParameterConfig::from_string(dist.get<std::string>());
        }
    }

    if (j.contains("with_reference")) config.with_reference = j["with_reference"];
    if (j.contains("reference_amplitude")) config.reference_amplitude = j["reference_amplitude"];
    if (j.contains("output_dir")) config.output_dir = j["output_dir"];
    if (j.contains("seed")) config.seed = j["seed"];
    if (j.contains("num_threads")) config.num_threads = j["num_threads"];

    return config;
}

// Job file the mrsfit driver reads back
nlohmann::json make_job(const MockDataConfig& config, const AcquisitionInfo& info,
                        const std::string& basis_dir) {
    nlohmann::json job;
    job["acquisition"] = {
        {"dwellTime", info.dwell_time},
        {"txfrq", info.txfrq_mhz},
        {"b0", info.b0_tesla},
        {"te", info.te_ms},
        {"tr", info.tr_ms},
        {"centerPpm", info.center_ppm}
    };
    job["processing"] = {
        {"sequence", to_string(config.sequence)},
        {"target", to_string(config.target)},
        {"reference", "CrCho"},
        {"ecc", config.with_reference},
        {"waterRemoval", true},
        {"fitWater", config.with_reference}
    };
    job["output"] = (fs::path(config.output_dir) / "results").string();

    nlohmann::json datasets = nlohmann::json::array();
    for (int i = 0; i < config.num_datasets; ++i) {
        std::stringstream ss;
        ss << std::setfill('0') << std::setw(4) << (i + 1);
        const fs::path dir = fs::absolute(fs::path(config.output_dir) / ss.str());
        const int n_sub = make_protocol(config.sequence, config.target)->n_subspectra();

        nlohmann::json d;
        d["label"]      = ss.str();
        d["metabolite"] = signal_entry((dir / "metabolite.txt").string(), config.averages, n_sub);
        if (config.with_reference)
            d["reference"] = signal_entry((dir / "reference.txt").string(), 1, 1);
        datasets.push_back(d);
    }
    job["datasets"] = datasets;

    nlohmann::json functions = nlohmann::json::object();
    for (const auto& [name, dist] : config.concentrations)
        functions[name] = (fs::absolute(fs::path(basis_dir)) / (name + ".txt")).string();
    job["basis"] = {{"normalize", false}, {"functions", functions}};
    return job;
}

int main(int argc, char** argv) {
    cxxopts::Options options("mrsfit_mock_data",
                             "Generate synthetic MRS datasets and a matching job file");

    options.add_options()
        ("c,config", "Configuration JSON file", cxxopts::value<std::string>())
        ("n,num-sets", "Number of datasets to generate", cxxopts::value<int>()->default_value("4"))
        ("points", "Samples per FID", cxxopts::value<int>()->default_value("2048"))
        ("b0", "Field strength (T)", cxxopts::value<double>()->default_value("2.89"))
        ("sw", "Spectral width (Hz)", cxxopts::value<double>()->default_value("2000"))
        ("a,averages", "Averages per sub-spectrum", cxxopts::value<int>()->default_value("32"))
        ("sequence", "unedited|MEGA|HERMES|HERCULES", cxxopts::value<std::string>()->default_value("unedited"))
        ("target", "none|GABA|GSH|GABA+GSH", cxxopts::value<std::string>()->default_value("none"))
        ("noise", "Noise SD distribution (value | mean,sigma | min:max)", cxxopts::value<std::string>()->default_value("0.5:2"))
        ("freq-sd", "Per-average frequency jitter (Hz)", cxxopts::value<std::string>()->default_value("2"))
        ("phase-sd", "Per-average phase jitter (deg)", cxxopts::value<std::string>()->default_value("5"))
        ("linewidth", "Lorentzian linewidth (Hz)", cxxopts::value<std::string>()->default_value("3:6"))
        ("water", "Residual water amplitude", cxxopts::value<std::string>()->default_value("50"))
        ("drift", "Dataset frequency offset (Hz)", cxxopts::value<std::string>()->default_value("0,3"))
        ("no-reference", "Do not write a water reference")
        ("seed", "Random seed (0: random)", cxxopts::value<unsigned>()->default_value("0"))
        ("o,output", "Output directory", cxxopts::value<std::string>()->default_value("./mock_data/"))
        ("j,threads", "Number of threads", cxxopts::value<int>()->default_value("1"))
        ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        std::cout << "\nParameter distribution formats:\n"
                  << "  Fixed value:    4\n"
                  << "  Gaussian:       10,1  (mean,sigma)\n"
                  << "  Uniform:        3:6  (min:max)\n"
                  << "\nExample config.json:\n"
                  << "{\n"
                  << "  \"num_datasets\": 8,\n"
                  << "  \"sequence\": \"MEGA\",\n"
                  << "  \"target\": \"GABA\",\n"
                  << "  \"averages\": 64,\n"
                  << "  \"parameters\": {\n"
                  << "    \"noise\": \"0.5:2\",\n"
                  << "    \"linewidth\": \"4,0.5\"\n"
                  << "  },\n"
                  << "  \"concentrations\": {\"NAA\": \"10,1\", \"Cr\": \"8\", \"GABA\": \"1.5,0.2\"}\n"
                  << "}\n";
        return 0;
    }

    MockDataConfig config;

    try {
        if (result.count("config")) {
            config = load_config_from_json(result["config"].as<std::string>());
            std::cout << "Loaded configuration from " << result["config"].as<std::string>() << std::endl;
        } else {
            config.num_datasets = result["num-sets"].as<int>();
            config.n_points     = result["points"].as<int>();
            config.b0           = result["b0"].as<double>();
            config.sw           = result["sw"].as<double>();
            config.averages     = result["averages"].as<int>();
            config.sequence     = sequence_from_string(result["sequence"].as<std::string>());
            config.target       = edit_target_from_string(result["target"].as<std::string>());

            config.noise     = ParameterConfig::from_string(result["noise"].as<std::string>());
            config.freq_sd   = ParameterConfig::from_string(result["freq-sd"].as<std::string>());
            config.phase_sd  = ParameterConfig::from_string(result["phase-sd"].as<std::string>());
            config.linewidth = ParameterConfig::from_string(result["linewidth"].as<std::string>());
            config.water     = ParameterConfig::from_string(result["water"].as<std::string>());
            config.drift     = ParameterConfig::from_string(result["drift"].as<std::string>());

            config.with_reference = !result.count("no-reference");
            config.seed           = result["seed"].as<unsigned>();
            config.output_dir     = result["output"].as<std::string>();
            config.num_threads    = result["threads"].as<int>();
        }
        make_protocol(config.sequence, config.target);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }

    config.verbose = result["verbose"].as<bool>();
    if (config.num_datasets < 1 || config.averages < 1 || config.n_points < 16) {
        std::cerr << "Error: need at least one dataset, one average and 16 points" << std::endl;
        return 1;
    }

    // Print configuration summary
    std::cout << "\n=== Mock Data Generation Configuration ===\n";
    std::cout << "Datasets: " << config.num_datasets << "\n";
    std::cout << "Sequence: " << to_string(config.sequence) << " / " << to_string(config.target) << "\n";
    std::cout << "Geometry: " << config.n_points << " points, " << config.sw << " Hz, "
              << config.b0 << " T\n";
    std::cout << "Averages: " << config.averages << "\n";
    std::cout << "\nParameter distributions:\n";
    std::cout << "  noise: " << config.noise.to_string() << "\n";
    std::cout << "  freq jitter: " << config.freq_sd.to_string() << "\n";
    std::cout << "  phase jitter: " << config.phase_sd.to_string() << "\n";
    std::cout << "  linewidth: " << config.linewidth.to_string() << "\n";
    std::cout << "  water: " << config.water.to_string() << "\n";
    std::cout << "  drift: " << config.drift.to_string() << "\n";
    for (const auto& [name, dist] : config.concentrations)
        std::cout << "  [" << name << "]: " << dist.to_string() << "\n";
    std::cout << "\nOutput: " << config.output_dir << "\n";
    std::cout << "Threads: " << config.num_threads << "\n";
    std::cout << "==========================================\n\n";

    fs::create_directories(config.output_dir);

    std::random_device rd;
    std::mt19937 rng(config.seed ? config.seed : rd());
    std::bernoulli_distribution coin(0.5);

    std::vector<DatasetTruth> truths;
    for (int i = 0; i < config.num_datasets; ++i) {
        DatasetTruth t;
        for (const auto& [name, dist] : config.concentrations)
            t.concentrations[name] = std::max(0.0, dist.sample(rng));
        t.linewidth_hz = std::max(0.5, config.linewidth.sample(rng));
        t.noise_sd     = std::max(0.0, config.noise.sample(rng));
        t.freq_sd_hz   = std::max(0.0, config.freq_sd.sample(rng));
        t.phase_sd_deg = std::max(0.0, config.phase_sd.sample(rng));
        t.drift_hz     = config.drift.sample(rng);
        t.water        = std::max(0.0, config.water.sample(rng));
        t.swapped      = config.sequence == SequenceKind::MEGA && config.shuffle_subspectra && coin(rng);
        t.seed         = static_cast<unsigned>(rng());
        truths.push_back(std::move(t));
    }

    const AcquisitionInfo info = synthetic_acquisition(config.n_points, config.b0, config.sw);

    // Basis set: one noiseless FID per metabolite, narrower than the data
    const std::string basis_dir = (fs::path(config.output_dir) / "basis").string();
    try {
        fs::create_directories(basis_dir);
        std::vector<std::string> names;
        for (const auto& [name, dist] : config.concentrations) names.push_back(name);
        const BasisSet basis = synthetic_basis(info, config.n_points, names);
        for (const auto& f : basis.functions()) {
            CMatrix col(f.fid.size(), 1);
            col.col(0) = f.fid;
            write_complex_columns(basis_dir + "/" + f.name + ".txt", col, f.name + " basis FID");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error writing basis set: " << e.what() << std::endl;
        return 1;
    }

    GenerationProgress progress;
    progress.total = config.num_datasets;
    progress.verbose = config.verbose;

    std::cout << "Generating " << config.num_datasets << " datasets...\n";

    try {
        if(config.num_threads > 1) {
            std::vector<std::jthread> threads;
            const int n_threads = std::min(config.num_threads, config.num_datasets);
            const int sets_per_thread = config.num_datasets / n_threads;

            for(int t = 0; t < n_threads; ++t) {
                const int start_idx = t * sets_per_thread;
                const int end_idx = (t == n_threads - 1) ? config.num_datasets : (t + 1) * sets_per_thread;
                threads.emplace_back(generation_worker,
                                     std::cref(config), std::cref(info), std::cref(truths),
                                     std::ref(progress), t, start_idx, end_idx);
            }
        } else {
            generation_worker(config, info, truths, progress, 0, 0, config.num_datasets);
        }

        if (progress.failed)
            throw std::runtime_error(progress.error_message);

        std::ofstream job_file(fs::path(config.output_dir) / "job.json");
        job_file << std::setw(2) << make_job(config, info, basis_dir);
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n\n=== Generation Complete ===\n";
    std::cout << "Generated " << config.num_datasets << " datasets\n";
    std::cout << "Output location: " << fs::absolute(config.output_dir) << "\n";
    std::cout << "Each directory contains:\n";
    std::cout << "  - metabolite.txt (transients, one re/im column pair each)\n";
    if (config.with_reference)
        std::cout << "  - reference.txt (water reference)\n";
    std::cout << "  - metadata.json (true parameters)\n";
    std::cout << "Run: mrsfit --job " << (fs::path(config.output_dir) / "job.json").string() << "\n";
    return 0;
}
