#include "mrsfit/JsonUtils.hpp"
#include "mrsfit/Config.hpp"
#include "mrsfit/SignalLoaders.hpp"
#include "mrsfit/BasisCache.hpp"
#include "mrsfit/BatchRunner.hpp"
#include "mrsfit/Overview.hpp"
#include "mrsfit/ResultsExport.hpp"
#include "mrsfit/Progress.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <iostream>
#ifdef _OPENMP
  #include <omp.h>
#endif
#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

namespace fs = std::filesystem;
using namespace mrsfit;

namespace {

CancellationToken g_cancel;

extern "C" void on_sigint(int)
{
    g_cancel.cancel();
}

} // namespace

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("mrsfit", "MRS processing and linear-combination model fitting");
        opts.add_options()
            ("job", "Job description JSON", cxxopts::value<std::string>())
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("cache-size", "Maximum number of resampled basis sets kept", cxxopts::value<int>()->default_value("64"))
            ("output", "Output directory (overrides the job file)", cxxopts::value<std::string>())
            ("quiet", "Only print errors and the summary")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("job")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        BasisCache::instance().set_capacity(
            static_cast<std::size_t>(std::max(1, cli["cache-size"].as<int>())));

        // Load configuration
        auto job_json = load_json(cli["job"].as<std::string>());
        expand_env(job_json);
        JobConfig job = job_config_from_json(job_json);
        if (cli.count("output")) job.output_dir = cli["output"].as<std::string>();

        // Setup
        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());

        /* datasets run in parallel; keep the inner levels serial */
        const int outer = std::min<int>(nthreads, static_cast<int>(job.datasets.size()));
#ifdef _OPENMP
        omp_set_num_threads(std::max(1, nthreads / std::max(1, outer)));
#endif
        Eigen::setNbThreads(1);

        std::unique_ptr<ProgressObserver> progress;
        if (!cli.count("quiet")) progress = std::make_unique<ConsoleProgress>();

        // Load the basis
        BasisLibrary bases;
        bases.fallback = std::make_shared<const BasisSet>(load_basis(job.basis));
        std::cout << "Basis: " << bases.fallback->size() << " functions, "
                  << bases.fallback->info().n_samples << " points\n";

        // Load all datasets
        std::vector<DatasetInput> inputs;
        for (const auto& src : job.datasets) {
            DatasetInput in;
            in.label      = src.label;
            in.metabolite = load_signal(src.metabolite, job.acquisition);
            if (src.reference) in.reference = load_signal(*src.reference, job.acquisition);
            if (src.water)     in.water     = load_signal(*src.water,     job.acquisition);
            if (src.mm)        in.mm        = load_signal(*src.mm,        job.acquisition);
            std::cout << "Loaded: " << fs::path(src.metabolite.path).filename()
                      << " (" << in.metabolite.n_samples() << " points, "
                      << in.metabolite.n_averages() << " averages)\n";
            inputs.push_back(std::move(in));
        }

        // Run the batch
        const auto protocol = make_protocol(job.processing.sequence, job.processing.target);
        std::signal(SIGINT, on_sigint);

        BatchRunner runner(*protocol, bases, job.processing,
                           &BasisCache::instance(), progress.get());
        const auto results = runner.run(inputs, static_cast<unsigned>(std::max(1, outer)),
                                        &g_cancel);

        write_results(job.output_dir, results, group_overview(results));

        int failed = 0;
        for (const auto& r : results) {
            if (!r.failed) continue;
            ++failed;
            std::cerr << "Dataset " << r.label << " failed: " << r.message << '\n';
        }
        std::cout << "\nProcessed " << results.size() << " datasets ("
                  << failed << " failed), results in " << job.output_dir << '\n';

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time).count();
    int hours = duration / 3600;
    int minutes = (duration % 3600) / 60;
    int seconds = duration % 60;
    std::cout << "\nTook: ";
    if (hours > 0) std::cout << hours << "h ";
    if (minutes > 0 || hours > 0) std::cout << minutes << "m ";
    std::cout << seconds << "s\n";
    return 0;
}
