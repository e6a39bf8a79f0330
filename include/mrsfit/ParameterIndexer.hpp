#pragma once
/*
 * Maps  (dataset, basis function, lineshape parameter)  to one global
 * position in the parameter vector Levenberg–Marquardt operates on.
 *
 * Layout:  [ nonlinear | amplitudes | baseline coefficients ]
 *
 *   nonlinear, per dataset:   0 ph0 [deg]   1 ph1 [deg/ppm]   2 gauss [1/s²]
 *   nonlinear, per function:    lorentz [Hz]   shift [Hz]
 *
 * tie_datasets   : datasets share every nonlinear slot; per-function slots
 *                  are shared between functions of the same name
 * tie_lineshape  : all functions of a dataset share one lorentz and one
 *                  shift slot
 *
 * `users(k)` lists every (dataset, function, slot) that reads global
 * index k; the cost functor uses it to recompute only what a finite
 * difference step touches.
 */

#include <map>
#include <string>
#include <vector>

namespace mrsfit {

class ParameterIndexer {
public:
    enum Slot { kPh0 = 0, kPh1 = 1, kGauss = 2, kLorentz = 3, kShift = 4 };

    struct Use {
        int dataset;
        int function;      // −1 for ph0/ph1/gauss
        int slot;
    };

    struct Options {
        bool tie_datasets  = false;
        bool tie_lineshape = false;
    };

    /* names[d] = basis function names of dataset d; n_baseline[d] = coefficients */
    void build(const std::vector<std::vector<std::string>>& names,
               const std::vector<int>&                      n_baseline,
               const Options&                               opt)
    {
        const int nd = static_cast<int>(names.size());
        global_.assign(nd, std::vector<int>(3, -1));
        lorentz_.assign(nd, {});
        shift_.assign(nd, {});
        amplitude_.assign(nd, {});
        baseline_offset_.assign(nd, 0);
        baseline_count_ = n_baseline;
        users_.clear();

        int next = 0;
        auto fresh = [&](const Use& u) {
            users_.push_back({u});
            return next++;
        };
        auto share = [&](int gidx, const Use& u) {
            users_[gidx].push_back(u);
            return gidx;
        };

        /* ---- ph0 / ph1 / gauss ------------------------------------------ */
        for (int s = kPh0; s <= kGauss; ++s) {
            int shared = -1;
            for (int d = 0; d < nd; ++d) {
                const Use u{d, -1, s};
                if (opt.tie_datasets && shared >= 0) global_[d][s] = share(shared, u);
                else                                 global_[d][s] = shared = fresh(u);
            }
        }

        /* ---- per-function lorentz / shift ------------------------------- */
        for (int s : {kLorentz, kShift}) {
            std::map<std::string, int> by_name;
            for (int d = 0; d < nd; ++d) {
                auto& dst = (s == kLorentz) ? lorentz_[d] : shift_[d];
                dst.resize(names[d].size());
                int tied_in_dataset = -1;
                for (std::size_t j = 0; j < names[d].size(); ++j) {
                    const Use u{d, static_cast<int>(j), s};
                    int g = -1;
                    if (opt.tie_lineshape) {
                        /* one slot per dataset, or one overall when datasets are tied */
                        const std::string tag = "__lineshape__";
                        if (opt.tie_datasets && by_name.count(tag)) g = share(by_name[tag], u);
                        else if (!opt.tie_datasets && tied_in_dataset >= 0) g = share(tied_in_dataset, u);
                        else {
                            g = fresh(u);
                            tied_in_dataset = g;
                            by_name[tag] = g;
                        }
                    } else if (opt.tie_datasets && by_name.count(names[d][j])) {
                        g = share(by_name[names[d][j]], u);
                    } else {
                        g = fresh(u);
                        by_name[names[d][j]] = g;
                    }
                    dst[j] = g;
                }
            }
        }
        n_nonlinear_ = next;

        /* ---- amplitudes, then baselines --------------------------------- */
        for (int d = 0; d < nd; ++d) {
            amplitude_[d].resize(names[d].size());
            for (std::size_t j = 0; j < names[d].size(); ++j)
                amplitude_[d][j] = next++;
        }
        for (int d = 0; d < nd; ++d) {
            baseline_offset_[d] = next;
            next += n_baseline[d];
        }
        total_ = next;
    }

    int global(int d, int slot)   const { return global_[d][slot]; }
    int lorentz(int d, int j)     const { return lorentz_[d][j]; }
    int shift(int d, int j)       const { return shift_[d][j]; }
    int amplitude(int d, int j)   const { return amplitude_[d][j]; }
    int baseline(int d, int k)    const { return baseline_offset_[d] + k; }
    int baseline_count(int d)     const { return baseline_count_[d]; }

    int n_datasets()  const { return static_cast<int>(global_.size()); }
    int n_functions(int d) const { return static_cast<int>(amplitude_[d].size()); }
    int n_nonlinear() const { return n_nonlinear_; }
    int total()       const { return total_; }

    const std::vector<Use>& users(int k) const { return users_[k]; }

private:
    std::vector<std::vector<int>> global_;
    std::vector<std::vector<int>> lorentz_;
    std::vector<std::vector<int>> shift_;
    std::vector<std::vector<int>> amplitude_;
    std::vector<int>              baseline_offset_;
    std::vector<int>              baseline_count_;
    std::vector<std::vector<Use>> users_;
    int n_nonlinear_ = 0;
    int total_       = 0;
};

} // namespace mrsfit
