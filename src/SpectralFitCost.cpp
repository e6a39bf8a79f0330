#include "mrsfit/SpectralFitCost.hpp"
#include <cmath>
#include <utility>

namespace mrsfit {

namespace {
constexpr double kDeg = M_PI / 180.0;
}

SpectralFitCost::SpectralFitCost(std::vector<FitDataset> datasets,
                                 const ParameterIndexer& indexer)
    : datasets_(std::move(datasets))
    , indexer_(indexer)
{
    for (const auto& ds : datasets_) {
        row_offset_.push_back(num_residuals_);
        num_residuals_ += static_cast<int>(ds.window.count);
    }
}

/* ------------------------------------------------------------------------- */
/*  model pieces                                                             */
/* ------------------------------------------------------------------------- */
CVector SpectralFitCost::component_with(int d, int j, double lorentz,
                                        double gauss, double shift) const
{
    const FitDataset& ds = datasets_[d];
    const CVector&    b  = ds.basis[j];
    CVector x(b.size());
    for (Eigen::Index k = 0; k < b.size(); ++k) {
        const double t = ds.t[k];
        x[k] = b[k] * std::exp(Complex(-M_PI * lorentz * t - gauss * t * t,
                                       -2.0 * M_PI * shift * t));
    }
    return to_frequency_domain(x).segment(ds.window.first, ds.window.count);
}

CVector SpectralFitCost::component(int d, int j, const Eigen::VectorXd& p) const
{
    return component_with(d, j,
                          p[indexer_.lorentz(d, j)],
                          p[indexer_.global(d, ParameterIndexer::kGauss)],
                          p[indexer_.shift(d, j)]);
}

CVector SpectralFitCost::phase_factor(int d, const Eigen::VectorXd& p) const
{
    const FitDataset& ds  = datasets_[d];
    const double      ph0 = p[indexer_.global(d, ParameterIndexer::kPh0)];
    const double      ph1 = p[indexer_.global(d, ParameterIndexer::kPh1)];
    CVector e(ds.ppm.size());
    for (Eigen::Index i = 0; i < ds.ppm.size(); ++i)
        e[i] = std::polar(1.0, (ph0 + ph1 * (ds.ppm[i] - ds.centre_ppm)) * kDeg);
    return e;
}

Matrix SpectralFitCost::amplitude_design(int d, const Eigen::VectorXd& p) const
{
    const FitDataset& ds = datasets_[d];
    const CVector     e  = phase_factor(d, p);
    Matrix A(ds.window.count, static_cast<Eigen::Index>(ds.basis.size()));
    for (int j = 0; j < static_cast<int>(ds.basis.size()); ++j)
        A.col(j) = e.cwiseProduct(component(d, j, p)).real();
    return A;
}

Vector SpectralFitCost::baseline_part(int d, const Eigen::VectorXd& p) const
{
    const FitDataset& ds = datasets_[d];
    const int K = indexer_.baseline_count(d);
    if (K == 0) return Vector::Zero(ds.window.count);
    return ds.baseline * p.segment(indexer_.baseline(d, 0), K);
}

Vector SpectralFitCost::model(int d, const Eigen::VectorXd& p) const
{
    const FitDataset& ds = datasets_[d];
    const CVector     e  = phase_factor(d, p);
    CVector S = CVector::Zero(ds.window.count);
    for (int j = 0; j < static_cast<int>(ds.basis.size()); ++j)
        S += p[indexer_.amplitude(d, j)] * component(d, j, p);
    return e.cwiseProduct(S).real() + baseline_part(d, p);
}

/* ------------------------------------------------------------------------- */
/*  residuals + Jacobian                                                     */
/* ------------------------------------------------------------------------- */
void SpectralFitCost::operator()(const Eigen::VectorXd& p,
                                 Eigen::VectorXd*       residuals,
                                 Eigen::MatrixXd*       jacobians) const
{
    const int nd = n_datasets();

    /* ---- current components, kept for the Jacobian -------------------- */
    std::vector<std::vector<CVector>> F(nd);
    std::vector<CVector>              E(nd), S(nd);
    for (int d = 0; d < nd; ++d) {
        const int nf = static_cast<int>(datasets_[d].basis.size());
        F[d].resize(nf);
        E[d] = phase_factor(d, p);
        S[d] = CVector::Zero(datasets_[d].window.count);
        for (int j = 0; j < nf; ++j) {
            F[d][j] = component(d, j, p);
            S[d] += p[indexer_.amplitude(d, j)] * F[d][j];
        }
    }

    if (residuals) {
        residuals->resize(num_residuals_);
        for (int d = 0; d < nd; ++d) {
            const Vector m = E[d].cwiseProduct(S[d]).real() + baseline_part(d, p);
            residuals->segment(row_offset_[d], datasets_[d].window.count) = m - datasets_[d].data;
        }
    }

    if (!jacobians) return;
    jacobians->setZero(num_residuals_, indexer_.total());

    /* ========== (A) analytic columns ================================== */
    for (int d = 0; d < nd; ++d) {
        const FitDataset& ds   = datasets_[d];
        const Eigen::Index rows = ds.window.count;
        const int          r0   = row_offset_[d];

        for (int j = 0; j < static_cast<int>(ds.basis.size()); ++j)
            jacobians->block(r0, indexer_.amplitude(d, j), rows, 1) =
                E[d].cwiseProduct(F[d][j]).real();

        for (int k = 0; k < indexer_.baseline_count(d); ++k)
            jacobians->block(r0, indexer_.baseline(d, k), rows, 1) = ds.baseline.col(k);
    }

    /* ========== (B) nonlinear columns ================================= */
    for (int k = 0; k < indexer_.n_nonlinear(); ++k) {
        const double h = 1e-6 * (std::abs(p[k]) + 1.0);

        for (const auto& u : indexer_.users(k)) {
            const FitDataset& ds   = datasets_[u.dataset];
            const Eigen::Index rows = ds.window.count;
            const int          r0   = row_offset_[u.dataset];
            auto col = jacobians->block(r0, k, rows, 1);

            switch (u.slot) {
            case ParameterIndexer::kPh0:
                col += (-E[u.dataset].cwiseProduct(S[u.dataset]).imag() * kDeg).eval();
                break;
            case ParameterIndexer::kPh1:
                col += (-E[u.dataset].cwiseProduct(S[u.dataset]).imag()
                            .cwiseProduct((ds.ppm.array() - ds.centre_ppm).matrix()) * kDeg).eval();
                break;
            case ParameterIndexer::kGauss: {
                const double g = p[k] + h;
                CVector dS = CVector::Zero(rows);
                for (int j = 0; j < static_cast<int>(ds.basis.size()); ++j) {
                    const CVector Fj = component_with(u.dataset, j,
                                                      p[indexer_.lorentz(u.dataset, j)], g,
                                                      p[indexer_.shift(u.dataset, j)]);
                    dS += p[indexer_.amplitude(u.dataset, j)] * (Fj - F[u.dataset][j]);
                }
                col += (E[u.dataset].cwiseProduct(dS).real() / h).eval();
                break;
            }
            case ParameterIndexer::kLorentz:
            case ParameterIndexer::kShift: {
                const int    j  = u.function;
                const double lz = p[indexer_.lorentz(u.dataset, j)] + (u.slot == ParameterIndexer::kLorentz ? h : 0.0);
                const double sh = p[indexer_.shift(u.dataset, j)]   + (u.slot == ParameterIndexer::kShift   ? h : 0.0);
                const double g  = p[indexer_.global(u.dataset, ParameterIndexer::kGauss)];
                const CVector Fj = component_with(u.dataset, j, lz, g, sh);
                col += (p[indexer_.amplitude(u.dataset, j)]
                        * E[u.dataset].cwiseProduct(Fj - F[u.dataset][j]).real() / h).eval();
                break;
            }
            default:
                break;
            }
        }
    }
}

} // namespace mrsfit
