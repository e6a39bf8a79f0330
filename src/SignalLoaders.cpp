#include "mrsfit/SignalLoaders.hpp"
#include "mrsfit/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace mrsfit {

// ----------------------------------------------------------------------------
//  Read an ASCII table of doubles with an even number of columns
// ----------------------------------------------------------------------------
CMatrix read_complex_columns(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw PreconditionError("Cannot open '" + path + "'");

    std::vector<std::vector<double>> rows;
    std::string line;
    while (std::getline(in, line))
    {
        // trim leading whitespace
        auto it = std::find_if_not(line.begin(), line.end(),
                                   [](unsigned char c) { return std::isspace(c); });
        if (it == line.end()) continue;           // blank line
        if (*it == '#') continue;                 // comment

        std::istringstream ss(line);
        std::vector<double> row;
        double v;
        while (ss >> v) row.push_back(v);
        if (row.empty()) continue;
        if (row.size() % 2 != 0)
            throw PreconditionError("'" + path + "': odd number of columns");
        if (!rows.empty() && row.size() != rows.front().size())
            throw PreconditionError("'" + path + "': ragged table");
        rows.push_back(std::move(row));
    }
    if (rows.empty())
        throw PreconditionError("File '" + path + "' contains no valid data");

    const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
    const Eigen::Index m = static_cast<Eigen::Index>(rows.front().size() / 2);
    CMatrix out(n, m);
    for (Eigen::Index i = 0; i < n; ++i)
        for (Eigen::Index k = 0; k < m; ++k)
            out(i, k) = Complex(rows[i][2 * k], rows[i][2 * k + 1]);
    return out;
}

void write_complex_columns(const std::string& path, const CMatrix& fids,
                           const std::string& header)
{
    std::ofstream out(path);
    if (!out)
        throw PreconditionError("Cannot write '" + path + "'");
    if (!header.empty()) out << "# " << header << '\n';
    out << std::setprecision(17);
    for (Eigen::Index i = 0; i < fids.rows(); ++i) {
        for (Eigen::Index k = 0; k < fids.cols(); ++k) {
            if (k) out << ' ';
            out << fids(i, k).real() << ' ' << fids(i, k).imag();
        }
        out << '\n';
    }
}

// ----------------------------------------------------------------------------
TimeDomainSignal load_signal(const SignalSource& source, const AcquisitionInfo& info)
{
    CMatrix fids = read_complex_columns(source.path);
    const Eigen::Index expected =
        static_cast<Eigen::Index>(source.averages) * source.coils * source.subspecs;
    if (fids.cols() != expected) {
        std::ostringstream msg;
        msg << "'" << source.path << "': " << fids.cols() << " transients, expected "
            << source.averages << " x " << source.coils << " x " << source.subspecs;
        throw PreconditionError(msg.str());
    }
    return TimeDomainSignal(info, std::move(fids), source.averages, source.coils,
                            source.subspecs, source.averaged);
}

BasisSet load_basis(const BasisSource& source)
{
    if (source.files.empty())
        throw PreconditionError("basis: no functions listed");

    std::vector<BasisFunction> functions;
    for (const auto& [name, path] : source.files) {
        const CMatrix m = read_complex_columns(path);
        if (m.cols() != 1)
            throw PreconditionError("basis function '" + name + "': expected one FID");
        functions.push_back({name, m.col(0)});
    }

    AcquisitionInfo info = source.info;
    info.n_samples = static_cast<int>(functions.front().fid.size());
    BasisSet basis(info, std::move(functions));
    return source.normalize ? basis.normalized() : basis;
}

} // namespace mrsfit
