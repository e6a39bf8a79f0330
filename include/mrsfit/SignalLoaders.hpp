// SignalLoaders.hpp
#pragma once
#include "mrsfit/Signal.hpp"
#include "mrsfit/BasisSet.hpp"
#include "mrsfit/Config.hpp"
#include <string>

namespace mrsfit {

// ---------------------------------------------------------------------------
// ASCII complex tables: one row per time point, one (real, imag) column pair
// per transient.  '#' starts a comment line.
// ---------------------------------------------------------------------------
CMatrix read_complex_columns(const std::string& path);
void    write_complex_columns(const std::string& path, const CMatrix& fids,
                              const std::string& header = {});

// main entry points ----------------------------------------------------------
TimeDomainSignal load_signal(const SignalSource&    source,
                             const AcquisitionInfo& info);

BasisSet load_basis(const BasisSource& source);

} // namespace mrsfit
