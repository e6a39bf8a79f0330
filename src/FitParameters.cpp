#include "mrsfit/FitParameters.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace mrsfit {

const char* to_string(FitStage s)
{
    switch (s) {
        case FitStage::Unfit:              return "Unfit";
        case FitStage::Referenced:         return "Referenced";
        case FitStage::PreliminaryReduced: return "PreliminaryReduced";
        case FitStage::PreliminaryFull:    return "PreliminaryFull";
        case FitStage::Complete:           return "Complete";
        case FitStage::Failed:             return "Failed";
    }
    return "?";
}

FitStyle fit_style_from_string(const std::string& s)
{
    static const std::map<std::string, FitStyle> lut = {
        {"Separate", FitStyle::Separate}, {"Concatenated", FitStyle::Concatenated}
    };
    auto it = lut.find(s);
    if (it == lut.end())
        throw std::invalid_argument("unknown fit style '" + s + "'");
    return it->second;
}

const char* to_string(FitStyle s)
{
    return s == FitStyle::Separate ? "Separate" : "Concatenated";
}

/*  exp(−g t²)  ↔  Gaussian of FWHM 2·sqrt(g ln 2)/π Hz                       */
double FitParameters::gauss_fwhm_hz() const
{
    return 2.0 * std::sqrt(std::max(gauss, 0.0) * std::log(2.0)) / M_PI;
}

double FitParameters::amplitude(const std::string& name) const
{
    for (std::size_t i = 0; i < names.size(); ++i)
        if (names[i] == name) return amplitudes[static_cast<Eigen::Index>(i)];
    return std::numeric_limits<double>::quiet_NaN();
}

FitParameters FitParameters::failed_result(ConditionKind kind, std::string why)
{
    FitParameters p;
    p.condition = kind;
    p.stage     = FitStage::Failed;
    p.message   = std::move(why);
    return p;
}

} // namespace mrsfit
