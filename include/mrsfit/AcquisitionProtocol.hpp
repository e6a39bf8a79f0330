#pragma once
#include "Signal.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mrsfit {

enum class SequenceKind { Unedited, MEGA, HERMES, HERCULES };
enum class EditTarget   { None, GABA, GSH, GABA_GSH };

SequenceKind sequence_from_string(const std::string& s);
EditTarget   edit_target_from_string(const std::string& s);
const char*  to_string(SequenceKind s);
const char*  to_string(EditTarget t);

struct PpmWindow {
    double lo_ppm = 0.0;
    double hi_ppm = 0.0;
};

/*  averaged sub-spectra in the protocol's canonical order
 *  (MEGA: OFF, ON.  HERMES: A = off/off, B = GABA-on, C = GSH-on, D = on/on) */
struct EditedSubspectra {
    std::vector<ProcessedSpectrum> spectra;
    bool switch_order = false;
};

struct SubspecAlignment {
    double fs_hz   = 0.0;
    double phs_deg = 0.0;
    bool   converged = false;
};

/*  Powell fit of frequency and phase of `moving` so that the real parts of
 *  both spectra agree inside the reporter window; `moving` is corrected
 *  in place.                                                               */
SubspecAlignment align_subspectrum(const ProcessedSpectrum& fixed,
                                   ProcessedSpectrum&       moving,
                                   const PpmWindow&         reporter);

/* ------------------------------------------------------------------------- */
/*  Acquisition protocol (selected once per job)                              */
/* ------------------------------------------------------------------------- */
class AcquisitionProtocol {
public:
    virtual ~AcquisitionProtocol() = default;

    virtual const char* name() const = 0;
    virtual int         n_subspectra() const = 0;
    bool                edited() const { return n_subspectra() > 1; }

    /*  put averaged sub-spectra into canonical order                        */
    virtual EditedSubspectra classify(std::vector<ProcessedSpectrum> subspectra) const = 0;
    /*  register sub-spectra onto the first one                              */
    virtual void align(EditedSubspectra& e) const = 0;
    /*  derived conditions (OFF, ON, DIFF1, DIFF2, SUM as applicable)        */
    virtual ConditionMap combine(const EditedSubspectra& e) const = 0;

    virtual std::vector<ConditionKind> conditions()     const = 0;
    virtual std::vector<ConditionKind> fit_conditions() const = 0;

    virtual PpmWindow quality_window(ConditionKind kind) const;
    virtual PpmWindow polarity_window() const = 0;
};

/*  UnsupportedError for combinations that are not implemented              */
std::unique_ptr<AcquisitionProtocol> make_protocol(SequenceKind seq, EditTarget target);

/* ------------------------------------------------------------------------- */
class UneditedProtocol : public AcquisitionProtocol {
public:
    const char* name() const override { return "unedited"; }
    int n_subspectra() const override { return 1; }
    EditedSubspectra classify(std::vector<ProcessedSpectrum> s) const override;
    void align(EditedSubspectra&) const override {}
    ConditionMap combine(const EditedSubspectra& e) const override;
    std::vector<ConditionKind> conditions()     const override { return {ConditionKind::OFF}; }
    std::vector<ConditionKind> fit_conditions() const override { return {ConditionKind::OFF}; }
    PpmWindow polarity_window() const override { return {1.9, 2.1}; }
};

class MegaProtocol : public AcquisitionProtocol {
public:
    explicit MegaProtocol(EditTarget target);

    const char* name() const override { return "MEGA"; }
    int n_subspectra() const override { return 2; }
    EditTarget target() const { return target_; }

    EditedSubspectra classify(std::vector<ProcessedSpectrum> s) const override;
    void align(EditedSubspectra& e) const override;
    ConditionMap combine(const EditedSubspectra& e) const override;
    std::vector<ConditionKind> conditions() const override;
    std::vector<ConditionKind> fit_conditions() const override;
    PpmWindow polarity_window() const override { return {2.8, 3.2}; }

    /*  window whose |S| difference tells ON from OFF                        */
    PpmWindow classification_window() const;
    /*  signal untouched by the editing pulse                                */
    PpmWindow reporter_window() const;

private:
    EditTarget target_;
};

/*  HERCULES shares the HERMES sub-spectrum scheme                           */
class HermesProtocol : public AcquisitionProtocol {
public:
    explicit HermesProtocol(bool hercules = false) : hercules_(hercules) {}

    const char* name() const override { return hercules_ ? "HERCULES" : "HERMES"; }
    int n_subspectra() const override { return 4; }

    EditedSubspectra classify(std::vector<ProcessedSpectrum> s) const override;
    void align(EditedSubspectra& e) const override;
    ConditionMap combine(const EditedSubspectra& e) const override;
    std::vector<ConditionKind> conditions() const override;
    std::vector<ConditionKind> fit_conditions() const override;
    PpmWindow polarity_window() const override { return {2.8, 3.2}; }

private:
    bool hercules_;
};

} // namespace mrsfit
