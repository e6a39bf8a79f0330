#pragma once
#include <mutex>
#include <ostream>
#include <string>
#include <utility>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Optional side channel for progress text.  Nothing in the pipeline        */
/*  depends on it; pass nullptr to run silently.                             */
/* ------------------------------------------------------------------------- */
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;
    virtual void on_progress(const std::string& stage,
                             const std::string& message) = 0;
};

/*  "[stage] message" lines on std::cout, serialised across threads          */
class ConsoleProgress : public ProgressObserver {
public:
    explicit ConsoleProgress(std::string prefix = {});
    void on_progress(const std::string& stage,
                     const std::string& message) override;

private:
    std::string prefix_;
    static std::mutex& stream_mutex();
};

/*  forwards to another observer with a dataset label in front               */
class LabelledProgress : public ProgressObserver {
public:
    LabelledProgress(ProgressObserver* inner, std::string label)
        : inner_(inner), label_(std::move(label)) {}
    void on_progress(const std::string& stage,
                     const std::string& message) override;

private:
    ProgressObserver* inner_;
    std::string       label_;
};

inline void report(ProgressObserver* obs,
                   const std::string& stage,
                   const std::string& message)
{
    if (obs) obs->on_progress(stage, message);
}

} // namespace mrsfit
