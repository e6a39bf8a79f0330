#include "mrsfit/Progress.hpp"
#include <iostream>

namespace mrsfit {

ConsoleProgress::ConsoleProgress(std::string prefix)
    : prefix_(std::move(prefix))
{}

std::mutex& ConsoleProgress::stream_mutex()
{
    static std::mutex m;
    return m;
}

void ConsoleProgress::on_progress(const std::string& stage,
                                  const std::string& message)
{
    std::lock_guard lk(stream_mutex());
    std::cout << prefix_ << '[' << stage << "] " << message << '\n';
}

void LabelledProgress::on_progress(const std::string& stage,
                                   const std::string& message)
{
    if (inner_) inner_->on_progress(stage, label_ + ": " + message);
}

} // namespace mrsfit
