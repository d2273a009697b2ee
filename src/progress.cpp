// progress.cpp
#include "progress.hpp"
#include "config.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace prismag {

    ConsoleProgressBar::ConsoleProgressBar(std::size_t total, std::size_t interval, std::ostream& out)
        : total_(total), interval_(interval > 0 ? interval : 1), out_(out), completed_(0)
    {
    }

    ConsoleProgressBar::ConsoleProgressBar(std::size_t total)
        : ConsoleProgressBar(total, config::output::PROGRESS_INTERVAL, std::cerr)
    {
    }

    void ConsoleProgressBar::update(std::size_t n) {
        const std::size_t before = completed_.fetch_add(n);
        const std::size_t done = before + n;

        // Print when this update crossed an interval boundary or finished the run
        if (done / interval_ != before / interval_ || done == total_) {
            print(done);
        }
    }

    void ConsoleProgressBar::print(std::size_t done) {
        std::lock_guard<std::mutex> lock(print_mutex_);
        const double percent = total_ > 0 ? 100.0 * done / total_ : 100.0;
        std::ostringstream line;
        line << "Progress: " << done << "/" << total_
            << " (" << std::fixed << std::setprecision(1) << percent << "%)";
        out_ << line.str() << std::endl;
    }

} // namespace prismag
