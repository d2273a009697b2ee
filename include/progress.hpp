#pragma once
// progress.hpp
// Progress reporting for the forward modelling loop

#include <atomic>
#include <cstddef>
#include <mutex>
#include <ostream>

namespace prismag {

    // Receives one update per completed observation point.
    // update() may be called concurrently from several worker threads.
    class ProgressSink {
    public:
        virtual ~ProgressSink() = default;
        virtual void update(std::size_t n = 1) = 0;
    };

    // Prints "Progress: i/N (x%)" every `interval` points and on completion
    class ConsoleProgressBar : public ProgressSink {
    public:
        ConsoleProgressBar(std::size_t total, std::size_t interval, std::ostream& out);
        explicit ConsoleProgressBar(std::size_t total);

        void update(std::size_t n = 1) override;

        std::size_t completed() const { return completed_.load(); }
        std::size_t total() const { return total_; }

    private:
        std::size_t total_;
        std::size_t interval_;
        std::ostream& out_;
        std::atomic<std::size_t> completed_;
        std::mutex print_mutex_;

        void print(std::size_t done);
    };

} // namespace prismag
