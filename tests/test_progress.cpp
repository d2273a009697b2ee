#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "progress.hpp"

using namespace prismag;

namespace {

    int count_lines(const std::string& s) {
        int n = 0;
        for (char c : s) {
            if (c == '\n') ++n;
        }
        return n;
    }

}

TEST(ProgressTest, PrintsEveryIntervalAndAtCompletion) {
    std::ostringstream out;
    ConsoleProgressBar bar(12, 5, out);

    for (int i = 0; i < 12; ++i) {
        bar.update();
    }

    EXPECT_EQ(bar.completed(), 12u);
    EXPECT_EQ(count_lines(out.str()), 3);   // 5, 10 and 12
    EXPECT_NE(out.str().find("Progress: 12/12 (100.0%)"), std::string::npos);
}

TEST(ProgressTest, ConcurrentUpdatesAreNotLost) {
    std::ostringstream out;
    const std::size_t per_thread = 2500;
    const int n_threads = 4;
    ConsoleProgressBar bar(per_thread * n_threads, 1000, out);

    std::vector<std::thread> workers;
    for (int t = 0; t < n_threads; ++t) {
        workers.emplace_back([&bar, per_thread]() {
            for (std::size_t i = 0; i < per_thread; ++i) {
                bar.update(1);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(bar.completed(), per_thread * n_threads);
    EXPECT_EQ(count_lines(out.str()), 10);
}

TEST(ProgressTest, LeavesStreamFormattingUntouched) {
    std::ostringstream out;
    const std::ios_base::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();
    ConsoleProgressBar bar(3, 1, out);

    bar.update(2);
    EXPECT_NE(out.str().find("Progress: 2/3 (66.7%)"), std::string::npos);
    EXPECT_EQ(out.flags(), flags);
    EXPECT_EQ(out.precision(), precision);

    out << 0.123456;
    EXPECT_NE(out.str().find("0.123456"), std::string::npos);
}
