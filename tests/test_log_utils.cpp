// Tests for duration and rate formatting used in verbose output

#include "orfkit/log_utils.hpp"

#include <cassert>
#include <iostream>

using namespace orfkit::log_utils;

void test_durations() {
    std::cout << "Testing duration formatting... ";
    assert(format_duration_ms(-5) == "0 ms");
    assert(format_duration_ms(850) == "850 ms");
    assert(format_duration_ms(4200) == "4.2 s");
    assert(format_duration_ms(59940) == "59.9 s");
    assert(format_duration_ms(60000) == "1m 0s");
    assert(format_duration_ms(192000) == "3m 12s");
    assert(format_duration_ms(3900000) == "1h 5m");
    assert(format_duration_ms(2LL * 86400000 + 3 * 3600000 + 10 * 60000) == "2d 3h");
    std::cout << "PASSED\n";
}

void test_rates() {
    std::cout << "Testing rate formatting... ";
    assert(format_rate(5000, 2000, "records") == "2500 records/s");
    assert(format_rate(3, 1000, "records") == "3.0 records/s");
    assert(format_rate(7, 0, "records") == "7 records in <1 ms");

    assert(format_summary(3000, 1500, "records") == "1.5 s, 2000 records/s");
    assert(format_summary(7, 0, "records") == "7 records in <1 ms");
    std::cout << "PASSED\n";
}

void test_stopwatch() {
    std::cout << "Testing stopwatch... ";
    Stopwatch watch;
    int64_t first = watch.elapsed_ms();
    assert(first >= 0);
    assert(watch.elapsed_ms() >= first);
    assert(!watch.elapsed().empty());
    assert(watch.summary(10, "records").find("records") != std::string::npos);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Log Utils Tests ===\n\n";
    test_durations();
    test_rates();
    test_stopwatch();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
