#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include <chronoval.hpp>

using namespace chronoval;

// Helper function to print an instant or the error that replaced it
void printInstant(const Result<Instant>& instant, const std::string& label) {
    std::cout << label << ":\n";
    if (!instant) {
        std::cout << "  Error: " << instant.error() << "\n\n";
        return;
    }
    std::cout << "  ISO-8601: " << *instant << "\n";
    std::cout << "  Epoch second: " << instant->epoch_second() << "\n";
    std::cout << "  Nanosecond: " << instant->nano() << "\n";
    std::cout << std::endl;
}

int main() {
    std::cout << "chronoval Instant Examples\n";
    std::cout << "==========================\n\n";

    // Example 1: Creating instants
    std::cout << "1. Creating Instants\n";
    std::cout << "--------------------\n";

    printInstant(Instant::now(), "Current time");
    printInstant(Instant::of_epoch_milli(1440938096155), "From epoch millis (1440938096155)");
    printInstant(Instant::of_epoch_second(-1, 250'000'000), "From seconds + nanos (-1, 250000000)");
    printInstant(Instant::parse("2015-08-30T12:34:56.155Z"), "Parsed 2015-08-30T12:34:56.155Z");

    // Example 2: Arithmetic
    std::cout << "2. Instant Arithmetic\n";
    std::cout << "---------------------\n";

    auto base = Instant::of_epoch_second(1440979200);
    printInstant(base, "Base instant");
    printInstant(base.and_then([](const Instant& i) { return i.plus_days(1); }), "Base + 1 day");
    printInstant(base.and_then([](const Instant& i) { return i.minus_micros(500); }),
                 "Base - 500 microseconds");

    // Failures are values, not exceptions
    printInstant(base.and_then([](const Instant& i) { return i.plus_seconds(9007199254740991); }),
                 "Base + MAX_SAFE_INTEGER seconds");
    printInstant(base.and_then([](const Instant& i) { return i.plus_seconds(-9007199254740991); }),
                 "Base - MAX_SAFE_INTEGER seconds");

    // Example 3: Sorting
    std::cout << "3. Sorting Instants\n";
    std::cout << "-------------------\n";

    std::vector<Instant> instants;
    for (int64_t millis : {100001, 100000, 123456, 100001}) {
        auto instant = Instant::of_epoch_milli(millis);
        if (instant) {
            instants.push_back(*instant);
        }
    }
    std::sort(instants.begin(), instants.end(), Instant::compare_descending);
    for (const auto& instant : instants) {
        std::cout << "  " << instant << "\n";
    }
    std::cout << "\n";

    // Example 4: Dates, times and ranges
    std::cout << "4. Dates, Times and Ranges\n";
    std::cout << "--------------------------\n";

    auto leap_day = LocalDate::of(2016, 2, 29);
    auto next_year = leap_day.and_then([](const LocalDate& d) { return d.plus_years(1); });
    if (leap_day && next_year) {
        std::cout << "  " << *leap_day << " + 1 year = " << *next_year << "\n";
    }

    auto late = LocalTime::of(23, 30);
    if (late) {
        std::cout << "  " << *late << " + 2 hours = " << late->plus_hours(2) << "\n";
    }

    auto range = Instant::parse("2015-08-01T00Z").and_then([](const Instant& start) {
        return start.plus_days(1).and_then(
            [&start](const Instant& end) { return InstantRange::of(start, end); });
    });
    if (range) {
        std::cout << "  Range: " << *range << "\n";
    }

    auto backwards = InstantRange::of(Instant::max(), Instant::min());
    if (!backwards) {
        std::cout << "  Reversed range rejected: " << backwards.error().message() << "\n";
    }

    return 0;
}
