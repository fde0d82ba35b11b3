#include "bgd/clock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace bgd {

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

std::string format_timestamp(TimePoint time) {
    auto time_t = WallClock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

} // namespace bgd
