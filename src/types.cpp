#include "navis/types.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace navis
{

    std::string now_iso8601()
    {
        using clock = std::chrono::system_clock;
        auto now = clock::now();
        auto time_t_now = clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        gmtime_r(&time_t_now, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
        return oss.str();
    }

} // namespace navis
