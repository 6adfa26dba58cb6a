#pragma once

#include <cstdint>
#include <string>
#include "types.hpp"

// Short elapsed-time display: "850ms", "4.2s", "2m05s", "1h03m".
std::string format_elapsed(Millis d);

// Whole-second span in the coarse form used by listings: "2h35m",
// "14m22s", "8s". Negative spans render as "-".
std::string format_duration(int64_t seconds);

// Unix time to local "YYYY-MM-DD HH:MM". Returns "?" if it cannot be converted.
std::string format_timestamp(int64_t epoch_seconds);
