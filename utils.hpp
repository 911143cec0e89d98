#pragma once

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace utils{

size_t utf8_length(const std::string& str);

class timer : std::chrono::steady_clock {
    const time_point start_time;
public:
    timer(): start_time(now()) {}
    long long elapsed_time() const { return std::chrono::duration_cast<std::chrono::milliseconds>(now()-start_time).count(); }
};

inline void up(std::string& str){ std::transform(str.begin(), str.end(), str.begin(), ::toupper); }

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Progress lines go to stderr only in verbose mode, warnings always do.
void set_verbose(bool verbose);
std::ostream& log();
std::ostream& warn();

} // namespace utils
