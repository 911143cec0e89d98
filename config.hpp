#pragma once

#include <istream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace seatswap {

struct Settings {
    long long TIME_LIMIT = 30;          // seconds, advisory to the solver backend
    double    MIN_STORE_SCORE = 0.0;
    long long MAX_MATCHES = 10;
    long long BATCH_GROUP = 3;
    long long HEURISTIC_POOL = 60;
    long long WORKER_THREADS = 2;
    long long SUGGESTION_TTL = 24 * 3600; // seconds, 0 keeps entries forever
    long long SUGGESTION_CAPACITY = 10000;

    bool HEURISTIC_ONLY = false, PREVIEW = false, SHOW_ELAPSED_TIME = false, HIDE_SUMMARY = false, VERBOSE = false;

    std::vector<std::string> options; // accepted options, in input order
};

// Applies a single "NAME" or "NAME=VALUE" token.
absl::Status applyOption(Settings& settings, const std::string& option);

// Applies every token of a "#! A B=1 ..." line. Lines not starting with "#!" are ignored.
absl::Status applyOptionLine(Settings& settings, const std::string& line);

// Reads option lines from a config stream; blank lines and "#" comments are skipped.
absl::StatusOr<Settings> loadSettings(std::istream& in);

} // namespace seatswap
