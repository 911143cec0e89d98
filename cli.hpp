#pragma once

#include <istream>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"

#include "config.hpp"
#include "matching_service.hpp"
#include "repository.hpp"

namespace seatswap::cli {

// Everything read from the batch input.
struct Input {
    Settings settings;
    InMemoryRepository repository;
    std::map<std::string, std::string> ticketOwner;   // ticket id -> user id
    std::set<std::pair<std::string, std::string>> trips; // (train, date) in the input
    std::vector<std::string> customOutput;             // "#+" lines, echoed in the report header
    int totalTickets = 0;
};

// Replaces `settings` with the options of a config file. Options read later from the input apply on top.
absl::Status loadConfigFile(const std::string& path, Settings& settings);

// "(<user>) <ticket> <train> <date> <class> <coach>/<seat>[/<berth>] ... [+LB] [+SAME-COACH] [+SAME-BAY] [+CYCLIC] [+MIN=<score>]"
// A missing berth is taken from the coach layout. Unknown users are created on the fly.
absl::Status parseTicketLine(Input& input, const std::string& line);

// "!USER <id> <rating> <name...>"
absl::Status parseUserLine(Input& input, const std::string& line);

absl::Status parseLine(Input& input, const std::string& line);

// Reads the whole stream; errors are prefixed with "line N: ".
absl::Status readInput(Input& input, std::istream& in);

// Exchange cycles, ticket summary and statistics for each train and date.
void formatReports(std::ostream& out, const Input& input, const std::vector<GlobalRunReport>& reports);

} // namespace seatswap::cli
