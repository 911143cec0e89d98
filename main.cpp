#include <chrono>
#include <ctime>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"

#include "cli.hpp"
#include "config.hpp"
#include "matching_service.hpp"
#include "suggestion_store.hpp"
#include "utils.hpp"

using namespace std;
using namespace seatswap;

static class Stats {
public:
    string commandLine;

    utils::timer Timer;
    chrono::time_point<chrono::system_clock> startTime;
    const string version = "0.1";
} Metadata;

static cli::Input input;

static void formatOutput(ostream& out, const vector<GlobalRunReport>& reports){
    out << "SeatSwap Version " << Metadata.version << '\n';
    time_t startTimeT = chrono::system_clock::to_time_t(Metadata.startTime);
    out << "... run started: " << ctime(&startTimeT);
    out << "... command line: " << Metadata.commandLine << '\n';
    for(const auto& cO : input.customOutput) out << cO << '\n';
    out << "Options: "; for(const auto &o : input.settings.options) out << o << ' ';
    out << '\n';
    out << "Number of tickets: " << input.totalTickets << " (" << input.trips.size() << " train runs)";
    out << "\n\n";

    cli::formatReports(out, input, reports);
    if(input.settings.SHOW_ELAPSED_TIME) out << "Elapsed time = " << Metadata.Timer.elapsed_time() << "ms" << '\n';
}

// seatswap [config-file] < input
int main(int argc, char** argv) {
    Metadata.startTime = chrono::system_clock::now();
    Metadata.commandLine = argv[0];
    for(int i = 1; i < argc; i++) Metadata.commandLine += string(" ") + argv[i];

    if(argc > 2){
        cerr << "usage: " << argv[0] << " [config-file] < input" << endl;
        return 1;
    }
    if(argc == 2){
        absl::Status status = cli::loadConfigFile(argv[1], input.settings);
        if(not status.ok()){
            cerr << status.message() << endl;
            return 1;
        }
    }

    absl::Status status = cli::readInput(input, cin);
    if(not status.ok()){
        cerr << status.message() << endl;
        return 1;
    }
    const Settings& settings = input.settings;
    utils::set_verbose(settings.VERBOSE);

    SuggestionStore store(settings);
    MatchingService service(input.repository, store, settings);

    vector<GlobalRunReport> reports;
    for(const auto& [train, date] : input.trips){
        absl::StatusOr<GlobalRunReport> report = settings.PREVIEW
            ? service.previewGlobalMatching(train, date, chrono::seconds(settings.TIME_LIMIT))
            : service.runGlobalMatching(train, date, settings.MIN_STORE_SCORE, chrono::seconds(settings.TIME_LIMIT));
        if(not report.ok()){
            cerr << train << " " << date << ": " << report.status().message() << endl;
            return 1;
        }
        reports.push_back(std::move(*report));
    }

    formatOutput(cout, reports);
    return 0;
}
