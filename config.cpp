#include "config.hpp"

#include <sstream>
#include <stdexcept>

using namespace std;

namespace seatswap {

namespace {

absl::StatusOr<long long> toInteger(const string& name, const string& value, long long minimum){
    try {
        size_t used = 0;
        long long v = stoll(value, &used);
        if(used != value.size() or v < minimum) throw invalid_argument(value);
        return v;
    } catch(const logic_error&) {
        return absl::InvalidArgumentError("Bad value \"" + value + "\" for option " + name);
    }
}

absl::StatusOr<double> toReal(const string& name, const string& value){
    try {
        size_t used = 0;
        double v = stod(value, &used);
        if(used != value.size() or v < 0) throw invalid_argument(value);
        return v;
    } catch(const logic_error&) {
        return absl::InvalidArgumentError("Bad value \"" + value + "\" for option " + name);
    }
}

} // namespace

absl::Status applyOption(Settings& settings, const string& option){
    bool validOption = true;

    if(option == "HEURISTIC-ONLY")         settings.HEURISTIC_ONLY = true;
    else if(option == "PREVIEW")           settings.PREVIEW = true;
    else if(option == "SHOW-ELAPSED-TIME") settings.SHOW_ELAPSED_TIME = true;
    else if(option == "HIDE-SUMMARY")      settings.HIDE_SUMMARY = true;
    else if(option == "VERBOSE")           settings.VERBOSE = true;
    else if(option.find('=') != string::npos and 0 < option.find('=') and option.find('=') < option.size() - 1){
        // Must be "Option=Value"
        string name = option.substr(0, option.find('='));
        string value = option.substr(option.find('=') + 1);

        absl::StatusOr<long long> number = 0LL;
        if(name == "TIME-LIMIT"){                 number = toInteger(name, value, 1);   if(number.ok()) settings.TIME_LIMIT = *number; }
        else if(name == "MAX-MATCHES"){           number = toInteger(name, value, 1);   if(number.ok()) settings.MAX_MATCHES = *number; }
        else if(name == "BATCH-GROUP"){           number = toInteger(name, value, 1);   if(number.ok()) settings.BATCH_GROUP = *number; }
        else if(name == "HEURISTIC-POOL"){        number = toInteger(name, value, 2);   if(number.ok()) settings.HEURISTIC_POOL = *number; }
        else if(name == "WORKER-THREADS"){        number = toInteger(name, value, 1);   if(number.ok()) settings.WORKER_THREADS = *number; }
        else if(name == "SUGGESTION-TTL"){        number = toInteger(name, value, 0);   if(number.ok()) settings.SUGGESTION_TTL = *number; }
        else if(name == "SUGGESTION-CAPACITY"){   number = toInteger(name, value, 1);   if(number.ok()) settings.SUGGESTION_CAPACITY = *number; }
        else if(name == "MIN-STORE-SCORE"){
            absl::StatusOr<double> real = toReal(name, value);
            if(not real.ok()) return real.status();
            settings.MIN_STORE_SCORE = *real;
        }
        else validOption = false;

        if(not number.ok()) return number.status();
    } else validOption = false;

    if(not validOption) return absl::InvalidArgumentError("Unknown option \"" + option + "\"");

    settings.options.push_back(option);
    return absl::OkStatus();
}

absl::Status applyOptionLine(Settings& settings, const string& line){
    if(line.size() < 2 or line[0] != '#' or line[1] != '!') return absl::OkStatus();

    istringstream iss(line.substr(2));
    string option;
    while(iss >> option){
        absl::Status status = applyOption(settings, option);
        if(not status.ok()) return status;
    }
    return absl::OkStatus();
}

absl::StatusOr<Settings> loadSettings(istream& in){
    Settings settings;
    string line;
    for(int lineNo = 1; getline(in, line); lineNo++){
        if(line.empty()) continue;
        if(line[0] != '#') return absl::InvalidArgumentError("Line " + to_string(lineNo) + " is not an option line");

        absl::Status status = applyOptionLine(settings, line);
        if(not status.ok()) return absl::InvalidArgumentError("Line " + to_string(lineNo) + ": " + string(status.message()));
    }
    return settings;
}

} // namespace seatswap
