#include "cli.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "coach_layout.hpp"
#include "utils.hpp"

using namespace std;

namespace seatswap::cli {

absl::Status loadConfigFile(const string& path, Settings& settings){
    ifstream file(path);
    if(not file) return absl::NotFoundError("Cannot open config file " + path);

    absl::StatusOr<Settings> loaded = loadSettings(file);
    if(not loaded.ok()) return absl::Status(loaded.status().code(), path + ": " + string(loaded.status().message()));
    settings = std::move(*loaded);
    return absl::OkStatus();
}

absl::Status parseTicketLine(Input& input, const string& line){
    istringstream iss(line);
    string temp, username;

    getline(iss, temp, '(');
    getline(iss, username, ')');
    if(not temp.empty() or username.empty()) return absl::InvalidArgumentError("Garbage line: " + line);

    Ticket t;
    string cls;
    if(not (iss >> t.id >> t.train_number >> t.travel_date >> cls)) return absl::InvalidArgumentError("Incomplete ticket line: " + line);
    utils::up(cls);
    optional<ClassType> classType = parseClassType(cls);
    if(not classType) return absl::InvalidArgumentError("Unknown class \"" + cls + "\" on ticket " + t.id);

    t.user_id = username;
    t.pnr = t.id;
    t.class_type = *classType;

    while(iss >> temp){
        utils::up(temp);
        if(temp[0] == '+'){ // Preference
            string pref = temp.substr(1);
            if(pref == "SAME-COACH")          t.preferences.same_coach_only = true;
            else if(pref == "SAME-BAY")       t.preferences.same_bay_only = true;
            else if(pref == "CYCLIC")         t.preferences.allow_cyclic = true;
            else if(pref.rfind("MIN=", 0) == 0){
                try { t.min_match_score = stod(pref.substr(4)); }
                catch(const logic_error&) { return absl::InvalidArgumentError("Bad score in " + temp); }
            }
            else if(auto berth = parseBerthType(pref)) t.preferences.preferred_berth.insert(*berth);
            else return absl::InvalidArgumentError("Unknown preference " + temp + " on ticket " + t.id);
            continue;
        }

        // Seat: COACH/SEAT[/BERTH], the berth defaults to the coach layout
        size_t a = temp.find('/'), b = temp.find('/', a + 1);
        if(a == string::npos or a == 0) return absl::InvalidArgumentError("Bad seat " + temp + " on ticket " + t.id);

        Passenger p;
        p.coach = temp.substr(0, a);
        string number = temp.substr(a + 1, b == string::npos ? string::npos : b - a - 1);
        try {
            size_t used = 0;
            p.seat_number = stoi(number, &used);
            if(used != number.size()) throw invalid_argument(number);
        } catch(const logic_error&) {
            return absl::InvalidArgumentError("Bad seat " + temp + " on ticket " + t.id);
        }
        if(p.seat_number <= 0) return absl::InvalidArgumentError("Bad seat " + temp + " on ticket " + t.id);

        if(b == string::npos) p.berth_type = layout::berthTypeFor(p.seat_number, t.class_type);
        else if(auto berth = parseBerthType(temp.substr(b + 1))) p.berth_type = *berth;
        else return absl::InvalidArgumentError("Bad berth " + temp + " on ticket " + t.id);

        p.id = t.id + "#" + to_string(t.passengers.size() + 1);
        p.name = p.id;
        t.passengers.push_back(p);
    }
    if(t.passengers.empty()) return absl::InvalidArgumentError("Ticket " + t.id + " has no passengers");
    if(input.ticketOwner.count(t.id)) return absl::InvalidArgumentError("Repeated ticket " + t.id);

    string id = t.id, train = t.train_number, date = t.travel_date;
    absl::Status added = input.repository.addTicket(std::move(t));
    if(not added.ok()) return added;

    if(not input.repository.getUser(username)) input.repository.addUser(User{.id = username, .name = username});
    input.ticketOwner[id] = username;
    input.trips.insert({train, date});
    input.totalTickets++;
    return absl::OkStatus();
}

absl::Status parseUserLine(Input& input, const string& line){
    istringstream iss(line);
    string tag, id, name;
    double rating = 0;
    if(not (iss >> tag >> id >> rating)) return absl::InvalidArgumentError("Bad user line: " + line);
    getline(iss >> ws, name);
    input.repository.addUser(User{.id = id, .name = name.empty() ? id : name, .rating = rating});
    return absl::OkStatus();
}

absl::Status parseLine(Input& input, const string& line){
    if(line.empty()) return absl::OkStatus();
    if(line[0] == '#'){
        if(line.size() > 1 and line[1] == '+'){ input.customOutput.push_back(line); return absl::OkStatus(); } // Custom output
        return applyOptionLine(input.settings, line); // "#!" options, anything else is a comment
    }
    if(line.rfind("!USER", 0) == 0) return parseUserLine(input, line);
    return parseTicketLine(input, line);
}

absl::Status readInput(Input& input, istream& in){
    string line;
    for(int lineNo = 1; getline(in, line); lineNo++){
        absl::Status status = parseLine(input, line);
        if(not status.ok()) return absl::Status(status.code(), "line " + to_string(lineNo) + ": " + string(status.message()));
    }
    return absl::OkStatus();
}

void formatReports(ostream& out, const Input& input, const vector<GlobalRunReport>& reports){
    auto show = [&](const string& ticketId){
        auto it = input.ticketOwner.find(ticketId);
        return ticketId + " (" + (it == input.ticketOwner.end() ? string("?") : it->second) + ")";
    };

    size_t formattingWidth = 0;
    for(const auto& report : reports)
        for(const auto& c : report.result.cycles)
            for(const auto& id : c.ticket_ids) formattingWidth = max(formattingWidth, utils::utf8_length(show(id)) + 1);

    for(const auto& report : reports){
        const GlobalMatchResult& r = report.result;
        out << "TRAIN " << report.train_number << " ON " << report.travel_date << ": " << report.tickets << " active tickets, "
            << r.backend << " (" << toString(r.status) << ")\n\n";
        out << "EXCHANGE CYCLES (" << r.traded_tickets << " tickets trading):\n\n";

        vector<string> ticketSummary;
        double totalScore = 0;
        for(const auto& c : r.cycles){
            size_t k = c.ticket_ids.size();
            for(size_t i = 0; i < k; i++){
                const string& current     = c.ticket_ids[i];
                const string& takesFrom   = c.ticket_ids[(i + 1) % k];
                const string& givesTo     = c.ticket_ids[(i + k - 1) % k];

                out << std::left << setfill(' ') << setw(formattingWidth) << show(current) << " receives seats of "
                    << std::left << setfill(' ') << setw(formattingWidth) << show(takesFrom)
                    << " (+" << c.edge_scores[i] << ")\n";

                stringstream buffer;
                buffer  << std::left << setfill(' ') << setw(formattingWidth) << show(current) << " receives "
                        << std::left << setfill(' ') << setw(formattingWidth) << show(takesFrom) << "and gives to "
                        << show(givesTo);
                ticketSummary.push_back(buffer.str());
            }
            totalScore += c.total_score;
            out << '\n';
        }

        if(not input.settings.HIDE_SUMMARY){
            out << "TICKET SUMMARY (" << r.traded_tickets << " tickets trading):\n\n";
            sort(ticketSummary.begin(), ticketSummary.end());
            for(const auto &s : ticketSummary) out << s << '\n';
            out << "\n";
        }

        int scattered = 0;
        for(const auto& t : input.repository.findActiveTickets(report.train_number, report.travel_date)) scattered += t.isScattered();

        out << "Num trading  = " << r.traded_tickets << " of " << report.tickets << " tickets ("
            << (report.tickets ? r.traded_tickets * 100.0 / report.tickets : 0.0) << "%)\n";
        out << "Scattered    = " << scattered << '\n';
        out << "Total score  = " << totalScore << '\n';
        out << "Num groups   = " << r.cycles.size() << '\n';
        out << "Group sizes  = "; for(const auto& g : r.group_sizes) out << g << ' '; out << '\n';
        out << "Sum squares  = " << r.sum_squares << '\n';
        if(report.persisted) out << "Stored       = " << report.stored << " (" << report.cleared << " cleared)\n";
        if(input.settings.SHOW_ELAPSED_TIME) out << "Solve time   = " << r.elapsed_ms << "ms" << '\n';
        out << "\n";
    }
}

} // namespace seatswap::cli
