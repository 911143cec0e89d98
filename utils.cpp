#include "utils.hpp"

#include <atomic>
#include <codecvt>
#include <locale>

using namespace std;

namespace utils{

size_t utf8_length(const string& str){
    wstring_convert<codecvt_utf8_utf16<wchar_t>> converter;
    return converter.from_bytes(str).length();
}

string join(const vector<string>& parts, const string& sep){
    string out;
    for(size_t i = 0; i < parts.size(); i++){
        if(i) out += sep;
        out += parts[i];
    }
    return out;
}

static atomic<bool> verboseLogging{false};

void set_verbose(bool verbose){ verboseLogging = verbose; }

ostream& log(){
    // Writing to a stream without a buffer sets its badbit, so each thread needs its own.
    thread_local ostream discard(nullptr);
    return verboseLogging ? cerr : discard;
}

ostream& warn(){ return cerr << "warning: "; }

} // namespace utils
