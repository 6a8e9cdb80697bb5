#include "result_writer.h"

#include <fstream>
#include <iomanip>

#include "search_errors.h"

using namespace std;

namespace hash_search {

namespace {

// Charsets with punctuation can produce pre-images containing ',' or '"'
string csv_field(const string &value) {
    if (value.find_first_of(",\"\r\n") == string::npos) {
        return value;
    }
    string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    return quoted + "\"";
}

} // namespace

void write_results(ostream &out, const SearchResult &result) {
    out << "Target Hash,Pre-image,Elapsed Time (s)\n";
    out << fixed << setprecision(2);
    for (const FoundPreImage &found : result.found) {
        out << found.digest << ',' << csv_field(found.pre_image) << ',' << found.elapsed_seconds << '\n';
    }
}

void write_results_csv(const string &path, const SearchResult &result) {
    ofstream file(path, ios::trunc);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot write results to '" + path + "'");
    }
    write_results(file, result);
    file.flush();
    if (!file) {
        throw ConfigurationError("Failed writing results to '" + path + "'");
    }
}

} // namespace hash_search
