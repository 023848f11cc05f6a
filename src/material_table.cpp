#include "material_table.hpp"
#include "errors.hpp"
#include "string_utils.hpp"

#include <fstream>
#include <sstream>

namespace {

bool is_skippable(const std::string& line) {
    std::string t = trim(line);
    return t.empty() || t[0] == '#';
}

double parse_number(const std::string& field, const std::string& source_name, int line_no, const char* column) {
    double value = 0.0;
    if (!parse_full_double(field, value)) {
        std::ostringstream msg;
        msg << source_name << ":" << line_no << ": " << column << " is not a number: '" << trim(field) << "'";
        throw DataFormatError(msg.str());
    }
    return value;
}

} // namespace

std::vector<std::string> split_fields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    if (delimiter == ' ') {
        std::istringstream ss(line);
        std::string token;
        while (ss >> token) {
            fields.push_back(token);
        }
        return fields;
    }

    std::stringstream ss(line);
    std::string value;
    while (std::getline(ss, value, delimiter)) {
        fields.push_back(trim(value));
    }
    // Trailing delimiter leaves an empty last column
    std::string trimmed = trim(line);
    if (!trimmed.empty() && trimmed.back() == delimiter) {
        fields.push_back("");
    }
    return fields;
}

char detect_delimiter(const std::string& header) {
    if (header.find(',') != std::string::npos) return ',';
    if (header.find(';') != std::string::npos) return ';';
    if (header.find('\t') != std::string::npos) return '\t';
    return ' ';
}

MaterialTable parse_material_table(std::istream& in, const std::string& source_name, double f_min, double f_max) {
    if (f_min > f_max) {
        throw DataFormatError(source_name + ": empty frequency band (f_min > f_max)");
    }

    std::string line;
    int line_no = 0;

    // Header row
    bool have_header = false;
    while (std::getline(in, line)) {
        ++line_no;
        if (!is_skippable(line)) {
            have_header = true;
            break;
        }
    }
    if (!have_header) {
        throw DataFormatError(source_name + ": no header row");
    }

    const char delimiter = detect_delimiter(line);
    const size_t header_columns = split_fields(trim(line), delimiter).size();
    if (header_columns < 3) {
        std::ostringstream msg;
        msg << source_name << ":" << line_no << ": header has " << header_columns
            << " column(s), expected frequency, mu', mu''";
        throw MissingColumnError(msg.str());
    }

    MaterialTable table;
    double last_freq = 0.0;
    int rows_read = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (is_skippable(line)) {
            continue;
        }

        std::vector<std::string> values = split_fields(trim(line), delimiter);
        if (values.size() < 3) {
            std::ostringstream msg;
            msg << source_name << ":" << line_no << ": expected 3 columns, found " << values.size();
            throw DataFormatError(msg.str());
        }

        double f   = parse_number(values[0], source_name, line_no, "frequency");
        double mu1 = parse_number(values[1], source_name, line_no, "mu'");
        double mu2 = parse_number(values[2], source_name, line_no, "mu''");

        if (!(f > 0.0)) {
            std::ostringstream msg;
            msg << source_name << ":" << line_no << ": frequency must be positive, got " << f;
            throw DataFormatError(msg.str());
        }
        if (rows_read > 0 && !(f > last_freq)) {
            std::ostringstream msg;
            msg << source_name << ":" << line_no << ": frequencies must be strictly ascending ("
                << f << " after " << last_freq << ")";
            throw DataFormatError(msg.str());
        }
        last_freq = f;
        ++rows_read;

        if (f < f_min || f > f_max) {
            continue;
        }

        table.frequency.push_back(f);
        table.mu_prime.push_back(mu1);
        table.mu_double_prime.push_back(mu2);
    }

    if (in.bad()) {
        throw DataFormatError(source_name + ": read error");
    }
    if (rows_read == 0) {
        throw DataFormatError(source_name + ": no data rows");
    }
    if (table.empty()) {
        std::ostringstream msg;
        msg << source_name << ": no rows inside band [" << f_min << ", " << f_max << "] Hz";
        throw DataFormatError(msg.str());
    }
    return table;
}

MaterialTable load_material_table(const std::string& filename, double f_min, double f_max) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw DataFormatError("could not open input file " + filename);
    }
    return parse_material_table(file, filename, f_min, f_max);
}
