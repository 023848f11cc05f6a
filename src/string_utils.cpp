#include "string_utils.hpp"

#include <stdexcept>

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool parse_full_double(const std::string& text, double& value) {
    std::string t = trim(text);
    if (t.empty()) {
        return false;
    }
    size_t used = 0;
    try {
        value = std::stod(t, &used);
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range
        return false;
    }
    return used == t.size();
}

bool parse_full_int(const std::string& text, int& value) {
    std::string t = trim(text);
    if (t.empty()) {
        return false;
    }
    size_t used = 0;
    try {
        value = std::stoi(t, &used);
    } catch (const std::logic_error&) {
        return false;
    }
    return used == t.size();
}
