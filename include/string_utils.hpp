#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <string>

// Strips leading and trailing whitespace (space, tab, CR, LF)
std::string trim(const std::string& s);

// Parses the whole of text (surrounding whitespace allowed) as a double.
// Returns false on an empty string, trailing characters or overflow.
bool parse_full_double(const std::string& text, double& value);

// Same for an int; "3.7" and "12x" are rejected
bool parse_full_int(const std::string& text, int& value);

#endif // STRING_UTILS_HPP
