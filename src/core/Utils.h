#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace wiz_scan {
namespace utils {

std::vector<std::string> read_lines(const std::string& path);
std::optional<std::string> read_file(const std::string& path);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string& s, char sep);
std::vector<std::string> split_csv(const std::string& s); // drops empty items
bool contains_ci(const std::string& haystack, const std::string& needle);

// Parses a base-10 integer; the whole string must be consumed.
bool parse_int(const std::string& s, long long& out);

std::string time_to_iso(std::chrono::system_clock::time_point tp);
long long to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(long long ms);

// Lowercase, colon separated, two hex digits per octet.
// Accepts ':' or '-' separated forms (octets may be single digit) and bare 12 hex digits.
std::optional<std::string> normalize_mac(const std::string& raw);

}
}
