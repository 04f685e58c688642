#include "Utils.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <iomanip>

namespace wiz_scan {
namespace utils {

std::vector<std::string> read_lines(const std::string& path){
    std::vector<std::string> lines;
    std::ifstream f(path);
    if(!f) return lines;
    std::string line;
    while(std::getline(f, line)) lines.push_back(line);
    return lines;
}

std::optional<std::string> read_file(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string trim(const std::string& s){
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char sep){
    std::vector<std::string> out; std::string cur;
    for(char c : s){ if(c==sep){ out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    out.push_back(cur);
    return out;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c);} if(!cur.empty()) out.push_back(cur);
    return out;
}

bool contains_ci(const std::string& haystack, const std::string& needle){
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool parse_int(const std::string& s, long long& out){
    if(s.empty()) return false;
    if(std::isspace(static_cast<unsigned char>(s.front()))) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if(errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

long long to_epoch_ms(std::chrono::system_clock::time_point tp){
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(long long ms){
    return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

std::optional<std::string> normalize_mac(const std::string& raw){
    std::string s = to_lower(trim(raw));
    if(s.empty()) return std::nullopt;
    std::vector<std::string> parts;
    if(s.find(':') != std::string::npos || s.find('-') != std::string::npos){
        std::replace(s.begin(), s.end(), '-', ':');
        parts = split(s, ':');
    } else if(s.size() == 12){
        for(size_t i=0;i<12;i+=2) parts.push_back(s.substr(i, 2));
    } else {
        return std::nullopt;
    }
    if(parts.size() != 6) return std::nullopt;
    std::string out;
    for(size_t i=0;i<parts.size();++i){
        const std::string& p = parts[i];
        if(p.empty() || p.size() > 2) return std::nullopt;
        for(char c : p) if(!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        if(i) out.push_back(':');
        if(p.size() == 1) out.push_back('0');
        out += p;
    }
    return out;
}

}
}
