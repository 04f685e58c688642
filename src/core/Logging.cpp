#include "Logging.h"
#include "Utils.h"
#include <iostream>
#include <chrono>
#include <ctime>

namespace wiz_scan {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
}

const char* Logger::prefix(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(!enabled(lvl)) return;
    std::string ts = utils::time_to_iso(std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << ts << ' ' << prefix(lvl) << msg << '\n';
}

bool parse_log_level(const std::string& name, LogLevel& out){
    std::string n = utils::to_lower(utils::trim(name));
    if(n=="error") { out = LogLevel::Error; return true; }
    if(n=="warn" || n=="warning") { out = LogLevel::Warn; return true; }
    if(n=="info") { out = LogLevel::Info; return true; }
    if(n=="debug") { out = LogLevel::Debug; return true; }
    if(n=="trace") { out = LogLevel::Trace; return true; }
    return false;
}

}
