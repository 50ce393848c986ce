#include "log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
std::atomic<int> g_level{static_cast<int>(Logger::Level::Warn)};
std::atomic<bool> g_env_read{false};

std::string nowTs() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    auto t = system_clock::to_time_t(tp);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    std::tm tmv;
    localtime_r(&t, &tmv);
    std::ostringstream oss;
    oss << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

const char* levelName(Logger::Level lvl) {
    switch(lvl) {
        case Logger::Level::Debug: return "DEBUG";
        case Logger::Level::Info: return "INFO";
        case Logger::Level::Warn: return "WARN";
        case Logger::Level::Error: return "ERROR";
        default: return "NONE";
    }
}
}

bool Logger::parseLevel(const std::string& name, Level& out) {
    std::string v(name);
    for(auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if(v == "debug") out = Level::Debug;
    else if(v == "info") out = Level::Info;
    else if(v == "warn" || v == "warning") out = Level::Warn;
    else if(v == "error") out = Level::Error;
    else if(v == "none" || v == "off") out = Level::None;
    else return false;
    return true;
}

void Logger::initFromEnv() {
    if(g_env_read.exchange(true)) return;
    const char* s = std::getenv("LOG_LEVEL");
    if(!s) return;
    Level lvl;
    if(parseLevel(s, lvl))
        setLevel(lvl);
}

void Logger::logImpl(Level lvl, const std::string& msg) {
    if(!enabled(lvl)) return;
    std::ostringstream line;
    line << nowTs() << " [" << levelName(lvl) << "] " << msg << '\n';
    std::cerr << line.str();
}

void Logger::debug(const std::string& msg) { logImpl(Level::Debug, msg); }
void Logger::info(const std::string& msg) { logImpl(Level::Info, msg); }
void Logger::warn(const std::string& msg) { logImpl(Level::Warn, msg); }
void Logger::error(const std::string& msg) { logImpl(Level::Error, msg); }

void Logger::logException(const std::string& where, const std::exception& e) {
    logImpl(Level::Error, where + ": " + e.what());
}

void Logger::setLevel(Level lvl) { g_level.store(static_cast<int>(lvl)); }
bool Logger::enabled(Level lvl) {
    return lvl != Level::None && static_cast<int>(lvl) >= g_level.load();
}
