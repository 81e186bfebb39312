/**
 * @file fsStoreLib/util/Log.cpp
 * @brief 태그 기반 한 줄 로거 구현.
 * @details
 * - 출력 형식: [YYYY-MM-DD HH:MM:SS][LEVEL][tag] message
 * - 레벨 필터는 잠금 없이 확인하므로, 걸러지는 메시지는 mutex 를 잡지 않는다.
 * - sink 를 지정하지 않으면 std::cerr 로 쓴다.
 */
#include <fsstore/util/Log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>

namespace FsStore::log {

namespace {

std::mutex gMutex;
std::atomic<Level> gLevel{Level::Warn};
std::ostream* gSink = nullptr;

const char* levelName(Level l) {
    switch (l) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        break;
    }
    return "OFF";
}

std::string nowLocal() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return std::string();
    return buf;
}

void emit(Level l, const std::string& tag, const std::string& msg) {
    Level threshold = gLevel.load();
    if (l < threshold || threshold == Level::Off)
        return;
    std::lock_guard<std::mutex> lk(gMutex);
    std::ostream& os = gSink ? *gSink : std::cerr;
    os << "[" << nowLocal() << "][" << levelName(l) << "][" << tag << "] " << msg << "\n";
}

} // namespace

void setLevel(Level l) { gLevel.store(l); }

Level level() { return gLevel.load(); }

void setSink(std::ostream* sink) {
    std::lock_guard<std::mutex> lk(gMutex);
    gSink = sink;
}

bool parseLevel(const std::string& name, Level& out) {
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug")
        out = Level::Debug;
    else if (s == "info")
        out = Level::Info;
    else if (s == "warn" || s == "warning")
        out = Level::Warn;
    else if (s == "error")
        out = Level::Error;
    else if (s == "off")
        out = Level::Off;
    else
        return false;
    return true;
}

void debug(const std::string& tag, const std::string& msg) { emit(Level::Debug, tag, msg); }
void info(const std::string& tag, const std::string& msg) { emit(Level::Info, tag, msg); }
void warn(const std::string& tag, const std::string& msg) { emit(Level::Warn, tag, msg); }
void error(const std::string& tag, const std::string& msg) { emit(Level::Error, tag, msg); }

} // namespace FsStore::log
