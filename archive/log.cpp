#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
using namespace std;

static atomic<int> minLevel((int)LogLevel::Info);
static mutex outputLock;

static void emit(LogLevel level, const char* tag, const string& message) {
    if ((int)level < minLevel.load()) return;
    // workers log concurrently; keep lines whole
    lock_guard<mutex> guard(outputLock);
    cout << tag << " " << message << "\n";
}

void setLogLevel(LogLevel level) {
    minLevel.store((int)level);
}

LogLevel getLogLevel() {
    return (LogLevel)minLevel.load();
}

void logInfo(const string& message) { emit(LogLevel::Info, "[INFO]", message); }
void logWarn(const string& message) { emit(LogLevel::Warn, "[WARN]", message); }
void logError(const string& message) { emit(LogLevel::Error, "[ERROR]", message); }
