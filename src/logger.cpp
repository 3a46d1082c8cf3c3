#include "../include/logger.hpp"
#include "../include/utils.hpp"
#include <fstream>
#include <iostream>

std::mutex Logger::logMutex;
std::string Logger::logFile = "system.log";
bool Logger::toConsole = false;

void Logger::configure(const std::string& file, bool console) {
    std::lock_guard<std::mutex> lock(logMutex);
    logFile = file;
    toConsole = console;
}

void Logger::writeLog(const nlohmann::json& log) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (toConsole) {
        std::cout << log.dump(4) << std::endl;
    }
    // 日志文件为空路径时不落盘
    if (logFile.empty()) return;
    std::ofstream file(logFile, std::ios::app);
    if (file) {
        file << log.dump() << "\n";
    }
}

void Logger::logVehicle(const std::string& plate, const std::string& action, const std::string& message) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"license_plate", plate},
        {"action", action},
        {"message", message}
    };
    writeLog(log);
}

void Logger::logReport(const std::string& action, const std::string& message) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"component", "report"},
        {"action", action},
        {"message", message}
    };
    writeLog(log);
}

void Logger::logSystem(const std::string& action, const std::string& message) {
    nlohmann::json log = {
        {"timestamp", utils::getCurrentTimeISO()},
        {"component", "system"},
        {"action", action},
        {"message", message}
    };
    writeLog(log);
}
