#pragma once
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

class Logger {
public:
    static void configure(const std::string& logFile, bool toConsole);
    static void logVehicle(const std::string& plate, const std::string& action, const std::string& message);
    static void logReport(const std::string& action, const std::string& message);
    static void logSystem(const std::string& action, const std::string& message);

private:
    static std::mutex logMutex;
    static std::string logFile;
    static bool toConsole;
    static void writeLog(const nlohmann::json& log);
};
