#pragma once
#include <string>
#include <ctime>

namespace utils {
    std::string getCurrentTimeISO();
    std::string formatTime(std::time_t t, const char* fmt);
    double hoursBetween(std::time_t start, std::time_t end);
    std::string trim(const std::string& s);
    std::string toUpper(std::string s);
    std::string toLower(std::string s);
}
