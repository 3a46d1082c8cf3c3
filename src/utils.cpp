#include "../include/utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>

// 获取当前时间的ISO格式字符串
std::string utils::getCurrentTimeISO() {
    return formatTime(std::time(nullptr), "%Y-%m-%dT%H:%M:%S");
}

// 按本地时间格式化时间戳
std::string utils::formatTime(std::time_t t, const char* fmt) {
    std::tm tm = {};
    localtime_r(&t, &tm);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), fmt, &tm) == 0) {
        return "";
    }
    return std::string(buf);
}

// 计算两个时间戳之间的小时差
double utils::hoursBetween(std::time_t start, std::time_t end) {
    return std::difftime(end, start) / 3600.0;
}

std::string utils::trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    if (first >= last) return "";
    return std::string(first, last);
}

std::string utils::toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string utils::toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
