#pragma once
#include "ledger.hpp"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// 车位数上限
constexpr int maxTotalSlots = 100000;

struct ParkingConfig {
    int totalSlots = 10;
    PricingTable pricing = defaultPricing();
    std::string reportFile = "parking_report.txt";
    std::string logFile = "system.log";
    bool logToConsole = false;
};

// 从 JSON 对象读取配置，未出现的字段保留默认值
bool parseConfig(const json& j, ParkingConfig& cfg, std::string& msg);
// 配置文件不存在时使用默认配置
bool loadConfig(const std::string& filename, ParkingConfig& cfg, std::string& msg);
