#include "../include/config.hpp"
#include <cstdint>
#include <fstream>

static bool parsePricing(const json& j, PricingTable& pricing, std::string& msg) {
    if (!j.is_object() || j.empty()) {
        msg = "pricing must be a non-empty object";
        return false;
    }
    PricingTable table;
    for (auto& [name, rule] : j.items()) {
        VehicleClass vc;
        if (!parseVehicleClass(name, vc)) {
            msg = "unknown vehicle type in pricing: " + name;
            return false;
        }
        if (!rule.is_object() || !rule.contains("base") || !rule.contains("hourly")
            || !rule["base"].is_number() || !rule["hourly"].is_number()) {
            msg = "pricing." + name + " must have numeric base and hourly";
            return false;
        }
        double base = rule["base"];
        double hourly = rule["hourly"];
        if (base < 0 || hourly < 0) {
            msg = "pricing." + name + " rates must not be negative";
            return false;
        }
        table[vc] = PricingRule{base, hourly};
    }
    pricing = table;
    return true;
}

bool parseConfig(const json& j, ParkingConfig& cfg, std::string& msg) {
    if (!j.is_object()) {
        msg = "config must be a JSON object";
        return false;
    }
    ParkingConfig result = cfg;

    if (j.contains("total_slots")) {
        const json& slots = j["total_slots"];
        // 先按 64 位读取再判断范围，避免窄化到 int 时回绕
        bool inRange = slots.is_number_unsigned()
            ? slots.get<std::uint64_t>() <= static_cast<std::uint64_t>(maxTotalSlots)
            : slots.is_number_integer() && slots.get<std::int64_t>() <= maxTotalSlots;
        if (!slots.is_number_integer() || !inRange || slots.get<std::int64_t>() <= 0) {
            msg = "total_slots must be an integer between 1 and " + std::to_string(maxTotalSlots);
            return false;
        }
        result.totalSlots = slots.get<int>();
    }
    if (j.contains("pricing") && !parsePricing(j["pricing"], result.pricing, msg)) {
        return false;
    }
    if (j.contains("report_file")) {
        if (!j["report_file"].is_string()) {
            msg = "report_file must be a string";
            return false;
        }
        result.reportFile = j["report_file"];
    }
    if (j.contains("log_file")) {
        if (!j["log_file"].is_string()) {
            msg = "log_file must be a string";
            return false;
        }
        result.logFile = j["log_file"];
    }
    if (j.contains("log_to_console")) {
        if (!j["log_to_console"].is_boolean()) {
            msg = "log_to_console must be a boolean";
            return false;
        }
        result.logToConsole = j["log_to_console"];
    }

    cfg = result;
    return true;
}

bool loadConfig(const std::string& filename, ParkingConfig& cfg, std::string& msg) {
    std::ifstream config_file(filename);
    if (!config_file.is_open()) {
        msg = filename + " not found, using default settings";
        return true;
    }
    json config;
    try {
        config_file >> config;
    } catch (const json::parse_error& e) {
        msg = filename + ": " + e.what();
        return false;
    }
    if (!parseConfig(config, cfg, msg)) {
        msg = filename + ": " + msg;
        return false;
    }
    msg = "loaded " + filename;
    return true;
}
