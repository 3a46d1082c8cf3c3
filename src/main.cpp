#include "../include/clock.hpp"
#include "../include/config.hpp"
#include "../include/ledger.hpp"
#include "../include/logger.hpp"
#include "../include/shell.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";

    // 读取配置文件
    ParkingConfig config;
    std::string msg;
    if (!loadConfig(configPath, config, msg)) {
        std::cerr << "Error: " << msg << std::endl;
        return 1;
    }
    Logger::configure(config.logFile, config.logToConsole);
    Logger::logSystem("startup", msg + ", " + std::to_string(config.totalSlots) + " slots");

    SystemClock clock;
    FacilityLedger ledger(config.totalSlots, config.pricing, clock);
    ParkingShell shell(ledger, config.reportFile, std::cin, std::cout);
    shell.run();

    Logger::logSystem("shutdown", "session ended");
    return 0;
}
