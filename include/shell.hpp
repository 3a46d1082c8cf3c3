#pragma once
#include "ledger.hpp"
#include <iostream>
#include <string>

class ParkingShell {
public:
    ParkingShell(FacilityLedger& ledger, std::string reportFile, std::istream& in, std::ostream& out);

    void run();

private:
    bool readLine(const std::string& prompt, std::string& line);
    void vehicleEntry();
    void vehicleExit();
    void displayStatus();
    void dailyReport();
    void saveDailyReport();

    FacilityLedger& ledger;
    std::string reportFile;
    std::istream& in;
    std::ostream& out;
};
