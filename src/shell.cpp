#include "../include/shell.hpp"
#include "../include/logger.hpp"
#include "../include/report.hpp"
#include "../include/utils.hpp"
#include <stdexcept>
#include <utility>

ParkingShell::ParkingShell(FacilityLedger& ledger, std::string reportFile, std::istream& in, std::ostream& out)
    : ledger(ledger), reportFile(std::move(reportFile)), in(in), out(out) {}

bool ParkingShell::readLine(const std::string& prompt, std::string& line) {
    out << prompt;
    if (!std::getline(in, line)) {
        return false;
    }
    line = utils::trim(line);
    return true;
}

// 主菜单循环，输入结束或选择 6 时退出
void ParkingShell::run() {
    while (true) {
        out << "\n" << std::string(50, '=') << "\n"
            << "SMART PARKING MANAGEMENT SYSTEM\n"
            << "1. Vehicle Entry  2. Vehicle Exit  3. Display Status\n"
            << "4. Daily Report   5. Save Report   6. Exit\n";
        std::string choice;
        if (!readLine("Enter choice (1-6): ", choice)) {
            out << "\n";
            break;
        }

        if (choice == "1") {
            vehicleEntry();
        } else if (choice == "2") {
            vehicleExit();
        } else if (choice == "3") {
            displayStatus();
        } else if (choice == "4") {
            dailyReport();
        } else if (choice == "5") {
            saveDailyReport();
        } else if (choice == "6") {
            out << "Thank you for using Smart Parking System!\n";
            break;
        } else {
            out << "Invalid choice! Try again.\n";
        }
    }
}

void ParkingShell::vehicleEntry() {
    std::string plate, type;
    if (!readLine("Vehicle Number: ", plate)) return;
    if (!readLine("Vehicle Type (bike/car/ev/heavy): ", type)) return;
    plate = utils::toUpper(plate);
    type = utils::toLower(type);

    Admission admission;
    LedgerError err;
    if (ledger.admit(plate, type, admission, err)) {
        std::string msg = formatAdmission(plate, type, admission);
        Logger::logVehicle(plate, "entry", msg);
        out << msg << "\n";
    } else {
        std::string msg = errorMessage(err);
        if (err == LedgerError::InvalidClass) {
            msg = "Error: Invalid vehicle type '" + type + "'. Use: bike, car, ev, heavy";
        }
        Logger::logVehicle(plate, "entry", "Failed: " + msg);
        out << msg << "\n";
    }
}

void ParkingShell::vehicleExit() {
    std::string input;
    if (!readLine("Enter Slot Number: ", input)) return;

    int slot;
    try {
        size_t pos = 0;
        slot = std::stoi(input, &pos);
        if (pos != input.size()) {
            out << "Invalid slot number!\n";
            return;
        }
    } catch (const std::exception&) {
        out << "Invalid slot number!\n";
        return;
    }

    Receipt receipt;
    LedgerError err;
    if (ledger.release(slot, receipt, err)) {
        Logger::logVehicle(receipt.vehicleId, "exit",
                           "Slot " + std::to_string(slot) + " charged " + formatAmount(receipt.amount));
        out << formatReceipt(receipt) << "\n";
    } else {
        std::string msg = "Slot " + std::to_string(slot) + " is empty or invalid.";
        Logger::logSystem("exit", "Failed: " + msg);
        out << msg << "\n";
    }
}

void ParkingShell::displayStatus() {
    out << "\n" << formatStatus(ledger.snapshot());
}

void ParkingShell::dailyReport() {
    DailyReport report = ledger.dailySummary();
    Logger::logReport("daily_report", "vehicles=" + std::to_string(report.vehicleCount) +
                                      " revenue=" + formatAmount(report.revenue));
    out << formatReport(report);
}

void ParkingShell::saveDailyReport() {
    std::string msg;
    if (saveReport(ledger, reportFile, msg)) {
        Logger::logReport("save_report", msg);
    } else {
        Logger::logReport("save_report", "Failed: " + msg);
    }
    out << msg << "\n";
}
