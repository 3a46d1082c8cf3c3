#include "../include/report.hpp"
#include "../include/utils.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

static std::string formatFixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string formatAmount(double amount) {
    return "Rs." + formatFixed(amount, 2);
}

std::string formatAdmission(const std::string& vehicleId, const std::string& vehicleClass, const Admission& a) {
    std::ostringstream oss;
    oss << "Vehicle " << vehicleId << " (" << vehicleClass << ") parked in Slot " << a.slotId
        << " at " << utils::formatTime(a.entryTime, "%H:%M:%S");
    return oss.str();
}

std::string formatReceipt(const Receipt& r) {
    std::ostringstream oss;
    oss << "Vehicle " << r.vehicleId << " (" << vehicleClassName(r.vehicleClass) << ") exiting Slot " << r.slotId << "\n"
        << "Entry: " << utils::formatTime(r.entryTime, "%H:%M:%S")
        << " | Exit: " << utils::formatTime(r.exitTime, "%H:%M:%S") << "\n"
        << "Duration: " << formatFixed(r.durationHours, 2) << " hours | Charges: " << formatAmount(r.amount) << "\n"
        << "Slot " << r.slotId << " now FREE.";
    return oss.str();
}

std::string formatStatus(const StatusView& view) {
    std::ostringstream oss;
    oss << "=== PARKING LOT STATUS ===\n"
        << "Total Slots: " << view.total << " | Occupied: " << view.occupied << " | Free: " << view.free << "\n"
        << "Today's Revenue: " << formatAmount(view.revenue) << " | Vehicles Served: " << view.vehiclesServed << "\n"
        << "\nOccupied Slots:\n";
    for (const auto& s : view.slots) {
        oss << "Slot " << s.slotId << ": " << s.vehicleId << " (" << vehicleClassName(s.vehicleClass) << ") - "
            << formatFixed(s.elapsedHours, 1) << "h\n";
    }
    return oss.str();
}

std::string formatReport(const DailyReport& report) {
    std::ostringstream oss;
    oss << "\n=== DAILY PARKING REPORT ===\n"
        << "Date: " << utils::formatTime(report.generatedAt, "%Y-%m-%d") << "\n"
        << "Total Vehicles: " << report.vehicleCount << "\n"
        << "Total Revenue: " << formatAmount(report.revenue) << "\n"
        << "Average per vehicle: " << formatAmount(report.averagePerVehicle) << "\n"
        << "Peak Occupancy: " << report.peakOccupancy << "/" << report.totalSlots << "\n";
    return oss.str();
}

bool saveReport(FacilityLedger& ledger, const std::string& filename, std::string& msg) {
    std::ofstream file(filename, std::ios::app);
    if (!file) {
        msg = "Could not open " + filename;
        return false;
    }
    file << formatReport(ledger.dailySummary());
    if (!file) {
        msg = "Failed writing " + filename;
        return false;
    }
    msg = "Report saved to " + filename;
    return true;
}
