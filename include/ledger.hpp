#pragma once
#include "clock.hpp"
#include <ctime>
#include <map>
#include <string>
#include <vector>

enum class VehicleClass { Bike, Car, Ev, Heavy };

enum class LedgerError { None, InvalidClass, FacilityFull, SlotEmpty };

struct PricingRule {
    double base;    // 前两小时（含）的固定费用
    double hourly;  // 超出两小时后的每小时费用
};

using PricingTable = std::map<VehicleClass, PricingRule>;

struct Occupancy {
    std::string vehicleId;
    VehicleClass vehicleClass;
    std::time_t entryTime;
};

struct SlotRecord {
    bool occupied = false;
    Occupancy occupancy;  // 仅在 occupied 为 true 时有效
};

struct Admission {
    int slotId;
    std::time_t entryTime;
};

struct Receipt {
    int slotId;
    std::string vehicleId;
    VehicleClass vehicleClass;
    std::time_t entryTime;
    std::time_t exitTime;
    double durationHours;
    double amount;
};

struct OccupiedSlot {
    int slotId;
    std::string vehicleId;
    VehicleClass vehicleClass;
    double elapsedHours;
};

struct StatusView {
    int total;
    int occupied;
    int free;
    double revenue;
    int vehiclesServed;
    std::vector<OccupiedSlot> slots;
};

struct DailyReport {
    std::time_t generatedAt;
    int vehicleCount;
    double revenue;
    double averagePerVehicle;
    int peakOccupancy;  // 生成报告时的在场数量，不是历史峰值
    int totalSlots;
};

PricingTable defaultPricing();
std::string vehicleClassName(VehicleClass vc);
bool parseVehicleClass(const std::string& name, VehicleClass& vc);
std::string errorMessage(LedgerError err);

// 计算指定时长与价格规则下的费用，四舍五入到两位小数
double chargeFor(const PricingRule& rule, double durationHours);

class FacilityLedger {
public:
    static constexpr double baseWindowHours = 2.0;

    FacilityLedger(int totalSlots, PricingTable pricing, const Clock& clock);

    int findFreeSlot() const;  // 没有空位时返回 0

    bool admit(const std::string& vehicleId, const std::string& vehicleClass, Admission& out, LedgerError& err);
    bool computeCharge(int slotId, std::time_t at, double& amount, double& durationHours, LedgerError& err) const;
    bool release(int slotId, Receipt& out, LedgerError& err);
    bool release(int slotId, std::time_t at, Receipt& out, LedgerError& err);

    StatusView snapshot() const;
    DailyReport dailySummary();
    DailyReport dailySummary(std::time_t at);

    const std::vector<DailyReport>& reports() const { return history; }
    const PricingTable& pricing() const { return pricingTable; }
    int totalSlots() const { return slotCount; }
    int occupiedCount() const;
    double revenue() const { return revenueTotal; }
    int vehicleCount() const { return vehiclesServed; }

private:
    const Occupancy* occupant(int slotId) const;

    int slotCount;
    PricingTable pricingTable;
    const Clock& clock;
    // 下标 0 对应 1 号车位
    std::vector<SlotRecord> slots;
    double revenueTotal = 0.0;
    int vehiclesServed = 0;
    std::vector<DailyReport> history;
};
