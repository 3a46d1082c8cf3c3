#include "../include/ledger.hpp"
#include "../include/utils.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

PricingTable defaultPricing() {
    return {
        {VehicleClass::Bike, {10, 5}},
        {VehicleClass::Car, {20, 10}},
        {VehicleClass::Ev, {25, 12}},
        {VehicleClass::Heavy, {50, 25}}
    };
}

std::string vehicleClassName(VehicleClass vc) {
    switch (vc) {
        case VehicleClass::Bike: return "bike";
        case VehicleClass::Car: return "car";
        case VehicleClass::Ev: return "ev";
        case VehicleClass::Heavy: return "heavy";
    }
    return "unknown";
}

bool parseVehicleClass(const std::string& name, VehicleClass& vc) {
    static const std::map<std::string, VehicleClass> names = {
        {"bike", VehicleClass::Bike},
        {"car", VehicleClass::Car},
        {"ev", VehicleClass::Ev},
        {"heavy", VehicleClass::Heavy}
    };
    auto it = names.find(name);
    if (it == names.end()) {
        return false;
    }
    vc = it->second;
    return true;
}

std::string errorMessage(LedgerError err) {
    switch (err) {
        case LedgerError::None: return "OK";
        case LedgerError::InvalidClass: return "Invalid vehicle type. Use: bike, car, ev, heavy";
        case LedgerError::FacilityFull: return "Parking Full! No slots available.";
        case LedgerError::SlotEmpty: return "Slot is empty or invalid.";
    }
    return "Unknown error";
}

double chargeFor(const PricingRule& rule, double durationHours) {
    double charge = rule.base;
    if (durationHours > FacilityLedger::baseWindowHours) {
        charge += (durationHours - FacilityLedger::baseWindowHours) * rule.hourly;
    }
    // 四舍五入到分，0.5 远离零；整秒时长会落在半分上，先补偿二进制误差
    return std::round(charge * 100.0 + 1e-6) / 100.0;
}

FacilityLedger::FacilityLedger(int totalSlots, PricingTable pricing, const Clock& clock)
    : slotCount(totalSlots), pricingTable(std::move(pricing)), clock(clock) {
    if (slotCount <= 0) {
        throw std::invalid_argument("total slots must be positive");
    }
    slots.resize(slotCount);
}

const Occupancy* FacilityLedger::occupant(int slotId) const {
    if (slotId < 1 || slotId > slotCount) {
        return nullptr;
    }
    const SlotRecord& slot = slots[slotId - 1];
    return slot.occupied ? &slot.occupancy : nullptr;
}

// 按编号从小到大查找第一个空车位
int FacilityLedger::findFreeSlot() const {
    for (int i = 0; i < slotCount; ++i) {
        if (!slots[i].occupied) {
            return i + 1;
        }
    }
    return 0;
}

int FacilityLedger::occupiedCount() const {
    int count = 0;
    for (const auto& slot : slots) {
        if (slot.occupied) ++count;
    }
    return count;
}

bool FacilityLedger::admit(const std::string& vehicleId, const std::string& vehicleClass, Admission& out, LedgerError& err) {
    VehicleClass vc;
    if (!parseVehicleClass(vehicleClass, vc) || pricingTable.count(vc) == 0) {
        err = LedgerError::InvalidClass;
        return false;
    }

    int slotId = findFreeSlot();
    if (slotId == 0) {
        err = LedgerError::FacilityFull;
        return false;
    }

    std::time_t entry = clock.now();
    SlotRecord& slot = slots[slotId - 1];
    slot.occupied = true;
    slot.occupancy = Occupancy{vehicleId, vc, entry};
    ++vehiclesServed;

    out = Admission{slotId, entry};
    err = LedgerError::None;
    return true;
}

bool FacilityLedger::computeCharge(int slotId, std::time_t at, double& amount, double& durationHours, LedgerError& err) const {
    const Occupancy* occ = occupant(slotId);
    if (!occ) {
        err = LedgerError::SlotEmpty;
        return false;
    }
    // 时钟回拨时时长可能为负，按基础费用计
    durationHours = utils::hoursBetween(occ->entryTime, at);
    amount = chargeFor(pricingTable.at(occ->vehicleClass), durationHours);
    err = LedgerError::None;
    return true;
}

bool FacilityLedger::release(int slotId, Receipt& out, LedgerError& err) {
    return release(slotId, clock.now(), out, err);
}

bool FacilityLedger::release(int slotId, std::time_t at, Receipt& out, LedgerError& err) {
    double amount, hours;
    if (!computeCharge(slotId, at, amount, hours, err)) {
        return false;
    }

    SlotRecord& slot = slots[slotId - 1];
    out = Receipt{slotId, slot.occupancy.vehicleId, slot.occupancy.vehicleClass,
                  slot.occupancy.entryTime, at, hours, amount};

    revenueTotal += amount;
    slot.occupied = false;
    slot.occupancy = Occupancy{};
    return true;
}

StatusView FacilityLedger::snapshot() const {
    std::time_t now = clock.now();
    StatusView view{slotCount, 0, 0, revenueTotal, vehiclesServed, {}};
    for (int i = 0; i < slotCount; ++i) {
        const SlotRecord& slot = slots[i];
        if (!slot.occupied) continue;
        view.slots.push_back(OccupiedSlot{i + 1, slot.occupancy.vehicleId, slot.occupancy.vehicleClass,
                                          utils::hoursBetween(slot.occupancy.entryTime, now)});
    }
    view.occupied = static_cast<int>(view.slots.size());
    view.free = slotCount - view.occupied;
    return view;
}

DailyReport FacilityLedger::dailySummary() {
    return dailySummary(clock.now());
}

DailyReport FacilityLedger::dailySummary(std::time_t at) {
    DailyReport report;
    report.generatedAt = at;
    report.vehicleCount = vehiclesServed;
    report.revenue = revenueTotal;
    report.averagePerVehicle = vehiclesServed > 0 ? revenueTotal / vehiclesServed : 0.0;
    report.peakOccupancy = occupiedCount();
    report.totalSlots = slotCount;
    history.push_back(report);
    return report;
}
