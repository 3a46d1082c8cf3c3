#pragma once
#include "ledger.hpp"
#include <string>

std::string formatAmount(double amount);
std::string formatAdmission(const std::string& vehicleId, const std::string& vehicleClass, const Admission& a);
std::string formatReceipt(const Receipt& r);
std::string formatStatus(const StatusView& view);
std::string formatReport(const DailyReport& report);

// 生成日报并以追加方式写入文件
bool saveReport(FacilityLedger& ledger, const std::string& filename, std::string& msg);
