#pragma once
#include <ctime>

// 时间来源接口，测试中可替换为固定时间
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::time_t now() const = 0;
};

class SystemClock : public Clock {
public:
    std::time_t now() const override { return std::time(nullptr); }
};
