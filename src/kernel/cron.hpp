#pragma once
#include <bitset>
#include <chrono>
#include <optional>
#include <string>

namespace bastion::kernel {

// Five-field cron expression (min hour dom month dow, UTC) or a fixed
// interval ("every 30s", "every 5m", "every 2h", "every 1d").
class CronSchedule {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // Throws std::invalid_argument with a description of the bad field
    static CronSchedule parse(const std::string& spec);

    // First boundary strictly after t; nullopt if the expression can never fire
    std::optional<TimePoint> next_after(TimePoint t) const;

    bool is_interval() const { return interval_.count() > 0; }
    const std::string& spec() const { return spec_; }

private:
    std::string spec_;
    std::chrono::seconds interval_{0};

    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_of_month_;   // 1-31
    std::bitset<13> months_;          // 1-12
    std::bitset<7> days_of_week_;     // 0 = Sunday
    bool dom_restricted_ = false;
    bool dow_restricted_ = false;

    bool day_matches(int mday, int month, int wday) const;
};

} // namespace bastion::kernel
