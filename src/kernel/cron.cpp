#include "kernel/cron.hpp"
#include <cctype>
#include <cstdint>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace bastion::kernel {

namespace {

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

// Leap-day expressions can be four years from their next match
constexpr int64_t MAX_SEARCH_SECONDS = 5 * 366 * SECONDS_PER_DAY;

int parse_number(const std::string& text, const std::string& field) {
    if (text.empty() || text.size() > 4) {
        throw std::invalid_argument("bad number '" + text + "' in " + field);
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("bad number '" + text + "' in " + field);
        }
    }
    return std::stoi(text);
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

// Sets bits [lo, hi] of a field from "*", "n", "a-b" and "/step" forms.
// Returns false when the field is a bare "*".
template <size_t N>
bool parse_field(const std::string& text, int lo, int hi, const std::string& name,
                 std::bitset<N>& bits, bool fold_seven = false) {
    bool restricted = text != "*";

    for (const auto& item : split(text, ',')) {
        std::string range = item;
        int step = 1;

        auto slash = item.find('/');
        if (slash != std::string::npos) {
            range = item.substr(0, slash);
            step = parse_number(item.substr(slash + 1), name);
            if (step <= 0) {
                throw std::invalid_argument("step must be positive in " + name);
            }
        }

        int first = lo;
        int last = hi;
        if (range != "*") {
            auto dash = range.find('-');
            if (dash != std::string::npos) {
                first = parse_number(range.substr(0, dash), name);
                last = parse_number(range.substr(dash + 1), name);
            } else {
                first = parse_number(range, name);
                last = slash != std::string::npos ? hi : first;
            }
        }

        int max_allowed = fold_seven ? 7 : hi;
        if (first < lo || last > max_allowed || first > last) {
            throw std::invalid_argument("value out of range in " + name);
        }

        for (int v = first; v <= last; v += step) {
            bits.set(static_cast<size_t>(fold_seven && v == 7 ? 0 : v));
        }
    }
    return restricted;
}

int64_t to_epoch(CronSchedule::TimePoint t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

} // namespace

CronSchedule CronSchedule::parse(const std::string& spec) {
    CronSchedule schedule;
    schedule.spec_ = spec;

    std::istringstream iss(spec);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }

    if (fields.size() == 2 && fields[0] == "every") {
        const std::string& amount = fields[1];
        if (amount.size() < 2) {
            throw std::invalid_argument("interval needs a number and a unit");
        }
        char unit = amount.back();
        int64_t n = parse_number(amount.substr(0, amount.size() - 1), "interval");
        int64_t scale = 0;
        switch (unit) {
            case 's': scale = 1; break;
            case 'm': scale = SECONDS_PER_MINUTE; break;
            case 'h': scale = SECONDS_PER_HOUR; break;
            case 'd': scale = SECONDS_PER_DAY; break;
            default:
                throw std::invalid_argument(std::string("unknown interval unit '") + unit + "'");
        }
        if (n <= 0) {
            throw std::invalid_argument("interval must be positive");
        }
        schedule.interval_ = std::chrono::seconds(n * scale);
        return schedule;
    }

    if (fields.size() != 5) {
        throw std::invalid_argument("expected 5 cron fields or 'every <n><s|m|h|d>'");
    }

    parse_field(fields[0], 0, 59, "minute", schedule.minutes_);
    parse_field(fields[1], 0, 23, "hour", schedule.hours_);
    schedule.dom_restricted_ = parse_field(fields[2], 1, 31, "day-of-month", schedule.days_of_month_);
    parse_field(fields[3], 1, 12, "month", schedule.months_);
    schedule.dow_restricted_ = parse_field(fields[4], 0, 6, "day-of-week", schedule.days_of_week_, true);
    return schedule;
}

bool CronSchedule::day_matches(int mday, int month, int wday) const {
    if (!months_.test(static_cast<size_t>(month))) return false;

    bool dom = days_of_month_.test(static_cast<size_t>(mday));
    bool dow = days_of_week_.test(static_cast<size_t>(wday));

    // Classic cron: when both day fields are restricted either may match
    if (dom_restricted_ && dow_restricted_) return dom || dow;
    if (dom_restricted_) return dom;
    if (dow_restricted_) return dow;
    return true;
}

std::optional<CronSchedule::TimePoint> CronSchedule::next_after(TimePoint t) const {
    if (is_interval()) {
        return t + interval_;
    }

    int64_t start = to_epoch(t);
    // Next whole minute strictly after t
    int64_t s = start - start % SECONDS_PER_MINUTE + SECONDS_PER_MINUTE;

    while (s - start <= MAX_SEARCH_SECONDS) {
        std::time_t tt = static_cast<std::time_t>(s);
        std::tm tm{};
        gmtime_r(&tt, &tm);

        if (!day_matches(tm.tm_mday, tm.tm_mon + 1, tm.tm_wday)) {
            s = s - s % SECONDS_PER_DAY + SECONDS_PER_DAY;
            continue;
        }
        if (!hours_.test(static_cast<size_t>(tm.tm_hour))) {
            s = s - s % SECONDS_PER_HOUR + SECONDS_PER_HOUR;
            continue;
        }
        if (!minutes_.test(static_cast<size_t>(tm.tm_min))) {
            s += SECONDS_PER_MINUTE;
            continue;
        }
        return TimePoint(std::chrono::seconds(s));
    }
    return std::nullopt;
}

} // namespace bastion::kernel
