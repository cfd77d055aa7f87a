#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace monthclose::core {

// The (year, month) a run is scoped to. Immutable once constructed.
class PeriodContext {
public:
    // Throws ConfigurationError(InvalidPeriod) for month outside 1-12 or
    // a year outside 1901-9999
    PeriodContext(int year, int month);

    int year() const { return year_; }
    int month() const { return month_; }

    // "10"
    std::string month_2d() const;

    // Localized month name: "Outubro"
    std::string month_name() const;

    // Source folder naming: "10-Outubro"
    std::string month_folder() const;

    // Folder suffix: "2024_10"
    std::string tag() const;

    // Two-digit year + month: "2410"
    std::string yymm() const;

    // The month before this one (January wraps to December of year - 1)
    PeriodContext previous() const;

    // Template variables available to path and command templates
    std::map<std::string, std::string> variables() const;

    // "2024-10"
    std::string to_string() const;

    nlohmann::json to_json() const;

    bool operator==(const PeriodContext& other) const {
        return year_ == other.year_ && month_ == other.month_;
    }

private:
    int year_;
    int month_;

    // Unchecked, for previous()
    struct Unchecked {};
    PeriodContext(int year, int month, Unchecked) : year_(year), month_(month) {}
};

} // namespace monthclose::core
