#include "period.h"
#include "errors.h"
#include <array>
#include <iomanip>
#include <sstream>

namespace monthclose::core {

namespace {

constexpr std::array<const char*, 12> kMonthNames = {
    "Janeiro", "Fevereiro", "Março", "Abril", "Maio", "Junho",
    "Julho", "Agosto", "Setembro", "Outubro", "Novembro", "Dezembro"
};

std::string pad(int value, int width) {
    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << value;
    return ss.str();
}

} // anonymous namespace

PeriodContext::PeriodContext(int year, int month)
    : year_(year), month_(month) {
    if (month < 1 || month > 12) {
        throw ConfigurationError(ConfigErrorCode::InvalidPeriod,
            "Invalid month " + std::to_string(month) + " (expected 1-12)");
    }
    if (year < 1901 || year > 9999) {
        throw ConfigurationError(ConfigErrorCode::InvalidPeriod,
            "Invalid year " + std::to_string(year));
    }
}

std::string PeriodContext::month_2d() const {
    return pad(month_, 2);
}

std::string PeriodContext::month_name() const {
    return kMonthNames[static_cast<size_t>(month_ - 1)];
}

std::string PeriodContext::month_folder() const {
    return month_2d() + "-" + month_name();
}

std::string PeriodContext::tag() const {
    return pad(year_, 4) + "_" + month_2d();
}

std::string PeriodContext::yymm() const {
    return pad(year_ % 100, 2) + month_2d();
}

PeriodContext PeriodContext::previous() const {
    if (month_ == 1) {
        return PeriodContext(year_ - 1, 12, Unchecked{});
    }
    return PeriodContext(year_, month_ - 1, Unchecked{});
}

std::map<std::string, std::string> PeriodContext::variables() const {
    auto prev = previous();
    return {
        {"year", std::to_string(year_)},
        {"month", std::to_string(month_)},
        {"mm", month_2d()},
        {"month_name", month_name()},
        {"month_folder", month_folder()},
        {"tag", tag()},
        {"yymm", yymm()},
        {"prev_year", std::to_string(prev.year())},
        {"prev_mm", prev.month_2d()},
        {"prev_tag", prev.tag()},
    };
}

std::string PeriodContext::to_string() const {
    return pad(year_, 4) + "-" + month_2d();
}

nlohmann::json PeriodContext::to_json() const {
    return {
        {"year", year_},
        {"month", month_},
        {"tag", tag()}
    };
}

} // namespace monthclose::core
