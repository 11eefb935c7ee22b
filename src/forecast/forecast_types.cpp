#include "pv_watch/forecast/forecast_types.h"
#include "pv_watch/core/errors.h"

namespace pv_watch {
namespace forecast {

std::string forecastHorizonToString(ForecastHorizon horizon) {
    switch (horizon) {
        case ForecastHorizon::HOUR:  return "hour";
        case ForecastHorizon::DAY:   return "day";
        case ForecastHorizon::WEEK:  return "week";
        case ForecastHorizon::MONTH: return "month";
    }
    return "hour";
}

ForecastHorizon stringToForecastHorizon(const std::string& str) {
    if (str == "hour") return ForecastHorizon::HOUR;
    if (str == "day") return ForecastHorizon::DAY;
    if (str == "week") return ForecastHorizon::WEEK;
    if (str == "month") return ForecastHorizon::MONTH;
    throw InvalidInputError("Unknown forecast horizon: " + str);
}

} // namespace forecast
} // namespace pv_watch
