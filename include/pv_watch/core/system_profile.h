#pragma once

#include <string>

namespace pv_watch {

/**
 * @brief Static description of a PV installation
 */
struct SystemProfile {
    double capacity_kw = 10.0;            // nameplate DC capacity
    double electricity_rate = 0.15;       // $/kWh
    double co2_factor = 0.4;              // kg CO2 avoided per kWh
    double max_module_efficiency = 25.0;  // %, physical upper bound
    double system_age_years = 0.0;
    double annual_target_kwh = 0.0;       // 0 = derive from capacity

    /**
     * @brief Annual production target, falling back to 1300 kWh per kWp
     */
    double annualTarget() const {
        return annual_target_kwh > 0.0 ? annual_target_kwh : capacity_kw * 1300.0;
    }
};

} // namespace pv_watch
