#include "pv_watch/detection/detection_config.h"
#include "pv_watch/core/errors.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pv_watch {
namespace detection {

namespace {

std::string toLower(const std::string& str) {
    std::string lower = str;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

} // anonymous namespace

std::string sensitivityToString(Sensitivity sensitivity) {
    switch (sensitivity) {
        case Sensitivity::LOW: return "low";
        case Sensitivity::MEDIUM: return "medium";
        case Sensitivity::HIGH: return "high";
        default: return "unknown";
    }
}

Sensitivity stringToSensitivity(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "low") return Sensitivity::LOW;
    if (lower == "medium") return Sensitivity::MEDIUM;
    if (lower == "high") return Sensitivity::HIGH;
    throw std::invalid_argument("Unknown sensitivity: " + str);
}

std::string exclusionTypeToString(ExclusionType type) {
    switch (type) {
        case ExclusionType::WEATHER: return "weather";
        case ExclusionType::MAINTENANCE: return "maintenance";
        case ExclusionType::GRID: return "grid";
        case ExclusionType::MANUAL: return "manual";
        default: return "unknown";
    }
}

ExclusionType stringToExclusionType(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "weather") return ExclusionType::WEATHER;
    if (lower == "maintenance") return ExclusionType::MAINTENANCE;
    if (lower == "grid") return ExclusionType::GRID;
    if (lower == "manual") return ExclusionType::MANUAL;
    throw std::invalid_argument("Unknown exclusion type: " + str);
}

// ========== ExclusionCondition ==========

ExclusionCondition ExclusionCondition::weather(double precipitation_threshold,
                                               double min_irradiance) {
    ExclusionCondition c;
    c.type = ExclusionType::WEATHER;
    c.condition = "precipitation > " + std::to_string(precipitation_threshold) +
                  " or irradiance < " + std::to_string(min_irradiance);
    c.parameters["precipitation_threshold"] = precipitation_threshold;
    c.parameters["min_irradiance"] = min_irradiance;
    return c;
}

ExclusionCondition ExclusionCondition::maintenance(double buffer_hours) {
    ExclusionCondition c;
    c.type = ExclusionType::MAINTENANCE;
    c.condition = "scheduled_maintenance";
    c.parameters["buffer_hours"] = buffer_hours;
    return c;
}

ExclusionCondition ExclusionCondition::grid(double outage_voltage) {
    ExclusionCondition c;
    c.type = ExclusionType::GRID;
    c.condition = "grid_outage";
    c.parameters["outage_voltage"] = outage_voltage;
    return c;
}

ExclusionCondition ExclusionCondition::manual(int64_t start_ms, int64_t end_ms) {
    ExclusionCondition c;
    c.type = ExclusionType::MANUAL;
    c.condition = "manual_window";
    c.parameters["start_ms"] = static_cast<double>(start_ms);
    c.parameters["end_ms"] = static_cast<double>(end_ms);
    return c;
}

// ========== SeverityThresholds ==========

double SeverityThresholds::forSeverity(Severity severity) const {
    switch (severity) {
        case Severity::CRITICAL: return critical;
        case Severity::WARNING: return warning;
        case Severity::INFO:
        default: return info;
    }
}

// ========== DetectionConfig ==========

DetectionConfig DetectionConfig::defaults(const std::string& system_id) {
    DetectionConfig config;
    config.system_id = system_id;
    config.methods = {
        "statistical_outlier",
        "threshold_analysis",
        "trend_analysis",
        "comparative_analysis",
        "physics_based",
        "seasonal_anomaly"
    };
    config.exclusions.push_back(ExclusionCondition::weather());
    config.exclusions.push_back(ExclusionCondition::maintenance());
    return config;
}

DetectionConfig DetectionConfig::fromConfigMap(const ConfigMap& map) {
    using utils::getConfigValue;

    DetectionConfig config = defaults(getConfigValue<std::string>(map, "system_id", ""));
    config.enabled = getConfigValue<bool>(map, "enabled", config.enabled);

    auto sensitivity = map.find("sensitivity");
    if (sensitivity != map.end()) {
        try {
            config.sensitivity = stringToSensitivity(sensitivity->second);
        } catch (const std::invalid_argument& e) {
            throw InvalidInputError(e.what());
        }
    }

    auto methods = map.find("methods");
    if (methods != map.end()) {
        config.methods = utils::splitList(methods->second);
    }

    // Severity score thresholds
    SeverityThresholds& st = config.severity_thresholds;
    st.info = getConfigValue<double>(map, "severity.info", st.info);
    st.warning = getConfigValue<double>(map, "severity.warning", st.warning);
    st.critical = getConfigValue<double>(map, "severity.critical", st.critical);

    // Alert frequency caps
    FrequencyLimits& fl = config.frequency;
    fl.max_per_hour = getConfigValue<int>(map, "frequency.max_per_hour", fl.max_per_hour);
    fl.max_per_day = getConfigValue<int>(map, "frequency.max_per_day", fl.max_per_day);
    fl.cooldown_minutes = getConfigValue<int>(map, "frequency.cooldown_minutes", fl.cooldown_minutes);

    // Impact minimums
    ImpactMinimums& im = config.impact;
    im.min_production_loss = getConfigValue<double>(map, "impact.min_production_loss", im.min_production_loss);
    im.min_efficiency_drop = getConfigValue<double>(map, "impact.min_efficiency_drop", im.min_efficiency_drop);
    im.min_financial_impact = getConfigValue<double>(map, "impact.min_financial_impact", im.min_financial_impact);

    config.historical_window_days =
        getConfigValue<int>(map, "historical_window_days", config.historical_window_days);
    config.minimum_data_points =
        getConfigValue<size_t>(map, "minimum_data_points", config.minimum_data_points);

    // System profile
    SystemProfile& sp = config.system;
    sp.capacity_kw = getConfigValue<double>(map, "system.capacity_kw", sp.capacity_kw);
    sp.electricity_rate = getConfigValue<double>(map, "system.electricity_rate", sp.electricity_rate);
    sp.co2_factor = getConfigValue<double>(map, "system.co2_factor", sp.co2_factor);
    sp.max_module_efficiency =
        getConfigValue<double>(map, "system.max_module_efficiency", sp.max_module_efficiency);
    sp.system_age_years = getConfigValue<double>(map, "system.system_age_years", sp.system_age_years);
    sp.annual_target_kwh = getConfigValue<double>(map, "system.annual_target_kwh", sp.annual_target_kwh);

    // Exclusions: the list replaces the defaults, parameters override per type
    auto exclusions = map.find("exclusions");
    if (exclusions != map.end()) {
        config.exclusions.clear();
        for (const auto& name : utils::splitList(exclusions->second)) {
            ExclusionType type;
            try {
                type = stringToExclusionType(name);
            } catch (const std::invalid_argument& e) {
                throw InvalidInputError(e.what());
            }
            switch (type) {
                case ExclusionType::WEATHER:
                    config.exclusions.push_back(ExclusionCondition::weather());
                    break;
                case ExclusionType::MAINTENANCE:
                    config.exclusions.push_back(ExclusionCondition::maintenance());
                    break;
                case ExclusionType::GRID:
                    config.exclusions.push_back(ExclusionCondition::grid());
                    break;
                case ExclusionType::MANUAL:
                    config.exclusions.push_back(ExclusionCondition::manual(0, 0));
                    break;
            }
        }
    }
    for (auto& exclusion : config.exclusions) {
        std::string prefix = "exclusion." + exclusionTypeToString(exclusion.type) + ".";
        for (const auto& [key, value] : utils::subConfig(map, prefix)) {
            if (key == "enabled") {
                exclusion.enabled = getConfigValue<bool>({{key, value}}, key, exclusion.enabled);
            } else if (key == "condition") {
                exclusion.condition = value;
            } else {
                exclusion.parameters[key] =
                    getConfigValue<double>({{key, value}}, key, exclusion.parameter(key, 0.0));
            }
        }
    }

    // method.<name>.<parameter>
    for (const auto& [key, value] : utils::subConfig(map, "method.")) {
        size_t dot = key.find('.');
        if (dot == std::string::npos || dot == 0 || dot + 1 >= key.size()) {
            throw InvalidInputError("Malformed method parameter key: method." + key);
        }
        config.method_params[key.substr(0, dot)][key.substr(dot + 1)] = value;
    }

    config.validate();
    return config;
}

void DetectionConfig::validate() const {
    if (system_id.empty()) {
        throw InvalidInputError("Detection config requires a system_id");
    }

    const SeverityThresholds& st = severity_thresholds;
    if (st.info < 0.0 || st.critical > 1.0 ||
        !(st.info < st.warning && st.warning < st.critical)) {
        throw InvalidInputError(
            "Severity thresholds must satisfy 0 <= info < warning < critical <= 1 "
            "for system '" + system_id + "'");
    }

    if (frequency.max_per_hour < 0 || frequency.max_per_day < 0 ||
        frequency.cooldown_minutes < 0) {
        throw InvalidInputError("Frequency limits must be non-negative");
    }

    if (impact.min_production_loss < 0.0 || impact.min_efficiency_drop < 0.0 ||
        impact.min_financial_impact < 0.0) {
        throw InvalidInputError("Impact minimums must be non-negative");
    }

    if (historical_window_days <= 0) {
        throw InvalidInputError("historical_window_days must be positive");
    }
    if (minimum_data_points == 0) {
        throw InvalidInputError("minimum_data_points must be positive");
    }
    if (system.capacity_kw <= 0.0) {
        throw InvalidInputError("system.capacity_kw must be positive");
    }

    for (const auto& exclusion : exclusions) {
        if (exclusion.type == ExclusionType::MANUAL && exclusion.enabled &&
            !exclusion.predicate &&
            exclusion.parameter("end_ms", 0.0) < exclusion.parameter("start_ms", 0.0)) {
            throw InvalidInputError("Manual exclusion window ends before it starts");
        }
    }
}

ConfigMap DetectionConfig::methodConfig(const std::string& method) const {
    ConfigMap result;
    auto it = method_params.find(method);
    if (it != method_params.end()) {
        result = it->second;
    }
    result.emplace("sensitivity", sensitivityToString(sensitivity));
    result.emplace("capacity_kw", std::to_string(system.capacity_kw));
    result.emplace("max_module_efficiency", std::to_string(system.max_module_efficiency));
    return result;
}

bool DetectionConfig::methodEnabled(const std::string& method) const {
    return std::find(methods.begin(), methods.end(), method) != methods.end();
}

} // namespace detection
} // namespace pv_watch
