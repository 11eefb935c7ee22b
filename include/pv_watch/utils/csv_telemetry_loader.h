#pragma once

#include "pv_watch/core/telemetry_record.h"
#include <fstream>
#include <functional>
#include <istream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pv_watch {
namespace utils {

/**
 * @brief Telemetry CSV loader
 *
 * Row format (14 columns):
 *   system_id,timestamp,dc_power,ac_power,energy_delta,voltage,current,
 *   frequency,irradiance,ambient_temp,module_temp,performance_ratio,
 *   efficiency,quality
 *
 * timestamp is in milliseconds. The environmental columns may be left empty.
 * Empty lines and lines starting with '#' are skipped.
 */
class CSVTelemetryLoader {
public:
    static constexpr size_t COLUMN_COUNT = 14;

    /**
     * @param filepath CSV file path
     * @param skip_header Skip the first line
     */
    explicit CSVTelemetryLoader(const std::string& filepath, bool skip_header = true)
        : filepath_(filepath), skip_header_(skip_header) {}

    /**
     * @brief Load every record
     * @throw std::runtime_error if the file cannot be opened or a line fails to parse
     */
    std::vector<TelemetryRecord> loadAll() const {
        std::vector<TelemetryRecord> records;
        loadStream([&records](const TelemetryRecord& record) {
            records.push_back(record);
        });
        return records;
    }

    /**
     * @brief Invoke callback once per record, in file order
     * @param callback Record consumer
     * @param max_records Stop after this many records (0 = no limit)
     * @return Number of records delivered
     * @throw std::runtime_error if the file cannot be opened or a line fails to parse
     */
    size_t loadStream(std::function<void(const TelemetryRecord&)> callback,
                      size_t max_records = 0) const {
        std::ifstream file(filepath_);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file: " + filepath_);
        }
        return readStream(file, filepath_, skip_header_, callback, max_records);
    }

    /**
     * @brief Same as loadStream() for an already open stream
     */
    static size_t readStream(std::istream& in,
                             const std::string& source,
                             bool skip_header,
                             const std::function<void(const TelemetryRecord&)>& callback,
                             size_t max_records = 0) {
        std::string line;
        int line_number = 0;
        size_t record_count = 0;

        if (skip_header && std::getline(in, line)) {
            line_number++;
        }

        while (std::getline(in, line)) {
            line_number++;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#') {
                continue;
            }

            TelemetryRecord record;
            try {
                record = parseLine(line);
            } catch (const std::exception& e) {
                throw std::runtime_error(
                    "Parse error at line " + std::to_string(line_number) +
                    " in " + source + ": " + e.what());
            }

            callback(record);
            record_count++;
            if (max_records > 0 && record_count >= max_records) {
                break;
            }
        }

        return record_count;
    }

    /**
     * @brief Parse one data row
     * @throw std::runtime_error on a wrong column count or a malformed number
     */
    static TelemetryRecord parseLine(const std::string& line) {
        std::vector<std::string> tokens = split(line, ',');
        // getline drops a trailing empty field
        if (!line.empty() && line.back() == ',') {
            tokens.emplace_back();
        }

        if (tokens.size() != COLUMN_COUNT) {
            throw std::runtime_error("Invalid CSV format. Expected " +
                                     std::to_string(COLUMN_COUNT) + " columns, got " +
                                     std::to_string(tokens.size()));
        }
        if (tokens[0].empty()) {
            throw std::runtime_error("Empty system id");
        }

        try {
            TelemetryRecord record(tokens[0], std::stoll(tokens[1]));
            record.production.dc_power = std::stod(tokens[2]);
            record.production.ac_power = std::stod(tokens[3]);
            record.production.energy_delta = std::stod(tokens[4]);
            record.production.voltage = std::stod(tokens[5]);
            record.production.current = std::stod(tokens[6]);
            record.production.frequency = std::stod(tokens[7]);
            record.environmental.irradiance = optionalNumber(tokens[8]);
            record.environmental.ambient_temp = optionalNumber(tokens[9]);
            record.environmental.module_temp = optionalNumber(tokens[10]);
            record.performance.performance_ratio = std::stod(tokens[11]);
            record.performance.efficiency = std::stod(tokens[12]);
            record.quality_confidence = std::stod(tokens[13]);
            return record;
        } catch (const std::logic_error& e) {
            // std::invalid_argument / std::out_of_range from stod and stoll
            throw std::runtime_error("Failed to parse numeric values: " + std::string(e.what()));
        }
    }

    static std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(str);
        std::string token;

        while (std::getline(ss, token, delimiter)) {
            tokens.push_back(token);
        }

        return tokens;
    }

private:
    static std::optional<double> optionalNumber(const std::string& token) {
        if (token.empty()) {
            return std::nullopt;
        }
        return std::stod(token);
    }

    std::string filepath_;
    bool skip_header_;
};

} // namespace utils
} // namespace pv_watch
