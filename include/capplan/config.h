#pragma once
/*
===============================================================================
CONFIG — JSON planning requests
===============================================================================

OVERVIEW
--------
A planning request file bundles the two inputs of a plan and, optionally,
solver settings:

    {
      "catalog": {
        "on_demand_rate": 0.64,
        "term_days": 365,                       // optional, default 365
        "tiers": [
          { "id": "light",  "fixed_cost": 552,  "hourly_cost": 0.312 },
          { "id": "medium", "fixed_cost": 1280, "hourly_cost": 0.192 },
          { "id": "heavy",  "fixed_cost": 1560, "hourly_cost": 0.128 }
        ]
      },
      "schedule": {
        "horizon_days": 1,                      // optional, default 1
        "periods": [
          { "id": "night",   "demand": 12.2, "hours": 8 },
          { "id": "morning", "demand": 25.1, "hours": 8 },
          { "id": "evening", "demand": 53.5, "hours": 8 }
        ]
      },
      "solver": {                               // optional
        "time_limit": 30, "mip_gap": 0, "threads": 0, "quiet": true
      }
    }

This layer checks structure only (fields present, right JSON types). Value
checks (negative costs, duplicate ids, ...) belong to ModelBuilder, so a
request built in code and one read from disk are validated the same way.
Solver settings are the exception: they go to the solver unchecked, so
threads must be a non-negative integer and time_limit, mip_gap >= 0.

ERRORS
------
• Unreadable file, malformed JSON, missing field or wrong type -> ConfigError
  whose message names the file and the JSON path, e.g.
  "request.json: catalog.tiers[1].fixed_cost: type must be number, but is string"

===============================================================================
*/

#include <cstddef>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "errors.h"
#include "pricing.h"
#include "solver.h"

namespace capplan {

    using json = nlohmann::json;

    /// @brief Everything needed to run one plan
    struct PlanningRequest {
        DemandSchedule schedule;
        PricingCatalog catalog;
        SolveOptions options;
    };

    namespace config_detail {

        /// @brief Re-throws JSON access errors as ConfigError carrying a path
        template<typename Fn>
        auto at(const std::string& path, Fn&& fn) -> decltype(fn()) {
            try {
                return fn();
            } catch (const json::exception& e) {
                throw ConfigError(path + ": " + e.what());
            }
        }

        template<typename T>
        T requiredField(const json& j, const std::string& parent, const char* key) {
            const std::string path = parent.empty() ? key : parent + "." + key;
            if (!j.is_object() || !j.contains(key)) {
                throw ConfigError(path + ": missing required field");
            }
            return at(path, [&] { return j.at(key).get<T>(); });
        }

        template<typename T>
        T optionalField(const json& j, const std::string& parent, const char* key, T fallback) {
            if (!j.is_object() || !j.contains(key)) {
                return fallback;
            }
            const std::string path = parent.empty() ? key : parent + "." + key;
            return at(path, [&] { return j.at(key).get<T>(); });
        }

        inline double nonNegativeNumber(const json& j, const std::string& parent,
                                        const char* key, double fallback) {
            const double value = optionalField<double>(j, parent, key, fallback);
            if (!(value >= 0.0)) {
                throw ConfigError(parent + "." + key + ": must be >= 0, got " + j.at(key).dump());
            }
            return value;
        }

        inline int nonNegativeInteger(const json& j, const std::string& parent,
                                      const char* key, int fallback) {
            if (!j.is_object() || !j.contains(key)) {
                return fallback;
            }
            const json& v = j.at(key);
            if (!v.is_number_integer() || v.get<double>() < 0.0
                || v.get<double>() > std::numeric_limits<int>::max()) {
                throw ConfigError(parent + "." + key + ": must be a non-negative integer, got "
                                  + v.dump());
            }
            return v.get<int>();
        }

        inline const json& requiredArray(const json& j, const std::string& parent, const char* key) {
            const std::string path = parent + "." + key;
            if (!j.is_object() || !j.contains(key)) {
                throw ConfigError(path + ": missing required field");
            }
            const json& arr = j.at(key);
            if (!arr.is_array()) {
                throw ConfigError(path + ": must be an array");
            }
            return arr;
        }

        inline std::string element(const std::string& path, std::size_t i) {
            return path + "[" + std::to_string(i) + "]";
        }

    } // namespace config_detail

    inline PricingCatalog parseCatalog(const json& j) {
        using namespace config_detail;
        const std::string base = "catalog";
        if (!j.is_object()) throw ConfigError(base + ": must be an object");

        PricingCatalog catalog;
        catalog.onDemandRate = requiredField<double>(j, base, "on_demand_rate");
        catalog.termDays = optionalField<double>(j, base, "term_days", kDefaultTermDays);

        const json& tiers = requiredArray(j, base, "tiers");
        for (std::size_t i = 0; i < tiers.size(); ++i) {
            const std::string path = element(base + ".tiers", i);
            const json& t = tiers[i];
            if (!t.is_object()) throw ConfigError(path + ": must be an object");
            catalog.tiers.push_back(PricingTier{
                requiredField<std::string>(t, path, "id"),
                requiredField<double>(t, path, "fixed_cost"),
                requiredField<double>(t, path, "hourly_cost")});
        }
        return catalog;
    }

    inline DemandSchedule parseSchedule(const json& j) {
        using namespace config_detail;
        const std::string base = "schedule";
        if (!j.is_object()) throw ConfigError(base + ": must be an object");

        DemandSchedule schedule;
        schedule.horizonDays = optionalField<double>(j, base, "horizon_days", kDefaultHorizonDays);

        const json& periods = requiredArray(j, base, "periods");
        for (std::size_t i = 0; i < periods.size(); ++i) {
            const std::string path = element(base + ".periods", i);
            const json& p = periods[i];
            if (!p.is_object()) throw ConfigError(path + ": must be an object");
            schedule.periods.push_back(Period{
                requiredField<std::string>(p, path, "id"),
                requiredField<double>(p, path, "demand"),
                requiredField<double>(p, path, "hours")});
        }
        return schedule;
    }

    inline SolveOptions parseSolveOptions(const json& j) {
        using namespace config_detail;
        const std::string base = "solver";
        if (!j.is_object()) throw ConfigError(base + ": must be an object");

        SolveOptions options;
        options.timeLimitSeconds = nonNegativeNumber(j, base, "time_limit", options.timeLimitSeconds);
        options.mipGap = nonNegativeNumber(j, base, "mip_gap", options.mipGap);
        options.threads = nonNegativeInteger(j, base, "threads", options.threads);
        options.quiet = optionalField<bool>(j, base, "quiet", options.quiet);
        return options;
    }

    inline json solveOptionsToJson(const SolveOptions& options) {
        return json{
            {"time_limit", options.timeLimitSeconds},
            {"mip_gap", options.mipGap},
            {"threads", options.threads},
            {"quiet", options.quiet}};
    }

    /**
     * @brief Parse an already-decoded request document
     * @throws ConfigError on any structural problem
     */
    inline PlanningRequest parseRequest(const json& j) {
        if (!j.is_object()) {
            throw ConfigError("request: must be a JSON object");
        }
        if (!j.contains("catalog")) throw ConfigError("catalog: missing required field");
        if (!j.contains("schedule")) throw ConfigError("schedule: missing required field");

        PlanningRequest request;
        request.catalog = parseCatalog(j.at("catalog"));
        request.schedule = parseSchedule(j.at("schedule"));
        if (j.contains("solver")) {
            request.options = parseSolveOptions(j.at("solver"));
        }
        return request;
    }

    /// @brief Parse request text
    inline PlanningRequest parseRequestText(const std::string& text) {
        json j;
        try {
            j = json::parse(text);
        } catch (const json::parse_error& e) {
            throw ConfigError(std::string("request: ") + e.what());
        }
        return parseRequest(j);
    }

    /**
     * @brief Read and parse a request file
     * @throws ConfigError prefixed with the file path
     */
    inline PlanningRequest loadRequest(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigError(path + ": cannot open request file");
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();

        try {
            return parseRequestText(buffer.str());
        } catch (const ConfigError& e) {
            throw ConfigError(path + ": " + e.what());
        }
    }

} // namespace capplan
