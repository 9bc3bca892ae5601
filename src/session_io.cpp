#include "session_io.hpp"
#include <fstream>
#include <optional>
#include <stdexcept>

namespace settings_review {

namespace {

template<typename Sample>
std::vector<Sample>
parse_series(const nlohmann::json &document, const char *key) {
    std::vector<Sample> series;
    if (!document.contains(key) || document.at(key).is_null()) { return series; }

    const auto &items = document.at(key);
    if (!items.is_array()) { throw std::runtime_error(std::string("[SessionIO] '") + key + "' must be an array."); }

    series.reserve(items.size());
    for (const auto &item : items) {
        if (!item.contains("start") || !item.contains("value")) {
            throw std::runtime_error(std::string("[SessionIO] Sample in '") + key + "' needs 'start' and 'value'.");
        }
        Sample sample;
        sample.start_date = time_from_seconds(item.at("start").get<double>());
        sample.end_date = item.contains("end") ? time_from_seconds(item.at("end").get<double>()) : sample.start_date;
        sample.value = item.at("value").get<double>();
        series.push_back(sample);
    }
    return series;
}

std::optional<double>
optional_number(const nlohmann::json &item, const char *key) {
    if (!item.contains(key) || item.at(key).is_null()) { return std::nullopt; }
    return item.at(key).get<double>();
}

std::optional<TimePoint>
optional_time(const nlohmann::json &item, const char *key) {
    auto seconds = optional_number(item, key);
    if (!seconds) { return std::nullopt; }
    return time_from_seconds(*seconds);
}

template<typename Sample>
nlohmann::json
series_to_json(const std::vector<Sample> &series) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto &sample : series) {
        items.push_back({ { "start", seconds_since_epoch(sample.start_date) },
                          { "end", seconds_since_epoch(sample.end_date) },
                          { "value", sample.value } });
    }
    return items;
}

} // namespace

SessionInputs
parse_session_inputs(const nlohmann::json &document) {
    SessionInputs inputs;
    try {
        if (!document.contains("start") || !document.contains("end")) {
            throw std::runtime_error("[SessionIO] Session inputs need 'start' and 'end'.");
        }
        inputs.start_date = time_from_seconds(document.at("start").get<double>());
        inputs.end_date = time_from_seconds(document.at("end").get<double>());
        if (inputs.end_date < inputs.start_date) { throw std::runtime_error("[SessionIO] Session 'end' precedes 'start'."); }

        inputs.series.glucose = parse_series<GlucoseSample>(document, "glucose");
        inputs.series.insulin_effect = parse_series<GlucoseEffect>(document, "insulin_effect");
        inputs.series.basal_effect = parse_series<GlucoseEffect>(document, "basal_effect");

        if (document.contains("carb_records") && !document.at("carb_records").is_null()) {
            for (const auto &item : document.at("carb_records")) {
                CarbAbsorptionRecord record;
                record.observed_start = optional_time(item, "observed_start");
                record.observed_end = optional_time(item, "observed_end");
                record.entered_carbs = optional_number(item, "entered_carbs");
                record.observed_carbs = optional_number(item, "observed_carbs");
                record.estimated_time_remaining = optional_number(item, "estimated_time_remaining");
                inputs.carb_records.push_back(record);
            }
        }
    } catch (const nlohmann::json::exception &e) {
        throw std::runtime_error(std::string("[SessionIO] Malformed session inputs: ") + e.what());
    }
    return inputs;
}

SessionInputs
load_session_inputs(const std::string &path) {
    std::ifstream input(path);
    if (!input) { throw std::runtime_error("[SessionIO] Cannot open input file '" + path + "'."); }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("[SessionIO] Cannot parse '" + path + "': " + e.what());
    }
    return parse_session_inputs(document);
}

nlohmann::json
session_inputs_to_json(const SessionInputs &inputs) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto &record : inputs.carb_records) {
        nlohmann::json item = nlohmann::json::object();
        if (record.observed_start) { item["observed_start"] = seconds_since_epoch(*record.observed_start); }
        if (record.observed_end) { item["observed_end"] = seconds_since_epoch(*record.observed_end); }
        if (record.entered_carbs) { item["entered_carbs"] = *record.entered_carbs; }
        if (record.observed_carbs) { item["observed_carbs"] = *record.observed_carbs; }
        if (record.estimated_time_remaining) { item["estimated_time_remaining"] = *record.estimated_time_remaining; }
        records.push_back(item);
    }

    return { { "start", seconds_since_epoch(inputs.start_date) },
             { "end", seconds_since_epoch(inputs.end_date) },
             { "glucose", series_to_json(inputs.series.glucose) },
             { "insulin_effect", series_to_json(inputs.series.insulin_effect) },
             { "basal_effect", series_to_json(inputs.series.basal_effect) },
             { "carb_records", records } };
}

std::unique_ptr<EstimationSession>
make_session(const SessionInputs &inputs, const EstimationConfig &config) {
    auto session = std::make_unique<EstimationSession>(inputs.start_date, inputs.end_date, config);
    session->set_glucose(inputs.series.glucose);
    session->set_insulin_effect(inputs.series.insulin_effect);
    session->set_basal_effect(inputs.series.basal_effect);
    session->set_carb_records(inputs.carb_records);
    return session;
}

} // namespace settings_review
