#include "settings_review.hpp"
#include "settings_review/example_scenarios.hpp"

#include <cstring>
#include <iostream>
#include <optional>
#include <string>

using namespace settings_review;

namespace {

void
print_usage(const char *program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--input FILE | --scenario meal|fasting] [--json]"
              << '\n';
}

} // namespace

int
main(int argc, char **argv) {
    std::string config_path;
    std::string input_path;
    std::string scenario = "meal";
    bool as_json = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
            input_path = argv[++i];
        } else if (std::strcmp(argv[i], "--scenario") == 0 && i + 1 < argc) {
            scenario = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            as_json = true;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        EstimationConfig config = config_path.empty() ? EstimationConfig() : load_estimation_config(config_path);

        SessionInputs inputs;
        if (!input_path.empty()) {
            inputs = load_session_inputs(input_path);
        } else if (scenario == "meal") {
            if (!as_json) { std::cout << "--- Simulated meal scenario ---" << '\n'; }
            inputs = examples::make_meal_scenario();
        } else if (scenario == "fasting") {
            if (!as_json) { std::cout << "--- Simulated fasting scenario ---" << '\n'; }
            inputs = examples::make_fasting_scenario();
        } else {
            print_usage(argv[0]);
            return 2;
        }

        auto session = make_session(inputs, config);
        session->update_parameter_estimates();

        std::optional<EstimatedMultipliers> combined;
        if (config.combined.enabled) {
            CombinedMultiplierEstimator estimator(config.combined, config.verbose);
            combined = estimator.estimate(*session);
        }

        if (as_json) {
            std::cout << render_report_json(*session, combined).dump(2) << '\n';
        } else {
            std::cout << render_report(*session, config.report, combined) << '\n';
        }
    } catch (const std::exception &e) {
        std::cerr << "Error running settings review: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
