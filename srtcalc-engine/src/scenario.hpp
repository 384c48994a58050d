#ifndef SRTCALC_SCENARIO_HPP
#define SRTCALC_SCENARIO_HPP

#include "deal.hpp"
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace srtcalc {

// ScenarioInput: one credit stress applied to the deal
struct ScenarioInput {
    std::string scenario_id;        // Label carried into every period record
    double stress_multiplier;       // Scales annual_loss_rate
    int trigger_year;               // Year sequential amortisation is forced on

    ScenarioInput();
    ScenarioInput(double stress, int trigger, std::string id = "");

    // Throws ConfigurationError if the scenario is not runnable against the deal
    void validate(const DealParameters& deal) const;
};

// ScenarioSet: ordered list of stress scenarios to run
class ScenarioSet {
public:
    ScenarioSet();

    // Scenarios without an id are labelled "Stress <n>" (1-based position)
    void add(const ScenarioInput& scenario);
    void add(ScenarioInput&& scenario);
    void add(double stress_multiplier, int trigger_year);

    const ScenarioInput& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<ScenarioInput>& scenarios() const { return scenarios_; }

    void reserve(size_t count);
    void clear();

    // Every stress against every trigger year, stress-major order
    static ScenarioSet grid(const std::vector<double>& stress_multipliers,
                            const std::vector<int>& trigger_years);

    // stress_multipliers[i] paired with trigger_years[i]; lengths must match
    static ScenarioSet paired(const std::vector<double>& stress_multipliers,
                              const std::vector<int>& trigger_years);

    // Load from CSV: expects columns stress_multiplier,trigger_year[,scenario_id]
    static ScenarioSet load_from_csv(const std::string& filepath);
    static ScenarioSet load_from_csv(std::istream& is);

private:
    std::vector<ScenarioInput> scenarios_;

    void label(ScenarioInput& scenario) const;
};

} // namespace srtcalc

#endif // SRTCALC_SCENARIO_HPP
