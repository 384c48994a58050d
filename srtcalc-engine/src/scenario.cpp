#include "scenario.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace srtcalc {

// ============================================================================
// ScenarioInput Implementation
// ============================================================================

ScenarioInput::ScenarioInput() : stress_multiplier(1.0), trigger_year(1) {}

ScenarioInput::ScenarioInput(double stress, int trigger, std::string id)
    : scenario_id(std::move(id)), stress_multiplier(stress), trigger_year(trigger) {}

void ScenarioInput::validate(const DealParameters& deal) const {
    if (!std::isfinite(stress_multiplier) || stress_multiplier <= 0.0) {
        std::ostringstream oss;
        oss << "stress_multiplier must be positive, got " << stress_multiplier;
        throw ConfigurationError(oss.str());
    }
    if (trigger_year < 1 || trigger_year > deal.maturity) {
        throw ConfigurationError("trigger_year must be in [1, " + std::to_string(deal.maturity)
                                 + "], got " + std::to_string(trigger_year));
    }
}

// ============================================================================
// ScenarioSet Implementation
// ============================================================================

ScenarioSet::ScenarioSet() = default;

void ScenarioSet::label(ScenarioInput& scenario) const {
    if (scenario.scenario_id.empty()) {
        scenario.scenario_id = "Stress " + std::to_string(scenarios_.size() + 1);
    }
}

void ScenarioSet::add(const ScenarioInput& scenario) {
    ScenarioInput copy = scenario;
    label(copy);
    scenarios_.push_back(std::move(copy));
}

void ScenarioSet::add(ScenarioInput&& scenario) {
    label(scenario);
    scenarios_.push_back(std::move(scenario));
}

void ScenarioSet::add(double stress_multiplier, int trigger_year) {
    add(ScenarioInput(stress_multiplier, trigger_year));
}

const ScenarioInput& ScenarioSet::get(size_t index) const {
    if (index >= scenarios_.size()) {
        throw std::out_of_range("Scenario index out of range");
    }
    return scenarios_[index];
}

size_t ScenarioSet::size() const {
    return scenarios_.size();
}

bool ScenarioSet::empty() const {
    return scenarios_.empty();
}

void ScenarioSet::reserve(size_t count) {
    scenarios_.reserve(count);
}

void ScenarioSet::clear() {
    scenarios_.clear();
}

ScenarioSet ScenarioSet::grid(const std::vector<double>& stress_multipliers,
                              const std::vector<int>& trigger_years) {
    ScenarioSet set;
    set.reserve(stress_multipliers.size() * trigger_years.size());
    for (double stress : stress_multipliers) {
        for (int trigger : trigger_years) {
            set.add(stress, trigger);
        }
    }
    return set;
}

ScenarioSet ScenarioSet::paired(const std::vector<double>& stress_multipliers,
                                const std::vector<int>& trigger_years) {
    if (stress_multipliers.size() != trigger_years.size()) {
        throw std::invalid_argument("Paired scenarios need one trigger year per stress multiplier ("
                                    + std::to_string(stress_multipliers.size()) + " stresses, "
                                    + std::to_string(trigger_years.size()) + " trigger years)");
    }
    ScenarioSet set;
    set.reserve(stress_multipliers.size());
    for (size_t i = 0; i < stress_multipliers.size(); ++i) {
        set.add(stress_multipliers[i], trigger_years[i]);
    }
    return set;
}

ScenarioSet ScenarioSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open scenario file: " + filepath);
    }
    return load_from_csv(file);
}

ScenarioSet ScenarioSet::load_from_csv(std::istream& is) {
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        throw std::runtime_error("Empty scenario CSV");
    }

    // Locate columns by name so the optional id column may appear anywhere
    int stress_idx = -1;
    int trigger_idx = -1;
    int id_idx = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string h = header[i];
        std::transform(h.begin(), h.end(), h.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (h == "stress_multiplier") stress_idx = static_cast<int>(i);
        else if (h == "trigger_year") trigger_idx = static_cast<int>(i);
        else if (h == "scenario_id") id_idx = static_cast<int>(i);
    }
    if (stress_idx < 0 || trigger_idx < 0) {
        throw std::runtime_error("Scenario CSV requires columns: stress_multiplier,trigger_year");
    }

    const size_t required = static_cast<size_t>(std::max(stress_idx, trigger_idx)) + 1;

    ScenarioSet set;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;
        if (row.size() < required) {
            throw std::runtime_error("Scenario CSV row has too few columns (line "
                                     + std::to_string(reader.line_number()) + ")");
        }

        ScenarioInput scenario;
        try {
            scenario.stress_multiplier = std::stod(row[static_cast<size_t>(stress_idx)]);
            scenario.trigger_year = std::stoi(row[static_cast<size_t>(trigger_idx)]);
        } catch (const std::logic_error& e) {
            throw std::runtime_error("Scenario CSV has a non-numeric value (line "
                                     + std::to_string(reader.line_number()) + "): " + e.what());
        }
        if (id_idx >= 0 && static_cast<size_t>(id_idx) < row.size()) {
            scenario.scenario_id = row[static_cast<size_t>(id_idx)];
        }
        set.add(std::move(scenario));
    }

    return set;
}

} // namespace srtcalc
