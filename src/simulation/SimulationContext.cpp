#include "pmsim/simulation/SimulationContext.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/utils/Apportionment.hpp"
#include <cstdint>
#include <initializer_list>
#include <utility>

namespace pmsim {

namespace {

    // Stream ids: provinces use their index, mobility the id after the last province.
    std::uint64_t mobilityStreamId(const ParameterBundle& params) {
        return static_cast<std::uint64_t>(params.provinces.size());
    }

} // namespace

SimulationContext::SimulationContext(const ParameterBundle& params)
    : mobilityStream_(RandomStream::subStream(params.seed, mobilityStreamId(params))) {

    std::vector<double> fractions;
    for (const auto& bc : params.behavior_classes) {
        fractions.push_back(bc.fraction);
    }
    const int num_classes = static_cast<int>(fractions.size());
    const int cap = params.maxDwell();

    provinces_.reserve(params.provinces.size());
    provinceStreams_.reserve(params.provinces.size());
    for (std::size_t i = 0; i < params.provinces.size(); ++i) {
        const ProvinceConfig& cfg = params.provinces[i];
        const int id = static_cast<int>(i);
        provinces_.emplace_back(id, cfg.label.empty() ? "PV_" + std::to_string(id + 1) : cfg.label,
                                cfg.hospital_capacity, cfg.icu_capacity, num_classes, cap);
        provinceStreams_.push_back(RandomStream::subStream(params.seed, static_cast<std::uint64_t>(id)));

        ProvinceState& province = provinces_.back();
        const long susceptible = cfg.population - cfg.initial_exposed - cfg.initial_infectious - cfg.initial_recovered;
        const std::pair<Compartment, long> initial[] = {
            {Compartment::S, susceptible},
            {Compartment::E, cfg.initial_exposed},
            {Compartment::I, cfg.initial_infectious},
            {Compartment::R, cfg.initial_recovered}};
        for (const auto& entry : initial) {
            const std::vector<long> shares = apportionLargestRemainder(entry.second, fractions);
            for (int b = 0; b < num_classes; ++b) {
                province.add(entry.first, CareStatus::Bedded, b, 0, shares[b]);
            }
        }

        initialPopulations_.push_back(cfg.population);
        initialPopulation_ += cfg.population;
    }
}

ProvinceState& SimulationContext::province(int id) {
    if (id < 0 || id >= numProvinces()) {
        PMSIM_THROW_OUT_OF_RANGE("SimulationContext::province", "Province " + std::to_string(id) + " out of range.");
    }
    return provinces_[id];
}

const ProvinceState& SimulationContext::province(int id) const {
    if (id < 0 || id >= numProvinces()) {
        PMSIM_THROW_OUT_OF_RANGE("SimulationContext::province", "Province " + std::to_string(id) + " out of range.");
    }
    return provinces_[id];
}

RandomStream& SimulationContext::provinceStream(int id) {
    if (id < 0 || id >= numProvinces()) {
        PMSIM_THROW_OUT_OF_RANGE("SimulationContext::provinceStream", "Province " + std::to_string(id) + " out of range.");
    }
    return provinceStreams_[id];
}

long SimulationContext::getInitialPopulation(int provinceId) const {
    if (provinceId < 0 || provinceId >= numProvinces()) {
        PMSIM_THROW_OUT_OF_RANGE("SimulationContext::getInitialPopulation", "Province " + std::to_string(provinceId) + " out of range.");
    }
    return initialPopulations_[provinceId];
}

long SimulationContext::totalLiving() const {
    long total = 0;
    for (const auto& p : provinces_) total += p.livingPopulation();
    return total;
}

long SimulationContext::totalDeaths() const {
    long total = 0;
    for (const auto& p : provinces_) total += p.getCumulativeDeaths();
    return total;
}

long SimulationContext::totalActiveInfections() const {
    long total = 0;
    for (const auto& p : provinces_) total += p.activeInfections();
    return total;
}

std::vector<OutputRow> SimulationContext::snapshot() const {
    std::vector<OutputRow> rows;
    rows.reserve(provinces_.size());
    for (const auto& p : provinces_) {
        OutputRow row;
        row.day = day_;
        row.province_id = p.getId();
        row.S = p.compartmentTotal(Compartment::S);
        row.E = p.compartmentTotal(Compartment::E);
        row.I = p.compartmentTotal(Compartment::I);
        row.J3 = p.compartmentTotal(Compartment::J3);
        row.J4 = p.compartmentTotal(Compartment::J4);
        row.R = p.compartmentTotal(Compartment::R);
        row.cumulative_deaths = p.getCumulativeDeaths();
        row.hospital_occupied = p.resources().occupied(Severity::Hospital);
        row.icu_occupied = p.resources().occupied(Severity::ICU);
        rows.push_back(row);
    }
    return rows;
}

std::optional<InvariantViolation> SimulationContext::findInvariantViolation() const {
    for (const auto& p : provinces_) {
        if (p.hasNegativeCell()) {
            return InvariantViolation{"non_negative_cells", p.getId(), "a cohort cell is negative"};
        }
        for (Severity s : {Severity::Hospital, Severity::ICU}) {
            const ResourcePool& pool = p.resources();
            if (pool.occupied(s) < 0 || pool.occupied(s) > pool.capacity(s)) {
                return InvariantViolation{"occupancy_bounds", p.getId(),
                    toString(s) + " occupancy " + std::to_string(pool.occupied(s)) +
                    " outside [0, " + std::to_string(pool.capacity(s)) + "]"};
            }
        }
        const long bedded_j3 = p.compartmentTotal(Compartment::J3, CareStatus::Bedded);
        const long bedded_j4 = p.compartmentTotal(Compartment::J4, CareStatus::Bedded);
        if (bedded_j3 != p.resources().occupied(Severity::Hospital) ||
            bedded_j4 != p.resources().occupied(Severity::ICU)) {
            return InvariantViolation{"occupancy_consistency", p.getId(),
                "bedded J3/J4 (" + std::to_string(bedded_j3) + "/" + std::to_string(bedded_j4) +
                ") differ from hospital/ICU occupancy (" +
                std::to_string(p.resources().occupied(Severity::Hospital)) + "/" +
                std::to_string(p.resources().occupied(Severity::ICU)) + ")"};
        }
    }

    const long accounted = totalLiving() + totalDeaths();
    if (accounted != initialPopulation_) {
        return InvariantViolation{"population_conservation", -1,
            "living + deceased = " + std::to_string(accounted) +
            ", initial population = " + std::to_string(initialPopulation_)};
    }
    return std::nullopt;
}

} // namespace pmsim
