#include "pmsim/model/MobilityNetwork.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include "pmsim/utils/Apportionment.hpp"
#include <algorithm>

namespace pmsim {

namespace {

    struct Departure {
        int origin;
        int destination;
        Eigen::Index cell;
        long count;
    };

} // namespace

MobilityNetwork::MobilityNetwork(int numProvinces,
                                 const std::vector<MobilityEdge>& edges,
                                 const std::array<bool, NUM_COMPARTMENTS>& movable,
                                 std::vector<BehaviorClass> behaviorClasses,
                                 std::shared_ptr<IInterventionSchedule> mobilitySchedule)
    : adjacency_(numProvinces),
      outgoingWeight_(numProvinces, 0.0),
      movable_(movable),
      classes_(std::move(behaviorClasses)),
      schedule_(std::move(mobilitySchedule)) {
    if (numProvinces < 0) {
        PMSIM_THROW_INVALID_PARAM("MobilityNetwork", "Number of provinces must be non-negative.");
    }
    movable_[index(Compartment::J3)] = false;
    movable_[index(Compartment::J4)] = false;

    for (const auto& e : edges) {
        if (e.from < 0 || e.from >= numProvinces || e.to < 0 || e.to >= numProvinces) {
            PMSIM_THROW_INVALID_PARAM("MobilityNetwork", "Edge " + std::to_string(e.from) + " -> " +
                                      std::to_string(e.to) + " references an unknown province.");
        }
        if (e.from == e.to || e.weight <= 0.0) continue;
        adjacency_[e.from].emplace_back(e.to, e.weight);
        outgoingWeight_[e.from] += e.weight;
    }
    for (auto& adj : adjacency_) {
        std::sort(adj.begin(), adj.end());
    }
}

const MobilityNetwork::Adjacency& MobilityNetwork::outgoing(int province) const {
    if (province < 0 || province >= numProvinces()) {
        PMSIM_THROW_OUT_OF_RANGE("MobilityNetwork::outgoing", "Province " + std::to_string(province) + " out of range.");
    }
    return adjacency_[province];
}

double MobilityNetwork::outgoingWeight(int province) const {
    if (province < 0 || province >= numProvinces()) {
        PMSIM_THROW_OUT_OF_RANGE("MobilityNetwork::outgoingWeight", "Province " + std::to_string(province) + " out of range.");
    }
    return outgoingWeight_[province];
}

double MobilityNetwork::departureProbability(int province, Compartment c, int behaviorClass, int day) const {
    if (!isMovable(c)) return 0.0;
    const double factor = schedule_ ? schedule_->getFactor(day) : 1.0;
    double scale = 1.0;
    if (c == Compartment::I) {
        const double prudence = classes_.at(behaviorClass).prudence;
        scale = (1.0 - prudence) * (1.0 - prudence);
    }
    return std::clamp(outgoingWeight(province) * factor * scale, 0.0, 1.0);
}

long MobilityNetwork::apply(std::vector<ProvinceState>& provinces, int day, RandomStream& rng) const {
    if (static_cast<int>(provinces.size()) != numProvinces()) {
        PMSIM_THROW_INVALID_PARAM("MobilityNetwork::apply", "Province count does not match the network.");
    }

    std::vector<Departure> departures;
    std::vector<double> weights;
    for (int p = 0; p < numProvinces(); ++p) {
        const Adjacency& adj = adjacency_[p];
        if (adj.empty()) continue;
        weights.clear();
        for (const auto& edge : adj) {
            weights.push_back(edge.second);
        }

        const ProvinceState& origin = provinces[p];
        for (Compartment c : allCompartments()) {
            if (!isMovable(c)) continue;
            for (int b = 0; b < origin.numBehaviorClasses(); ++b) {
                const double prob = departureProbability(p, c, b, day);
                if (prob <= 0.0) continue;
                for (int d = 0; d <= origin.maxDwell(); ++d) {
                    const Eigen::Index cell = origin.cellIndex(c, CareStatus::Bedded, b, d);
                    const long leaving = rng.binomial(origin.cells()(cell), prob);
                    if (leaving == 0) continue;
                    const std::vector<long> split = apportionLargestRemainder(leaving, weights);
                    for (std::size_t k = 0; k < adj.size(); ++k) {
                        if (split[k] > 0) {
                            departures.push_back(Departure{p, adj[k].first, cell, split[k]});
                        }
                    }
                }
            }
        }
    }

    long moved = 0;
    for (const auto& dep : departures) {
        provinces[dep.origin].cells()(dep.cell) -= dep.count;
        provinces[dep.destination].cells()(dep.cell) += dep.count;
        moved += dep.count;
    }
    return moved;
}

} // namespace pmsim
