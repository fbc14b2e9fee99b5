/// @file src/field/interaction_field.cpp
/// @brief InteractionField — population metrics, clustering, leader selection.

#include "triad/field.hpp"
#include "triad/metrics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace triad::field {

using metrics::VectorMetrics;

// ─── Membership ───────────────────────────────────────────────────────────────

void InteractionField::add(Entity entity) {
    if (entity.id.empty()) {
        throw std::invalid_argument("InteractionField::add: identifier must not be empty");
    }
    if (entities_.contains(entity.id)) {
        throw std::invalid_argument(fmt::format(
            "InteractionField::add: duplicate identifier '{}'", entity.id));
    }
    if (!entity.state.is_finite()) {
        throw std::invalid_argument(fmt::format(
            "InteractionField::add: state of '{}' is not finite", entity.id));
    }
    entities_.emplace(std::move(entity.id), entity.state);
}

void InteractionField::add(const std::string& id, const TriadicVector& state) {
    add(Entity{id, state});
}

bool InteractionField::update(const std::string& id, const TriadicVector& state) {
    if (!state.is_finite()) {
        throw std::invalid_argument(fmt::format(
            "InteractionField::update: state of '{}' is not finite", id));
    }
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return false;
    }
    it->second = state;
    return true;
}

bool InteractionField::remove(const std::string& id) {
    return entities_.erase(id) > 0;
}

bool InteractionField::contains(const std::string& id) const {
    return entities_.contains(id);
}

std::optional<TriadicVector> InteractionField::get(const std::string& id) const {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Entity> InteractionField::entities() const {
    std::vector<Entity> out;
    out.reserve(entities_.size());
    for (const auto& [id, state] : entities_) {
        out.push_back(Entity{id, state});
    }
    return out;
}

std::vector<Entity> InteractionField::coherent_entities() const {
    std::vector<Entity> out;
    for (const auto& [id, state] : entities_) {
        if (VectorMetrics::is_coherent(state)) {
            out.push_back(Entity{id, state});
        }
    }
    return out;
}

// ─── Alignment ────────────────────────────────────────────────────────────────

Eigen::MatrixXd InteractionField::alignment_matrix() const {
    const auto members = entities();
    const auto n = static_cast<Eigen::Index>(members.size());

    Eigen::MatrixXd m(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        m(i, i) = VectorMetrics::alignment(members[i].state, members[i].state);
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const double al = VectorMetrics::alignment(members[i].state, members[j].state);
            m(i, j) = al;
            m(j, i) = al;
        }
    }
    return m;
}

double InteractionField::field_coherence() const {
    if (entities_.size() < 2) {
        return constants::TRIVIAL_FIELD_COHERENCE;
    }

    const auto members = entities();
    double total = 0.0;
    std::size_t pairs = 0;
    for (std::size_t i = 0; i < members.size(); ++i) {
        for (std::size_t j = i + 1; j < members.size(); ++j) {
            total += VectorMetrics::alignment(members[i].state, members[j].state);
            ++pairs;
        }
    }
    return std::clamp(total / static_cast<double>(pairs), -1.0, 1.0);
}

// ─── Aggregates ───────────────────────────────────────────────────────────────

std::optional<TriadicVector> InteractionField::collective_state() const {
    if (entities_.empty()) {
        return std::nullopt;
    }

    // Divide before summing so finite inputs cannot overflow the accumulator.
    const double n = static_cast<double>(entities_.size());
    Vec3 mean = Vec3::Zero();
    for (const auto& [id, state] : entities_) {
        mean += state.to_eigen() / n;
    }
    return TriadicVector::from_eigen(mean);
}

std::optional<TriadicVector> InteractionField::strength_weighted_state() const {
    double total = 0.0;
    for (const auto& [id, state] : entities_) {
        total += VectorMetrics::strength(state);
    }
    if (!(total > 0.0)) {
        return std::nullopt;
    }

    Vec3 weighted = Vec3::Zero();
    for (const auto& [id, state] : entities_) {
        weighted += (VectorMetrics::strength(state) / total) * state.to_eigen();
    }
    return TriadicVector::from_eigen(weighted);
}

double InteractionField::emergence_potential() const {
    if (entities_.empty()) {
        return 0.0;
    }

    double mean_strength = 0.0;
    for (const auto& [id, state] : entities_) {
        mean_strength += VectorMetrics::strength(state);
    }
    mean_strength /= static_cast<double>(entities_.size());

    const double potential = std::max(0.0, field_coherence()) * mean_strength;
    return std::clamp(potential, 0.0, 1.0);
}

// ─── detect_clusters ──────────────────────────────────────────────────────────

std::vector<Cluster> InteractionField::detect_clusters(double threshold) const {
    if (std::isnan(threshold) || threshold < -1.0 || threshold > 1.0) {
        throw std::invalid_argument(fmt::format(
            "detect_clusters: threshold must be in [-1, 1], got {}", threshold));
    }

    const auto members = entities();
    const std::size_t n = members.size();

    // Seeds are visited in identifier order, so each cluster is discovered
    // from its smallest member and the result is already ordered.
    std::vector<bool> visited(n, false);
    std::vector<Cluster> clusters;

    for (std::size_t seed = 0; seed < n; ++seed) {
        if (visited[seed]) {
            continue;
        }

        Cluster cluster;
        std::vector<std::size_t> stack{seed};
        visited[seed] = true;

        while (!stack.empty()) {
            const std::size_t i = stack.back();
            stack.pop_back();
            cluster.insert(members[i].id);

            for (std::size_t j = 0; j < n; ++j) {
                if (!visited[j] &&
                    VectorMetrics::alignment(members[i].state, members[j].state) >= threshold) {
                    visited[j] = true;
                    stack.push_back(j);
                }
            }
        }
        clusters.push_back(std::move(cluster));
    }
    return clusters;
}

// ─── detect_leader ────────────────────────────────────────────────────────────

std::optional<Entity> InteractionField::detect_leader() const {
    std::optional<Entity> leader;
    double best = -1.0;

    // Strict comparison keeps the first (lexically smallest) of equal strengths.
    for (const auto& [id, state] : entities_) {
        const double s = VectorMetrics::strength(state);
        if (s > best) {
            best = s;
            leader = Entity{id, state};
        }
    }
    return leader;
}

// ─── phase_transition_check ───────────────────────────────────────────────────

bool InteractionField::phase_transition_check(double coherence_threshold,
                                              double emergence_threshold) const {
    if (std::isnan(coherence_threshold) ||
        coherence_threshold < -1.0 || coherence_threshold > 1.0) {
        throw std::invalid_argument(fmt::format(
            "phase_transition_check: coherence_threshold must be in [-1, 1], got {}",
            coherence_threshold));
    }
    if (std::isnan(emergence_threshold) ||
        emergence_threshold < 0.0 || emergence_threshold > 1.0) {
        throw std::invalid_argument(fmt::format(
            "phase_transition_check: emergence_threshold must be in [0, 1], got {}",
            emergence_threshold));
    }

    if (entities_.size() < constants::MIN_PHASE_POPULATION) {
        return false;
    }
    return field_coherence() >= coherence_threshold &&
           emergence_potential() >= emergence_threshold;
}

// ─── synchronize_towards ──────────────────────────────────────────────────────

void InteractionField::synchronize_towards(const TriadicVector& target, double fraction) {
    if (std::isnan(fraction) || fraction < 0.0 || fraction > 1.0) {
        throw std::invalid_argument(fmt::format(
            "synchronize_towards: fraction must be in [0, 1], got {}", fraction));
    }
    if (!target.is_finite()) {
        throw std::invalid_argument("synchronize_towards: target must be finite");
    }

    const Vec3 t = target.to_eigen();
    for (auto& [id, state] : entities_) {
        const Vec3 x = state.to_eigen();
        state = TriadicVector::from_eigen(x + fraction * (t - x));
    }
}

// ─── report ───────────────────────────────────────────────────────────────────

FieldReport InteractionField::report(double cluster_threshold) const {
    const auto clusters = detect_clusters(cluster_threshold);
    const auto collective = collective_state();
    const auto leader = detect_leader();

    FieldReport r{
        .entity_count        = entities_.size(),
        .coherent_count      = coherent_entities().size(),
        .field_coherence     = field_coherence(),
        .emergence_potential = emergence_potential(),
        .phase_transition    = phase_transition_check(),
        .collective          = collective,
        .collective_strength = collective ? VectorMetrics::strength(*collective) : 0.0,
        .leader_id           = std::nullopt,
        .leader_strength     = 0.0,
        .cluster_sizes       = {},
        .largest_cluster     = 0,
    };

    if (leader) {
        r.leader_id       = leader->id;
        r.leader_strength = VectorMetrics::strength(leader->state);
    }
    for (const auto& c : clusters) {
        r.cluster_sizes.push_back(c.size());
        r.largest_cluster = std::max(r.largest_cluster, c.size());
    }
    return r;
}

std::string FieldReport::to_string() const {
    std::string out = fmt::format(
        "entities={} (coherent {})  coherence={:+.4f}  potential={:.4f}  phase={}",
        entity_count, coherent_count, field_coherence, emergence_potential,
        phase_transition ? "yes" : "no");

    if (collective) {
        out += fmt::format("  collective=({:.4f}, {:.4f}, {:.4f}) s={:.4f}",
                           collective->a, collective->b, collective->c,
                           collective_strength);
    }
    if (leader_id) {
        out += fmt::format("  leader={} s={:.4f}", *leader_id, leader_strength);
    }
    out += fmt::format("  clusters={}  largest={}", cluster_sizes.size(), largest_cluster);
    return out;
}

}  // namespace triad::field
