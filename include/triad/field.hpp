#pragma once

/// @file include/triad/field.hpp
/// @brief InteractionField — a population of identified triadic entities.
///
/// # Module: Interaction Field
///
/// ## Responsibility
/// Hold a set of entities keyed by identifier and answer collective
/// questions about them:
///   - how aligned the population is (field coherence)
///   - what the population looks like as a whole (collective state)
///   - which entities group together (alignment clusters)
///   - whether the population is undergoing a collective phase transition
///
/// ## Guarantees
/// - Iteration and every derived result follow identifier lexical order,
///   so all outputs are deterministic
/// - add() rejects duplicate identifiers and non-finite states; a failed call
///   leaves the field as it was
///
/// ## Edge Cases
/// - Empty field: coherence 1.0, no collective state, potential 0.0, no leader
/// - Single entity: coherence 1.0, no phase transition

#include "triad/types.hpp"
#include "triad/constants.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace triad::field {

/// An identified member of a field.
struct Entity {
    std::string id;
    TriadicVector state;

    friend bool operator==(const Entity&, const Entity&) = default;
};

/// One alignment cluster: identifiers in lexical order.
using Cluster = std::set<std::string>;

// ─── FieldReport ──────────────────────────────────────────────────────────────

struct FieldReport {
    std::size_t entity_count;
    std::size_t coherent_count;
    double field_coherence;
    double emergence_potential;
    bool phase_transition;
    std::optional<TriadicVector> collective;
    double collective_strength;        ///< 0.0 when empty
    std::optional<std::string> leader_id;
    double leader_strength;            ///< 0.0 when empty
    std::vector<std::size_t> cluster_sizes;
    std::size_t largest_cluster;

    [[nodiscard]] std::string to_string() const;
};

// ─── InteractionField ─────────────────────────────────────────────────────────

class InteractionField {
public:
    InteractionField() = default;

    /// Insert a new entity.
    ///
    /// @throws std::invalid_argument if the identifier is empty or already
    ///         present, or the state has a non-finite component.
    void add(Entity entity);
    void add(const std::string& id, const TriadicVector& state);

    /// Replace the state of an existing entity. Returns false if unknown.
    ///
    /// @throws std::invalid_argument if the state has a non-finite component.
    bool update(const std::string& id, const TriadicVector& state);

    /// Remove an entity. Returns false if unknown.
    bool remove(const std::string& id);

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::optional<TriadicVector> get(const std::string& id) const;

    /// All entities in identifier order.
    [[nodiscard]] std::vector<Entity> entities() const;

    /// Entities whose state passes VectorMetrics::is_coherent.
    [[nodiscard]] std::vector<Entity> coherent_entities() const;

    [[nodiscard]] std::size_t size() const noexcept { return entities_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }

    /// Symmetric N×N matrix of pairwise alignments, rows in identifier order.
    /// The diagonal holds each entity's self-alignment (1.0, or 0.0 for a
    /// zero vector).
    [[nodiscard]] Eigen::MatrixXd alignment_matrix() const;

    /// Mean pairwise alignment over unordered pairs, in [-1, 1].
    /// 1.0 when fewer than two entities exist.
    [[nodiscard]] double field_coherence() const;

    /// Component-wise mean of all states. nullopt only when empty.
    [[nodiscard]] std::optional<TriadicVector> collective_state() const;

    /// Strength-weighted mean of all states. nullopt when the total strength is 0.
    [[nodiscard]] std::optional<TriadicVector> strength_weighted_state() const;

    /// max(0, field_coherence) · mean strength, in [0, 1]. 0.0 when empty.
    [[nodiscard]] double emergence_potential() const;

    /// Connected components of the graph linking entities whose alignment is
    /// at least `threshold`. Singletons are included. Clusters are ordered by
    /// their smallest identifier.
    ///
    /// @throws std::invalid_argument if threshold is NaN or outside [-1, 1].
    [[nodiscard]] std::vector<Cluster> detect_clusters(double threshold) const;

    /// Entity with the greatest strength; ties go to the smallest identifier.
    [[nodiscard]] std::optional<Entity> detect_leader() const;

    /// True if at least two entities exist and both field coherence and
    /// emergence potential reach their thresholds.
    ///
    /// @throws std::invalid_argument if coherence_threshold is outside
    ///         [-1, 1] or emergence_threshold is outside [0, 1].
    [[nodiscard]] bool phase_transition_check(
        double coherence_threshold = constants::DEFAULT_PHASE_COHERENCE_THRESHOLD,
        double emergence_threshold = constants::DEFAULT_PHASE_EMERGENCE_THRESHOLD) const;

    /// Move every entity `fraction` of the way toward `target`.
    ///
    /// @throws std::invalid_argument if fraction is outside [0, 1] or target
    ///         is not finite.
    void synchronize_towards(const TriadicVector& target, double fraction);

    /// Summary of the field using `cluster_threshold` for clustering.
    [[nodiscard]] FieldReport
    report(double cluster_threshold = constants::DEFAULT_CLUSTER_THRESHOLD) const;

private:
    std::map<std::string, TriadicVector> entities_;
};

} // namespace triad::field
