#pragma once
// galley: StationRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics and keep it
//     for the whole resolution; later mutations never change what they see.
//   • Writers copy the whole snapshot, mutate, and atomically swap with RELEASE.
//   • Writers are serialized by a mutex; readers never take it.
//   • Old snapshots are reclaimed by shared_ptr refcounts.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "galley/routing/route_tag.hpp"
#include "galley/routing/station.hpp"

namespace galley::routing {

/// Result codes for registry mutations.
enum class RegistryErr {
    Ok,         ///< Operation succeeded.
    Exists,     ///< Add failed because the station already exists.
    NotFound,   ///< Replace/setActive failed because the station is unknown.
    Invalid,    ///< Input validation failed (id, name, tag count, self-backup).
    Capacity    ///< Rejected by constants::MAX_STATIONS.
};

const char* to_string(RegistryErr e) noexcept;

/**
 * @brief Immutable registry state published by StationRegistry.
 *
 * Stations are keyed (and therefore iterated) by id, which gives the resolver
 * its deterministic station order.
 */
struct RegistrySnapshot final {
    using StationMap = std::map<std::string, Station, std::less<>>;

    std::uint64_t version{0};
    TagRegistry   tags;
    StationMap    stations;

    /// Station by id, nullptr if absent.
    [[nodiscard]] const Station* find(std::string_view id) const noexcept;

    /// Active stations whose subscriptions intersect @p tags, plus active expo stations, ordered by id.
    [[nodiscard]] std::vector<const Station*> stations_for_tags(const TagSet& tags) const;

    /// Active expo stations, ordered by id.
    [[nodiscard]] std::vector<const Station*> expo_stations() const;

    /// Configuration warnings (never errors): the engine still runs, possibly fully unrouted.
    [[nodiscard]] std::vector<std::string> validate() const;
};

///
/// Maintains the set of configured stations plus the closed tag registry.
/// - Reads: grab a shared_ptr snapshot, consistent and non-blocking.
/// - Writes: copy-on-write, atomic swap, version increment.
/// - Rejected mutations publish nothing and leave the version unchanged.
///
class StationRegistry final {
public:
    StationRegistry();
    explicit StationRegistry(TagRegistry tags);

    // --------------------------- RCU Snapshot API ----------------------------
    /// Current snapshot. Hold on to it for as long as a consistent view is needed.
    std::shared_ptr<const RegistrySnapshot> snapshot() const noexcept;

    /// Copy of one station (safe across snapshot swaps).
    [[nodiscard]] std::optional<Station> findStation(std::string_view id) const;

    /// Copies of the active stations matching @p tags (expo stations included), ordered by id.
    [[nodiscard]] StationList stationsForTags(const TagSet& tags) const;

    // --------------------------- Read utilities ------------------------------
    [[nodiscard]] bool hasStation(std::string_view id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<std::string> listStations() const;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] std::uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Add a new station. Fails if the id already exists or the station is invalid.
    RegistryErr addStation(const Station& st);

    /// Replace an existing station. Fails if the id is unknown.
    RegistryErr replaceStation(const Station& st);

    /// Insert or replace.
    RegistryErr upsertStation(const Station& st);

    /// Remove a station. Returns true if it was erased.
    bool removeStation(std::string_view id);

    /// Enable or disable a station without touching its subscriptions.
    RegistryErr setActive(std::string_view id, bool active);

    /// Swap the closed tag set (stations keep their subscriptions; unknown ones warn).
    void replaceTagRegistry(TagRegistry tags);

    /// Remove every station. The tag registry is kept.
    void clear();

    /// Rejected entry of a replaceAll() batch.
    struct Rejection {
        std::string id;
        RegistryErr err{RegistryErr::Invalid};
    };

    /**
     * @brief Swap tag registry and the whole station set in one publish (config reload).
     *
     * Invalid, duplicate and over-capacity stations are left out and reported;
     * the remaining ones become visible together with @p tags under one version.
     */
    std::vector<Rejection> replaceAll(TagRegistry tags, const StationList& stations);

    // --------------------------- Observability -------------------------------
    struct Stats {
        std::uint64_t adds{0}, replaces{0}, upserts{0}, removes{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

    /// Same id rules the registry applies on mutation.
    static bool validateId(std::string_view id) noexcept;

private:
    enum class Mode { Add, Replace, Upsert };

    RegistryErr mutate(Mode mode, const Station& st);
    RegistryErr fail(RegistryErr e) noexcept;
    void publish(std::shared_ptr<RegistrySnapshot> next);

    static bool validateStation(const Station& st) noexcept;

    std::shared_ptr<const RegistrySnapshot> snap_;
    std::atomic<std::uint64_t> version_{0};
    std::mutex write_mu_;

    std::atomic<std::uint64_t> adds_{0}, replaces_{0}, upserts_{0}, removes_{0}, failures_{0};
};

} // namespace galley::routing
