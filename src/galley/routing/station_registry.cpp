// StationRegistry: RCU Implementation Notes
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: copy current snapshot, mutate, stamp version, atomic_store (RELEASE).
// A resolution that captured a snapshot keeps it alive through its shared_ptr.

#include "galley/routing/station_registry.hpp"
#include "galley/config/constants.hpp"
#include "galley/obs/logger.hpp"

#include <algorithm>

namespace galley::routing {

using obs::logger;

const char* to_string(RegistryErr e) noexcept {
    switch (e) {
        case RegistryErr::Ok:       return "ok";
        case RegistryErr::Exists:   return "exists";
        case RegistryErr::NotFound: return "not_found";
        case RegistryErr::Invalid:  return "invalid";
        case RegistryErr::Capacity: return "capacity";
    }
    return "unknown";
}

//------------------------------ RegistrySnapshot -------------------------------

const Station* RegistrySnapshot::find(std::string_view id) const noexcept {
    const auto it = stations.find(id);
    return it == stations.end() ? nullptr : &it->second;
}

std::vector<const Station*> RegistrySnapshot::stations_for_tags(const TagSet& wanted) const {
    std::vector<const Station*> out;
    if (wanted.empty()) return out;
    for (const auto& [id, st] : stations) {
        if (!st.active) continue;
        if (st.expo || (!st.tags.empty() && !intersect(st.tags, wanted).empty())) out.push_back(&st);
    }
    return out;
}

std::vector<const Station*> RegistrySnapshot::expo_stations() const {
    std::vector<const Station*> out;
    for (const auto& [id, st] : stations) {
        if (st.active && st.expo) out.push_back(&st);
    }
    return out;
}

std::vector<std::string> RegistrySnapshot::validate() const {
    std::vector<std::string> warn;

    const bool any_active = std::any_of(stations.begin(), stations.end(),
                                        [](const auto& kv) { return kv.second.active; });
    if (!any_active) warn.push_back("no active stations; every item will be unrouted");

    for (const auto& [id, st] : stations) {
        if (!st.active) continue;
        if (st.tags.empty() && !st.expo) {
            warn.push_back("station '" + id + "' is active but subscribes to no tags");
        }
        for (const auto& t : st.tags) {
            if (!tags.is_known(t)) {
                warn.push_back("station '" + id + "' subscribes to unknown tag '" + t.str() + "'");
            }
        }
        if (st.is_printer() && st.printer.address.host.empty()) {
            warn.push_back("printer station '" + id + "' has no host");
        }
        if (!st.backup_station_id.empty()) {
            const Station* b = find(st.backup_station_id);
            if (!b) {
                warn.push_back("station '" + id + "' backup '" + st.backup_station_id + "' does not exist");
            } else if (!b->is_printer()) {
                warn.push_back("station '" + id + "' backup '" + st.backup_station_id + "' is not a printer");
            } else if (!b->active) {
                warn.push_back("station '" + id + "' backup '" + st.backup_station_id + "' is inactive");
            }
        }
    }
    return warn;
}

//------------------------------- Validation -----------------------------------

bool StationRegistry::validateId(std::string_view id) noexcept {
    if (id.empty() || id.size() > config::constants::STATION_ID_MAX_LEN) return false;
    for (char c : id) {
        const bool ok = (c == '_' || c == '-' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

bool StationRegistry::validateStation(const Station& st) noexcept {
    if (!validateId(st.id)) return false;
    if (st.name.empty()) return false;
    if (st.tags.size() > config::constants::MAX_TAGS_PER_STATION) return false;
    if (!std::is_sorted(st.tags.begin(), st.tags.end())) return false;
    if (std::adjacent_find(st.tags.begin(), st.tags.end()) != st.tags.end()) return false;
    if (st.backup_station_id == st.id) return false;
    if (!st.backup_station_id.empty() && !validateId(st.backup_station_id)) return false;
    return true;
}

//------------------------------- Public API -----------------------------------

StationRegistry::StationRegistry() : StationRegistry(TagRegistry::with_defaults()) {}

StationRegistry::StationRegistry(TagRegistry tags) {
    auto first = std::make_shared<RegistrySnapshot>();
    first->tags = std::move(tags);
    snap_ = std::move(first);
}

std::shared_ptr<const RegistrySnapshot> StationRegistry::snapshot() const noexcept {
    // RCU read: pairs with the RELEASE store in publish().
    return std::atomic_load_explicit(&snap_, std::memory_order_acquire);
}

std::optional<Station> StationRegistry::findStation(std::string_view id) const {
    auto snap = snapshot();
    const Station* st = snap->find(id);
    if (!st) return std::nullopt;
    return *st;
}

StationList StationRegistry::stationsForTags(const TagSet& tags) const {
    auto snap = snapshot();
    StationList out;
    for (const Station* st : snap->stations_for_tags(tags)) out.push_back(*st);
    return out;
}

bool StationRegistry::hasStation(std::string_view id) const noexcept {
    return snapshot()->find(id) != nullptr;
}

std::size_t StationRegistry::size() const noexcept {
    return snapshot()->stations.size();
}

std::vector<std::string> StationRegistry::listStations() const {
    auto snap = snapshot();
    std::vector<std::string> out;
    out.reserve(snap->stations.size());
    for (const auto& kv : snap->stations) out.push_back(kv.first);
    return out;
}

RegistryErr StationRegistry::addStation(const Station& st)     { return mutate(Mode::Add, st); }
RegistryErr StationRegistry::replaceStation(const Station& st) { return mutate(Mode::Replace, st); }
RegistryErr StationRegistry::upsertStation(const Station& st)  { return mutate(Mode::Upsert, st); }

bool StationRegistry::removeStation(std::string_view id) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap->find(id)) return false;

    auto next = std::make_shared<RegistrySnapshot>(*snap);
    next->stations.erase(next->stations.find(id));
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    logger()->debug("registry: removed station '{}' (v{})", id, version());
    return true;
}

RegistryErr StationRegistry::setActive(std::string_view id, bool active) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap->find(id)) return fail(RegistryErr::NotFound);

    auto next = std::make_shared<RegistrySnapshot>(*snap);
    next->stations.find(id)->second.active = active;
    publish(std::move(next));
    replaces_.fetch_add(1, std::memory_order_relaxed);
    logger()->debug("registry: station '{}' {} (v{})", id, active ? "enabled" : "disabled", version());
    return RegistryErr::Ok;
}

void StationRegistry::replaceTagRegistry(TagRegistry tags) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto next = std::make_shared<RegistrySnapshot>(*snapshot());
    next->tags = std::move(tags);
    const std::size_t count = next->tags.size();
    publish(std::move(next));
    logger()->debug("registry: tag registry replaced, {} tags (v{})", count, version());
}

void StationRegistry::clear() {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto next = std::make_shared<RegistrySnapshot>();
    next->tags = snapshot()->tags;
    publish(std::move(next));
}

std::vector<StationRegistry::Rejection> StationRegistry::replaceAll(TagRegistry tags, const StationList& stations) {
    std::vector<Rejection> rejected;
    auto next = std::make_shared<RegistrySnapshot>();
    next->tags = std::move(tags);

    for (const auto& st : stations) {
        RegistryErr err = RegistryErr::Ok;
        if (!validateStation(st))                                          err = RegistryErr::Invalid;
        else if (next->find(st.id))                                        err = RegistryErr::Exists;
        else if (next->stations.size() >= config::constants::MAX_STATIONS) err = RegistryErr::Capacity;

        if (err != RegistryErr::Ok) {
            logger()->warn("registry: reload rejected station '{}' ({})", st.id, to_string(err));
            rejected.push_back({st.id, fail(err)});
            continue;
        }
        next->stations.emplace(st.id, st);
    }

    const std::size_t count = next->stations.size();
    {
        std::lock_guard<std::mutex> lk(write_mu_);
        publish(std::move(next));
    }
    upserts_.fetch_add(count, std::memory_order_relaxed);
    logger()->debug("registry: reloaded {} station(s), {} rejected (v{})", count, rejected.size(), version());
    return rejected;
}

StationRegistry::Stats StationRegistry::stats() const noexcept {
    return Stats{
        adds_.load(std::memory_order_relaxed),
        replaces_.load(std::memory_order_relaxed),
        upserts_.load(std::memory_order_relaxed),
        removes_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed),
    };
}

//------------------------------- Mutation Core --------------------------------

RegistryErr StationRegistry::fail(RegistryErr e) noexcept {
    failures_.fetch_add(1, std::memory_order_relaxed);
    return e;
}

void StationRegistry::publish(std::shared_ptr<RegistrySnapshot> next) {
    next->version = version_.load(std::memory_order_relaxed) + 1;
    std::shared_ptr<const RegistrySnapshot> cnext = std::move(next);
    std::atomic_store_explicit(&snap_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

RegistryErr StationRegistry::mutate(Mode mode, const Station& st) {
    if (!validateStation(st)) {
        logger()->warn("registry: rejected invalid station '{}'", st.id);
        return fail(RegistryErr::Invalid);
    }

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    const bool exists = snap->find(st.id) != nullptr;

    switch (mode) {
        case Mode::Add:
            if (exists) return fail(RegistryErr::Exists);
            break;
        case Mode::Replace:
            if (!exists) return fail(RegistryErr::NotFound);
            break;
        case Mode::Upsert:
            break;
    }
    if (!exists && snap->stations.size() >= config::constants::MAX_STATIONS) {
        return fail(RegistryErr::Capacity);
    }

    auto next = std::make_shared<RegistrySnapshot>(*snap); // copy-on-write
    next->stations.insert_or_assign(st.id, st);
    publish(std::move(next));

    switch (mode) {
        case Mode::Add:     adds_.fetch_add(1, std::memory_order_relaxed); break;
        case Mode::Replace: replaces_.fetch_add(1, std::memory_order_relaxed); break;
        case Mode::Upsert:  upserts_.fetch_add(1, std::memory_order_relaxed); break;
    }
    logger()->debug("registry: {} station '{}' tags=[{}] (v{})",
                 exists ? "updated" : "added", st.id, join(st.tags), version());
    return RegistryErr::Ok;
}

} // namespace galley::routing
