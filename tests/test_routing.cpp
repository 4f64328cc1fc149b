/**
 * @file test_routing.cpp
 * @brief Tests for route tags, StationRegistry RCU semantics and resolve_routing().
 *
 * Validates:
 *  - Tag normalization and the closed tag registry
 *  - Snapshot publication via atomic_load/store on shared_ptr (RCU pattern)
 *  - add / upsert / replace / remove / setActive behavior and versioning
 *  - Own tags override category tags; fan-out shares one item object
 *  - Unrouted reasons, tag diagnostics, sent items, malformed input
 *  - No torn reads under 1 writer / many readers
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "galley/routing/order.hpp"
#include "galley/routing/route_tag.hpp"
#include "galley/routing/routing_resolver.hpp"
#include "galley/routing/station_registry.hpp"

using namespace galley::routing;

namespace {

Station display(std::string id, std::vector<std::string> tags) {
  Station st;
  st.id   = id;
  st.name = id;
  st.kind = StationKind::Display;
  st.tags = make_tag_set(tags);
  return st;
}

Station printer(std::string id, std::vector<std::string> tags, std::string host = "10.0.0.9") {
  Station st = display(std::move(id), std::move(tags));
  st.kind = StationKind::Printer;
  st.printer.address.host = std::move(host);
  return st;
}

OrderItem item(std::string id, std::string name, std::vector<std::string> tags,
               std::vector<std::string> category_tags = {}) {
  OrderItem it;
  it.id            = std::move(id);
  it.name          = std::move(name);
  it.tags          = std::move(tags);
  it.category_tags = std::move(category_tags);
  return it;
}

OrderSnapshot order(std::vector<OrderItem> items, std::string id = "o-1") {
  OrderSnapshot o;
  o.context.order_id     = std::move(id);
  o.context.order_number = "1042";
  o.items                = std::move(items);
  return o;
}

std::vector<std::string> ids(const std::vector<ItemRef>& refs) {
  std::vector<std::string> out;
  for (const auto& r : refs) out.push_back(r->id);
  return out;
}

} // namespace

// ------------------------------- Route tags ---------------------------------

/**
 * @test RouteTag_Normalizes
 * @brief Trim and lower-case make two spellings of one tag equal.
 */
TEST(RouteTag, RouteTag_Normalizes) {
  auto a = RouteTag::parse("  Grill ");
  auto b = RouteTag::parse("grill");
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ(*a, *b);
  EXPECT_EQ(a->str(), "grill");
}

/**
 * @test RouteTag_Rejects
 * @brief Empty, overlong and non-[a-z0-9_-] spellings are refused with a reason.
 */
TEST(RouteTag, RouteTag_Rejects) {
  EXPECT_EQ(RouteTag::parse("   ").error(), TagErr::Empty);
  EXPECT_EQ(RouteTag::parse(std::string(64, 'a')).error(), TagErr::TooLong);
  EXPECT_EQ(RouteTag::parse("gr ill").error(), TagErr::BadChar);
  EXPECT_EQ(RouteTag::parse("bar!").error(), TagErr::BadChar);
  EXPECT_TRUE(RouteTag::parse("made-to-order"));
}

/**
 * @test TagSet_SortedUnique
 * @brief make_tag_set sorts, dedups and reports invalid spellings.
 */
TEST(RouteTag, TagSet_SortedUnique) {
  std::vector<std::string> rejected;
  const TagSet s = make_tag_set({"grill", "BAR", "grill", "no way"}, &rejected);
  EXPECT_EQ(join(s), "bar,grill");
  ASSERT_EQ(rejected.size(), 1u);
  EXPECT_EQ(rejected[0], "no way");

  EXPECT_EQ(join(intersect(s, make_tag_set({"grill", "expo"}))), "grill");
  TagSet m = s;
  merge_into(m, make_tag_set({"expo", "bar"}));
  EXPECT_EQ(join(m), "bar,expo,grill");
}

/**
 * @test TagRegistry_FilterKnown
 * @brief Unknown tags are split off rather than matched.
 */
TEST(RouteTag, TagRegistry_FilterKnown) {
  const TagRegistry reg = TagRegistry::with_defaults();
  TagSet unknown;
  const TagSet known = reg.filter_known(make_tag_set({"grill", "griil"}), unknown);
  EXPECT_EQ(join(known), "grill");
  EXPECT_EQ(join(unknown), "griil");
  EXPECT_FALSE(reg.description(known[0]).empty());
}

// --------------------------- Registry: basics ------------------------------

/**
 * @test Registry_Construct_Empty
 * @brief Fresh registry publishes a valid empty snapshot with the default tags.
 */
TEST(StationRegistry, Registry_Construct_Empty) {
  StationRegistry reg;
  auto snap = reg.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_TRUE(snap->stations.empty());
  EXPECT_FALSE(snap->tags.empty());
  EXPECT_EQ(reg.version(), 0u);
}

/**
 * @test Registry_Add_Replace_Remove
 * @brief Mutations follow their contracts and bump the version only on success.
 */
TEST(StationRegistry, Registry_Add_Replace_Remove) {
  StationRegistry reg;

  EXPECT_EQ(reg.addStation(display("grill-kds", {"grill"})), RegistryErr::Ok);
  EXPECT_EQ(reg.version(), 1u);
  EXPECT_EQ(reg.addStation(display("grill-kds", {"fryer"})), RegistryErr::Exists);
  EXPECT_EQ(reg.version(), 1u);

  EXPECT_EQ(reg.replaceStation(display("nope", {"grill"})), RegistryErr::NotFound);
  EXPECT_EQ(reg.replaceStation(display("grill-kds", {"fryer"})), RegistryErr::Ok);
  ASSERT_TRUE(reg.findStation("grill-kds"));
  EXPECT_EQ(join(reg.findStation("grill-kds")->tags), "fryer");

  EXPECT_EQ(reg.upsertStation(display("bar-kds", {"bar"})), RegistryErr::Ok);
  EXPECT_EQ(reg.listStations(), (std::vector<std::string>{"bar-kds", "grill-kds"}));

  EXPECT_TRUE(reg.removeStation("bar-kds"));
  EXPECT_FALSE(reg.removeStation("bar-kds"));
  EXPECT_EQ(reg.size(), 1u);

  const auto st = reg.stats();
  EXPECT_EQ(st.adds, 1u);
  EXPECT_EQ(st.upserts, 1u);
  EXPECT_EQ(st.removes, 1u);
  EXPECT_GE(st.failures, 2u);
}

/**
 * @test Registry_Rejects_Invalid
 * @brief Bad ids, empty names and self-backup are refused without publishing.
 */
TEST(StationRegistry, Registry_Rejects_Invalid) {
  StationRegistry reg;
  EXPECT_EQ(reg.addStation(display("bad id", {"grill"})), RegistryErr::Invalid);
  EXPECT_EQ(reg.addStation(display("", {"grill"})), RegistryErr::Invalid);

  Station unnamed = display("x", {"grill"});
  unnamed.name.clear();
  EXPECT_EQ(reg.addStation(unnamed), RegistryErr::Invalid);

  Station self = printer("p1", {"grill"});
  self.backup_station_id = "p1";
  EXPECT_EQ(reg.addStation(self), RegistryErr::Invalid);

  EXPECT_EQ(reg.version(), 0u);
  EXPECT_TRUE(StationRegistry::validateId("grill_kds-2"));
  EXPECT_FALSE(StationRegistry::validateId("grill/kds"));
}

/**
 * @test Registry_Snapshot_Isolation
 * @brief A captured snapshot never observes later mutations.
 */
TEST(StationRegistry, Registry_Snapshot_Isolation) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("grill-kds", {"grill"})), RegistryErr::Ok);
  auto before = reg.snapshot();

  ASSERT_EQ(reg.setActive("grill-kds", false), RegistryErr::Ok);
  ASSERT_TRUE(reg.removeStation("grill-kds"));

  ASSERT_NE(before->find("grill-kds"), nullptr);
  EXPECT_TRUE(before->find("grill-kds")->active);
  EXPECT_EQ(reg.snapshot()->find("grill-kds"), nullptr);
  EXPECT_LT(before->version, reg.snapshot()->version);
}

/**
 * @test Registry_Validate_Warnings
 * @brief Configuration problems surface as warnings, never as errors.
 */
TEST(StationRegistry, Registry_Validate_Warnings) {
  StationRegistry reg;
  EXPECT_FALSE(reg.snapshot()->validate().empty());   // no active stations

  ASSERT_EQ(reg.addStation(display("empty", {})), RegistryErr::Ok);
  ASSERT_EQ(reg.addStation(display("odd", {"sushi"})), RegistryErr::Ok);
  Station p = printer("p1", {"grill"}, "");
  p.backup_station_id = "empty";
  ASSERT_EQ(reg.addStation(p), RegistryErr::Ok);

  const auto warnings = reg.snapshot()->validate();
  const auto has = [&](std::string_view needle) {
    return std::any_of(warnings.begin(), warnings.end(),
                       [&](const std::string& w) { return w.find(needle) != std::string::npos; });
  };
  EXPECT_TRUE(has("'empty' is active but subscribes to no tags"));
  EXPECT_TRUE(has("unknown tag 'sushi'"));
  EXPECT_TRUE(has("'p1' has no host"));
  EXPECT_TRUE(has("backup 'empty' is not a printer"));
}

/**
 * @test Registry_Concurrent_NoTornReads
 * @brief Readers always see a snapshot whose version matches its content.
 */
TEST(StationRegistry, Registry_Concurrent_NoTornReads) {
  StationRegistry reg;
  std::atomic<bool> stop{false};
  std::atomic<int> bad{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!stop.load(std::memory_order_relaxed)) {
        auto snap = reg.snapshot();
        // Writer adds one station per version, starting from an empty registry.
        if (snap->stations.size() != snap->version) bad.fetch_add(1);
      }
    });
  }
  for (int i = 0; i < 200; ++i) {
    ASSERT_EQ(reg.addStation(display("s" + std::to_string(i), {"grill"})), RegistryErr::Ok);
  }
  stop = true;
  for (auto& t : readers) t.join();

  EXPECT_EQ(bad.load(), 0);
  EXPECT_EQ(reg.size(), 200u);
}

/**
 * @test Registry_ReplaceAll_Validation
 * @brief A batch reload publishes one version and reports the stations it left out.
 */
TEST(StationRegistry, Registry_ReplaceAll_Validation) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("old-kds", {"grill"})), RegistryErr::Ok);
  const auto v0 = reg.version();

  TagRegistry tags;
  tags.add(*RouteTag::parse("grill"));
  tags.add(*RouteTag::parse("fryer"));
  Station bad = display("bad id!", {"grill"});
  const StationList batch = {display("grill-kds", {"grill"}), display("fry-kds", {"fryer"}),
                             display("grill-kds", {"fryer"}), bad};

  const auto rejected = reg.replaceAll(tags, batch);
  ASSERT_EQ(rejected.size(), 2u);
  EXPECT_EQ(rejected[0].id, "grill-kds");
  EXPECT_EQ(rejected[0].err, RegistryErr::Exists);
  EXPECT_EQ(rejected[1].err, RegistryErr::Invalid);

  EXPECT_EQ(reg.version(), v0 + 1);
  auto snap = reg.snapshot();
  EXPECT_EQ(snap->tags, tags);
  EXPECT_EQ(snap->stations.size(), 2u);
  EXPECT_FALSE(snap->find("old-kds"));
  EXPECT_EQ(join(snap->find("grill-kds")->tags), "grill");
}

/**
 * @test Registry_ReplaceAll_NoPartialSnapshots
 * @brief Readers racing a reload see the old station set or the new one, never a mix.
 */
TEST(StationRegistry, Registry_ReplaceAll_NoPartialSnapshots) {
  const StationList first  = {display("a", {"grill"}), display("b", {"fryer"})};
  const StationList second = {display("c", {"grill"}), display("d", {"fryer"}), display("e", {"bar"})};

  StationRegistry reg;
  ASSERT_TRUE(reg.replaceAll(TagRegistry::with_defaults(), first).empty());

  std::atomic<bool> stop{false};
  std::atomic<int> torn{0};
  std::thread reader([&] {
    while (!stop.load(std::memory_order_relaxed)) {
      auto snap = reg.snapshot();
      const auto n = snap->stations.size();
      const bool old_set = n == 2 && snap->find("a") && snap->find("b");
      const bool new_set = n == 3 && snap->find("c") && snap->find("d") && snap->find("e");
      if (!old_set && !new_set) torn.fetch_add(1);
    }
  });

  for (int i = 0; i < 2000; ++i) {
    ASSERT_TRUE(reg.replaceAll(TagRegistry::with_defaults(), (i % 2 == 0) ? second : first).empty());
  }
  stop = true;
  reader.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(reg.version(), 2001u);
}

// ------------------------------- Resolver -----------------------------------

/**
 * @test Resolve_BurgerFries
 * @brief Burger goes to grill, fries to fryer, both to expo; entries ordered by id.
 */
TEST(Resolver, Resolve_BurgerFries) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("grill-kds", {"grill"})), RegistryErr::Ok);
  ASSERT_EQ(reg.addStation(display("fry-kds", {"fryer"})), RegistryErr::Ok);
  ASSERT_EQ(reg.addStation(display("expo-kds", {"grill", "fryer"})), RegistryErr::Ok);

  auto m = resolve_routing(order({item("1", "Burger", {"grill"}), item("2", "Fries", {"fryer"})}),
                           *reg.snapshot());
  ASSERT_TRUE(m);
  ASSERT_EQ(m->entries.size(), 3u);
  EXPECT_EQ(m->entries[0].station_id, "expo-kds");
  EXPECT_EQ(m->entries[1].station_id, "fry-kds");
  EXPECT_EQ(m->entries[2].station_id, "grill-kds");

  EXPECT_EQ(ids(m->entry_for("expo-kds")->items), (std::vector<std::string>{"1", "2"}));
  EXPECT_EQ(ids(m->entry_for("grill-kds")->items), (std::vector<std::string>{"1"}));
  EXPECT_EQ(ids(m->entry_for("fry-kds")->items), (std::vector<std::string>{"2"}));
  EXPECT_EQ(join(m->entry_for("expo-kds")->matched_tags), "fryer,grill");

  EXPECT_TRUE(m->unrouted.empty());
  EXPECT_EQ(m->stats.routed, 2u);
  EXPECT_EQ(m->stats.stations_used, 3u);
  EXPECT_EQ(m->registry_version, reg.version());
}

/**
 * @test Resolve_FanOut_SharesItem
 * @brief An item routed to several stations is one shared object.
 */
TEST(Resolver, Resolve_FanOut_SharesItem) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("a", {"grill"})), RegistryErr::Ok);
  ASSERT_EQ(reg.addStation(display("b", {"grill"})), RegistryErr::Ok);

  auto m = resolve_routing(order({item("1", "Steak", {"grill"})}), *reg.snapshot());
  ASSERT_TRUE(m);
  ASSERT_EQ(m->entries.size(), 2u);
  EXPECT_EQ(m->entries[0].items[0].get(), m->entries[1].items[0].get());
  ASSERT_EQ(m->routing.size(), 1u);
  EXPECT_EQ(m->routing[0].station_ids, (std::vector<std::string>{"a", "b"}));
}

/**
 * @test Resolve_OwnTagsOverrideCategory
 * @brief Own tags win; category tags are used only when the item has none.
 */
TEST(Resolver, Resolve_OwnTagsOverrideCategory) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("bar-kds", {"bar"})), RegistryErr::Ok);
  ASSERT_EQ(reg.addStation(display("kitchen-kds", {"kitchen"})), RegistryErr::Ok);

  auto m = resolve_routing(order({
      item("1", "Espresso Martini", {"bar"}, {"kitchen"}),
      item("2", "Tiramisu", {}, {"kitchen"}),
  }), *reg.snapshot());
  ASSERT_TRUE(m);
  EXPECT_EQ(ids(m->entry_for("bar-kds")->items), (std::vector<std::string>{"1"}));
  EXPECT_EQ(ids(m->entry_for("kitchen-kds")->items), (std::vector<std::string>{"2"}));
  EXPECT_EQ(m->routing[0].source, TagSource::Item);
  EXPECT_EQ(m->routing[1].source, TagSource::Category);
}

/**
 * @test Resolve_UnroutedReasons
 * @brief No tags, only unknown tags and no matching station are told apart.
 */
TEST(Resolver, Resolve_UnroutedReasons) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("grill-kds", {"grill"})), RegistryErr::Ok);

  auto m = resolve_routing(order({
      item("1", "Water", {}),
      item("2", "Steak", {"griil"}, {"grill"}),   // misspelled own tag: no category fallback
      item("3", "Mojito", {"bar"}),
      item("4", "Burger", {"grill"}),
  }), *reg.snapshot());
  ASSERT_TRUE(m);
  ASSERT_EQ(m->unrouted.size(), 3u);
  EXPECT_EQ(m->unrouted[0].item->id, "1");
  EXPECT_EQ(m->unrouted[0].reason, UnroutedReason::NoTags);
  EXPECT_EQ(m->unrouted[1].item->id, "2");
  EXPECT_EQ(m->unrouted[1].reason, UnroutedReason::OnlyUnknownTags);
  EXPECT_EQ(m->unrouted[2].item->id, "3");
  EXPECT_EQ(m->unrouted[2].reason, UnroutedReason::NoMatchingStation);

  ASSERT_EQ(m->diagnostics.size(), 1u);
  EXPECT_EQ(m->diagnostics[0].item_id, "2");
  EXPECT_EQ(m->diagnostics[0].tag, "griil");
  EXPECT_EQ(m->diagnostics[0].kind, TagDiagnostic::Kind::UnknownTag);

  EXPECT_EQ(m->stats.routed, 1u);
  EXPECT_EQ(m->stats.unrouted, 3u);
  EXPECT_FALSE(m->fully_unrouted());
}

/**
 * @test Resolve_InvalidSpelling_Diagnosed
 * @brief A tag that cannot be parsed is reported, the valid ones still route.
 */
TEST(Resolver, Resolve_InvalidSpelling_Diagnosed) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("grill-kds", {"grill"})), RegistryErr::Ok);

  auto m = resolve_routing(order({item("1", "Burger", {"grill", "gr ill!"})}), *reg.snapshot());
  ASSERT_TRUE(m);
  ASSERT_EQ(m->diagnostics.size(), 1u);
  EXPECT_EQ(m->diagnostics[0].kind, TagDiagnostic::Kind::InvalidTag);
  EXPECT_EQ(m->entries.size(), 1u);
}

/**
 * @test Resolve_InactiveStation_Ignored
 * @brief Disabled stations receive nothing; with no alternative the order is fully unrouted.
 */
TEST(Resolver, Resolve_InactiveStation_Ignored) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("grill-kds", {"grill"})), RegistryErr::Ok);
  ASSERT_EQ(reg.setActive("grill-kds", false), RegistryErr::Ok);

  auto m = resolve_routing(order({item("1", "Burger", {"grill"})}), *reg.snapshot());
  ASSERT_TRUE(m);
  EXPECT_TRUE(m->entries.empty());
  EXPECT_TRUE(m->fully_unrouted());
  EXPECT_FALSE(m->config_warnings.empty());
}

/**
 * @test Resolve_SentItems_Skipped
 * @brief Items sent by an earlier send action are not routed again.
 */
TEST(Resolver, Resolve_SentItems_Skipped) {
  StationRegistry reg;
  ASSERT_EQ(reg.addStation(display("grill-kds", {"grill"})), RegistryErr::Ok);

  OrderItem done = item("1", "Burger", {"grill"});
  done.sent = true;
  auto m = resolve_routing(order({done, item("2", "Steak", {"grill"})}), *reg.snapshot());
  ASSERT_TRUE(m);
  EXPECT_EQ(ids(m->entry_for("grill-kds")->items), (std::vector<std::string>{"2"}));
  EXPECT_EQ(m->stats.skipped_sent, 1u);
  EXPECT_EQ(m->stats.total, 2u);
}

/**
 * @test Resolve_ReferenceItems
 * @brief Stations showing reference items see the rest of the send as context.
 */
TEST(Resolver, Resolve_ReferenceItems) {
  StationRegistry reg;
  Station grill = display("grill-kds", {"grill"});
  grill.show_reference_items = true;
  ASSERT_EQ(reg.addStation(grill), RegistryErr::Ok);
  ASSERT_EQ(reg.addStation(display("fry-kds", {"fryer"})), RegistryErr::Ok);

  auto m = resolve_routing(order({item("1", "Burger", {"grill"}), item("2", "Fries", {"fryer"}),
                                  item("3", "Water", {})}),
                           *reg.snapshot());
  ASSERT_TRUE(m);
  EXPECT_EQ(ids(m->entry_for("grill-kds")->reference_items), (std::vector<std::string>{"2", "3"}));
  EXPECT_TRUE(m->entry_for("fry-kds")->reference_items.empty());
}

/**
 * @test Resolve_Expo_ReceivesEverything
 * @brief An expo station gets every unsent item, tagged or not, and no reference items.
 */
TEST(Resolver, Resolve_Expo_ReceivesEverything) {
  StationRegistry reg;
  Station pass = display("pass", {});
  pass.expo                 = true;
  pass.show_reference_items = true;
  ASSERT_EQ(reg.addStation(pass), RegistryErr::Ok);
  ASSERT_EQ(reg.addStation(display("grill-kds", {"grill"})), RegistryErr::Ok);

  OrderItem done = item("4", "Soup", {"grill"});
  done.sent = true;
  auto m = resolve_routing(order({item("1", "Burger", {"grill"}), item("2", "Water", {}),
                                  item("3", "Mojito", {"bar"}), done}),
                           *reg.snapshot());
  ASSERT_TRUE(m);

  const auto* expo = m->entry_for("pass");
  ASSERT_NE(expo, nullptr);
  EXPECT_EQ(ids(expo->items), (std::vector<std::string>{"1", "2", "3"}));
  EXPECT_TRUE(expo->reference_items.empty());
  EXPECT_EQ(join(expo->matched_tags), "bar,grill");
  EXPECT_EQ(ids(m->entry_for("grill-kds")->items), (std::vector<std::string>{"1"}));

  EXPECT_TRUE(m->unrouted.empty());
  EXPECT_EQ(m->stats.routed, 3u);
  EXPECT_EQ(m->routing[0].station_ids, (std::vector<std::string>{"grill-kds", "pass"}));
  EXPECT_EQ(m->routing[1].station_ids, (std::vector<std::string>{"pass"}));

  // An expo station needs no tags of its own.
  const auto warnings = reg.snapshot()->validate();
  EXPECT_TRUE(std::none_of(warnings.begin(), warnings.end(), [](const std::string& w) {
    return w.find("'pass'") != std::string::npos;
  }));

  ASSERT_EQ(reg.setActive("pass", false), RegistryErr::Ok);
  auto off = resolve_routing(order({item("2", "Water", {})}), *reg.snapshot());
  ASSERT_TRUE(off);
  EXPECT_TRUE(off->fully_unrouted());
}

/**
 * @test Resolve_MalformedInput
 * @brief Malformed snapshots are rejected with a specific error.
 */
TEST(Resolver, Resolve_MalformedInput) {
  StationRegistry reg;
  const auto snap = reg.snapshot();

  EXPECT_EQ(resolve_routing(order({}, ""), *snap).error(), ResolveError::EmptyOrderId);
  EXPECT_EQ(resolve_routing(order({item("", "X", {})}), *snap).error(), ResolveError::EmptyItemId);
  EXPECT_EQ(resolve_routing(order({item("1", "X", {}), item("1", "Y", {})}), *snap).error(),
            ResolveError::DuplicateItemId);

  OrderItem zero = item("1", "X", {});
  zero.quantity = 0;
  EXPECT_EQ(resolve_routing(order({zero}), *snap).error(), ResolveError::NonPositiveQuantity);

  OrderItem deep = item("1", "X", {});
  deep.modifiers.push_back(Modifier{"cheese", "", -1, 1});
  EXPECT_EQ(resolve_routing(order({deep}), *snap).error(), ResolveError::NegativeModifierDepth);

  // An empty order is valid: nothing to route.
  auto empty = resolve_routing(order({}), *snap);
  ASSERT_TRUE(empty);
  EXPECT_TRUE(empty->entries.empty());
  EXPECT_FALSE(empty->fully_unrouted());
}
