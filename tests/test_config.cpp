/**
 * @file test_config.cpp
 * @brief Tests for the YAML Loader and the Engine send path built from it.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include "galley/config/config_loader.hpp"
#include "galley/dispatch/channel.hpp"
#include "galley/dispatch/dispatch_service.hpp"
#include "galley/engine.hpp"
#include "galley/routing/station_registry.hpp"

using namespace std::chrono_literals;
using galley::config::ConfigError;
using galley::config::Loader;
using namespace galley::routing;

namespace {

const char* kKitchenYaml = R"(
logging:
  level: debug
tags:
  - grill
  - fryer
  - name: bar
    description: Drinks
stations:
  - id: grill-print
    name: Grill
    kind: printer
    tags: [grill]
    backup: spare-print
    printer:
      host: 10.0.0.20
      port: 9100
      dialect: thermal
      paper_width_mm: 58
      buzzer: true
    style:
      preset: kitchen
      indent_per_depth: 4
      depth_glyphs: ["* ", "> "]
      elements:
        server: { enabled: false }
        item: { size: double, align: center }
  - id: spare-print
    name: Spare
    kind: printer
    tags: []
    printer:
      host: 10.0.0.21
      dialect: impact
  - id: expo-kds
    name: Expo
    tags: [grill, fryer, "Bad Tag!"]
    show_reference_items: true
dispatch:
  max_attempts: 5
  initial_backoff_ms: 100
  backoff_multiplier: 1.5
  max_backoff_ms: 2000
  attempt_timeout_ms: 2500
  connect_timeout_ms: 800
  channel_capacity: 16
  drain_timeout_ms: 3000
  job_retention_ms: 60000
  max_retained_jobs: 200
  require_status_ack: false
)";

const char* kOrderYaml = R"(
order:
  id: o-9
  number: "1042"
  type: dine_in
  table: "12"
  server: Sam
  items:
    - id: "1"
      name: Burger
      qty: 2
      tags: [grill]
      seat: 3
      modifiers:
        - { name: pickles, pre: "no" }
        - name: fries
          depth: 0
        - { name: well done, depth: 1 }
      notes: allergy
    - id: "2"
      name: Fries
      category: Sides
      category_tags: [fryer]
    - id: "3"
      name: Soda
      sent: true
)";

} // namespace

/**
 * @test Config_Load_FullDocument
 * @brief Every section is read into EngineConfig.
 */
TEST(ConfigLoader, Config_Load_FullDocument) {
  auto cfg = Loader::load_from_string(kKitchenYaml);
  ASSERT_TRUE(cfg) << cfg.error().message;

  EXPECT_EQ(cfg->logging.level, "debug");
  EXPECT_EQ(cfg->tags.size(), 3u);
  EXPECT_EQ(cfg->tags.description(*RouteTag::parse("bar")), "Drinks");

  ASSERT_EQ(cfg->stations.size(), 3u);
  const Station& grill = cfg->stations[0];
  EXPECT_EQ(grill.kind, StationKind::Printer);
  EXPECT_EQ(grill.backup_station_id, "spare-print");
  EXPECT_EQ(grill.printer.address.host, "10.0.0.20");
  EXPECT_EQ(grill.printer.paper_width_mm, 58);
  EXPECT_TRUE(grill.printer.supports_cut);
  EXPECT_TRUE(grill.printer.buzzer);
  EXPECT_EQ(grill.printer.style.indent_per_depth, 4);
  EXPECT_EQ(grill.printer.style.depth_glyphs, (std::vector<std::string>{"* ", "> "}));
  EXPECT_FALSE(grill.printer.style.server.enabled);
  EXPECT_EQ(grill.printer.style.item.size, galley::print::TextSize::Double);
  EXPECT_EQ(grill.printer.style.item.align, galley::print::Align::Center);
  EXPECT_TRUE(grill.printer.style.item.bold);   // kept from the preset

  const Station& spare = cfg->stations[1];
  EXPECT_EQ(spare.printer.dialect, PrinterDialect::Impact);
  EXPECT_FALSE(spare.printer.supports_cut);      // impact default
  EXPECT_EQ(spare.printer.address.port, 9100);

  const Station& expo = cfg->stations[2];
  EXPECT_EQ(expo.kind, StationKind::Display);
  EXPECT_TRUE(expo.show_reference_items);
  EXPECT_EQ(join(expo.tags), "fryer,grill");
  ASSERT_EQ(cfg->warnings.size(), 1u);
  EXPECT_NE(cfg->warnings[0].find("Bad Tag!"), std::string::npos);

  EXPECT_EQ(cfg->retry.max_attempts, 5u);
  EXPECT_EQ(cfg->retry.initial_backoff, 100ms);
  EXPECT_DOUBLE_EQ(cfg->retry.multiplier, 1.5);
  EXPECT_EQ(cfg->retry.max_backoff, 2000ms);
  EXPECT_EQ(cfg->retry.attempt_timeout, 2500ms);
  EXPECT_EQ(cfg->retry.connect_timeout, 800ms);
  EXPECT_FALSE(cfg->retry.require_status_ack);
  EXPECT_EQ(cfg->channel_capacity, 16u);
  EXPECT_EQ(cfg->drain_timeout, 3000ms);
  EXPECT_EQ(cfg->retention.window, 60000ms);
  EXPECT_EQ(cfg->retention.max_jobs, 200u);
}

/**
 * @test Config_Defaults
 * @brief An empty document yields the default tag set and policy.
 */
TEST(ConfigLoader, Config_Defaults) {
  auto cfg = Loader::load_from_string("");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->tags, TagRegistry::with_defaults());
  EXPECT_TRUE(cfg->stations.empty());
  EXPECT_EQ(cfg->retry, galley::dispatch::RetryPolicy{});
  EXPECT_EQ(cfg->retention, galley::dispatch::RetentionPolicy{});

  auto mapped = Loader::load_from_string("tags:\n  grill: Grill line\n  expo: ~\n");
  ASSERT_TRUE(mapped);
  EXPECT_EQ(mapped->tags.size(), 2u);
}

/**
 * @test Config_ExpoStation
 * @brief The expo flag is read per station and defaults to off.
 */
TEST(ConfigLoader, Config_ExpoStation) {
  auto cfg = Loader::load_from_string(R"(
stations:
  - id: pass
    name: Pass
    expo: true
  - id: grill-kds
    tags: [grill]
)");
  ASSERT_TRUE(cfg) << cfg.error().message;
  ASSERT_EQ(cfg->stations.size(), 2u);
  EXPECT_TRUE(cfg->stations[0].expo);
  EXPECT_TRUE(cfg->stations[0].tags.empty());
  EXPECT_FALSE(cfg->stations[1].expo);
  EXPECT_TRUE(cfg->warnings.empty());
}

/**
 * @test Config_Errors
 * @brief Syntax errors, bad values and missing files are told apart.
 */
TEST(ConfigLoader, Config_Errors) {
  auto syntax = Loader::load_from_string("stations: [ {id: a");
  ASSERT_FALSE(syntax);
  EXPECT_EQ(syntax.error().code, ConfigError::Code::Parse);

  auto kind = Loader::load_from_string("stations:\n  - id: a\n    kind: toaster\n");
  ASSERT_FALSE(kind);
  EXPECT_EQ(kind.error().code, ConfigError::Code::Invalid);
  EXPECT_NE(kind.error().message.find("stations[a].kind"), std::string::npos);

  auto dup = Loader::load_from_string("stations:\n  - id: a\n  - id: a\n");
  ASSERT_FALSE(dup);
  EXPECT_NE(dup.error().message.find("duplicate id 'a'"), std::string::npos);

  auto cap = Loader::load_from_string("dispatch:\n  channel_capacity: 10\n");
  ASSERT_FALSE(cap);
  EXPECT_NE(cap.error().message.find("channel_capacity"), std::string::npos);

  auto type = Loader::load_from_string("dispatch:\n  max_attempts: lots\n");
  ASSERT_FALSE(type);
  EXPECT_EQ(type.error().code, ConfigError::Code::Invalid);

  auto preset = Loader::load_from_string(
      "stations:\n  - id: p\n    kind: printer\n    printer: {host: h}\n    style: {preset: fancy}\n");
  ASSERT_FALSE(preset);
  EXPECT_NE(preset.error().message.find("unknown preset 'fancy'"), std::string::npos);

  auto hidden = Loader::load_from_string(
      "stations:\n  - id: p\n    kind: printer\n    printer: {host: h}\n"
      "    style:\n      elements:\n        destructive: {enabled: false}\n");
  ASSERT_FALSE(hidden);
  EXPECT_EQ(hidden.error().code, ConfigError::Code::Invalid);
  EXPECT_NE(hidden.error().message.find("stations[p].style: destructive"), std::string::npos);

  auto missing = Loader::load_from_file("/nonexistent/galley.yaml");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code, ConfigError::Code::Io);
  EXPECT_STREQ(galley::config::to_string(missing.error().code), "io");
}

/**
 * @test Config_LoadFromFile
 * @brief File loading goes through the same parser.
 */
TEST(ConfigLoader, Config_LoadFromFile) {
  const std::string path = ::testing::TempDir() + "galley_config_test.yaml";
  {
    std::ofstream out(path);
    out << kKitchenYaml;
  }
  auto cfg = Loader::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->stations.size(), 3u);
}

/**
 * @test Order_Load
 * @brief Order documents map onto OrderSnapshot, including nested modifiers.
 */
TEST(ConfigLoader, Order_Load) {
  auto o = Loader::load_order_from_string(kOrderYaml);
  ASSERT_TRUE(o) << o.error().message;
  EXPECT_EQ(o->context.order_id, "o-9");
  EXPECT_EQ(o->context.order_number, "1042");
  EXPECT_EQ(o->context.table_name, "12");
  ASSERT_EQ(o->items.size(), 3u);

  const OrderItem& burger = o->items[0];
  EXPECT_EQ(burger.quantity, 2);
  ASSERT_TRUE(burger.seat);
  EXPECT_EQ(*burger.seat, 3);
  ASSERT_EQ(burger.modifiers.size(), 3u);
  EXPECT_EQ(burger.modifiers[0].pre_modifier, "no");
  EXPECT_EQ(burger.modifiers[2].depth, 1);
  EXPECT_EQ(burger.notes, "allergy");

  EXPECT_EQ(o->items[1].category_tags, (std::vector<std::string>{"fryer"}));
  EXPECT_TRUE(o->items[2].sent);

  EXPECT_FALSE(Loader::load_order_from_string("- just\n- a list\n"));
}

/**
 * @test Apply_And_Send
 * @brief Loaded configuration drives a full send through the Engine.
 */
TEST(ConfigLoader, Apply_And_Send) {
  auto cfg = Loader::load_from_string(kKitchenYaml);
  ASSERT_TRUE(cfg);
  auto order = Loader::load_order_from_string(kOrderYaml);
  ASSERT_TRUE(order);

  StationRegistry reg;
  const auto v0 = reg.version();
  EXPECT_TRUE(Loader::apply(*cfg, reg).empty());
  EXPECT_EQ(reg.version(), v0 + 1);   // tags and stations become visible together
  EXPECT_EQ(reg.size(), 3u);
  EXPECT_EQ(reg.snapshot()->tags, cfg->tags);

  galley::dispatch::ChannelHub hub(cfg->channel_capacity);
  galley::dispatch::DispatchContext ctx(hub, nullptr, cfg->retry);
  galley::Engine engine(reg, ctx);

  auto prepared = engine.prepare(*order);
  ASSERT_TRUE(prepared);
  const RoutingManifest& m = prepared->manifest;
  EXPECT_EQ(m.stats.skipped_sent, 1u);
  ASSERT_NE(m.entry_for("grill-print"), nullptr);
  ASSERT_NE(m.entry_for("expo-kds"), nullptr);
  EXPECT_EQ(m.entry_for("expo-kds")->items.size(), 2u);

  ASSERT_EQ(prepared->bundle.tickets.size(), 1u);
  EXPECT_TRUE(prepared->bundle.tickets[0].backup_payload);

  // Printer tickets but no transport: the send is refused as a whole.
  auto sent = engine.send(*order);
  ASSERT_FALSE(sent);
  EXPECT_EQ(sent.error().code, galley::SendError::Code::Unavailable);

  OrderSnapshot bad = *order;
  bad.items[0].quantity = 0;
  auto rejected = engine.prepare(bad);
  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error().code, galley::SendError::Code::MalformedOrder);
}
