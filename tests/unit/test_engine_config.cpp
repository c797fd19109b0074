#include "TestFixtures.hpp"
#include "board-ident/EngineConfig.hpp"

#include <gtest/gtest.h>

using namespace boardident;
using namespace boardident::test;

TEST(EngineConfig, DefaultsMatchDocumentedValues) {
  EngineConfig cfg;
  EXPECT_EQ(cfg.scan.max_workers, 10u);
  EXPECT_EQ(cfg.scan.monitor_interval, std::chrono::seconds(5));
  EXPECT_EQ(cfg.scan.stop_timeout, std::chrono::seconds(10));
  EXPECT_EQ(cfg.direct_text.baud, 115200u);
  EXPECT_EQ(cfg.direct_text.command, 'I');
  EXPECT_EQ(cfg.direct_text.max_attempts, 5);
  EXPECT_EQ(cfg.direct_text.min_uid_hex_digits, 24u);
  EXPECT_EQ(cfg.bootloader.uid_length, 12);
  EXPECT_EQ(cfg.uid_addresses.address_for(BoardKind::Stm32), 0x1FFF7A10u);
  EXPECT_EQ(cfg.uid_addresses.address_for(BoardKind::Unknown), 0x1FFF7A10u);
  EXPECT_EQ(cfg.programmer.timeout, std::chrono::seconds(15));
  EXPECT_EQ(cfg.harvest.bauds, (std::vector<uint32_t>{115200, 9600}));
  EXPECT_EQ(cfg.harvest.max_bytes, 768u);
  EXPECT_EQ(cfg.devices_file().filename(), "devices.json");
  EXPECT_NO_THROW(cfg.validate());
}

TEST(EngineConfig, YamlOverridesNestedSections) {
  YAML::Node root = YAML::Load(R"(
data_dir: /tmp/bi
scan:
  max_workers: 4
  monitor_interval_ms: 250
direct_text:
  command: i
  max_attempts: 2
  read_window_ms: 4000
uid_addresses:
  default: 0x1FF0F420
  stm32: "0x1FFF7590"
programmer:
  debug_probes_only: false
  tools:
    openocd: /opt/openocd/bin/openocd
harvest:
  bauds: [9600]
)");

  EngineConfig cfg = config_from_yaml(root);
  EXPECT_EQ(cfg.data_dir, "/tmp/bi");
  EXPECT_EQ(cfg.scan.max_workers, 4u);
  EXPECT_EQ(cfg.scan.monitor_interval.count(), 250);
  EXPECT_EQ(cfg.direct_text.command, 'i');
  EXPECT_EQ(cfg.direct_text.max_attempts, 2);
  EXPECT_EQ(cfg.direct_text.read_window.count(), 4000);
  EXPECT_EQ(cfg.uid_addresses.address_for(BoardKind::Stm32), 0x1FFF7590u);
  EXPECT_EQ(cfg.uid_addresses.address_for(BoardKind::Arduino), 0x1FF0F420u);
  EXPECT_FALSE(cfg.programmer.debug_probes_only);
  EXPECT_EQ(cfg.programmer.tool_paths.at("openocd"), "/opt/openocd/bin/openocd");
  EXPECT_EQ(cfg.harvest.bauds, std::vector<uint32_t>{9600});

  // untouched sections keep defaults
  EXPECT_EQ(cfg.bootloader.baud, 115200u);
}

TEST(EngineConfig, InvalidValuesThrowConfigError) {
  EXPECT_THROW(config_from_yaml(YAML::Load("scan: {max_workers: 0}")),
               ConfigError);
  EXPECT_THROW(config_from_yaml(YAML::Load("direct_text: {command: ID}")),
               ConfigError);
  EXPECT_THROW(config_from_yaml(YAML::Load("uid_addresses: {default: zz}")),
               ConfigError);
  EXPECT_THROW(config_from_yaml(YAML::Load("uid_addresses: {pic32: 0x10}")),
               ConfigError);
  EXPECT_THROW(config_from_yaml(YAML::Load("bootloader: {uid_length: 300}")),
               ConfigError);
  EXPECT_THROW(config_from_yaml(YAML::Load("scan: {max_workers: lots}")),
               ConfigError);
}

class ConfigFileTest : public TempDirTest {};

TEST_F(ConfigFileTest, MissingFileYieldsDefaults) {
  EngineConfig cfg = load_config(path("absent.yaml").string());
  EXPECT_EQ(cfg.scan.max_workers, 10u);
}

TEST_F(ConfigFileTest, LoadsFromDisk) {
  write_file(path("board-ident.yaml"), "logging:\n  level: debug\n");
  EngineConfig cfg = load_config(path("board-ident.yaml").string());
  EXPECT_EQ(cfg.logging.level, "debug");
}

TEST_F(ConfigFileTest, MalformedYamlIsAConfigError) {
  write_file(path("broken.yaml"), "scan: [unterminated\n");
  EXPECT_THROW(load_config(path("broken.yaml").string()), ConfigError);
}

TEST(EngineConfig, BootloaderLengthEncoding) {
  EngineConfig cfg = config_from_yaml(YAML::Load(
      "bootloader: {length_encoding: single_byte, length_byte: '0xBC'}"));
  EXPECT_EQ(cfg.bootloader.length_encoding, LengthEncoding::SingleByte);
  EXPECT_EQ(cfg.bootloader.length_byte, 0xBC);

  EXPECT_EQ(EngineConfig().bootloader.length_encoding,
            LengthEncoding::Complement);
  EXPECT_THROW(
      config_from_yaml(YAML::Load("bootloader: {length_encoding: nibble}")),
      ConfigError);
  EXPECT_THROW(config_from_yaml(YAML::Load("bootloader: {length_byte: 300}")),
               ConfigError);
}
