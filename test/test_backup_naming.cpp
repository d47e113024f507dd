#include "backup_naming.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <ctime>

namespace {
std::tm make_tm(int year, int month, int day, int hour, int minute) {
  std::tm t{};
  t.tm_year = year - 1900;
  t.tm_mon = month - 1;
  t.tm_mday = day;
  t.tm_hour = hour;
  t.tm_min = minute;
  t.tm_sec = 17;
  return t;
}
} // namespace

TEST_CASE("Backup file name pattern", "[backup_naming]") {
  REQUIRE(backup_naming::make_file_name("Shop", make_tm(2024, 3, 5, 14, 7)) ==
          "Shop_05032024_14_07.bak");
  REQUIRE(backup_naming::make_file_name("Shop", make_tm(2024, 12, 31, 0, 0)) ==
          "Shop_31122024_00_00.bak");
}

TEST_CASE("Backup names collide within the same minute", "[backup_naming]") {
  auto first = make_tm(2024, 3, 5, 14, 7);
  auto second = first;
  second.tm_sec = 59;
  REQUIRE(backup_naming::make_file_name("Shop", first) ==
          backup_naming::make_file_name("Shop", second));
}

TEST_CASE("Backup descriptor joins the directory", "[backup_naming]") {
  // The test session runs in UTC
  const auto now = std::chrono::system_clock::from_time_t(1709647620);
  const auto descriptor =
      backup_naming::make_descriptor("Shop", "/var/backups/db", now);

  REQUIRE(descriptor.file_name == "Shop_05032024_14_07.bak");
  REQUIRE(descriptor.full_path == "/var/backups/db/Shop_05032024_14_07.bak");
  REQUIRE(descriptor.timestamp == now);

  const auto with_slash =
      backup_naming::make_descriptor("Shop", "/var/backups/db/", now);
  REQUIRE(with_slash.full_path == "/var/backups/db/Shop_05032024_14_07.bak");
}

TEST_CASE("Staging paths are unique per backup", "[backup_naming]") {
  const std::string destination = "/var/backups/db/Shop_05032024_14_07.bak";
  const auto first = backup_naming::make_staging_path(destination);
  const auto second = backup_naming::make_staging_path(destination);

  REQUIRE(first != second);
  REQUIRE(first.starts_with(destination + "."));
  REQUIRE(first.ends_with(".partial"));
  REQUIRE(second.starts_with(destination + "."));
  REQUIRE(second.ends_with(".partial"));
}
