#include "backup_naming.hpp"

#include <atomic>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace backup_naming {

namespace {
std::atomic<unsigned long> staging_counter{0};
} // namespace

std::string make_file_name(const std::string &database_name,
                           const std::tm &local_time) {
  std::ostringstream out;
  out << database_name << "_" << std::put_time(&local_time, "%d%m%Y_%H_%M")
      << ".bak";
  return out.str();
}

BackupDescriptor make_descriptor(const std::string &database_name,
                                 const std::string &backup_directory,
                                 const std::chrono::system_clock::time_point now) {
  const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
  std::tm local_time{};
  if (localtime_r(&now_c, &local_time) == nullptr) {
    throw std::runtime_error("Could not convert backup timestamp to local time");
  }

  BackupDescriptor descriptor;
  descriptor.file_name = make_file_name(database_name, local_time);
  descriptor.full_path =
      (std::filesystem::path(backup_directory) / descriptor.file_name)
          .string();
  descriptor.timestamp = now;
  return descriptor;
}

std::string make_staging_path(const std::string &destination_path) {
  return destination_path + "." + std::to_string(getpid()) + "_" +
         std::to_string(staging_counter.fetch_add(1)) + ".partial";
}

} // namespace backup_naming
