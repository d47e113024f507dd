#pragma once

#include <chrono>
#include <ctime>
#include <string>

struct BackupDescriptor {
  std::string file_name;
  std::string full_path;
  std::chrono::system_clock::time_point timestamp;
};

namespace backup_naming {

/// <database>_<ddMMyyyy>_<HH_mm>.bak for the given broken-down local time
std::string make_file_name(const std::string &database_name,
                           const std::tm &local_time);

/// Converts the time point to local time and joins the file name with the
/// backup directory. Does not touch the file system.
BackupDescriptor make_descriptor(const std::string &database_name,
                                 const std::string &backup_directory,
                                 std::chrono::system_clock::time_point now);

/// Name the backup is written under before it is renamed to the destination.
/// Unique per call, so concurrent backups to the same destination do not
/// share a staging file.
std::string make_staging_path(const std::string &destination_path);

} // namespace backup_naming
