#pragma once

#include "../constants.hpp"
#include "duckdb.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <grpcpp/grpcpp.h>

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>

inline bool NO_FAIL(
    const duckdb::unique_ptr<duckdb::MaterializedQueryResult> &result) {
  if (result->HasError()) {
    fprintf(stderr, "Query failed with message: %s\n",
            result->GetError().c_str());
  }
  return !result->HasError();
}

inline bool NO_FAIL(const grpc::Status &status) {
  if (!status.ok()) {
    UNSCOPED_INFO("Request failed with message: " + status.error_message());
  }
  return status.ok();
}

inline bool REQUIRE_FAIL(const grpc::Status &status,
                         const Catch::Matchers::StringMatcherBase &matcher) {
  if (!status.ok()) {
    REQUIRE_THAT(status.error_message(), matcher);
    return true;
  }
  return false;
}

#define REQUIRE_NO_FAIL(result) REQUIRE(NO_FAIL((result)))

/// Scratch layout of one mirror run: a source database file, a backup
/// directory and a directory holding the remote database file.
struct MirrorFixture {
  std::string root;
  std::string source_path;
  std::string backup_directory;
  std::string remote_directory;
  std::string remote_path;

  /// Run properties for the "Shop" database and the "analytics" remote
  std::map<std::string, std::string> properties() const;
};

/// Creates the directories and an empty remote database. The source database
/// is created by running the given statements.
MirrorFixture make_fixture(const std::string &name,
                           const std::vector<std::string> &source_statements);

void run_statements(const std::string &database_path,
                    const std::vector<std::string> &statements);

// Helper to verify a row's values in order. Usage:
//   check_row(res, 0, {1, "first", duckdb::Value()});
void check_row(duckdb::unique_ptr<duckdb::MaterializedQueryResult> &res,
               duckdb::idx_t row, std::initializer_list<duckdb::Value> expected);
