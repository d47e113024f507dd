#include "../integration/common.hpp"

#include "../test_helpers.hpp"

#include <filesystem>

MirrorFixture make_fixture(const std::string &name,
                           const std::vector<std::string> &source_statements) {
  MirrorFixture fixture;
  fixture.root = test_helpers::scratch_dir(name);
  const std::filesystem::path root(fixture.root);
  fixture.source_path = (root / "Shop.duckdb").string();
  fixture.backup_directory = (root / "backups").string();
  fixture.remote_directory = (root / "remote").string();
  fixture.remote_path = (root / "remote" / "analytics.duckdb").string();

  std::filesystem::create_directories(fixture.backup_directory);
  std::filesystem::create_directories(fixture.remote_directory);
  run_statements(fixture.source_path, source_statements);
  run_statements(fixture.remote_path, {});
  return fixture;
}

std::map<std::string, std::string> MirrorFixture::properties() const {
  return {
      {"source_database", "Shop"},
      {"source_database_path", source_path},
      {"name_suffix", "bi"},
      {"backup_directory", backup_directory},
      {"remote_address", remote_directory},
      {"remote_database", "analytics"},
  };
}

void run_statements(const std::string &database_path,
                    const std::vector<std::string> &statements) {
  duckdb::DuckDB db(database_path);
  duckdb::Connection con(db);
  for (const auto &statement : statements) {
    REQUIRE_NO_FAIL(con.Query(statement));
  }
}

void check_row(duckdb::unique_ptr<duckdb::MaterializedQueryResult> &res,
               duckdb::idx_t row,
               std::initializer_list<duckdb::Value> expected) {
  duckdb::idx_t col = 0;
  for (const auto &val : expected) {
    if (val.IsNull()) {
      REQUIRE(res->GetValue(col++, row).IsNull());
    } else {
      REQUIRE(res->GetValue(col++, row) == val);
    }
  }
}
