#include "extension_helper.hpp"

#include "duckdb.hpp"

void preload_motherduck_extension() {
  // create an in-memory DuckDB instance
  duckdb::DuckDB db;
  duckdb::Connection con(db);
  {
    auto md_install_res = con.Query("INSTALL motherduck");
    if (md_install_res->HasError()) {
      md_install_res->ThrowError(
          "Could not install motherduck extension during pre-loading: ");
    }
  }
  {
    const auto md_load_res = con.Query("LOAD motherduck");
    if (md_load_res->HasError()) {
      md_load_res->ThrowError(
          "Could not load motherduck extension during pre-loading: ");
    }
  }
}
