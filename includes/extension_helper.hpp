#pragma once

/// Installs and loads the MotherDuck extension in a throw-away in-memory
/// DuckDB instance, so that later "md:" connections find it locally.
void preload_motherduck_extension();
