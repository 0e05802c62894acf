#pragma once

namespace semcache::cli {

// Entry point for the `semcache` executable; returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace semcache::cli
