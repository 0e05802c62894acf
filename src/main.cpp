#include "semcache/cli/commands.hpp"

int main(int argc, char **argv) { return semcache::cli::run_cli(argc, argv); }
