#include "test_framework.hpp"

#include <csignal>
#include <iostream>
#include <string>

void register_common_tests(std::vector<semcache::tests::TestCase> &tests);
void register_config_tests(std::vector<semcache::tests::TestCase> &tests);
void register_vector_index_tests(std::vector<semcache::tests::TestCase> &tests);
void register_sqlite_store_tests(std::vector<semcache::tests::TestCase> &tests);
void register_semantic_cache_tests(std::vector<semcache::tests::TestCase> &tests);
void register_embedding_tests(std::vector<semcache::tests::TestCase> &tests);
void register_provider_tests(std::vector<semcache::tests::TestCase> &tests);
void register_chat_tests(std::vector<semcache::tests::TestCase> &tests);
void register_observability_tests(std::vector<semcache::tests::TestCase> &tests);
void register_cli_tests(std::vector<semcache::tests::TestCase> &tests);

// Usage: semcache_tests [substring]. With an argument, only tests whose name
// contains it are run.
int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);
  const std::string filter = argc > 1 ? argv[1] : "";

  std::vector<semcache::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_vector_index_tests(tests);
  register_sqlite_store_tests(tests);
  register_semantic_cache_tests(tests);
  register_embedding_tests(tests);
  register_provider_tests(tests);
  register_chat_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);

  std::size_t ran = 0;
  std::size_t failed = 0;
  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    ++ran;
    try {
      test.fn();
    } catch (const semcache::tests::TestFailure &failure) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << failure.what() << "\n";
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": unexpected exception: " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << ran << " tests: " << (ran - failed) << " passed, " << failed
            << " failed\n";
  return failed == 0 && ran > 0 ? 0 : 1;
}
