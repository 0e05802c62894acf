#include "semcache/cli/commands.hpp"

#include "semcache/chat/session.hpp"
#include "semcache/common/fs.hpp"
#include "semcache/config/config.hpp"
#include "semcache/runtime/app.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace semcache::cli {

namespace {

std::string version_string() {
#ifdef SEMCACHE_VERSION
  std::string version = SEMCACHE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "semcache " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

int report_failure(const common::Status &status) {
  std::cerr << "error [" << common::error_code_name(status.code()) << "]: " << status.error()
            << "\n";
  return 1;
}

template <typename T> int report_failure(const common::Result<T> &result) {
  return report_failure(result.status());
}

// --model / --temperature overrides shared by `ask` and `chat`.
bool apply_generation_overrides(std::vector<std::string> &args, config::Config &config) {
  std::string value;
  if (take_option(args, "--model", "", value)) {
    config.generation.model = value;
  }
  if (take_option(args, "--temperature", "-t", value)) {
    try {
      config.generation.temperature = std::stod(value);
    } catch (const std::exception &) {
      std::cerr << "invalid temperature: " << value << "\n";
      return false;
    }
  }
  return true;
}

common::Result<runtime::RuntimeContext> load_context() {
  auto context = runtime::RuntimeContext::from_disk();
  if (context.ok()) {
    for (const auto &warning : context.value().warnings()) {
      std::cerr << "warning: " << warning << "\n";
    }
  }
  return context;
}

void print_counters(const cache::CacheStats &stats) {
  std::cout << "Lookups: fast " << stats.fast_hits << ", fallback " << stats.fallback_hits
            << ", miss " << stats.misses << "\n";
  std::cout << "Records: new " << stats.records_new << ", updated " << stats.records_updated
            << "\n";
  std::cout << "Index entries: " << stats.index_size << "\n";
}

void print_reply(const chat::ChatReply &reply, const bool show_path) {
  std::cout << reply.content << "\n";
  if (show_path) {
    std::cerr << "[" << cache::lookup_path_name(reply.path)
              << (reply.from_cache ? " cached" : " generated") << "]\n";
  }
}

int run_ask(std::vector<std::string> args) {
  auto context = load_context();
  if (!context.ok()) {
    return report_failure(context);
  }

  std::string message;
  (void)take_option(args, "--message", "-m", message);
  const bool show_path = take_flag(args, "--show-path");
  if (!apply_generation_overrides(args, context.value().mutable_config())) {
    return 1;
  }
  if (message.empty() && !args.empty()) {
    message = args.size() == 1 && args[0] == "-" ? read_stdin_all() : join_tokens(args);
  }
  if (common::trim(message).empty()) {
    std::cerr << "usage: semcache ask -m <prompt>\n";
    return 1;
  }

  auto service = context.value().create_chat_service();
  if (!service.ok()) {
    return report_failure(service);
  }

  auto reply = service.value()->ask(message, {});
  if (!reply.ok()) {
    return report_failure(reply);
  }
  print_reply(reply.value(), show_path);
  return 0;
}

int run_chat(std::vector<std::string> args) {
  auto context = load_context();
  if (!context.ok()) {
    return report_failure(context);
  }
  std::string chat_id;
  const bool resume = take_option(args, "--session", "-s", chat_id);
  const bool no_save = take_flag(args, "--no-save");
  if (resume && no_save) {
    std::cerr << "--session and --no-save cannot be combined\n";
    return 1;
  }
  const bool show_path = take_flag(args, "--show-path");
  if (!apply_generation_overrides(args, context.value().mutable_config())) {
    return 1;
  }

  auto service = context.value().create_chat_service();
  if (!service.ok()) {
    return report_failure(service);
  }

  std::optional<chat::ChatSession> session;
  if (no_save) {
    session.emplace(*service.value());
  } else {
    auto store = context.value().create_chat_store();
    if (!store.ok()) {
      return report_failure(store);
    }
    auto opened = chat::ChatSession::open(*service.value(), store.value(), chat_id);
    if (!opened.ok()) {
      return report_failure(opened);
    }
    session.emplace(std::move(opened.value()));
  }

  std::cout << version_string() << " (model " << context.value().config().generation.model
            << "). Type /exit to quit, /clear to start over, /stats for cache counters.\n";
  if (!session->chat_id().empty()) {
    std::cout << "Chat " << session->chat_id();
    if (!session->history().empty()) {
      std::cout << " resumed with " << session->history().size() << " messages";
    }
    std::cout << ".\n";
  }

  std::string line;
  while (true) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\n";
      break;
    }
    const std::string input = common::trim(line);
    if (input.empty()) {
      continue;
    }
    if (input == "/exit" || input == "/quit") {
      break;
    }
    if (input == "/stats") {
      print_counters(service.value()->cache().stats());
      continue;
    }
    if (input == "/clear") {
      session->clear();
      if (session->chat_id().empty()) {
        std::cout << "History cleared.\n";
      } else {
        std::cout << "Started chat " << session->chat_id() << ".\n";
      }
      continue;
    }

    auto reply = session->send(input);
    if (!reply.ok()) {
      std::cerr << "error [" << common::error_code_name(reply.code()) << "]: " << reply.error()
                << "\n";
      continue;
    }
    print_reply(reply.value(), show_path);
  }
  return 0;
}

int sessions_usage() {
  std::cerr << "usage: semcache sessions list | show ID | rename ID TITLE | delete ID | "
               "delete --all\n";
  return 1;
}

int run_sessions(std::vector<std::string> args) {
  if (args.empty()) {
    return sessions_usage();
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto context = load_context();
  if (!context.ok()) {
    return report_failure(context);
  }
  auto store = context.value().create_chat_store();
  if (!store.ok()) {
    return report_failure(store);
  }
  auto &chats = *store.value();

  if (action == "list" && args.empty()) {
    auto threads = chats.list_chats();
    if (!threads.ok()) {
      return report_failure(threads);
    }
    if (threads.value().empty()) {
      std::cout << "No saved chats.\n";
    }
    for (const auto &thread : threads.value()) {
      std::cout << thread.id << "  " << thread.title << "  (" << thread.message_count
                << " messages, " << thread.created_at << ")\n";
    }
    return 0;
  }

  if (action == "show" && args.size() == 1) {
    auto messages = chats.load_messages(args[0]);
    if (!messages.ok()) {
      return report_failure(messages);
    }
    for (const auto &message : messages.value()) {
      std::cout << message.role << ": " << message.content << "\n";
    }
    return 0;
  }

  if (action == "rename" && args.size() >= 2) {
    const auto status = chats.rename_chat(args[0], join_tokens(args, 1));
    if (!status.ok()) {
      return report_failure(status);
    }
    std::cout << "Renamed " << args[0] << "\n";
    return 0;
  }

  if (action == "delete" && args.size() == 1 && args[0] == "--all") {
    auto removed = chats.delete_all_chats();
    if (!removed.ok()) {
      return report_failure(removed);
    }
    std::cout << "Deleted " << removed.value() << " chats\n";
    return 0;
  }

  if (action == "delete" && args.size() == 1) {
    auto removed = chats.delete_chat(args[0]);
    if (!removed.ok()) {
      return report_failure(removed);
    }
    if (!removed.value()) {
      std::cerr << "no saved chat with id " << args[0] << "\n";
      return 1;
    }
    std::cout << "Deleted " << args[0] << "\n";
    return 0;
  }

  return sessions_usage();
}

int run_stats() {
  auto context = load_context();
  if (!context.ok()) {
    return report_failure(context);
  }

  auto cache = context.value().create_cache();
  if (!cache.ok()) {
    return report_failure(cache);
  }

  auto &store = cache.value()->store();
  const auto records = store.count();
  if (!records.ok()) {
    return report_failure(records);
  }
  const auto stats = cache.value()->stats();
  const auto &options = cache.value()->options();

  std::cout << "Database: " << config::resolved_db_path(context.value().config()).string()
            << "\n";
  std::cout << "Store: " << store.name() << " (" << (store.health_check() ? "healthy" : "unhealthy")
            << ")\n";
  std::cout << "Embedder: " << cache.value()->embedder().name() << " ("
            << cache.value()->embedder().dimensions() << " dims)\n";
  std::cout << "Stored queries: " << records.value() << "\n";
  print_counters(stats);
  std::cout << "Thresholds: fast > " << options.fast_threshold << ", fallback > "
            << options.fallback_threshold << ", top_k " << options.top_k << "\n";
  return 0;
}

int run_init_config(std::vector<std::string> args) {
  const bool force = take_flag(args, "--force");
  auto path = config::config_path();
  if (!path.ok()) {
    return report_failure(path);
  }
  if (config::config_exists() && !force) {
    std::cerr << "config already exists at " << path.value().string()
              << " (use --force to overwrite)\n";
    return 1;
  }

  const auto status = config::save_config(config::Config{});
  if (!status.ok()) {
    return report_failure(status);
  }
  std::cout << "Wrote " << path.value().string() << "\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << " - chat front end with a semantic response cache\n\n";
  std::cout << "Usage: semcache [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  ask -m PROMPT      Answer one prompt (from cache when possible)\n";
  std::cout << "  chat               Interactive conversation (/exit, /clear, /stats)\n";
  std::cout << "  sessions ACTION    Saved chats: list, show ID, rename ID TITLE,\n";
  std::cout << "                     delete ID, delete --all\n";
  std::cout << "  stats              Show cache store and index statistics\n";
  std::cout << "  init-config        Write a default config file (--force to overwrite)\n";
  std::cout << "  config-path        Print the config file location\n";
  std::cout << "  version            Print the version\n";
  std::cout << "  help               Show this help\n\n";
  std::cout << "Options for ask/chat:\n";
  std::cout << "  --model NAME       Override generation.model\n";
  std::cout << "  -t, --temperature  Override generation.temperature\n";
  std::cout << "  --show-path        Report whether a reply came from the cache\n\n";
  std::cout << "Options for chat:\n";
  std::cout << "  -s, --session ID   Resume a saved chat\n";
  std::cout << "  --no-save          Keep the conversation in memory only\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return report_failure(path_result);
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "init-config") {
    return run_init_config(std::move(args));
  }
  if (subcommand == "ask") {
    return run_ask(std::move(args));
  }
  if (subcommand == "chat") {
    return run_chat(std::move(args));
  }
  if (subcommand == "sessions") {
    return run_sessions(std::move(args));
  }
  if (subcommand == "stats") {
    return run_stats();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace semcache::cli
