#include <config/config.hpp>
#include <fmt/core.h>
#include <session/builder.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

namespace {

void print_error(const std::string &what, const tome::error_s &error) {
  fmt::print("{}: {} ({})\n", what, error.message,
             tome::error_name(error.error_code));
}

void print_usage() {
  fmt::print("Usage: tome <store-path> [options] <command> [argument]\n");
  fmt::print("Options:\n");
  fmt::print("  --help, -h\t\tPrint this help message\n");
  fmt::print("  --config, -c <file>\tRead store options from a config file\n");
  fmt::print("  --read-only, -r\tOpen the store read-only\n");
  fmt::print("  --user, -u <id>\tUser id of a secured store\n");
  fmt::print("  --password, -p <pw>\tPassword of a secured store\n");
  fmt::print("Commands:\n");
  fmt::print("  collections\t\tList collection names\n");
  fmt::print("  repositories\t\tList repository type names\n");
  fmt::print("  dump <collection>\tPrint every document of a collection\n");
  fmt::print("  count <collection>\tPrint the document count of a collection\n");
  fmt::print("  compact\t\tCompact the store\n");
}

int run_command(tome::session::session_c &session, const std::string &command,
                const std::string &argument) {
  if (command == "collections") {
    for (const auto &name : session.list_collection_names()) {
      fmt::print("{}\n", name);
    }
    return 0;
  }

  if (command == "repositories") {
    for (const auto &type_name : session.list_repositories()) {
      fmt::print("{}\n", type_name);
    }
    return 0;
  }

  if (command == "dump" || command == "count") {
    if (argument.empty()) {
      fmt::print("{} requires a collection name\n", command);
      return 1;
    }
    if (!session.has_collection(argument)) {
      fmt::print("No such collection: {}\n", argument);
      return 1;
    }
    auto collection = session.get_collection(argument);
    if (collection.is_error()) {
      print_error(fmt::format("Failed to open collection {}", argument),
                  collection.error());
      return 1;
    }
    if (command == "count") {
      fmt::print("{}\n", collection.value()->size());
      return 0;
    }
    collection.value()->for_each(
        [](tome::doc::doc_id_t, const tome::doc::json &document) {
          fmt::print("{}\n", document.dump());
          return true;
        });
    return 0;
  }

  if (command == "compact") {
    auto status = session.compact();
    if (status.is_error()) {
      print_error("Failed to compact", status.error());
      return 1;
    }
    fmt::print("compacted\n");
    return 0;
  }

  fmt::print("Unknown command: {}\n", command);
  print_usage();
  return 1;
}

} // namespace

int main(int argc, char **argv) {

  std::vector<std::string> args(argv, argv + argc);

  if (args.size() == 1) {
    print_usage();
    return 1;
  }

  std::string config_path;
  std::string user_id;
  std::string password;
  bool read_only = false;
  std::vector<std::string> positional;

  for (std::size_t i = 1; i < args.size(); i++) {
    if (args[i] == "--help" || args[i] == "-h") {
      print_usage();
      return 0;
    }

    if (args[i] == "--read-only" || args[i] == "-r") {
      read_only = true;
      continue;
    }

    if (args[i] == "--config" || args[i] == "-c" || args[i] == "--user" ||
        args[i] == "-u" || args[i] == "--password" || args[i] == "-p") {
      if (i + 1 >= args.size()) {
        fmt::print("Missing value for {}\n", args[i]);
        return 1;
      }
      const std::string &value = args[++i];
      if (args[i - 1] == "--config" || args[i - 1] == "-c") {
        config_path = value;
      } else if (args[i - 1] == "--user" || args[i - 1] == "-u") {
        user_id = value;
      } else {
        password = value;
      }
      continue;
    }

    positional.push_back(args[i]);
  }

  if (positional.size() < 2) {
    print_usage();
    return 1;
  }

  const std::string &store_path = positional[0];
  const std::string &command = positional[1];
  const std::string argument = positional.size() > 2 ? positional[2] : "";

  auto logger = spdlog::stderr_color_mt("tome");
  logger->set_level(spdlog::level::warn);

  tome::session::session_builder_c builder;
  if (!config_path.empty()) {
    tome::config::config_c config;
    if (!tome::config::load_config(config_path, config)) {
      fmt::print("Failed to load config file: {}\n", config_path);
      return 1;
    }
    builder.with_config(config);
    logger->set_level(config.get_log_level());
  }

  builder.file_path(store_path).logger(logger);
  if (read_only) {
    builder.read_only();
  }

  auto opened = builder.open_or_create(user_id, password);
  if (opened.is_error()) {
    print_error(fmt::format("Failed to open {}", store_path), opened.error());
    return 1;
  }
  auto session = opened.take();

  int result = run_command(*session, command, argument);

  auto closed = session->close();
  if (closed.is_error()) {
    print_error(fmt::format("Failed to close {}", store_path), closed.error());
    return 1;
  }
  return result;
}
