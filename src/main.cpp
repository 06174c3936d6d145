#include "file/file.hpp"
#include "logger/logger.hpp"
#include "transfer/indexer.hpp"

#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <unordered_set>

enum class Command {
  NONE,
  FILE_ROOT,
  DOWNLOAD,
  SELECT
};

struct ProgramOptions {
  Command command{Command::NONE};
  std::string file_path;
  std::string root;
  std::string out_path;
  std::string indexer_url;
  uint64_t replicas{0};
  bool with_proof{false};
  std::string log_file;
  zgs::logging::severity_level log_level{zgs::logging::severity_level::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n"
        << "Commands:\n"
        << "  -f, --file <path>          Print merkle root and submission of a file\n"
        << "  -d, --download <root>      Download a file by root hash (needs --out, --indexer)\n"
        << "  -s, --select <replicas>    Select storage nodes from the indexer (needs --indexer)\n"
        << "Options:\n"
        << "  -o, --out <path>           Destination of a download\n"
        << "  -i, --indexer <url>        Indexer RPC url\n"
        << "      --proof                Verify segment proofs while downloading\n"
        << "      --log-file <path>      Write logs to a file instead of the console\n"
        << "      --log-level <level>    trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -d 0x<root> -o ./out.bin -i https://indexer.example\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-f", "--file", "-d", "--download", "-s", "--select", "-o", "--out",
    "-i", "--indexer", "--log-file", "--log-level"
  };

  ProgramOptions options;
  int commands = 0;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--proof") {
      options.with_proof = true;
      continue;
    }

    if (value_flags.count(flag) == 0 || i + 1 >= argc) {
      std::cerr << "Error: Unknown or incomplete argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-f" || flag == "--file") {
      options.command = Command::FILE_ROOT;
      options.file_path = value;
      ++commands;
    } else if (flag == "-d" || flag == "--download") {
      options.command = Command::DOWNLOAD;
      options.root = value;
      ++commands;
    } else if (flag == "-s" || flag == "--select") {
      options.command = Command::SELECT;
      try {
        options.replicas = std::stoull(value);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid replica count\n";
        print_usage(argv[0]);
        return options;
      }
      ++commands;
    } else if (flag == "-o" || flag == "--out") {
      options.out_path = value;
    } else if (flag == "-i" || flag == "--indexer") {
      options.indexer_url = value;
    } else if (flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "--log-level") {
      if (!zgs::logging::parse_severity(value, options.log_level)) {
        std::cerr << "Error: Invalid log level: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (commands != 1) {
    std::cerr << "Error: Exactly one command is required\n";
    print_usage(argv[0]);
    return options;
  }

  if (options.command == Command::DOWNLOAD) {
    if (!zgs::transfer::validate_root_hash(options.root)) {
      std::cerr << "Error: Root hash must be 0x followed by 64 hex digits\n";
      return options;
    }
    if (options.out_path.empty() || options.indexer_url.empty()) {
      std::cerr << "Error: Download requires --out and --indexer\n";
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.command == Command::SELECT) {
    if (!zgs::transfer::validate_replicas(options.replicas) || options.indexer_url.empty()) {
      std::cerr << "Error: Select requires a replica count of at least 1 and --indexer\n";
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

bool run_file_root(const ProgramOptions& options) {
  zgs::file::DiskFile file(options.file_path);
  auto tree = file.merkle_tree();
  if (!tree) {
    std::cerr << "Error: File is empty\n";
    return false;
  }

  nlohmann::json report = {
    {"root", zgs::crypto::to_hex(tree->root_hash())},
    {"size", file.size()},
    {"chunks", file.num_chunks()},
    {"segments", file.num_segments()},
    {"submission", file.create_submission({})}
  };
  std::cout << report.dump(2) << '\n';
  return true;
}

bool run_download(const ProgramOptions& options) {
  zgs::transfer::Indexer indexer(options.indexer_url);
  indexer.download(zgs::crypto::hash_from_hex(options.root), options.out_path, options.with_proof);
  std::cout << "Downloaded " << options.root << " to " << options.out_path << '\n';
  return true;
}

bool run_select(const ProgramOptions& options) {
  zgs::transfer::Indexer indexer(options.indexer_url);
  for (const auto& node : indexer.select_nodes(options.replicas)) {
    std::cout << node->url() << '\n';
  }
  return true;
}

bool run(const ProgramOptions& options) {
  try {
    switch (options.command) {
      case Command::FILE_ROOT: return run_file_root(options);
      case Command::DOWNLOAD: return run_download(options);
      case Command::SELECT: return run_select(options);
      default: return false;
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  zgs::logging::init_logging(options.log_file, options.log_level);
  return run(options) ? 0 : 1;
}
