// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/journal/InitDb.hpp"
#include "core/journal/WriteJournal.hpp"
#include "services/WriteOrchestrator.hpp"

using nlohmann::json;

// ---------- helpers ----------

static std::string requireJournalPath(const bw::Config& cfg) {
  if (cfg.journalPath.empty()) throw std::runtime_error("BW_JOURNAL_PATH is not set");
  return cfg.journalPath;
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                     # create/upgrade the journal (BW_JOURNAL_PATH)\n"
            << "  " << argv0 << " --write <file> --path <p> [--directory <root>] [--recursive]\n"
            << "  " << argv0 << " --history [n]              # last n journal entries as JSON\n";
}

static int runWrite(const bw::Config& cfg, int argc, char** argv) {
  std::string source;
  bw::WriteOptions opts;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--path" && i + 1 < argc) {
      opts.path = argv[++i];
    } else if (arg == "--directory" && i + 1 < argc) {
      opts.directory = bw::parse_directory(argv[++i]);
      if (!opts.directory) {
        std::cerr << "unknown directory: " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--recursive") {
      opts.recursive = true;
    } else if (source.empty() && arg.rfind("--", 0) != 0) {
      source = arg;
    } else {
      print_usage(argv[0]);
      return 1;
    }
  }
  if (source.empty() || opts.path.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  opts.blob = std::make_shared<bw::FileBlob>(source);
  opts.onFallback = [](const bw::BlobWriteError& e) {
    std::cerr << "streaming failed (" << e.kind() << "), using fallback: " << e.what() << "\n";
  };

  std::cout << bw::write_blob(std::move(opts)).get() << "\n";
  return 0;
}

static int runHistory(const bw::Config& cfg, int argc, char** argv) {
  int limit = 20;
  if (argc > 2) {
    try {
      limit = std::stoi(argv[2]);
    } catch (const std::exception&) {
      print_usage(argv[0]);
      return 1;
    }
  }

  bw::WriteJournal journal(requireJournalPath(cfg));
  json out = json::array();
  for (const auto& r : journal.recent(limit)) {
    out.push_back({
      {"id", r.id},
      {"destination", r.destination},
      {"bytes", r.bytes},
      {"strategy", r.strategy},
      {"outcome", r.outcome},
      {"error_kind", r.error_kind.empty() ? json(nullptr) : json(r.error_kind)},
      {"details", json::parse(r.details_json, nullptr, false)},
      {"started_at", r.started_at},
      {"finished_at", r.finished_at}
    });
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const bw::Config cfg = bw::Config::fromEnvironment();
    bw::configure_logging(cfg.logLevel);

    if (argc > 1 && std::string(argv[1]) == "--init") {
      const std::string dbPath = requireJournalPath(cfg);
      const int version = bw::initJournal(dbPath);
      std::cout << "Journal initialized at: " << dbPath << " (schema v" << version << ")\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--write") {
      return runWrite(cfg, argc, argv);
    }

    if (argc > 1 && std::string(argv[1]) == "--history") {
      return runHistory(cfg, argc, argv);
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("fatal: {}", e.what());
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
