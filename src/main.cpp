#include <grpcpp/grpcpp.h>
#include <pthread.h>
#include <signal.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>

#include "mtrack/config.hpp"
#include "mtrack/lmdb_storage.hpp"
#include "mtrack/log.hpp"
#include "mtrack/retriever.hpp"
#include "mtrack/supervisor.hpp"
#include "mtrack/tracker_service.hpp"

using namespace mtrack;

static int run_read(const TrackerConfig& cfg) {
  LMDBStorage store(cfg.db_path, cfg.map_size);
  Retriever retriever(store);

  auto topics = store.list_keys();
  if (topics.empty()) {
    std::cout << "No users found in " << cfg.db_path << "\n";
    return 0;
  }

  std::cout << "Found " << topics.size() << " user(s)\n";
  for (auto& topic : topics) {
    std::string user = entity_from_topic(topic);
    if (user.empty()) {
      std::cout << topic << ": not a user topic, skipped\n";
      continue;
    }
    auto samples = retriever.fetch(user);
    std::cout << user << ": " << samples.size() << " samples\n";

    if (!samples.empty() && cfg.dump_n > 0) {
      size_t n = std::min<size_t>(cfg.dump_n, samples.size());
      std::cout << "First " << n << " samples:\n";
      for (size_t i = 0; i < n; ++i)
        std::cout << " " << samples[i].to_string() << "\n";
    }
  }
  return 0;
}

static int run_server(const TrackerConfig& cfg) {
  // Block before any thread exists so every thread inherits the mask and
  // only sigwait() below sees the signals.
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  uint64_t seed = cfg.seed;
  if (seed == 0)
    seed = (uint64_t(std::random_device{}()) << 32) ^
           uint64_t(std::chrono::steady_clock::now().time_since_epoch().count());

  auto store = make_storage(cfg.no_store ? "" : cfg.db_path, cfg.map_size);
  SessionSupervisor supervisor(*store, cfg.gen, seed);
  Retriever retriever(*store);
  TrackerService service(supervisor, retriever, cfg.session_duration);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(cfg.listen_addr, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    safe_err("[Server] failed to listen on ", cfg.listen_addr);
    return 1;
  }

  safe_log("[Server] listening on ", cfg.listen_addr);
  safe_log("[Server] store: ", cfg.no_store ? "<memory>" : cfg.db_path);
  safe_log("[Server] rpcs: Tracker/Start {user_ids}, Tracker/Stop, "
           "Tracker/Fetch {user_id, min, max}");

  int sig = 0;
  sigwait(&sigs, &sig);
  safe_log("[Server] received signal ", sig, ", stopping simulations");

  supervisor.stop();
  server->Shutdown();
  safe_log("[Server] shutdown complete");
  return 0;
}

int main(int argc, char** argv) {
  TrackerConfig cfg;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--dbpath" && i + 1 < argc)
      cfg.db_path = argv[++i];
    else if (a == "--addr" && i + 1 < argc)
      cfg.listen_addr = argv[++i];
    else if (a == "--duration" && i + 1 < argc)
      cfg.session_duration = std::chrono::seconds(std::stoll(argv[++i]));
    else if (a == "--batch" && i + 1 < argc)
      cfg.gen.batch_size = std::stoull(argv[++i]);
    else if (a == "--flush-ms" && i + 1 < argc)
      cfg.gen.flush_interval = std::chrono::milliseconds(std::stoll(argv[++i]));
    else if (a == "--sample-us" && i + 1 < argc)
      cfg.gen.sample_interval =
          std::chrono::microseconds(std::stoll(argv[++i]));
    else if (a == "--max-step" && i + 1 < argc)
      cfg.gen.max_step = std::stod(argv[++i]);
    else if (a == "--seed" && i + 1 < argc)
      cfg.seed = std::stoull(argv[++i]);
    else if (a == "--map-size" && i + 1 < argc)
      cfg.map_size = std::stoull(argv[++i]);
    else if (a == "--no-store")
      cfg.no_store = true;
    else if (a == "--quiet")
      cfg.quiet = true;
    else if (a == "--dump" && i + 1 < argc)
      cfg.dump_n = std::stoi(argv[++i]);
    else if (a == "--read") {
      cfg.read_mode = true;
      if (i + 1 < argc && argv[i + 1][0] != '-') cfg.db_path = argv[++i];
    } else if (a == "--help") {
      std::cout
          << "Usage: ./mtrack_server [options]\n"
          << "  --dbpath PATH        LMDB directory (default ./user_movement_db)\n"
          << "  --addr HOST:PORT     gRPC listen address (default 0.0.0.0:8080)\n"
          << "  --duration SECS      Session length (default 30)\n"
          << "  --batch N            Samples per batch write (default 100)\n"
          << "  --flush-ms MS        Max time between writes (default 100)\n"
          << "  --sample-us US       Time between samples (default 1000)\n"
          << "  --max-step X         Max displacement per sample (default "
             "0.004)\n"
          << "  --seed S             Base RNG seed (default random)\n"
          << "  --map-size BYTES     LMDB map size (default 1<<30)\n"
          << "  --no-store           Keep samples in memory only\n"
          << "  --quiet              Only print errors\n"
          << "  --read [PATH]        List users and counts instead of serving\n"
          << "  --dump N             Samples to print per user with --read\n";
      return 0;
    } else {
      std::cerr << "Unknown option: " << a << " (see --help)\n";
      return 2;
    }
  }

  try {
    set_quiet(cfg.quiet);
    if (cfg.read_mode) return run_read(cfg);
    return run_server(cfg);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
