#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <thread>

#include "rangekv/server/node.h"

////////////////////////////////////////////////////////////////////////

using rkv::server::NodeServer;

////////////////////////////////////////////////////////////////////////

// Set from the signal handler, waited on by the shutdown thread.
static std::mutex shutdown_mutex;
static std::condition_variable shutdown_cv;
static bool shutdown_requested = false;

void handle_shutdown_signal(int) {
  // NOTE: neither a mutex nor a condition variable is strictly
  // async-signal-safe, but this is all the handler does.
  std::lock_guard<std::mutex> lock(shutdown_mutex);
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

////////////////////////////////////////////////////////////////////////

int main(int argc, char* argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <state_directory> <port>"
              << std::endl;
    return 1;
  }

  const char* state_directory = argv[1];
  const int port = std::atoi(argv[2]);

  // NOTE: glog writes to stderr rather than to files.
  FLAGS_logtostderr = 1;
  google::InitGoogleLogging(argv[0]);

  tl::expected<std::unique_ptr<NodeServer>, std::string> server =
      NodeServer::Instantiate(
          state_directory,
          "0.0.0.0:" + std::to_string(port));

  if (!server.has_value()) {
    LOG(ERROR) << "Failed to start node: " << server.error();
    return 1;
  }

  LOG(INFO) << "Node serving '" << state_directory << "' at "
            << (*server)->address();

  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  // 'Shutdown()' blocks until in-flight RPCs are done, so it must not
  // be called from the signal handler itself.
  std::thread shutdown_thread([node = server->get()]() {
    std::unique_lock<std::mutex> lock(shutdown_mutex);
    shutdown_cv.wait(lock, [] { return shutdown_requested; });
    LOG(INFO) << "Shutting down node";
    node->Shutdown();
  });

  (*server)->Wait();

  shutdown_thread.join();

  return 0;
}

////////////////////////////////////////////////////////////////////////
