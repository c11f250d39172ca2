#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "application/ports/ILogger.hpp"
#include "application/ports/IResolver.hpp"
#include "domain/Settings.hpp"

namespace nostr::relaygeo::infrastructure::dns
{

// -----------------------------------------------------------------------------
// Resolver_Asio
//  - Pool of io_contexts, one thread each. Asio runs getaddrinfo on one private
//    thread per io_context, so a worker can run exactly one lookup at a time.
//  - Requests wait in a FIFO until a worker is idle; the timeout clock starts
//    only when the lookup actually starts.
//  - A worker whose lookup timed out stays busy until getaddrinfo returns.
// -----------------------------------------------------------------------------
class Resolver_Asio final : public nostr::relaygeo::application::ports::IResolver
{
 public:
  using tcp = boost::asio::ip::tcp;

  Resolver_Asio(nostr::relaygeo::application::ports::ILogger& log,
                const nostr::relaygeo::domain::Settings& s);
  ~Resolver_Asio() override;

  Resolver_Asio(const Resolver_Asio&) = delete;
  Resolver_Asio& operator=(const Resolver_Asio&) = delete;

  // IResolver
  void async_resolve_v4(const std::string& host, Callback cb) override;

  // Fails every queued or running request with ResolveError::failure, then joins
  // the workers. Must not be called from inside a callback.
  void stop();

  std::size_t workers() const { return workers_.size(); }

 private:
  struct Pending;

  struct Request
  {
    std::string host;
    Callback cb;
  };

  struct Worker
  {
    boost::asio::io_context io;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work;
    std::thread thread;
    std::shared_ptr<Pending> active;  // guarded by m_
  };

  void run_worker(Worker& w, std::size_t id);

  // Hands queued requests to idle workers. Caller holds m_.
  void dispatch_locked();
  void start_locked(Worker& w, Request req);
  void release(Worker& w, const std::shared_ptr<Pending>& p);

  nostr::relaygeo::application::ports::ILogger& log_;
  std::chrono::milliseconds timeout_;
  std::vector<std::unique_ptr<Worker>> workers_;

  std::mutex m_;
  std::deque<Request> queue_;
  bool stopped_{false};
};

}  // namespace nostr::relaygeo::infrastructure::dns
