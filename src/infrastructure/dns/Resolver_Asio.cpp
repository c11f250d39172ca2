#include "infrastructure/dns/Resolver_Asio.hpp"

#include <exception>
#include <utility>

using nostr::relaygeo::application::ports::LogLevel;
using nostr::relaygeo::application::ports::ResolveError;
using nostr::relaygeo::application::ports::ResolveResult;

namespace nostr::relaygeo::infrastructure::dns
{

namespace
{
ResolveError classify(const boost::system::error_code& ec)
{
  namespace err = boost::asio::error;
  if (ec == err::host_not_found || ec == err::no_data) return ResolveError::not_found;
  return ResolveError::failure;
}

ResolveResult stopped_result()
{
  ResolveResult r;
  r.error = ResolveError::failure;
  r.detail = "resolver stopped";
  return r;
}
}  // namespace

// One running lookup. Timer and resolver handlers both run on the owning worker's thread;
// stop() touches it only after that thread has been joined.
struct Resolver_Asio::Pending
{
  Pending(boost::asio::io_context& io, std::string h, Callback c)
      : resolver(io), timer(io), host(std::move(h)), cb(std::move(c))
  {
  }

  void complete(ResolveResult r)
  {
    if (fired) return;
    fired = true;
    cb(std::move(r));
  }

  tcp::resolver resolver;
  boost::asio::steady_timer timer;
  std::string host;
  Callback cb;
  bool fired{false};
};

// -------------------- ctor/dtor --------------------
Resolver_Asio::Resolver_Asio(application::ports::ILogger& log, const domain::Settings& s)
    : log_(log), timeout_(std::chrono::milliseconds(s.resolver.timeoutMs > 0 ? s.resolver.timeoutMs : 5000))
{
  const std::size_t n = s.resolver.workers > 0 ? static_cast<std::size_t>(s.resolver.workers) : 1;
  workers_.reserve(n);

  for (std::size_t i = 0; i < n; ++i)
  {
    auto w = std::make_unique<Worker>();
    w->work.emplace(boost::asio::make_work_guard(w->io));
    workers_.push_back(std::move(w));
  }
  for (std::size_t i = 0; i < n; ++i)
  {
    Worker& w = *workers_[i];
    w.thread = std::thread([this, &w, i] { run_worker(w, i); });
  }
}

Resolver_Asio::~Resolver_Asio()
{
  stop();
}

// -------------------------------------------------------------------------------------------------
// stop()
//  - New requests fail immediately from here on.
//  - Queued requests never started; running ones lose their worker. Both fail once the
//    worker threads are joined, so no callback is left hanging.
// -------------------------------------------------------------------------------------------------
void Resolver_Asio::stop()
{
  std::deque<Request> queued;
  {
    std::lock_guard<std::mutex> lk(m_);
    if (stopped_) return;
    stopped_ = true;
    queued.swap(queue_);
  }

  for (auto& w : workers_)
  {
    if (w->work) w->work->reset();
    w->io.stop();
  }
  for (auto& w : workers_)
  {
    if (w->thread.joinable()) w->thread.join();
  }

  std::vector<std::shared_ptr<Pending>> running;
  {
    std::lock_guard<std::mutex> lk(m_);
    for (auto& w : workers_)
      if (w->active) running.push_back(std::move(w->active));
  }

  for (auto& p : running) p->complete(stopped_result());
  for (auto& r : queued) r.cb(stopped_result());
}

// -------------------------------------------------------------------------------------------------
// run_worker
//  - A throwing user callback must not take the worker (and every request queued on it) down.
// -------------------------------------------------------------------------------------------------
void Resolver_Asio::run_worker(Worker& w, std::size_t id)
{
  for (;;)
  {
    try
    {
      w.io.run();
      return;
    }
    catch (const std::exception& e)
    {
      log_.app(LogLevel::err,
               "[Resolver] worker " + std::to_string(id) + " handler threw: " + e.what());
    }
  }
}

void Resolver_Asio::async_resolve_v4(const std::string& host, Callback cb)
{
  {
    std::lock_guard<std::mutex> lk(m_);
    if (!stopped_)
    {
      queue_.push_back(Request{host, std::move(cb)});
      dispatch_locked();
      return;
    }
  }
  cb(stopped_result());
}

void Resolver_Asio::dispatch_locked()
{
  for (auto& w : workers_)
  {
    if (queue_.empty()) return;
    if (w->active) continue;

    Request req = std::move(queue_.front());
    queue_.pop_front();
    start_locked(*w, std::move(req));
  }
}

// -------------------------------------------------------------------------------------------------
// start_locked(worker, request)
//  - AF_INET only, no AI_ADDRCONFIG, so numeric literals work on hosts without routes.
//  - The timer is armed on the worker thread right before the lookup is issued.
//  - Timeout wins the race: a late resolver answer is discarded. The worker is released
//    only by the resolver handler, i.e. once getaddrinfo has really returned.
// -------------------------------------------------------------------------------------------------
void Resolver_Asio::start_locked(Worker& w, Request req)
{
  auto p = std::make_shared<Pending>(w.io, std::move(req.host), std::move(req.cb));
  w.active = p;

  boost::asio::post(
      w.io,
      [this, &w, p, timeout = timeout_]
      {
        p->timer.expires_after(timeout);
        p->timer.async_wait(
            [p, timeout](const boost::system::error_code& ec)
            {
              if (ec == boost::asio::error::operation_aborted) return;
              ResolveResult r;
              r.error = ResolveError::timeout;
              r.detail = "no answer within " + std::to_string(timeout.count()) + " ms";
              p->resolver.cancel();
              p->complete(std::move(r));
            });

        p->resolver.async_resolve(
            tcp::v4(), p->host, "", static_cast<tcp::resolver::flags>(0),
            [this, &w, p](const boost::system::error_code& ec, tcp::resolver::results_type results)
            {
              p->timer.cancel();

              ResolveResult r;
              if (ec)
              {
                r.error = classify(ec);
                r.detail = ec.message();
              }
              else
              {
                for (const auto& entry : results)
                {
                  const auto addr = entry.endpoint().address();
                  if (addr.is_v4()) r.addresses.push_back(addr.to_string());
                }
                if (r.addresses.empty()) r.error = ResolveError::not_found;
              }

              // free the worker first so a throwing callback cannot wedge it
              release(w, p);
              p->complete(std::move(r));
            });
      });
}

void Resolver_Asio::release(Worker& w, const std::shared_ptr<Pending>& p)
{
  std::lock_guard<std::mutex> lk(m_);
  if (w.active == p) w.active.reset();
  if (!stopped_) dispatch_locked();
}

}  // namespace nostr::relaygeo::infrastructure::dns
