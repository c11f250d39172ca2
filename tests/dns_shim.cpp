#include "DnsShim.hpp"

#include <dlfcn.h>
#include <netdb.h>

#include <map>
#include <optional>
#include <mutex>
#include <thread>

namespace test_doubles::dns_shim
{

namespace
{
struct Entry
{
  std::chrono::milliseconds delay;
  std::string answer;
};

std::mutex& table_mutex()
{
  static std::mutex m;
  return m;
}

std::map<std::string, Entry>& table()
{
  static std::map<std::string, Entry> t;
  return t;
}
}  // namespace

void script(const std::string& host, std::chrono::milliseconds delay, const std::string& answer_ipv4)
{
  std::lock_guard<std::mutex> lk(table_mutex());
  table()[host] = Entry{delay, answer_ipv4};
}

void clear()
{
  std::lock_guard<std::mutex> lk(table_mutex());
  table().clear();
}

}  // namespace test_doubles::dns_shim

extern "C" int getaddrinfo(const char* node, const char* service, const struct addrinfo* hints,
                           struct addrinfo** res) noexcept
{
  using Fn = int (*)(const char*, const char*, const struct addrinfo*, struct addrinfo**);
  static const Fn real = reinterpret_cast<Fn>(::dlsym(RTLD_NEXT, "getaddrinfo"));
  if (!real) return EAI_SYSTEM;

  if (node)
  {
    std::optional<test_doubles::dns_shim::Entry> hit;
    {
      std::lock_guard<std::mutex> lk(test_doubles::dns_shim::table_mutex());
      auto& t = test_doubles::dns_shim::table();
      if (auto it = t.find(node); it != t.end()) hit = it->second;
    }
    if (hit)
    {
      std::this_thread::sleep_for(hit->delay);
      return real(hit->answer.c_str(), service, hints, res);
    }
  }
  return real(node, service, hints, res);
}
