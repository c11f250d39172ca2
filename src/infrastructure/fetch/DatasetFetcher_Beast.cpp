#include "infrastructure/fetch/DatasetFetcher_Beast.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>

using nostr::relaygeo::application::ports::DatasetError;
using nostr::relaygeo::application::ports::LogLevel;
namespace fs = boost::filesystem;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace bio = boost::iostreams;
using tcp = net::ip::tcp;

namespace nostr::relaygeo::infrastructure::fetch
{

namespace
{
constexpr const char* kUserAgent = "relay-geo/1.0";

struct Reply
{
  unsigned status{0};
  std::string location;
};

// One GET on an already connected stream, body streamed straight to `to`.
template <class Stream>
Reply exchange(Stream& stream, const Url& u, const fs::path& to)
{
  http::request<http::empty_body> req{http::verb::get, u.target, 11};
  req.set(http::field::host, u.host);
  req.set(http::field::user_agent, kUserAgent);
  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response_parser<http::file_body> parser;
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

  beast::error_code ec;
  parser.get().body().open(to.string().c_str(), beast::file_mode::write, ec);
  if (ec) throw DatasetError("cannot create " + to.string() + ": " + ec.message());

  http::read(stream, buffer, parser);

  Reply r;
  r.status = parser.get().result_int();
  if (auto it = parser.get().find(http::field::location); it != parser.get().end())
    r.location = std::string(it->value());
  parser.get().body().close();
  return r;
}

std::string follow(const Url& base, const std::string& location)
{
  auto lower = location;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0) return location;

  const std::string origin = base.scheme + "://" + base.host + ":" + base.port;
  if (!location.empty() && location.front() == '/') return origin + location;

  const auto dir = base.target.substr(0, base.target.rfind('/') + 1);
  return origin + dir + location;
}

void discard(const fs::path& p)
{
  boost::system::error_code ec;
  fs::remove(p, ec);
}
}  // namespace

Url parse_url(const std::string& url)
{
  Url u;
  const auto sep = url.find("://");
  if (sep == std::string::npos) throw DatasetError("dataset URL has no scheme: " + url);

  u.scheme = url.substr(0, sep);
  std::transform(u.scheme.begin(), u.scheme.end(), u.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (u.scheme != "http" && u.scheme != "https")
    throw DatasetError("unsupported dataset URL scheme: " + u.scheme);

  const auto host_start = sep + 3;
  const auto path_start = url.find('/', host_start);
  std::string authority = url.substr(host_start, path_start == std::string::npos
                                                     ? std::string::npos
                                                     : path_start - host_start);
  u.target = (path_start == std::string::npos) ? "/" : url.substr(path_start);

  if (auto colon = authority.rfind(':'); colon != std::string::npos)
  {
    u.port = authority.substr(colon + 1);
    authority.resize(colon);
  }
  if (u.port.empty()) u.port = (u.scheme == "https") ? "443" : "80";

  u.host = std::move(authority);
  if (u.host.empty()) throw DatasetError("dataset URL has no host: " + url);
  return u;
}

// -------------------------------------------------------------------------------------------------
// download(to)
//  - Plain GET with redirect following; HTTPS verifies the peer against the default trust store
//    and the requested host name (SNI set explicitly).
// -------------------------------------------------------------------------------------------------
void DatasetFetcher_Beast::download(const fs::path& to)
{
  std::string current = url_;

  for (int hop = 0; hop <= kMaxRedirects; ++hop)
  {
    const Url u = parse_url(current);

    net::io_context io;
    tcp::resolver resolver(io);
    const auto results = resolver.resolve(u.host, u.port);

    Reply r;
    if (u.scheme == "https")
    {
      ssl::context ctx{ssl::context::tls_client};
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(ssl::verify_peer);

      beast::ssl_stream<beast::tcp_stream> stream(io, ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str()))
        throw DatasetError("cannot set SNI host name " + u.host);
      stream.set_verify_callback(ssl::host_name_verification(u.host));

      beast::get_lowest_layer(stream).connect(results);
      stream.handshake(ssl::stream_base::client);
      r = exchange(stream, u, to);

      beast::error_code ec;
      stream.shutdown(ec);
      if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated)
        log_.app(LogLevel::debug, "[Fetch] TLS shutdown: " + ec.message());
    }
    else
    {
      beast::tcp_stream stream(io);
      stream.connect(results);
      r = exchange(stream, u, to);

      beast::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    if (r.status >= 300 && r.status < 400 && !r.location.empty())
    {
      current = follow(u, r.location);
      log_.app(LogLevel::debug, "[Fetch] redirect " + std::to_string(r.status) + " -> " + current);
      continue;
    }
    if (r.status != 200)
      throw DatasetError("HTTP " + std::to_string(r.status) + " while fetching " + current);
    return;
  }

  throw DatasetError("too many redirects while fetching " + url_);
}

void DatasetFetcher_Beast::gunzip(const fs::path& from, const fs::path& to)
{
  std::ifstream in(from.string(), std::ios::binary);
  if (!in) throw DatasetError("cannot open " + from.string());

  std::ofstream out(to.string(), std::ios::binary | std::ios::trunc);
  if (!out) throw DatasetError("cannot create " + to.string());

  bio::filtering_istreambuf src;
  src.push(bio::gzip_decompressor());
  src.push(in);
  bio::copy(src, out);

  out.flush();
  if (!out) throw DatasetError("write failed for " + to.string());
}

void DatasetFetcher_Beast::fetch(const std::string& dest_path)
{
  const fs::path dest{dest_path};
  fs::path gz = dest;
  gz += ".gz";
  fs::path part = dest;
  part += ".part";

  try
  {
    if (dest.has_parent_path()) fs::create_directories(dest.parent_path());

    log_.app(LogLevel::info, "Downloading " + url_);
    download(gz);

    log_.app(LogLevel::info, "Extracting database...");
    gunzip(gz, part);
    fs::rename(part, dest);
    fs::remove(gz);
  }
  catch (const DatasetError&)
  {
    discard(gz);
    discard(part);
    throw;
  }
  catch (const std::exception& e)
  {
    discard(gz);
    discard(part);
    throw DatasetError(std::string("dataset acquisition failed: ") + e.what());
  }
}

}  // namespace nostr::relaygeo::infrastructure::fetch
