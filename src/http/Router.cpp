/* @file Router.cpp
 * @brief request-target parsing and path dispatch
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

#include <cctype>

#include "http/Router.hpp"

using namespace deskctl::http;

namespace {

  int hexValue(char c) {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  }

  // application/x-www-form-urlencoded decoding; malformed escapes are kept literally
  std::string decode(const std::string& in, bool plusIsSpace) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
      char c = in[i];
      if (c == '+' && plusIsSpace) {
        out += ' ';
      } else if (c == '%' && i + 2 < in.size()) {
        int hi = hexValue(in[i + 1]);
        int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0) {
          out += c;
          continue;
        }
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
      } else {
        out += c;
      }
    }
    return out;
  }

  std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
      return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  }

} // namespace

std::optional<std::string> Request::param(const std::string& key) const {
  auto it = query.find(key);
  if (it == query.end() || it->second.empty())
    return std::nullopt;
  return it->second.front();
}

bool Request::force() const {
  auto v = param("force");
  return v && trim(*v) == "1";
}

Request Request::fromTarget(std::string method, const std::string& target) {
  Request req;
  req.method = std::move(method);

  auto qpos = target.find('?');
  std::string rawPath = target.substr(0, qpos);
  std::string rawQuery = qpos == std::string::npos ? std::string{} : target.substr(qpos + 1);

  // fragments never reach a server, but tolerate them
  if (auto hash = rawQuery.find('#'); hash != std::string::npos)
    rawQuery.erase(hash);

  // routes match the path as sent; only the query is decoded
  req.path = rawPath;
  if (req.path.empty())
    req.path = "/";

  std::size_t start = 0;
  while (start <= rawQuery.size()) {
    auto amp = rawQuery.find('&', start);
    std::string pair = rawQuery.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      std::string key = decode(pair.substr(0, eq), true);
      std::string value = eq == std::string::npos ? std::string{} : decode(pair.substr(eq + 1), true);
      // blank values are dropped, like a form parser does
      if (!key.empty() && !value.empty())
        req.query[key].push_back(std::move(value));
    }
    if (amp == std::string::npos)
      break;
    start = amp + 1;
  }
  return req;
}

bool Router::add(const std::string& path, Handler handler) {
  return routes_.emplace(path, std::move(handler)).second;
}

bool Router::addAliases(std::initializer_list<const char*> paths, const Handler& handler) {
  bool all = true;
  for (const char* p : paths)
    all = add(p, handler) && all;
  return all;
}

std::optional<Reply> Router::dispatch(const Request& req) const {
  auto it = routes_.find(req.path);
  if (it == routes_.end())
    return std::nullopt;
  return it->second(req);
}
