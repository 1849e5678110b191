#pragma once
/** @file  Router.hpp
 *  @brief Runtime registry that maps request paths to handlers.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace deskctl::http {

  /// Parsed request line; the body is never used.
  struct Request {
    std::string method;
    std::string path;
    std::map<std::string, std::vector<std::string>> query;

    /// First value of \p key, if any.
    std::optional<std::string> param(const std::string& key) const;

    /// `force=1` (first value, surrounding blanks ignored).
    bool force() const;

    /// Split "/path?a=1&b=2"; the path stays raw, query pairs are percent-decoded.
    static Request fromTarget(std::string method, const std::string& target);
  };

  struct Reply {
    int status{ 200 };
    nlohmann::json body;
  };

  /**
 * @class Router
 * @brief Register & dispatch handlers by exact path.
 *
 *  * Keeps ControlApi decoupled from the socket layer.
 *  * Several paths may share one handler (aliases).
 */
  class Router {
  public:
    using Handler = std::function<Reply(const Request&)>;

    /// Register a handler under \p path.  Returns false on duplicate.
    bool add(const std::string& path, Handler handler);

    /// Register one handler under every alias; false if any alias was taken.
    bool addAliases(std::initializer_list<const char*> paths, const Handler& handler);

    /// Run the matching handler, or std::nullopt when no route matches.
    std::optional<Reply> dispatch(const Request& req) const;

  private:
    std::unordered_map<std::string, Handler> routes_;
  };

} // namespace deskctl::http
