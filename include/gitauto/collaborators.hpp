#pragma once
#include <optional>
#include <string>

namespace gitauto {

struct Credentials {
  std::string username;
  std::optional<std::string> token;
};

struct RepoPresence {
  bool local{false};
  bool remote{false};
};

// Remote hosting service (repository CRUD). Implemented outside this library.
class HostingClient {
public:
  virtual ~HostingClient() = default;
  virtual bool create_repository(const std::string &name, bool is_private) = 0;
  virtual bool delete_repository(const std::string &name) = 0;
  virtual bool set_visibility(const std::string &name, bool is_private) = 0;
  virtual RepoPresence repository_exists(const std::string &name) = 0;
  virtual std::string authenticated_clone_url(const std::string &name) = 0;
};

class CredentialProvider {
public:
  virtual ~CredentialProvider() = default;
  virtual std::optional<Credentials> current_credentials() = 0;
  virtual std::optional<Credentials> interactive_login() = 0;
};

} // namespace gitauto
