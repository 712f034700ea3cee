#pragma once

#include <string>

namespace vodbridge::platform {

class SessionStore {
 public:
  virtual ~SessionStore() = default;

  // True when a persisted, non-empty provider session exists.
  virtual bool HasSession() = 0;
};

/*
  Session persisted by the provider as a JSON document:
    { "cookies": { "session-id": "..." , ... } }
*/
class FileSessionStore : public SessionStore {
 public:
  explicit FileSessionStore(std::string path);

  bool HasSession() override;

 private:
  std::string path_;
};

} // namespace vodbridge::platform
