#pragma once

#include <string>

namespace gdbsession {

// One client connection as seen by a session. deliver() must not block; a
// channel that cannot keep up reports false and is dropped by the caller.
class channel {
public:
  virtual ~channel() = default;

  virtual bool deliver(std::string message) = 0;
  virtual bool open() const = 0;
  virtual void close() = 0;
};

} // namespace gdbsession
