#ifndef __APC_SOCKET_ENDPOINT__
#define __APC_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace apc {
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  explicit SocketEndpoint(const string &_name) : name(_name), port(-1) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  /**
   * @brief Parses `host:port`. Throws std::invalid_argument when the port is
   * missing or not a number.
   */
  static SocketEndpoint parse(const string &address) {
    auto colon = address.rfind(':');
    if (colon == string::npos || colon == 0 || colon + 1 == address.length()) {
      throw std::invalid_argument("Address must be host:port: " + address);
    }
    string portString = address.substr(colon + 1);
    if (portString.find_first_not_of("0123456789") != string::npos) {
      throw std::invalid_argument("Invalid port in address: " + address);
    }
    int port = stoi(portString);
    if (port <= 0 || port > 65535) {
      throw std::invalid_argument("Port out of range in address: " + address);
    }
    return SocketEndpoint(address.substr(0, colon), port);
  }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace apc

#endif  // __APC_SOCKET_ENDPOINT__
