#ifndef __APC_ERRORS__
#define __APC_ERRORS__

#include "Headers.hpp"

namespace apc {
/**
 * @brief Base class for every failure raised by the agent protocol engine.
 */
class ApcError : public std::runtime_error {
 public:
  explicit ApcError(const string& what) : std::runtime_error(what) {}
};

/** @brief The TCP/TLS connection to the server could not be established. */
class ConnectFailure : public ApcError {
 public:
  explicit ConnectFailure(const string& what) : ApcError(what) {}
};

/** @brief The first event on a new connection was not a session start. */
class HandshakeFailure : public ApcError {
 public:
  explicit HandshakeFailure(const string& what) : ApcError(what) {}
};

/**
 * @brief A record could not be parsed. Never escapes the reader thread.
 */
class DecodeFailure : public ApcError {
 public:
  explicit DecodeFailure(const string& what) : ApcError(what) {}
};

/** @brief A command could not be laid out in the wire format. */
class EncodeFailure : public ApcError {
 public:
  explicit EncodeFailure(const string& what) : ApcError(what) {}
};

/**
 * @brief The session is shut down. Raised for every pending and every later
 * command.
 */
class ConnectionClosed : public ApcError {
 public:
  explicit ConnectionClosed(const string& what) : ApcError(what) {}
};

/** @brief No data arrived before the rolling read deadline. */
class StreamTimeout : public ConnectionClosed {
 public:
  explicit StreamTimeout(const string& what) : ConnectionClosed(what) {}
};

/** @brief Every invoke id is held by an in-flight command. */
class IdentifierExhausted : public ApcError {
 public:
  explicit IdentifierExhausted(const string& what) : ApcError(what) {}
};

/** @brief The caller's deadline passed before the response arrived. */
class CommandTimeout : public ApcError {
 public:
  explicit CommandTimeout(const string& what) : ApcError(what) {}
};

/** @brief The caller cancelled the command while it was in flight. */
class CommandCancelled : public ApcError {
 public:
  explicit CommandCancelled(const string& what) : ApcError(what) {}
};

/**
 * @brief The server answered a command with an error or busy event.
 */
class CommandFailed : public ApcError {
 public:
  CommandFailed(const string& _keyword, const string& _code,
                const string& _message)
      : ApcError(_keyword + " failed with " + _code +
                 (_message.empty() ? string() : ": " + _message)),
        keyword(_keyword),
        code(_code),
        message(_message) {}

  const string& getKeyword() const { return keyword; }
  const string& getCode() const { return code; }
  const string& getMessage() const { return message; }

 protected:
  string keyword;
  string code;
  string message;
};
}  // namespace apc

#endif  // __APC_ERRORS__
