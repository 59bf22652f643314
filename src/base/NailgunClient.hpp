#ifndef __RAILGUN_NAILGUN_CLIENT__
#define __RAILGUN_NAILGUN_CLIENT__

#include "ExecutionContext.hpp"
#include "Headers.hpp"
#include "NailgunConnection.hpp"

namespace railgun {
/**
 * @brief Output of one remote command.
 */
struct ExecutionResult {
  /** @brief Every stdout payload, concatenated in arrival order. */
  string out;
  /** @brief Every stderr payload, concatenated in arrival order. */
  string err;
  int exitCode = 0;
};

/**
 * @brief Runs commands on a nailgun server.
 *
 * The client is not connected initially; execute() connects on demand.  Not
 * safe for concurrent execute() calls, use one client per concurrent session.
 */
class NailgunClient {
 public:
  NailgunClient(const SocketEndpoint& _endpoint = SocketEndpoint(),
                shared_ptr<ExecutionContext> _context =
                    shared_ptr<ExecutionContext>(new ProcessExecutionContext()));
  /**
   * @brief Uses a caller-supplied connection, e.g. one built on a custom
   * SocketHandler.
   */
  NailgunClient(shared_ptr<NailgunConnection> _connection,
                shared_ptr<ExecutionContext> _context);

  virtual ~NailgunClient();

  /** @throws ConnectionError */
  void connect();
  void close();

  /**
   * @brief Sends the arguments, environment, working directory and command,
   * then collects output until the exit chunk.
   * @param command Command to run, e.g. a fully qualified Java main class.
   * @param args Positional arguments, in order.
   * @throws ConnectionError, TransportError, UnknownMessageTypeError
   */
  ExecutionResult execute(const string& command,
                          const vector<string>& args = vector<string>());

  inline shared_ptr<NailgunConnection> getConnection() { return connection; }

 protected:
  void sendArguments(const vector<string>& args);
  void sendEnvironment();
  void sendCurrentDirectory();
  ExecutionResult waitForExit();

  shared_ptr<NailgunConnection> connection;
  shared_ptr<ExecutionContext> context;
};

/**
 * @brief Parses the payload of an exit chunk.
 *
 * Takes the leading decimal integer (leading whitespace and a sign allowed)
 * and ignores whatever follows it.  A payload without digits means 0, and
 * values outside the range of int saturate.
 */
int parseExitCode(const string& payload);
}  // namespace railgun

#endif  // __RAILGUN_NAILGUN_CLIENT__
