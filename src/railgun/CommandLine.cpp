#include "CommandLine.hpp"

#include "Errors.hpp"

namespace railgun {
namespace {
// Options that take a value in the next argv slot when not written as
// --name=value.
const set<string> OPTIONS_WITH_VALUE = {"--nailgun-server", "--nailgun-port",
                                        "-v", "--verbose", "-l", "--logdir"};
}  // namespace

int findCommandIndex(int argc, const char* const* argv, bool* hasSeparator) {
  *hasSeparator = false;
  for (int i = 1; i < argc; i++) {
    string arg(argv[i]);
    if (arg == "--") {
      *hasSeparator = true;
      return i;
    }
    if (arg.empty() || arg[0] != '-') {
      return i;
    }
    if (OPTIONS_WITH_VALUE.count(arg)) {
      i++;
    }
  }
  return argc;
}

vector<string> remoteArguments(int argc, const char* const* argv) {
  bool hasSeparator;
  int commandIndex = findCommandIndex(argc, argv, &hasSeparator);
  vector<string> remoteArgs;
  for (int i = commandIndex + (hasSeparator ? 1 : 0); i < argc; i++) {
    remoteArgs.push_back(argv[i]);
  }
  return remoteArgs;
}

string getEnvOrDefault(const char* name, const string& defaultValue) {
  const char* value = ::getenv(name);
  if (value == NULL || value[0] == '\0') {
    return defaultValue;
  }
  return string(value);
}

int runRemoteCommand(NailgunClient* client, const string& command,
                     const vector<string>& args, ostream& out, ostream& err) {
  const SocketEndpoint& endpoint = client->getConnection()->getEndpoint();
  int exitCode = 1;
  try {
    ExecutionResult result = client->execute(command, args);
    out << result.out << flush;
    err << result.err << flush;
    exitCode = result.exitCode;
  } catch (const ConnectionError& ce) {
    err << "Could not reach the nailgun server: " << endpoint << endl;
    LOG(ERROR) << ce.what();
  } catch (const ProtocolDecodeError& pde) {
    err << "Protocol error: " << pde.what() << endl;
    STERROR << pde.what();
  } catch (const TransportError& te) {
    err << "Connection to the nailgun server was lost: " << te.what() << endl;
    STERROR << te.what();
  } catch (const std::exception& e) {
    err << "Error: " << e.what() << endl;
    STERROR << e.what();
  }
  client->close();
  return exitCode;
}
}  // namespace railgun
