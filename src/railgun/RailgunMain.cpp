#include <cxxopts.hpp>

#include "CommandLine.hpp"
#include "ExecutionContext.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "NailgunClient.hpp"

using namespace railgun;

namespace {
void handleParseException(std::exception& e, cxxopts::Options& options) {
  cerr << "Exception: " << e.what() << "\n" << endl;
  cerr << options.help({}) << endl;
  exit(1);
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Everything from the command on belongs to the remote process.
  bool hasSeparator;
  int localArgc = findCommandIndex(argc, argv, &hasSeparator);
  vector<string> remoteArgs = remoteArguments(argc, argv);

  // Setup easylogging configurations
  el::Configurations defaultConf =
      LogHandler::setupLogHandler(&localArgc, &argv);
  LogHandler::setupStdoutLogger();

  railgun::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, railgun::InterruptSignalHandler);

  cxxopts::Options options("railgun", "Run a command on a nailgun server");
  options.positional_help("command [args...]");
  options.add_options()             //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("nailgun-server", "Nailgun server host",
       cxxopts::value<std::string>()->default_value(defaultNailgunHost()))  //
      ("nailgun-port", "Nailgun server port",
       cxxopts::value<int>()->default_value(defaultNailgunPort()))  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"))  //
      ("l,logdir", "Base directory for log files.",
       cxxopts::value<std::string>()->default_value(tmpDir))  //
      ("logtostdout", "Write log to stdout")                  //
      ("silent", "Disable logging");

  int nailgunPort = DEFAULT_NAILGUN_PORT;
  string nailgunHost = DEFAULT_NAILGUN_HOST;
  try {
    auto result = options.parse(localArgc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "railgun version " << RAILGUN_VERSION << endl;
      exit(0);
    }

    el::Loggers::setVerboseLevel(result["verbose"].as<int>());

    if (result.count("silent")) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    } else {
      LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                                "railgun", result.count("logtostdout") > 0);
    }
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("railgun-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    nailgunHost = result["nailgun-server"].as<string>();
    nailgunPort = result["nailgun-port"].as<int>();
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const std::runtime_error& re) {
    cerr << "Cannot set up logging: " << re.what() << endl;
    exit(1);
  }

  if (remoteArgs.empty()) {
    cerr << "Missing command to run" << endl;
    cerr << options.help({}) << endl;
    exit(1);
  }
  if (nailgunPort <= 0 || nailgunPort > 65535) {
    cerr << "Invalid nailgun port: " << nailgunPort << endl;
    exit(1);
  }

  string command = remoteArgs.front();
  vector<string> commandArgs(remoteArgs.begin() + 1, remoteArgs.end());
  SocketEndpoint endpoint(nailgunHost, nailgunPort);

  NailgunClient client(endpoint, shared_ptr<ExecutionContext>(
                                     new ProcessExecutionContext()));
  return runRemoteCommand(&client, command, commandArgs, cout, cerr);
}
