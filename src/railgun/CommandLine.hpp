#ifndef __RAILGUN_COMMAND_LINE__
#define __RAILGUN_COMMAND_LINE__

#include "Headers.hpp"
#include "NailgunClient.hpp"

namespace railgun {

// Index of the first argv entry that belongs to the remote command (the
// command itself, or a "--" separator), or argc if there is none.  Options
// before it are railgun's own.
int findCommandIndex(int argc, const char* const* argv, bool* hasSeparator);

// Remote command followed by its arguments, i.e. everything from the command
// index on, minus a leading "--".
vector<string> remoteArguments(int argc, const char* const* argv);

// Value of an environment variable, or defaultValue when unset or empty
string getEnvOrDefault(const char* name, const string& defaultValue);

// Server host from NAILGUN_SERVER, falling back to localhost
inline string defaultNailgunHost() {
  return getEnvOrDefault("NAILGUN_SERVER", DEFAULT_NAILGUN_HOST);
}

// Server port from NAILGUN_PORT, falling back to 2113
inline string defaultNailgunPort() {
  return getEnvOrDefault("NAILGUN_PORT", to_string(DEFAULT_NAILGUN_PORT));
}

// Runs one command, copies its output to out/err and returns the exit status
// for this process: the remote exit code, or 1 when the session failed.
int runRemoteCommand(NailgunClient* client, const string& command,
                     const vector<string>& args, ostream& out, ostream& err);
}  // namespace railgun

#endif  // __RAILGUN_COMMAND_LINE__
