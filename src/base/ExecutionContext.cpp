#include "ExecutionContext.hpp"

extern char **environ;

namespace railgun {
vector<pair<string, string>> ProcessExecutionContext::getEnvironment() {
  vector<pair<string, string>> entries;
  for (char **env = environ; env && *env; ++env) {
    string entry(*env);
    auto equalsPos = entry.find('=');
    if (equalsPos == string::npos) {
      VLOG(1) << "Skipping malformed environment entry: " << entry;
      continue;
    }
    entries.push_back(
        make_pair(entry.substr(0, equalsPos), entry.substr(equalsPos + 1)));
  }
  return entries;
}

string ProcessExecutionContext::getCurrentDirectory() {
  vector<char> buf(4096);
  while (::getcwd(&buf[0], buf.size()) == NULL) {
    if (errno != ERANGE) {
      throw std::runtime_error(string("Cannot get current directory: ") +
                               strerror(errno));
    }
    buf.resize(buf.size() * 2);
  }
  return string(&buf[0]);
}
}  // namespace railgun
