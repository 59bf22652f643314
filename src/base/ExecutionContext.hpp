#ifndef __RAILGUN_EXECUTION_CONTEXT__
#define __RAILGUN_EXECUTION_CONTEXT__

#include "Headers.hpp"

namespace railgun {
/**
 * @brief Supplies the local process state that accompanies every command:
 * the environment table, the working directory and the platform separators.
 */
class ExecutionContext {
 public:
  virtual ~ExecutionContext() {}

  /**
   * @brief Environment entries, in a deterministic order for the lifetime of
   * the context.
   */
  virtual vector<pair<string, string>> getEnvironment() = 0;
  /** @brief Absolute path of the working directory. */
  virtual string getCurrentDirectory() = 0;
  /** @brief Separator between path components. */
  virtual string getFileSeparator() = 0;
  /** @brief Separator between entries of a search path. */
  virtual string getPathSeparator() = 0;
};

/**
 * @brief ExecutionContext backed by the current process.
 */
class ProcessExecutionContext : public ExecutionContext {
 public:
  ProcessExecutionContext() {}
  virtual ~ProcessExecutionContext() {}

  /** @brief Reads `environ` in table order. */
  virtual vector<pair<string, string>> getEnvironment();
  /**
   * @throws std::runtime_error if getcwd fails.
   */
  virtual string getCurrentDirectory();
  virtual string getFileSeparator() { return "/"; }
  virtual string getPathSeparator() { return ":"; }
};
}  // namespace railgun

#endif  // __RAILGUN_EXECUTION_CONTEXT__
