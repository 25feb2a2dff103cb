#ifndef PROCESS_ENV_VARS_H_
#define PROCESS_ENV_VARS_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webui_init {

// An owned copy of a NAME=VALUE environment block.
class EnvVars {
 public:
  // Copies the given env vars into a new EnvVars instance. A null 'env'
  // gives an empty environment.
  explicit EnvVars(char** env = nullptr);

  EnvVars(const EnvVars& other);
  EnvVars& operator=(const EnvVars& other);
  EnvVars(EnvVars&&) = default;
  EnvVars& operator=(EnvVars&&) = default;

  // Returns a copy of the process's environment.
  static EnvVars environ();

  // Sets 'var' to 'val', replacing any existing value.
  void set(std::string_view var, std::string_view val);

  // Removes 'var' if present.
  void unset(std::string_view var);

  // Returns the value of 'var', or nullopt if it isn't set.
  std::optional<std::string> get(std::string_view var) const;

  // Returns the env vars as a null terminated char**, suitable for
  // posix_spawn. Invalidated by set() and unset().
  char** vars();

 private:
  std::vector<std::string>::iterator find(std::string_view var);
  std::vector<std::string>::const_iterator find(std::string_view var) const;

  std::vector<std::string> entries_;
  std::vector<char*> vars_;
};

}  // namespace webui_init

#endif
