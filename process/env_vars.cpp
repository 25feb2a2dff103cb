#include "process/env_vars.h"

#include <unistd.h>

#include <algorithm>

namespace webui_init {
namespace {

bool has_name(const std::string& entry, std::string_view var) {
  return entry.size() > var.size() && entry[var.size()] == '=' &&
         std::string_view(entry).substr(0, var.size()) == var;
}

}  // namespace

EnvVars::EnvVars(char** env) {
  if (!env) return;
  for (size_t i = 0; env[i]; ++i) {
    entries_.push_back(env[i]);
  }
}

EnvVars::EnvVars(const EnvVars& other) : entries_(other.entries_) {}

EnvVars& EnvVars::operator=(const EnvVars& other) {
  if (this != &other) {
    entries_ = other.entries_;
    vars_.clear();
  }
  return *this;
}

EnvVars EnvVars::environ() { return EnvVars(::environ); }

void EnvVars::set(std::string_view var, std::string_view val) {
  std::string entry = std::string(var) + "=" + std::string(val);
  auto it = find(var);
  if (it != entries_.end()) {
    *it = std::move(entry);
  } else {
    entries_.push_back(std::move(entry));
  }
  vars_.clear();
}

void EnvVars::unset(std::string_view var) {
  auto it = find(var);
  if (it != entries_.end()) entries_.erase(it);
  vars_.clear();
}

std::optional<std::string> EnvVars::get(std::string_view var) const {
  auto it = find(var);
  if (it == entries_.end()) return std::nullopt;
  return it->substr(var.size() + 1);
}

char** EnvVars::vars() {
  vars_.clear();
  for (std::string& entry : entries_) {
    vars_.push_back(entry.data());
  }
  vars_.push_back(nullptr);
  return vars_.data();
}

std::vector<std::string>::iterator EnvVars::find(std::string_view var) {
  return std::find_if(entries_.begin(), entries_.end(),
                      [&](const std::string& e) { return has_name(e, var); });
}

std::vector<std::string>::const_iterator EnvVars::find(
    std::string_view var) const {
  return std::find_if(entries_.begin(), entries_.end(),
                      [&](const std::string& e) { return has_name(e, var); });
}

}  // namespace webui_init
