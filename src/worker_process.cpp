#include "worker_process.hpp"

extern char** environ;

namespace gateway {

EnvironmentList CurrentEnvironment() {
  EnvironmentList out;
  for (char** e = environ; e && *e; ++e) {
    const std::string kv(*e);
    const auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    out.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
  }
  return out;
}

}  // namespace gateway
