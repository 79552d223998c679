#include "ragvix/observability/factory.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/observability/log_observer.hpp"
#include "ragvix/observability/multi_observer.hpp"
#include "ragvix/observability/noop_observer.hpp"

#include <iostream>
#include <vector>

namespace ragvix::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (name != "log") {
    std::cerr << "[WARN] unknown observability backend '" << name << "', using log\n";
  }
  return std::make_unique<LogObserver>();
}

std::vector<std::string> backend_names(const std::string &list) {
  std::vector<std::string> names;
  std::size_t start = 0;
  while (true) {
    const auto comma = list.find(',', start);
    names.push_back(common::to_lower(common::trim(list.substr(start, comma - start))));
    if (comma == std::string::npos) {
      return names;
    }
    start = comma + 1;
  }
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = backend_names(config.observability.backend);
  if (names.size() == 1) {
    return make_backend(names.front());
  }
  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    multi->add(make_backend(name));
  }
  return multi;
}

} // namespace ragvix::observability
