#include "bench_common.hpp"

#include "ragvix/config/config.hpp"

void run_config_benchmark() {
  ragvix::bench::run_bench("config_validate", 2000, [] {
    ragvix::config::Config config;
    (void)ragvix::config::validate_config(config);
  });

  const std::string toml = "[chunking]\nwindow_size = 800\noverlap = 80\nunit = \"chars\"\n"
                           "[index]\ndistance_metric = \"dot\"\n";
  ragvix::bench::run_bench("config_parse", 2000,
                           [&] { (void)ragvix::config::parse_config(toml); });
}
