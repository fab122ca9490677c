#include <chrono>
#include <string>
#include <thread>

#include "../../platform/include/platform_log.h"
#include "config.h"
#include "transfer_service.h"

namespace {

namespace plog = pc::platform::log;

constexpr char kLogTag[] = "pc_transport_server";

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = (argc > 1) ? argv[1] : "config.ini";

  std::string error;
  pc::transport::TransferConfig cfg;
  if (!pc::transport::LoadConfig(config_path, cfg, error)) {
    plog::Log(plog::Level::kError, kLogTag, "config load failed",
              {{"path", config_path}, {"error", error}});
    return 1;
  }
  plog::SetMinLevel(cfg.log.debug_log ? plog::Level::kDebug
                                      : plog::Level::kInfo);

  pc::transport::TransferService service;
  if (!service.Init(cfg, error)) {
    plog::Log(plog::Level::kError, kLogTag, "service init failed",
              {{"error", error}});
    return 1;
  }
  plog::Log(plog::Level::kInfo, kLogTag, "config loaded",
            {{"path", config_path},
             {"max_file_size", std::to_string(cfg.transfer.max_file_size)},
             {"sweep_interval_sec",
              std::to_string(cfg.transfer.sweep_interval_sec)}});

  // Streams are accepted by the QUIC carrier, which hands each one to
  // TransferService::ServeStream. This process only runs the staging sweep.
  while (true) {
    std::string tick_error;
    if (!service.RunOnce(tick_error) && !tick_error.empty()) {
      plog::Log(plog::Level::kError, kLogTag, "tick failed",
                {{"error", tick_error}});
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  return 0;
}
