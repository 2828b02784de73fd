#include "aws_util.h"

#include "platform.h"

#include "aws/core/utils/logging/LogLevel.h"
#include "aws/core/utils/logging/NullLogSystem.h"

#include <mutex>

namespace strata {
namespace {

constexpr char const *kAllocationTag{ "strata-aws-util" };
constexpr long kConnectTimeoutMs{ 5000 };
constexpr long kRequestTimeoutMs{ 30000 };

Aws::SDKOptions g_options;
std::once_flag g_init_once;
std::mutex g_state_mutex;
bool g_initialized{ false };

void configure_options(Aws::SDKOptions &options) {
  options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
  options.loggingOptions.logger_create_fn = [] {
    return Aws::MakeShared<Aws::Utils::Logging::NullLogSystem>(kAllocationTag);
  };
}

}  // namespace

void aws_init() {
  std::call_once(g_init_once, [] {
    platform::set_env_var("AWS_SDK_LOAD_CONFIG", "1");
    configure_options(g_options);
    Aws::InitAPI(g_options);
    std::lock_guard<std::mutex> lock{ g_state_mutex };
    g_initialized = true;
  });
}

void aws_shutdown() {
  std::lock_guard<std::mutex> lock{ g_state_mutex };
  if (!g_initialized) { return; }
  g_initialized = false;
  Aws::ShutdownAPI(g_options);
}

aws_shutdown_guard::~aws_shutdown_guard() { aws_shutdown(); }

Aws::Client::ClientConfiguration aws_client_config(aws_client_options const &options) {
  aws_init();

  Aws::Client::ClientConfiguration config;
  if (!options.region.empty()) { config.region = aws_str(options.region); }
  if (options.endpoint && !options.endpoint->empty()) {
    config.endpointOverride = aws_str(*options.endpoint);
    if (options.endpoint->rfind("http://", 0) == 0) {
      config.scheme = Aws::Http::Scheme::HTTP;
    }
  }
  config.connectTimeoutMs = kConnectTimeoutMs;
  config.requestTimeoutMs = kRequestTimeoutMs;
  return config;
}

}  // namespace strata
