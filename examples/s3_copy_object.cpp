#include "mpcopy/config/config.hpp"
#include "mpcopy/copy/coordinator.hpp"
#include "mpcopy/events/components.hpp"
#include "mpcopy/events/event_bus.hpp"
#include "mpcopy/storage/s3_client.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

using json = nlohmann::json;

namespace {

int report_error(const std::string& stage, const mpcopy::CopyError& error) {
    std::cout << json{{"status", "error"}, {"stage", stage}, {"error", error}}.dump(2) << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <s3-client.json> <request.json> [coordinator.json]" << std::endl;
        return 2;
    }

    auto s3_config = mpcopy::config::load_s3_client_config(argv[1]);
    if (s3_config.is_error()) {
        return report_error("s3-config", s3_config.error());
    }
    auto request = mpcopy::config::load_copy_request(argv[2]);
    if (request.is_error()) {
        return report_error("request", request.error());
    }

    mpcopy::config::CoordinatorConfig config;
    if (argc > 3) {
        auto loaded = mpcopy::config::load_coordinator_config(argv[3]);
        if (loaded.is_error()) {
            return report_error("config", loaded.error());
        }
        config = loaded.value();
    }
    if (auto applied = mpcopy::config::apply_log_level(config); applied.is_error()) {
        return report_error("config", applied.error());
    }

    mpcopy::storage::AwsSdkSession sdk;

    int exit_code = 0;
    {
        mpcopy::storage::S3StorageClient storage(s3_config.value());

        mpcopy::events::EventBus event_bus;
        mpcopy::events::LoggerComponent logger(event_bus);
        mpcopy::events::MetricsComponent metrics(event_bus);

        mpcopy::copy::CompletionCoordinator coordinator(storage, config, event_bus);
        auto result = coordinator.copy_object(request.value());
        if (result.is_error()) {
            exit_code = report_error("copy", result.error());
        } else {
            std::cout << json{{"status", "completed"}, {"response", result.value()}}.dump(2) << std::endl;
        }
        metrics.print_stats();
    }
    return exit_code;
}
