#include "mpcopy/config/config.hpp"
#include "mpcopy/copy/coordinator.hpp"
#include "mpcopy/events/components.hpp"
#include "mpcopy/events/event_bus.hpp"
#include "mpcopy/storage/memory_client.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// 120 MB at the default part size: one full part and one trailing part
json default_request() {
    return json{
        {"source_bucket", "demo-source"},
        {"object_key", "archive/2024/backup.tar"},
        {"destination_bucket", "demo-destination"},
        {"copied_object_name", "restored/backup.tar"},
        {"object_size", 120000000},
        {"content_type", "application/x-tar"},
        {"metadata", {{"copied-by", "mpcopy_demo"}}},
    };
}

std::vector<std::uint8_t> seed_bytes(std::int64_t size) {
    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    std::uint32_t state = 2463534242u;
    for (auto& byte : data) {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        byte = static_cast<std::uint8_t>(state);
    }
    return data;
}

int report_error(const std::string& stage, const mpcopy::CopyError& error) {
    std::cout << json{{"status", "error"}, {"stage", stage}, {"error", error}}.dump(2) << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    mpcopy::config::CoordinatorConfig config;
    if (argc > 1) {
        auto loaded = mpcopy::config::load_coordinator_config(argv[1]);
        if (loaded.is_error()) {
            return report_error("config", loaded.error());
        }
        config = loaded.value();
    }
    if (auto applied = mpcopy::config::apply_log_level(config); applied.is_error()) {
        return report_error("config", applied.error());
    }

    auto request = argc > 2 ? mpcopy::config::load_copy_request(argv[2])
                            : mpcopy::config::parse_copy_request(default_request());
    if (request.is_error()) {
        return report_error("request", request.error());
    }
    const auto& copy_request = request.value();

    spdlog::info("Coordinator config: {}", json(config).dump());

    mpcopy::storage::InMemoryStorageClient storage;
    storage.create_bucket(copy_request.source.bucket);
    storage.create_bucket(copy_request.destination.bucket);
    if (auto seeded = storage.put_object(copy_request.source, seed_bytes(copy_request.object_size));
        seeded.is_error()) {
        return report_error("seed", seeded.error());
    }

    mpcopy::events::EventBus event_bus;
    mpcopy::events::LoggerComponent logger(event_bus);
    mpcopy::events::MetricsComponent metrics(event_bus);

    int exit_code = 0;
    {
        mpcopy::copy::CompletionCoordinator coordinator(storage, config, event_bus);
        auto result = coordinator.copy_object(copy_request, std::string("demo-1"));
        if (result.is_error()) {
            exit_code = report_error("copy", result.error());
        } else {
            std::cout << json{{"status", "completed"}, {"response", result.value()}}.dump(2) << std::endl;
        }
    }

    metrics.print_stats();
    return exit_code;
}
