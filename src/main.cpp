#include <chrono>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "broker/in_memory_broker.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "jobs/job_router.hpp"

using json = nlohmann::json;
using namespace argwire;
using schema::types::array_of;
using schema::types::enumeration;
using schema::types::integer;
using schema::types::nilable;
using schema::types::string;

namespace {

class ResizeImage : public jobs::Job {
public:
    struct Args : schema::ArgumentSchema {
        Args() {
            field("image_id", integer());
            field("width", integer(), 800);
            field("format", enumeration({"png", "jpeg", "webp"}), "png");
            field("tags", array_of(string()), json::array());
            field("requested_by", nilable(string()));
        }
    };

    json run() override {
        auto width = arg<int64_t>("width");
        return {
            {"image", arg<int64_t>("image_id")},
            {"size", std::to_string(width) + "x" + std::to_string(width * 3 / 4)},
            {"format", arg<std::string>("format")},
            {"tags", arg("tags")},
        };
    }
};

class NightlyReport : public jobs::Job {
public:
    json run() override { return "report generated"; }
};

void usage() {
    std::cerr << "argwire_demo usage:\n"
              << "  argwire_demo [--inline] [--verbose]\n"
              << "Environment: ARGWIRE_LOG_LEVEL, ARGWIRE_BROKER_MODE (fake|inline), ARGWIRE_LOG_PAYLOADS\n";
}

} // namespace

int main(int argc, char** argv) {
    core::config::load_dotenv();
    auto config = core::config::load_runtime_config();

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--inline") config.broker_mode = "inline";
        else if (a == "--verbose") config.log_level = "debug";
        else { usage(); return 2; }
    }

    core::init_logger();
    core::set_log_level(core::log_level_from_string(config.log_level));

    broker::InMemoryBroker broker(broker::broker_mode_from_string(config.broker_mode));
    jobs::JobRouter router(broker);
    broker.attach(router);

    auto& resize = router.define<ResizeImage>("ResizeImage");
    auto& report = router.define<NightlyReport>("NightlyReport");
    router.set_log_payloads(config.log_payloads);

    spdlog::info("argwire demo ({} broker)", broker::broker_mode_to_string(broker.mode()));

    json summary;
    try {
        summary["sync"] = resize.run_synchronously({{"image_id", 42}, {"format", "webp"}});

        summary["jids"] = json::array({
            resize.submit({{"image_id", 7}, {"tags", json::array({"thumbnail"})}}),
            resize.schedule_in(std::chrono::seconds(30), {{"image_id", 8}, {"width", 1024}}),
            report.schedule_at(std::chrono::system_clock::now() + std::chrono::hours(6)),
        });

        json queued = json::array();
        for (const auto& entry : broker.jobs()) {
            queued.push_back(entry.to_json());
        }
        summary["queued"] = queued;
        summary["drained"] = broker.drain();

        try {
            resize.submit({{"image_id", "seven"}});
        } catch (const core::InvalidArgsError& e) {
            summary["rejected"] = e.what();
        }
    } catch (const core::Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    std::cout << summary.dump(2) << std::endl;
    return 0;
}
