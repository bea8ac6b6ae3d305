#include "bus/amqp_connection.hpp"
#include "bus/json_serializer.hpp"
#include "bus/metrics.hpp"
#include "bus/transporter.hpp"
#include "bus/types.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

using namespace mqtransit;

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> items;
    size_t pos = 0;
    while (pos < list.length()) {
        size_t next_pos = list.find(',', pos);
        if (next_pos == std::string::npos) {
            items.push_back(list.substr(pos));
            break;
        }
        items.push_back(list.substr(pos, next_pos - pos));
        pos = next_pos + 1;
    }
    return items;
}

// "sum" adds a and b; any other action echoes its params back.
nlohmann::json run_action(const std::string& action, const nlohmann::json& params) {
    if (action == "sum") {
        return params.at("a").get<double>() + params.at("b").get<double>();
    }
    return params;
}

void metrics_thread(Transporter& transporter) {
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto stats = transporter.get_metrics();
        spdlog::info("METRICS: {}", metrics_utils::format_stats(stats));
    }
}

int main(int argc, char* argv[]) {
    TransporterConfig config;
    config.node_id = "worker-1";
    std::vector<std::string> actions = {"sum"};

    for (int i = 1; i < argc; i += 2) {
        if (i + 1 >= argc) break;

        std::string arg = argv[i];
        if (arg == "--url") {
            config.url = argv[i + 1];
        } else if (arg == "--node") {
            config.node_id = argv[i + 1];
        } else if (arg == "--ns") {
            config.ns = argv[i + 1];
        } else if (arg == "--workers") {
            config.worker_threads = std::atoi(argv[i + 1]);
        } else if (arg == "--prefetch") {
            config.prefetch = static_cast<uint16_t>(std::atoi(argv[i + 1]));
        } else if (arg == "--actions") {
            actions = split_list(argv[i + 1]);
        }
    }

    std::cout << "Starting worker node:" << std::endl;
    std::cout << "  Broker: " << config.url << std::endl;
    std::cout << "  Node: " << config.node_id << std::endl;
    std::cout << "  Worker threads: " << config.worker_threads << std::endl;
    std::cout << "  Prefetch: " << config.prefetch << std::endl;
    std::cout << "  Actions: ";
    for (const auto& action : actions) {
        std::cout << action << " ";
    }
    std::cout << std::endl << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        auto serializer = std::make_shared<JsonSerializer>();
        Transporter* self = nullptr;

        auto handler = [&self, serializer](PacketType type, const std::string& raw, HandlerDone done) {
            Packet packet = serializer->deserialize(type, raw);
            if (type != PacketType::Request) {
                spdlog::debug("{} from {}", to_string(type), packet.payload.sender);
                done(nullptr);
                return;
            }

            nlohmann::json params = packet.payload.data.empty()
                ? nlohmann::json::object()
                : nlohmann::json::parse(packet.payload.data);

            PacketPayload reply;
            reply.sender = self->node_id();
            reply.id = packet.payload.id;
            reply.action = packet.payload.action;
            reply.data = nlohmann::json{{"success", true},
                                        {"data", run_action(packet.payload.action, params)}}.dump();

            // Acked once the response is on its way.
            self->publish(Packet(PacketType::Response, packet.payload.sender, reply)).get();
            done(nullptr);
        };

        auto provider = [actions]() {
            ServiceInfo service;
            service.name = "math";
            service.actions = actions;
            return std::vector<ServiceInfo>{service};
        };

        Transporter transporter(config, amqp_connector(), serializer, handler, provider);
        self = &transporter;

        transporter.connect().get();

        PacketPayload info;
        info.sender = config.node_id;
        info.data = nlohmann::json{{"services", {{{"name", "math"}, {"actions", actions}}}}}.dump();
        transporter.publish(Packet(PacketType::Info, std::nullopt, info)).get();

        std::cout << "Worker started. Waiting for requests..." << std::endl;
        std::cout << "Press Ctrl+C to stop." << std::endl << std::endl;

        std::thread metrics_worker(metrics_thread, std::ref(transporter));

        while (g_running.load() && transporter.is_connected()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        g_running.store(false);

        std::cout << std::endl << "Shutting down..." << std::endl;

        metrics_worker.join();

        transporter.disconnect().get();
        transporter.stop();

        std::cout << "FINAL METRICS: " << metrics_utils::format_stats(transporter.get_metrics()) << std::endl;
        std::cout << "Worker stopped." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
