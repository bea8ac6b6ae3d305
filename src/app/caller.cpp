#include "app/pending_requests.hpp"
#include "bus/amqp_connection.hpp"
#include "bus/json_serializer.hpp"
#include "bus/transporter.hpp"
#include "bus/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace mqtransit;

int main(int argc, char* argv[]) {
    TransporterConfig config;
    config.node_id = "caller-1";
    std::string action = "sum";
    int num_requests = 10;
    std::chrono::milliseconds timeout{5000};

    for (int i = 1; i < argc; i += 2) {
        if (i + 1 >= argc) break;

        std::string arg = argv[i];
        if (arg == "--url") {
            config.url = argv[i + 1];
        } else if (arg == "--node") {
            config.node_id = argv[i + 1];
        } else if (arg == "--ns") {
            config.ns = argv[i + 1];
        } else if (arg == "--action") {
            action = argv[i + 1];
        } else if (arg == "--requests") {
            num_requests = std::atoi(argv[i + 1]);
        } else if (arg == "--timeout") {
            timeout = std::chrono::milliseconds(std::atoi(argv[i + 1]));
        }
    }

    std::cout << "Starting caller node:" << std::endl;
    std::cout << "  Broker: " << config.url << std::endl;
    std::cout << "  Node: " << config.node_id << std::endl;
    std::cout << "  Action: " << action << std::endl;
    std::cout << "  Requests: " << num_requests << std::endl;
    std::cout << std::endl;

    try {
        auto serializer = std::make_shared<JsonSerializer>();
        app::PendingRequests pending;

        auto handler = [serializer, &pending](PacketType type, const std::string& raw, HandlerDone done) {
            if (type == PacketType::Response) {
                Packet packet = serializer->deserialize(type, raw);
                pending.resolve(packet.payload.id, packet.payload.data);
            }
            done(nullptr);
        };

        Transporter transporter(config, amqp_connector(), serializer, handler,
                                []() { return std::vector<ServiceInfo>(); });
        transporter.connect().get();

        std::cout << "Caller connected. Sending requests..." << std::endl;

        int answered = 0;
        auto start_time = std::chrono::steady_clock::now();

        for (int i = 0; i < num_requests; ++i) {
            PacketPayload payload;
            payload.sender = config.node_id;
            payload.id = config.node_id + "-" + std::to_string(i);
            payload.action = action;
            payload.data = nlohmann::json{{"a", i}, {"b", i * 2}}.dump();

            auto response = pending.add(payload.id);
            transporter.publish(Packet(PacketType::Request, std::nullopt, payload)).get();

            if (response.wait_for(timeout) != std::future_status::ready) {
                std::cerr << "Request " << payload.id << " timed out" << std::endl;
                pending.cancel(payload.id);
                continue;
            }
            ++answered;
            std::cout << "  " << payload.id << " -> " << response.get() << std::endl;
        }

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        std::cout << answered << "/" << num_requests << " requests answered in "
                  << duration.count() << " ms" << std::endl;
        if (duration.count() > 0) {
            std::cout << "Rate: " << (answered * 1000.0 / duration.count()) << " requests/sec" << std::endl;
        }

        transporter.disconnect().get();
        std::cout << "Caller stopped" << std::endl;

        return answered == num_requests ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
