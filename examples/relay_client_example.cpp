/**
 * Relay Client Example
 *
 * Connects a Controller and a Car to a running carlink-relay over WebSocket
 * and lets them negotiate a video call. Media is carried by loopback
 * transports, so both peers live in this process. Restart the relay while
 * the example runs to watch both peers reconnect and rejoin the room.
 */

#include <carlink/core/event.hpp>
#include <carlink/core/logger.hpp>
#include <carlink/session/call_manager.hpp>
#include <carlink/session/loopback_transport.hpp>
#include <carlink/session/websocket_signaling_channel.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace carlink;

std::atomic<bool> running{true};

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    running = false;
}

void printUsage(const char* programName) {
    std::cout << "Relay Client Example" << std::endl;
    std::cout << "Usage: " << programName << " [host] [port] [room]" << std::endl;
    std::cout << "  defaults: 127.0.0.1 3000 video-room" << std::endl;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    std::string host = argc > 1 ? argv[1] : "127.0.0.1";
    std::string port = argc > 2 ? argv[2] : "3000";
    std::string room = argc > 3 ? argv[3] : "video-room";

    session::WebSocketSignalingChannel car_link(host, port);
    session::WebSocketSignalingChannel controller_link(host, port);

    for (auto* link : {&car_link, &controller_link}) {
        auto connected = link->connect();
        if (connected.is_error()) {
            core::Logger::error("{}", connected.error().what());
            return 1;
        }
    }

    core::EventLoop loop;
    loop.start();
    session::LoopbackTransportProvider transports;

    {
        session::PeerSessionOptions car_options;
        car_options.room = room;
        car_options.local_role = relay::Role::Car;
        car_options.target_role = relay::Role::Controller;

        session::PeerSessionOptions controller_options;
        controller_options.room = room;
        controller_options.local_role = relay::Role::Controller;
        controller_options.target_role = relay::Role::Car;

        session::CallManager car(loop, car_link, transports, car_options);
        session::CallManager controller(loop, controller_link, transports, controller_options);

        controller.onCallStateChange = [](const session::CallInfo& info) {
            std::cout << "Call " << info.id << " with " << info.remote_id << ": "
                      << session::callStateName(info.state) << std::endl;
        };
        controller.onRelayLink = [](bool connected) {
            std::cout << (connected ? "Relay link restored" : "Relay link lost, reconnecting...") << std::endl;
        };
        controller.onRelayError = [](const std::string& message) {
            std::cout << "Relay error: " << message << std::endl;
        };

        car.start();
        controller.start();

        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        controller.stop();
        car.stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        loop.stop();
    }

    controller_link.close();
    car_link.close();
    return 0;
}
