// naivecall
#include <call/call_configuration.hpp>
#include <common/logger.hpp>
#include <signaling/local_broadcast_hub.hpp>

// boost
#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>

#include "client.hpp"

#include <plog/Log.h>

#include <chrono>
#include <csignal>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

// Reads the configuration shared by every device, the user id is set per device.
naivecall::CallConfiguration LoadConfiguration(int argc, const char* argv[]) {
    if (argc < 2) {
        naivecall::CallConfiguration config;
        config.local_user_id = "alice";
        config.offer_retransmit_interval_ms = 200;
        return config;
    }
    std::ifstream file(argv[1]);
    if (!file) {
        throw std::invalid_argument(std::string("Can not open ") + argv[1]);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return naivecall::CallConfiguration::Parse(ss.str());
}

} // namespace

int main(int argc, const char* argv[]) {

    naivecall::CallConfiguration base_config;
    try {
        base_config = LoadConfiguration(argc, argv);
    } catch (const std::exception& exp) {
        naivecall::logging::InitLogger(naivecall::logging::Level::ERROR);
        PLOG_ERROR << "Invalid configuration: " << exp.what();
        return 1;
    }
    naivecall::logging::InitLogger(base_config.log_level);

    boost::asio::io_context ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard(ioc.get_executor());

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        ioc.stop();
        PLOG_VERBOSE << "main ioc exit";
    });

    naivecall::signaling::LocalBroadcastHub hub;
    std::vector<std::shared_ptr<Client>> clients;
    for (const auto& user_id : {"alice", "bob", "carol"}) {
        auto config = base_config;
        config.local_user_id = user_id;
        auto client = Client::Create(std::move(config), &hub, ioc);
        client->Start();
        clients.push_back(client);
    }

    PLOG_INFO << "alice calls bob and carol.";
    auto& caller = clients.front();
    if (!caller->manager().StartCall("demo-room", {"bob", "carol"}, naivecall::signaling::CallType::VIDEO)) {
        PLOG_ERROR << "Failed to start the call.";
        return 1;
    }

    // Polls until every pair is connected, then hangs up.
    boost::asio::steady_timer timer(ioc);
    int polls_left = 100;
    std::function<void(const boost::system::error_code&)> on_timer = [&](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        bool all_connected = true;
        for (const auto& client : clients) {
            all_connected = all_connected && client->connected_count() == clients.size() - 1;
        }
        if (all_connected || --polls_left == 0) {
            PLOG_INFO << (all_connected ? "Everyone is connected, alice hangs up." : "Timed out, alice hangs up.");
            caller->manager().EndCall();
            ioc.stop();
            return;
        }
        timer.expires_after(std::chrono::milliseconds(100));
        timer.async_wait(on_timer);
    };
    timer.expires_after(std::chrono::milliseconds(100));
    timer.async_wait(on_timer);

    ioc.run();

    for (auto& client : clients) {
        client->Stop();
    }
    clients.clear();

    PLOG_VERBOSE << "main exit.";

    return 0;
}
