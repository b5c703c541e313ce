#pragma once

#include "HttpServer.hpp"
#include "SimulatorEngine.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace greenwave
{
    // Publishes engine snapshots over HTTP.
    //   GET /                 replay page
    //   GET /snapshot         latest engine snapshot (JSON)
    //   GET /command?cmd=stop closes the display; the engine stops on its next tick
    class HttpEngineDisplay : public IEngineDisplay
    {
    public:
        // With `realtime` set, update() sleeps so simulated time follows the wall clock.
        HttpEngineDisplay(int port, bool realtime = true);
        ~HttpEngineDisplay() override;

        bool start();

        void update(const SimulatorEngine &engine) override;
        bool closed() const override { return is_closed; }

        // Returns false for commands other than "stop".
        bool handleCommand(const std::string &cmd);
        std::string latestSnapshot() const;

        // Answers a request without going through the socket.
        HttpReply respond(const HttpRequest &request) const { return server.dispatch(request); }

    private:
        HttpReply commandReply(const HttpRequest &request);

        HttpServer server;
        bool realtime;
        std::atomic<bool> is_closed{false};
        mutable std::mutex snapshot_mutex;
        std::string snapshot_json = "{}";
        std::optional<std::chrono::steady_clock::time_point> started_at;
    };

} // namespace greenwave
