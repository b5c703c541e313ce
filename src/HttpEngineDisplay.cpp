#include "greenwave/HttpEngineDisplay.hpp"

#include <iostream>
#include <thread>

namespace greenwave
{
    namespace
    {
        const char *kReplayPage = R"HTML(<!doctype html>
<html lang="en"><head><meta charset="UTF-8" /><title>greenwave replay</title></head>
<body>
<button onclick="fetch('/command?cmd=stop')">Stop</button>
<pre id="state">waiting for snapshot...</pre>
<script>
setInterval(async () => {
  const r = await fetch('/snapshot');
  document.getElementById('state').textContent = JSON.stringify(await r.json(), null, 2);
}, 250);
</script>
</body></html>
)HTML";
    }

    HttpEngineDisplay::HttpEngineDisplay(int port, bool realtime)
        : server(port), realtime(realtime)
    {
        server.route("/", [](const HttpRequest &)
                     { return HttpReply{200, "text/html; charset=utf-8", kReplayPage}; });
        server.route("/snapshot", [this](const HttpRequest &)
                     { return HttpReply{200, "application/json", latestSnapshot()}; });
        server.route("/command", [this](const HttpRequest &request)
                     { return commandReply(request); });
    }

    HttpEngineDisplay::~HttpEngineDisplay()
    {
        server.stop();
    }

    bool HttpEngineDisplay::start()
    {
        return server.start();
    }

    void HttpEngineDisplay::update(const SimulatorEngine &engine)
    {
        {
            std::lock_guard<std::mutex> lock(snapshot_mutex);
            snapshot_json = engine.getSnapshotJson();
        }

        if (!realtime)
        {
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        if (!started_at.has_value())
        {
            started_at = now - std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                   std::chrono::duration<double>(engine.currentTime()));
        }
        const auto due = *started_at + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                           std::chrono::duration<double>(engine.currentTime()));
        if (due > now && !is_closed)
        {
            std::this_thread::sleep_until(due);
        }
    }

    bool HttpEngineDisplay::handleCommand(const std::string &cmd)
    {
        if (cmd == "stop")
        {
            is_closed = true;
            return true;
        }
        std::cerr << "UI server: unknown command '" << cmd << "'\n";
        return false;
    }

    HttpReply HttpEngineDisplay::commandReply(const HttpRequest &request)
    {
        auto cmd = request.query.find("cmd");
        if (cmd == request.query.end())
        {
            return {400, "text/plain", "missing cmd"};
        }
        if (!handleCommand(cmd->second))
        {
            return {400, "text/plain", "unknown command " + cmd->second};
        }
        return {200, "text/plain", "ok"};
    }

    std::string HttpEngineDisplay::latestSnapshot() const
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex);
        return snapshot_json;
    }

} // namespace greenwave
