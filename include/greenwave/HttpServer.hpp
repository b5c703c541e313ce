#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <thread>

namespace greenwave
{
    struct HttpRequest
    {
        std::string method;
        std::string path;
        std::map<std::string, std::string> query;
    };

    struct HttpReply
    {
        int status = 200;
        std::string content_type = "text/plain";
        std::string body;
    };

    // Reads the request line of a raw HTTP request. A malformed line leaves
    // method and path empty.
    HttpRequest parseRequestLine(const std::string &raw);
    std::string formatReply(const HttpReply &reply);

    // Single-threaded GET-only server. Each path maps to one handler; requests
    // are answered one at a time and the connection is closed afterwards.
    class HttpServer
    {
    public:
        using Handler = std::function<HttpReply(const HttpRequest &)>;

        explicit HttpServer(int port);
        ~HttpServer();

        HttpServer(const HttpServer &) = delete;
        HttpServer &operator=(const HttpServer &) = delete;

        void route(const std::string &path, Handler handler);
        HttpReply dispatch(const HttpRequest &request) const;

        bool start();
        void stop();

    private:
        void serve();
        void answer(int client_fd) const;

        int port;
        int listen_fd = -1;
        std::atomic<bool> serving{false};
        std::thread worker;
        std::map<std::string, Handler> routes;
    };

} // namespace greenwave
