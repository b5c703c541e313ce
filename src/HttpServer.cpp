#include "greenwave/HttpServer.hpp"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <iostream>
#include <sstream>

namespace greenwave
{
    namespace
    {
        constexpr int POLL_INTERVAL_MS = 200;
        constexpr std::size_t MAX_REQUEST_BYTES = 8192;

        const char *statusText(int status)
        {
            switch (status)
            {
            case 200:
                return "OK";
            case 400:
                return "Bad Request";
            case 404:
                return "Not Found";
            case 405:
                return "Method Not Allowed";
            default:
                return "Internal Server Error";
            }
        }

        std::map<std::string, std::string> parseQuery(const std::string &text)
        {
            std::map<std::string, std::string> values;
            std::istringstream pairs(text);
            std::string pair;
            while (std::getline(pairs, pair, '&'))
            {
                if (pair.empty())
                    continue;
                const std::size_t eq = pair.find('=');
                if (eq == std::string::npos)
                    values[pair] = "";
                else
                    values[pair.substr(0, eq)] = pair.substr(eq + 1);
            }
            return values;
        }
    }

    HttpRequest parseRequestLine(const std::string &raw)
    {
        HttpRequest request;
        const std::string line = raw.substr(0, raw.find("\r\n"));
        std::istringstream words(line);
        std::string target;
        std::string protocol;
        if (!(words >> request.method >> target >> protocol) || protocol.rfind("HTTP/", 0) != 0)
        {
            return HttpRequest{};
        }

        const std::size_t mark = target.find('?');
        request.path = target.substr(0, mark);
        if (mark != std::string::npos)
        {
            request.query = parseQuery(target.substr(mark + 1));
        }
        return request;
    }

    std::string formatReply(const HttpReply &reply)
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << reply.status << ' ' << statusText(reply.status) << "\r\n"
            << "Content-Type: " << reply.content_type << "\r\n"
            << "Content-Length: " << reply.body.size() << "\r\n"
            << "Cache-Control: no-store\r\n"
            << "Connection: close\r\n"
            << "\r\n"
            << reply.body;
        return out.str();
    }

    HttpServer::HttpServer(int port) : port(port) {}

    HttpServer::~HttpServer()
    {
        stop();
    }

    void HttpServer::route(const std::string &path, Handler handler)
    {
        routes[path] = std::move(handler);
    }

    HttpReply HttpServer::dispatch(const HttpRequest &request) const
    {
        if (request.method.empty())
        {
            return {400, "text/plain", "malformed request"};
        }
        if (request.method != "GET")
        {
            return {405, "text/plain", "only GET is supported"};
        }
        auto it = routes.find(request.path);
        if (it == routes.end())
        {
            return {404, "text/plain", "no route for " + request.path};
        }
        return it->second(request);
    }

    bool HttpServer::start()
    {
        if (serving)
        {
            return true;
        }

        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd < 0)
        {
            std::cerr << "UI server: cannot open a socket\n";
            return false;
        }

        const int reuse = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_port = htons(static_cast<uint16_t>(port));
        address.sin_addr.s_addr = htonl(INADDR_ANY);
        if (bind(listen_fd, reinterpret_cast<const sockaddr *>(&address), sizeof(address)) != 0 ||
            listen(listen_fd, 8) != 0)
        {
            std::cerr << "UI server: cannot listen on port " << port << "\n";
            close(listen_fd);
            listen_fd = -1;
            return false;
        }

        serving = true;
        worker = std::thread([this]()
                             { serve(); });
        return true;
    }

    void HttpServer::stop()
    {
        serving = false;
        if (worker.joinable())
        {
            worker.join();
        }
        if (listen_fd >= 0)
        {
            close(listen_fd);
            listen_fd = -1;
        }
    }

    void HttpServer::serve()
    {
        pollfd watched{};
        watched.fd = listen_fd;
        watched.events = POLLIN;

        while (serving)
        {
            const int ready = poll(&watched, 1, POLL_INTERVAL_MS);
            if (ready <= 0 || (watched.revents & POLLIN) == 0)
            {
                continue;
            }
            const int client_fd = accept(listen_fd, nullptr, nullptr);
            if (client_fd < 0)
            {
                continue;
            }
            answer(client_fd);
            close(client_fd);
        }
    }

    void HttpServer::answer(int client_fd) const
    {
        std::string raw(MAX_REQUEST_BYTES, '\0');
        const ssize_t received = recv(client_fd, &raw[0], raw.size(), 0);
        if (received <= 0)
        {
            return;
        }
        raw.resize(static_cast<std::size_t>(received));

        const std::string response = formatReply(dispatch(parseRequestLine(raw)));
        std::size_t sent = 0;
        while (sent < response.size())
        {
            const ssize_t n = send(client_fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
            {
                return;
            }
            sent += static_cast<std::size_t>(n);
        }
    }

} // namespace greenwave
