#pragma once

#include "ApiService.hpp"

#include <atomic>
#include <string>
#include <thread>

namespace greenwave
{
    class HttpApiServer
    {
    public:
        HttpApiServer(int port, ApiService &service);
        ~HttpApiServer();

        HttpApiServer(const HttpApiServer &) = delete;
        HttpApiServer &operator=(const HttpApiServer &) = delete;

        bool start();
        void stop();

        // Maps a request line onto the service; no socket involved
        ApiResponse route(const std::string &method, const std::string &path);

    private:
        void acceptLoop(int listen_fd);
        void handleClient(int client_fd);
        std::string buildHttpResponse(const std::string &status,
                                      const std::string &content_type,
                                      const std::string &body) const;

        int port;
        std::atomic<int> server_fd;
        std::atomic<bool> running;
        std::thread accept_thread;
        ApiService &service;
    };
} // namespace greenwave
