#include "HttpApiServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>

namespace greenwave
{
    namespace
    {
        const char *kSetSignalPrefix = "/set_signal/";

        std::string statusTextFromCode(int status_code)
        {
            switch (status_code)
            {
            case 200:
                return "200 OK";
            case 204:
                return "204 No Content";
            case 400:
                return "400 Bad Request";
            case 404:
                return "404 Not Found";
            case 405:
                return "405 Method Not Allowed";
            case 500:
                return "500 Internal Server Error";
            default:
                return std::to_string(status_code) + " Unknown";
            }
        }

        int hexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        // Percent-decoding for a single path segment; malformed escapes are kept verbatim
        std::string decodePathSegment(const std::string &segment)
        {
            std::string out;
            out.reserve(segment.size());
            for (std::size_t i = 0; i < segment.size(); ++i)
            {
                if (segment[i] == '%' && i + 2 < segment.size())
                {
                    const int hi = hexValue(segment[i + 1]);
                    const int lo = hexValue(segment[i + 2]);
                    if (hi >= 0 && lo >= 0)
                    {
                        out.push_back(static_cast<char>(hi * 16 + lo));
                        i += 2;
                        continue;
                    }
                }
                out.push_back(segment[i]);
            }
            return out;
        }

        ApiResponse methodNotAllowed()
        {
            return ApiResponse{405, errorToJson("method not allowed")};
        }

        bool sendAll(int client_fd, const std::string &data)
        {
            std::size_t sent = 0;
            while (sent < data.size())
            {
                const ssize_t n = send(client_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (n < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    return false;
                }
                sent += static_cast<std::size_t>(n);
            }
            return true;
        }
    } // namespace

    HttpApiServer::HttpApiServer(int port, ApiService &service)
        : port(port),
          server_fd(-1),
          running(false),
          service(service)
    {
    }

    HttpApiServer::~HttpApiServer()
    {
        stop();
    }

    bool HttpApiServer::start()
    {
        if (running)
        {
            return false;
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
        {
            std::cerr << "API server: failed to create socket: " << std::strerror(errno) << "\n";
            return false;
        }

        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            std::cerr << "API server: failed to set SO_REUSEADDR: " << std::strerror(errno) << "\n";
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(port));

        if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 || listen(fd, 16) < 0)
        {
            std::cerr << "API server: cannot listen on port " << port << ": " << std::strerror(errno) << "\n";
            close(fd);
            return false;
        }

        server_fd = fd;
        running = true;
        accept_thread = std::thread(&HttpApiServer::acceptLoop, this, fd);
        std::cout << "API server: listening on port " << port << std::endl;
        return true;
    }

    void HttpApiServer::stop()
    {
        if (!running.exchange(false))
        {
            return;
        }

        // shutdown() wakes the blocked accept(); the descriptor is closed only after the thread is gone
        const int fd = server_fd.exchange(-1);
        if (fd >= 0)
        {
            shutdown(fd, SHUT_RDWR);
        }

        if (accept_thread.joinable())
        {
            accept_thread.join();
        }
        if (fd >= 0)
        {
            close(fd);
        }
        std::cout << "API server: stopped" << std::endl;
    }

    void HttpApiServer::acceptLoop(int listen_fd)
    {
        while (running)
        {
            sockaddr_in client_addr{};
            socklen_t len = sizeof(client_addr);
            int client_fd = accept(listen_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
            if (client_fd < 0)
            {
                if (running)
                {
                    continue;
                }
                break;
            }

            handleClient(client_fd);
            close(client_fd);
        }
    }

    ApiResponse HttpApiServer::route(const std::string &method, const std::string &path)
    {
        if (method == "OPTIONS")
        {
            return ApiResponse{204, ""};
        }

        std::size_t qmark = path.find('?');
        std::string clean_path = qmark == std::string::npos ? path : path.substr(0, qmark);

        if (clean_path.rfind(kSetSignalPrefix, 0) == 0)
        {
            if (method != "GET" && method != "POST")
            {
                return methodNotAllowed();
            }
            return service.setSignal(decodePathSegment(clean_path.substr(std::strlen(kSetSignalPrefix))));
        }

        if (clean_path == "/end_override")
        {
            if (method != "GET" && method != "POST")
            {
                return methodNotAllowed();
            }
            return service.endOverride();
        }

        if (clean_path == "/" || clean_path.empty())
        {
            return method == "GET" ? service.index() : methodNotAllowed();
        }
        if (clean_path == "/get_counts")
        {
            return method == "GET" ? service.getCounts() : methodNotAllowed();
        }
        if (clean_path == "/system_status")
        {
            return method == "GET" ? service.systemStatus() : methodNotAllowed();
        }
        if (clean_path == "/config")
        {
            return method == "GET" ? service.activeConfig() : methodNotAllowed();
        }

        return ApiResponse{404, errorToJson("not found")};
    }

    void HttpApiServer::handleClient(int client_fd)
    {
        char buffer[8192];
        std::memset(buffer, 0, sizeof(buffer));
        ssize_t n = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
        if (n <= 0)
        {
            return;
        }

        std::string req(buffer, static_cast<std::size_t>(n));
        std::istringstream input(req);
        std::string method, path, version;
        input >> method >> path >> version;
        if (method.empty() || path.empty())
        {
            std::string resp = buildHttpResponse(statusTextFromCode(400), "application/json",
                                                 errorToJson("malformed request line"));
            if (!sendAll(client_fd, resp))
            {
                std::cerr << "API server: failed to send response: " << std::strerror(errno) << "\n";
            }
            return;
        }

        ApiResponse result;
        try
        {
            result = route(method, path);
        }
        catch (const std::exception &e)
        {
            std::cerr << "API server: " << method << " " << path << " failed: " << e.what() << "\n";
            result = ApiResponse{500, errorToJson("internal server error")};
        }

        std::string resp = buildHttpResponse(statusTextFromCode(result.status_code), "application/json", result.body);
        if (!sendAll(client_fd, resp))
        {
            std::cerr << "API server: failed to send response: " << std::strerror(errno) << "\n";
        }
    }

    std::string HttpApiServer::buildHttpResponse(const std::string &status,
                                                 const std::string &content_type,
                                                 const std::string &body) const
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << status << "\r\n";
        out << "Content-Type: " << content_type << "\r\n";
        out << "Access-Control-Allow-Origin: *\r\n";
        out << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n";
        out << "Access-Control-Allow-Headers: Content-Type\r\n";
        out << "Cache-Control: no-store, no-cache, must-revalidate, max-age=0\r\n";
        out << "Content-Length: " << body.size() << "\r\n";
        out << "Connection: close\r\n\r\n";
        out << body;
        return out.str();
    }
} // namespace greenwave
