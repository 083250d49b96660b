#include "ControlHttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>

namespace signalnet
{
    namespace
    {
        std::string statusTextFromCode(int status_code)
        {
            switch (status_code)
            {
            case 200:
                return "200 OK";
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

        std::string urlDecode(const std::string &text)
        {
            std::string out;
            out.reserve(text.size());
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                if (text[i] == '+')
                {
                    out.push_back(' ');
                }
                else if (text[i] == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0)
                {
                    out.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2])));
                    i += 2;
                }
                else
                {
                    out.push_back(text[i]);
                }
            }
            return out;
        }

        const char *kMethodNotAllowed = "{\"ok\":false,\"error\":\"method not allowed\"}";
    } // namespace

    ControlHttpServer::ControlHttpServer(int port,
                                         SnapshotProvider snapshot_provider,
                                         CommandHandler command_handler,
                                         ConfigProvider config_provider,
                                         ConfigMutationHandler config_mutation_handler,
                                         EventsHandler events_handler,
                                         EventPostHandler event_post_handler)
        : port(port),
          server_fd(-1),
          running(false),
          snapshot_provider(std::move(snapshot_provider)),
          command_handler(std::move(command_handler)),
          config_provider(std::move(config_provider)),
          config_mutation_handler(std::move(config_mutation_handler)),
          events_handler(std::move(events_handler)),
          event_post_handler(std::move(event_post_handler))
    {
    }

    ControlHttpServer::~ControlHttpServer()
    {
        stop();
    }

    ControlHttpServer::QueryParams ControlHttpServer::parseQuery(const std::string &path)
    {
        QueryParams params;
        std::size_t qmark = path.find('?');
        if (qmark == std::string::npos)
        {
            return params;
        }

        std::istringstream query(path.substr(qmark + 1));
        std::string pair;
        while (std::getline(query, pair, '&'))
        {
            if (pair.empty())
            {
                continue;
            }
            std::size_t eq = pair.find('=');
            if (eq == std::string::npos)
            {
                params[urlDecode(pair)] = "";
            }
            else
            {
                params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        return params;
    }

    bool ControlHttpServer::start()
    {
        server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (server_fd < 0)
        {
            std::cerr << "Control server: failed to create socket\n";
            return false;
        }

        int opt = 1;
        if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            std::cerr << "Control server: could not set SO_REUSEADDR\n";
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(port));

        if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            std::cerr << "Control server: bind failed on port " << port << "\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        if (listen(server_fd, 16) < 0)
        {
            std::cerr << "Control server: listen failed\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        running = true;
        accept_thread = std::thread(&ControlHttpServer::acceptLoop, this);
        return true;
    }

    void ControlHttpServer::stop()
    {
        if (!running)
        {
            return;
        }

        running = false;
        if (server_fd >= 0)
        {
            shutdown(server_fd, SHUT_RDWR);
            close(server_fd);
            server_fd = -1;
        }

        if (accept_thread.joinable())
        {
            accept_thread.join();
        }
    }

    void ControlHttpServer::acceptLoop()
    {
        while (running)
        {
            sockaddr_in client_addr{};
            socklen_t len = sizeof(client_addr);
            int client_fd = accept(server_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
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

    void ControlHttpServer::handleClient(int client_fd)
    {
        char buffer[16384];
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
        std::string body;
        std::size_t body_start = req.find("\r\n\r\n");
        if (body_start != std::string::npos)
        {
            body = req.substr(body_start + 4);
        }

        std::size_t qmark = path.find('?');
        std::string clean_path = qmark == std::string::npos ? path : path.substr(0, qmark);

        if (clean_path == "/snapshot")
        {
            if (method != "GET")
            {
                sendResponse(client_fd, 405, "application/json", kMethodNotAllowed);
                return;
            }
            sendResponse(client_fd, 200, "application/json", snapshot_provider());
            return;
        }

        if (clean_path == "/command")
        {
            Response result = command_handler(parseQuery(path));
            sendResponse(client_fd, result.status_code, "application/json", result.body);
            return;
        }

        if (clean_path == "/config/api" || clean_path == "/config.json")
        {
            if (method == "GET")
            {
                sendResponse(client_fd, 200, "application/json", config_provider());
                return;
            }

            if (method == "POST")
            {
                Response result = config_mutation_handler(body);
                sendResponse(client_fd, result.status_code, "application/json", result.body);
                return;
            }

            sendResponse(client_fd, 405, "application/json", kMethodNotAllowed);
            return;
        }

        if (clean_path == "/events")
        {
            Response result;
            if (method == "GET")
            {
                result = events_handler(parseQuery(path));
            }
            else if (method == "POST")
            {
                result = event_post_handler(body);
            }
            else
            {
                sendResponse(client_fd, 405, "application/json", kMethodNotAllowed);
                return;
            }
            sendResponse(client_fd, result.status_code, "application/json", result.body);
            return;
        }

        sendResponse(client_fd, 404, "text/plain", "not found");
    }

    void ControlHttpServer::sendResponse(int client_fd, int status_code, const std::string &content_type, const std::string &body) const
    {
        const std::string resp = buildHttpResponse(statusTextFromCode(status_code), content_type, body);
        std::size_t sent = 0;
        while (sent < resp.size())
        {
            ssize_t rc = send(client_fd, resp.c_str() + sent, resp.size() - sent, 0);
            if (rc <= 0)
            {
                std::cerr << "Control server: client went away mid-response\n";
                return;
            }
            sent += static_cast<std::size_t>(rc);
        }
    }

    std::string ControlHttpServer::buildHttpResponse(const std::string &status,
                                                     const std::string &content_type,
                                                     const std::string &body) const
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << status << "\r\n";
        out << "Content-Type: " << content_type << "\r\n";
        out << "Cache-Control: no-store, no-cache, must-revalidate, max-age=0\r\n";
        out << "Access-Control-Allow-Origin: *\r\n";
        out << "Content-Length: " << body.size() << "\r\n";
        out << "Connection: close\r\n\r\n";
        out << body;
        return out.str();
    }
} // namespace signalnet
