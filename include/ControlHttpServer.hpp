#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <thread>

namespace signalnet
{
    // Minimal blocking HTTP/1.1 endpoint: one accept thread, one request per
    // connection. Routes:
    //   GET  /snapshot                      -> snapshot provider
    //   GET  /command?cmd=...&from=&to=&value= -> command handler
    //   GET  /config/api                    -> config provider
    //   POST /config/api                    -> config mutation handler
    //   GET  /events?limit=N                -> events handler
    //   POST /events                        -> event post handler
    class ControlHttpServer
    {
    public:
        struct Response
        {
            int status_code = 200;
            std::string body;
        };

        using QueryParams = std::map<std::string, std::string>;

        using SnapshotProvider = std::function<std::string()>;
        using CommandHandler = std::function<Response(const QueryParams &)>;
        using ConfigProvider = std::function<std::string()>;
        using ConfigMutationHandler = std::function<Response(const std::string &)>;
        using EventsHandler = std::function<Response(const QueryParams &)>;
        using EventPostHandler = std::function<Response(const std::string &)>;

        ControlHttpServer(int port,
                          SnapshotProvider snapshot_provider,
                          CommandHandler command_handler,
                          ConfigProvider config_provider,
                          ConfigMutationHandler config_mutation_handler,
                          EventsHandler events_handler,
                          EventPostHandler event_post_handler);
        ~ControlHttpServer();

        bool start();
        void stop();

        static QueryParams parseQuery(const std::string &path);

    private:
        void acceptLoop();
        void handleClient(int client_fd);
        void sendResponse(int client_fd, int status_code, const std::string &content_type, const std::string &body) const;
        std::string buildHttpResponse(const std::string &status,
                                      const std::string &content_type,
                                      const std::string &body) const;

        int port;
        int server_fd;
        std::atomic<bool> running;
        std::thread accept_thread;
        SnapshotProvider snapshot_provider;
        CommandHandler command_handler;
        ConfigProvider config_provider;
        ConfigMutationHandler config_mutation_handler;
        EventsHandler events_handler;
        EventPostHandler event_post_handler;
    };
} // namespace signalnet
