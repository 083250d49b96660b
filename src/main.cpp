#include <iostream>
#include <atomic>
#include <csignal>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <thread>
#include <optional>
#include <sstream>
#include <vector>
#include "SimulationOrchestrator.hpp"
#include "ControlHttpServer.hpp"
#include "NetworkConfigJson.hpp"
#include "SnapshotJson.hpp"
#include "db/Database.hpp"

#include <nlohmann/json.hpp>

namespace
{
    std::atomic<bool> g_keep_running{true};

    void handleSignal(int)
    {
        g_keep_running = false;
    }

    signalnet::ControlHttpServer::Response okResponse(nlohmann::json extra = nlohmann::json::object())
    {
        extra["ok"] = true;
        return {200, extra.dump()};
    }

    signalnet::ControlHttpServer::Response errorResponse(int status, const std::string &message)
    {
        return {status, signalnet::validationErrorsToJson({message})};
    }

    std::optional<std::string> param(const signalnet::ControlHttpServer::QueryParams &params, const std::string &key)
    {
        auto it = params.find(key);
        if (it == params.end() || it->second.empty())
        {
            return std::nullopt;
        }
        return it->second;
    }
}

int main()
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "=== signalnet traffic network controller ===" << std::endl;
    std::cout << std::endl;

    constexpr int kPort = 8080;
    uint32_t seed = 42;
    if (const char *seed_env = std::getenv("SIGNALNET_SEED"))
    {
        seed = static_cast<uint32_t>(std::strtoul(seed_env, nullptr, 10));
    }

    signalnet::db::Database database("signalnet.db");
    std::string db_error;
    if (!database.initialize(&db_error))
    {
        std::cerr << "Warning: failed to initialize config database: " << db_error << std::endl;
    }

    signalnet::NetworkConfig initial_config = signalnet::makeGrid2x2NetworkConfig();
    if (auto stored = database.loadActiveNetworkConfigJson(&db_error); stored.has_value())
    {
        signalnet::ConfigParseResult parsed = signalnet::networkConfigFromJson(*stored);
        if (parsed.ok)
        {
            initial_config = parsed.config;
        }
        else
        {
            std::cerr << "Warning: stored network config is invalid, using grid-2x2" << std::endl;
            for (const auto &error : parsed.errors)
            {
                std::cerr << "  " << error << std::endl;
            }
        }
    }
    else if (!db_error.empty())
    {
        std::cerr << "Warning: failed to load config from database: " << db_error << std::endl;
    }
    else if (!database.saveActiveNetworkConfigJson(signalnet::networkConfigToJson(initial_config), &db_error))
    {
        std::cerr << "Warning: failed to store default config: " << db_error << std::endl;
    }

    std::cout << "Network layout: " << initial_config.layout << " (" << initial_config.intersections.size()
              << " intersections, " << initial_config.roads.size() << " roads), seed " << seed << std::endl;

    auto orchestrator = std::make_unique<signalnet::SimulationOrchestrator>(initial_config, seed);
    std::mutex engine_mutex;
    std::atomic<bool> app_running{true};
    std::optional<signalnet::NetworkConfig> pending_config;

    auto applyPendingConfigIfNeeded = [&]()
    {
        if (!pending_config.has_value())
        {
            return;
        }
        const double speed = orchestrator->getSpeed();
        orchestrator = std::make_unique<signalnet::SimulationOrchestrator>(*pending_config, seed);
        if (!orchestrator->setSpeed(speed))
        {
            std::cerr << "Warning: could not carry speed " << speed << " over to the new network" << std::endl;
        }
        pending_config.reset();
        std::cout << "Applied pending network config" << std::endl;
    };

    signalnet::ControlHttpServer server(
        kPort,
        [&]()
        {
            std::lock_guard<std::mutex> lock(engine_mutex);
            return orchestrator->getSnapshotJson();
        },
        [&](const signalnet::ControlHttpServer::QueryParams &params)
        {
            std::lock_guard<std::mutex> lock(engine_mutex);
            using Command = signalnet::SimulationOrchestrator::Command;

            const std::string cmd = param(params, "cmd").value_or("");
            if (cmd == "start")
            {
                if (!orchestrator->isRunning())
                {
                    applyPendingConfigIfNeeded();
                }
                orchestrator->handleCommand(Command::Start);
                return okResponse();
            }
            if (cmd == "stop")
            {
                orchestrator->handleCommand(Command::Stop);
                return okResponse();
            }
            if (cmd == "reset")
            {
                applyPendingConfigIfNeeded();
                orchestrator->handleCommand(Command::Reset);
                return okResponse();
            }
            if (cmd == "step")
            {
                orchestrator->handleCommand(Command::Step);
                return okResponse({{"tick", orchestrator->getState().tick}});
            }
            if (cmd == "spawn")
            {
                auto id = orchestrator->spawnVehicle(param(params, "from"), param(params, "to"));
                if (!id.has_value())
                {
                    return errorResponse(400, "could not spawn a vehicle between the given intersections");
                }
                return okResponse({{"vehicle_id", *id}});
            }
            if (cmd == "speed")
            {
                double value = 0.0;
                std::istringstream in(param(params, "value").value_or(""));
                if (!(in >> value) || !orchestrator->setSpeed(value))
                {
                    return errorResponse(400, "speed must be a positive number");
                }
                std::cout << "Speed set to " << value << "x (" << orchestrator->getTickIntervalMs() << " ms/tick)" << std::endl;
                return okResponse({{"speed", value}});
            }
            return errorResponse(400, "unknown command: " + cmd);
        },
        [&]()
        {
            std::lock_guard<std::mutex> lock(engine_mutex);
            if (pending_config.has_value())
            {
                return signalnet::networkConfigToJson(*pending_config);
            }
            return signalnet::networkConfigToJson(orchestrator->getConfig());
        },
        [&](const std::string &body)
        {
            std::lock_guard<std::mutex> lock(engine_mutex);

            signalnet::ConfigParseResult parsed = signalnet::networkConfigFromJson(body);
            if (!parsed.ok)
            {
                return signalnet::ControlHttpServer::Response{400, signalnet::validationErrorsToJson(parsed.errors)};
            }

            const std::string normalized_json = signalnet::networkConfigToJson(parsed.config);
            std::string error;
            if (!database.saveActiveNetworkConfigJson(normalized_json, &error))
            {
                return signalnet::ControlHttpServer::Response{500, signalnet::validationErrorsToJson({"database error: " + error})};
            }

            pending_config = parsed.config;
            return signalnet::ControlHttpServer::Response{200, "{\"ok\":true,\"state\":\"pending\",\"apply_on\":\"start_or_reset\"}"};
        },
        [&](const signalnet::ControlHttpServer::QueryParams &params)
        {
            std::lock_guard<std::mutex> lock(engine_mutex);

            long long limit = 50;
            if (auto text = param(params, "limit"))
            {
                std::istringstream in(*text);
                if (!(in >> limit) || limit < 0)
                {
                    return errorResponse(400, "limit must be a non-negative integer");
                }
            }
            return signalnet::ControlHttpServer::Response{
                200, signalnet::eventsToJson(orchestrator->getState(), static_cast<std::size_t>(limit))};
        },
        [&](const std::string &body)
        {
            std::lock_guard<std::mutex> lock(engine_mutex);

            nlohmann::json root = nlohmann::json::parse(body, nullptr, false);
            if (root.is_discarded() || !root.is_object() || !root.contains("message") || !root["message"].is_string())
            {
                return errorResponse(400, "event needs a string message");
            }

            signalnet::EventLevel level = signalnet::EventLevel::Info;
            if (root.contains("level") &&
                (!root["level"].is_string() || !signalnet::eventLevelFromString(root["level"].get<std::string>(), level)))
            {
                return errorResponse(400, "level must be one of DEBUG, INFO, WARN, ERROR");
            }
            if (!orchestrator->recordEvent(level, root["message"].get<std::string>()))
            {
                return errorResponse(400, "event needs a string message");
            }
            return okResponse({{"event_id", orchestrator->getState().events.front().id}});
        });

    if (!server.start())
    {
        std::cerr << "Failed to start control server on port " << kPort << std::endl;
        return 1;
    }

    std::thread sim_thread([&]()
                           {
        while (app_running)
        {
            double interval_ms = 100.0;
            {
                std::lock_guard<std::mutex> lock(engine_mutex);
                orchestrator->tick();
                interval_ms = orchestrator->getTickIntervalMs();
            }
            std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(interval_ms));
        } });

    std::cout << "Snapshot at: http://localhost:" << kPort << "/snapshot" << std::endl;
    std::cout << "Start with:  http://localhost:" << kPort << "/command?cmd=start" << std::endl;
    std::cout << "Press Ctrl+C to stop server..." << std::endl;

    while (g_keep_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    app_running = false;
    if (sim_thread.joinable())
    {
        sim_thread.join();
    }
    server.stop();

    std::cout << "Control server stopped." << std::endl;
    return 0;
}
