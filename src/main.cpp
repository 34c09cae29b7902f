#include <map>
#include <string>
#include <iostream>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "session.hpp"
#include "tool/debug_tool.hpp"

int main(int argc, char* argv[]) {
    CLI::App app{ "DBGp debugger client" };

    ClientConfig config{};
    app.add_option("-p,--port", config.port, "Port the DBGp listener binds on 127.0.0.1");

    spdlog::level::level_enum level = spdlog::level::info;
    std::map<std::string, spdlog::level::level_enum> levels{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off} };
    app.add_option("-l,--loglevel", level, "Log level")->transform(CLI::CheckedTransformer(levels, CLI::ignore_case));

    app.add_option("-q,--queue-size", config.error_queue_size, "Maximum number of queued errors")->check(CLI::PositiveNumber);
    app.add_option("-r,--radius", config.context_radius, "Source lines shown around an error")->check(CLI::NonNegativeNumber);
    app.add_option("--max-port-attempts", config.max_port_attempts, "Ports tried when the requested one is in use")->check(CLI::PositiveNumber);

    bool start_listener = false;
    app.add_flag("-s,--start", start_listener, "Start listening immediately");

    CLI11_PARSE(app, argc, argv);

    // stdout carries tool responses
    spdlog::set_default_logger(spdlog::stderr_color_mt("dbgpc"));
    spdlog::set_level(level);

    Session session(config);
    DebugTool tool(session);

    if (start_listener) {
        auto result = tool.Execute({ {"action", "start"} });
        if (result.is_error) {
            spdlog::error("{}", result.text);
            return 1;
        }
        spdlog::info("{}", result.text);
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }

        auto request = nlohmann::json::parse(line, nullptr, false);
        if (request.is_discarded()) {
            std::cout << nlohmann::json{ {"text", "Error: invalid JSON request"}, {"isError", true} }.dump() << std::endl;
            continue;
        }

        if (request.is_object() && request.contains("action") && request["action"] == "quit") {
            break;
        }

        auto result = tool.Execute(request);
        std::cout << nlohmann::json{ {"text", result.text}, {"isError", result.is_error} }.dump() << std::endl;
    }

    session.Reset();
    return 0;
}
