#include "qlink/load/LoadInterface.hpp"
#include "qlink/log/Log.hpp"
#include "qlink/protocol/CommandSession.hpp"

#include "CLI/CLI11.hpp"

#include <charconv>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

using namespace qlink;

namespace {

// Contractor numbers are usually numeric; anything else goes out as a string.
protocol::Param toParam(const std::string& id) {
    long long number = 0;
    const auto* end = id.data() + id.size();
    auto [ptr, ec] = std::from_chars(id.data(), end, number);
    if (!id.empty() && ec == std::errc{} && ptr == end) {
        return protocol::Param(number);
    }
    return protocol::Param(id);
}

std::chrono::milliseconds seconds(double value) {
    return std::chrono::milliseconds{static_cast<long long>(value * 1000.0)};
}

int report(const Error& error) {
    std::cerr << "error: " << error.describe() << "\n";
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"Host command client for lighting controllers"};
    app.require_subcommand(1);

    std::string host;
    int port = protocol::config::DEFAULT_PORT;
    double connectTimeout = 30.0;
    double readTimeout = 60.0;
    bool verbose = false;

    app.add_option("--host", host, "Controller hostname or IP address")->required();
    app.add_option("--port", port, "Host command port")
        ->capture_default_str()->check(CLI::Range(1, 65535));
    app.add_option("--connect-timeout", connectTimeout, "Connect timeout (s)")->capture_default_str();
    app.add_option("--read-timeout", readTimeout, "Reply timeout (s)")->capture_default_str();
    app.add_flag("-v,--verbose", verbose, "Log every line sent and received");

    std::string id;
    int level = 0;
    double fade = 0.0;
    std::optional<double> transition;
    std::optional<int> onLevel;
    std::string rawLine;
    std::size_t dataLines = 0;

    auto* get = app.add_subcommand("get", "Print the level of a load");
    get->add_option("id", id, "Contractor number")->required();

    auto* set = app.add_subcommand("set", "Set a load to a level immediately");
    set->add_option("id", id, "Contractor number")->required();
    set->add_option("level", level, "Level 0-100")->required();

    auto* ramp = app.add_subcommand("ramp", "Fade a load to a level");
    ramp->add_option("id", id, "Contractor number")->required();
    ramp->add_option("level", level, "Level 0-100")->required();
    ramp->add_option("seconds", fade, "Fade time (s)")->required();

    auto* on = app.add_subcommand("on", "Turn a load on");
    on->add_option("id", id, "Contractor number")->required();
    on->add_option("--transition", transition, "Fade time (s)");
    on->add_option("--level", onLevel, "Level 0-100 (default 100)");

    auto* off = app.add_subcommand("off", "Turn a load off");
    off->add_option("id", id, "Contractor number")->required();
    off->add_option("--transition", transition, "Fade time (s)");

    auto* raw = app.add_subcommand("raw", "Send a request line and print the reply lines");
    raw->add_option("line", rawLine, "Request, e.g. \"VGL 12\"")->required();
    raw->add_option("--data-lines", dataLines, "Data lines expected before the terminal line");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        setDebugLogHandler([](std::string_view message) { std::cerr << message; });
    }
    // Keep stdout for results only.
    setInfoLogHandler([verbose](std::string_view message) {
        if (verbose) std::cerr << message;
    });

    protocol::SessionOptions options;
    options.host = host;
    options.port = static_cast<unsigned short>(port);
    options.connectTimeout = seconds(connectTimeout);
    options.readTimeout = seconds(readTimeout);

    protocol::CommandSession session(options);
    load::LoadInterface loads(session);

    if (*get) {
        auto current = loads.getLevel(toParam(id));
        if (!current) return report(current.error());
        std::cout << *current << "\n";
        return 0;
    }

    if (*raw) {
        auto lines = session.rawRequest(rawLine, dataLines);
        if (!lines) return report(lines.error());
        for (const auto& line : *lines) {
            std::cout << line << "\n";
        }
        return 0;
    }

    Result<void> done;
    if (*set) {
        done = loads.setLevel(toParam(id), level);
    } else if (*ramp) {
        done = loads.ramp(toParam(id), level, fade);
    } else if (*on) {
        done = loads.turnOn(toParam(id), transition, onLevel);
    } else {
        done = loads.turnOff(toParam(id), transition);
    }
    if (!done) return report(done.error());
    return 0;
}
