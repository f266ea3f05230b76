#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "platform.hpp"

using json = nlohmann::json;

namespace {
    void print_usage() {
        std::cerr << "Usage: incidex [--socket NAME] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  ping                              - Test connection\n";
        std::cerr << "  ingest <source> [file|url]        - Load incidents from a file or web page\n";
        std::cerr << "  search <query> [top_k] [key=value...] - Find similar incidents\n";
        std::cerr << "  stats                             - Show collection statistics\n";
        std::cerr << "  layout [--no-cache]               - Print the project layout\n";
        std::cerr << "  clear                             - Delete every stored incident\n";
    }

    // Throws std::invalid_argument (or std::out_of_range from stoi) on malformed arguments.
    json build_request(const std::string& command, const std::vector<std::string>& args) {
        json params = json::object();
        if (command == "ingest") {
            if (args.empty()) throw std::invalid_argument("ingest requires a source");
            params["source"] = args[0];
            if (args.size() > 1) params["source_type"] = args[1];
        } else if (command == "search") {
            if (args.empty()) throw std::invalid_argument("search requires a query");
            params["query"] = args[0];
            json filters = json::object();
            for (size_t i = 1; i < args.size(); ++i) {
                auto eq = args[i].find('=');
                if (eq != std::string::npos) {
                    filters[args[i].substr(0, eq)] = args[i].substr(eq + 1);
                } else {
                    params["top_k"] = std::stoi(args[i]);
                }
            }
            if (!filters.empty()) params["filters"] = filters;
        } else if (command == "layout") {
            params["use_cache"] = !(args.size() > 0 && args[0] == "--no-cache");
        }
        return {{"method", command}, {"params", params}};
    }
}

int main(int argc, char* argv[]) {
    std::string socket_name = "incidex.sock";
    int first = 1;
    if (argc > 2 && std::string(argv[1]) == "--socket") {
        socket_name = argv[2];
        first = 3;
    }

    if (argc <= first) {
        print_usage();
        return 1;
    }

    std::string command = argv[first];
    std::vector<std::string> args;
    for (int i = first + 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    json request;
    try {
        request = build_request(command, args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage();
        return 1;
    }

    auto client = incidex::platform::Client::create();
    if (!client) {
        std::cerr << "Error: Failed to create client platform interface.\n";
        return 1;
    }

    if (!client->connect(socket_name)) {
        std::cerr << "Error: Could not connect to incidexd daemon. Is it running?\n";
        return 1;
    }

    std::string response = client->send(request.dump());
    if (response.empty()) {
        std::cerr << "Error: No response from daemon.\n";
        return 1;
    }

    auto parsed = json::parse(response, nullptr, false);
    if (parsed.is_discarded()) {
        std::cout << response << "\n";
        return 1;
    }
    std::cout << parsed.dump(2) << "\n";
    return parsed.contains("error") ? 1 : 0;
}
