// cpamm-replay
//
// Feeds a JSON-lines stream of pool messages through a PoolRouter and prints
// one JSON response per line.
//
//   { "op": 630424929, "sender": "<hex>", "gas": 20000000, "body": {...} }
//   { "get": "get_reserves", "args": {} }

#include "cpamm/config.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/logging.hpp"
#include "cpamm/pool.hpp"
#include "cpamm/router.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string input_path;     // Empty = stdin
    std::string log_level;      // Empty = take it from the config
    bool dump_state = false;
    bool pretty = false;
};

void print_usage(const char* prog) {
    std::cout << "cpamm pool message replay\n\n"
              << "Usage: " << prog << " -c <config.json> [options] [messages.jsonl]\n\n"
              << "Options:\n"
              << "  -c, --config <path>     Pool configuration (JSON)\n"
              << "  -l, --log-level <lvl>   trace|debug|info|warn|error|off\n"
              << "  -d, --dump              Print get_pool_data after the last message\n"
              << "  -p, --pretty            Indent responses\n"
              << "  -h, --help              Show this help message\n\n"
              << "Messages are read from stdin when no file is given.\n\n"
              << "Examples:\n"
              << "  " << prog << " -c pool.json session.jsonl\n"
              << "  " << prog << " -c pool.json -l off -d < session.jsonl\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level\n";
                std::exit(1);
            }
            options.log_level = argv[++i];
        } else if (arg == "-d" || arg == "--dump") {
            options.dump_state = true;
        } else if (arg == "-p" || arg == "--pretty") {
            options.pretty = true;
        } else if (arg[0] != '-' && options.input_path.empty()) {
            options.input_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.config_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return options;
}

//------------------------------------------------------------------------------
// Replay
//------------------------------------------------------------------------------

json dispatch(cpamm::PoolRouter& router, const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        return cpamm::codec::error_to_json(
            cpamm::PoolError(cpamm::ErrorCode::INVALID_PAYLOAD, e.what()));
    }

    if (message.is_object() && message.contains("get")) {
        if (!message["get"].is_string()) {
            return cpamm::codec::error_to_json(
                cpamm::PoolError(cpamm::ErrorCode::INVALID_PAYLOAD, "'get' must be a string"));
        }
        json args = message.value("args", json::object());
        return router.get(message["get"].get<std::string>(), args);
    }
    return router.call(message);
}

int run(const Options& options, std::istream& in) {
    cpamm::PoolConfig config = cpamm::PoolConfig::from_file(options.config_path);
    cpamm::logging::setup(options.log_level.empty() ? config.log_level : options.log_level);

    cpamm::PoolController pool(config);
    cpamm::PoolRouter router(pool);
    int indent = options.pretty ? 2 : -1;

    size_t failures = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == '#') continue;

        json response = dispatch(router, line);
        if (!response.value("ok", false)) ++failures;
        std::cout << response.dump(indent) << "\n";
    }

    if (options.dump_state) {
        std::cout << router.get("get_pool_data").dump(indent) << "\n";
    }

    cpamm::logging::get()->info("replay finished: {} rejected", failures);
    return 0;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        if (options.input_path.empty()) {
            return run(options, std::cin);
        }

        std::ifstream file(options.input_path);
        if (!file.is_open()) {
            std::cerr << "Cannot open " << options.input_path << "\n";
            return 1;
        }
        return run(options, file);
    } catch (const cpamm::PoolError& e) {
        std::cerr << "Pool setup failed: " << cpamm::to_string(e.code()) << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
