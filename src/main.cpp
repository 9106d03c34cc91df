/*
 * engram C++11 - Command Line Interface
 *
 * Runs one memory operation against the configured store and prints
 * the JSON result.
 *
 * Usage:
 *   ./engram-cli [-c config.json] <operation> [json-params]
 */

#include <engram/core/logger.hpp>
#include <engram/core/config.hpp>
#include <engram/core/json.hpp>
#include <engram/tools/memory/memory.hpp>

#include <iostream>
#include <iterator>
#include <cstring>
#include <curl/curl.h>

namespace engram {

static const char* APP_VERSION = "0.3.0";
static const char* APP_NAME = "engram";

enum ExitCode {
    EXIT_OK = 0,
    EXIT_OPERATION_FAILED = 1,
    EXIT_USAGE = 2
};

void print_usage(const char* prog) {
    std::cout << APP_NAME << " - associative long-term memory\n\n"
              << "Usage: " << prog << " [options] <operation> [json-params]\n"
              << "       " << prog << " list\n\n"
              << "Options:\n"
              << "  -c, --config FILE  Load configuration from FILE\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version\n\n"
              << "Parameters are a JSON object; pass - to read it from stdin.\n\n"
              << "Config file format (JSON):\n"
              << "  {\n"
              << "    \"db_path\": \"~/.engram/memory.db\",\n"
              << "    \"log_level\": \"info\",\n"
              << "    \"embedding\": { \"provider\": \"hashing\", \"dimension\": 256 },\n"
              << "    \"recall\": { \"max_branches\": 3, \"max_depth\": 3, \"temperature\": 0.7 }\n"
              << "  }\n\n"
              << "Example:\n"
              << "  " << prog << " remember '{\"content\": \"Sunset over the bay\", \"emotion\": \"moved\"}'\n"
              << "  " << prog << " recall_divergent '{\"context\": \"evening light\"}'\n";
}

void print_version() {
    std::cout << APP_NAME << " v" << APP_VERSION << "\n";
}

void print_operations() {
    std::vector<std::string> names = MemoryTool::tool_names();
    for (size_t i = 0; i < names.size(); ++i) {
        std::cout << "  " << names[i];
        if (names[i].size() < 30) {
            std::cout << std::string(30 - names[i].size(), ' ');
        }
        std::cout << MemoryTool::describe(names[i]) << "\n";
    }
}

int run(int argc, char* argv[]) {
    const char* config_file = NULL;
    std::vector<std::string> positional;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return EXIT_OK;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return EXIT_OK;
        }
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << argv[i] << "\n";
                return EXIT_USAGE;
            }
            config_file = argv[++i];
            continue;
        }
        positional.push_back(argv[i]);
    }

    if (positional.empty() || positional.size() > 2) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    const std::string& operation = positional[0];
    if (operation == "list") {
        print_operations();
        return EXIT_OK;
    }

    Config config;
    if (config_file) {
        if (!config.load_file(config_file)) {
            std::cerr << "Failed to load config from " << config_file << ": "
                      << config.last_error() << "\n";
            return EXIT_USAGE;
        }
    }

    // Configure logging from config
    Logger::instance().set_level(Logger::parse_level(config.get_string("log_level", "info")));
    if (config_file) {
        LOG_DEBUG("Loaded config from %s", config_file);
    }

    Json params = Json::object();
    if (positional.size() == 2) {
        std::string text = positional[1];
        if (text == "-") {
            text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
        try {
            params = Json::parse(text);
        } catch (const std::exception& e) {
            std::cerr << "Invalid JSON parameters: " << e.what() << "\n";
            return EXIT_USAGE;
        }
        if (!params.is_object()) {
            std::cerr << "Parameters must be a JSON object\n";
            return EXIT_USAGE;
        }
    }

    MemoryTool tool;
    if (!tool.init(config)) {
        std::cerr << "Failed to open memory store: " << tool.last_error() << "\n";
        return EXIT_USAGE;
    }

    Json result = tool.execute(operation, params);
    std::cout << result.dump(2) << std::endl;

    tool.shutdown();
    return result.get_bool("success", false) ? EXIT_OK : EXIT_OPERATION_FAILED;
}

} // namespace engram

int main(int argc, char* argv[]) {
    // Initialize libcurl globally (must be done before any threads start)
    curl_global_init(CURL_GLOBAL_ALL);

    int result = engram::run(argc, argv);

    curl_global_cleanup();
    return result;
}
