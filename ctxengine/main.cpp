#include "host.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void usage() {
    std::cerr << "Usage: ctxengine_host [--memory-file PATH] [--max-memories N]\n"
                 "                      [--local-window N] [--max-related N] [--max-section-length N]\n"
                 "Reads length-prefixed JSON requests on stdin, writes responses on stdout.\n"
                 "CTXENGINE_MEMORY_FILE sets the memory file when --memory-file is not given."
              << std::endl;
}

size_t parse_count(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    unsigned long long n = std::stoull(value, &pos);
    if (pos != value.size() || value[0] == '-') {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
    }
    return static_cast<size_t>(n);
}

} // namespace

int main(int argc, char* argv[]) {
    ctxengine::HostConfig config;
    if (const char* env_file = std::getenv("CTXENGINE_MEMORY_FILE")) {
        config.memory_file = env_file;
    }

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                usage();
                return 0;
            } else if (arg == "--memory-file" && i + 1 < argc) {
                config.memory_file = argv[++i];
            } else if (arg == "--max-memories" && i + 1 < argc) {
                config.max_memories = parse_count(arg, argv[++i]);
            } else if (arg == "--local-window" && i + 1 < argc) {
                config.assemble_defaults.local_window = parse_count(arg, argv[++i]);
            } else if (arg == "--max-related" && i + 1 < argc) {
                config.assemble_defaults.max_related_sections = parse_count(arg, argv[++i]);
            } else if (arg == "--max-section-length" && i + 1 < argc) {
                config.assemble_defaults.max_section_length = parse_count(arg, argv[++i]);
            } else {
                usage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ctxengine] " << e.what() << std::endl;
        usage();
        return 1;
    }

    std::cerr << "[ctxengine] memory file: "
              << (config.memory_file.empty() ? "(none)" : config.memory_file)
              << ", max memories: " << config.max_memories
              << ", local window: " << config.assemble_defaults.local_window << std::endl;

    try {
        ctxengine::Host host(config);
        host.run();
    } catch (const std::exception& e) {
        std::cerr << "[ctxengine] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
