#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "context_assembler.hpp"
#include "memory_manager.hpp"

namespace ctxengine {

// Framing: 4-byte uint32 big-endian length + JSON payload.
constexpr uint32_t MAX_MESSAGE_BYTES = 10 * 1024 * 1024;

// Reads one frame. Returns false on a clean end of input before the header.
bool read_message(int fd, std::string& payload);
void write_message(int fd, const std::string& msg);

struct HostConfig {
    std::string memory_file;     // export snapshot; empty disables persistence
    size_t max_memories = 1000;  // 0 = unbounded
    AssembleOptions assemble_defaults;
};

// Local message host: reads framed JSON requests from `in_fd`, writes
// framed responses to `out_fd`. Owns the session's MemoryManager.
class Host {
public:
    explicit Host(HostConfig config, int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO);

    // Main message loop. Blocks until end of input or shutdown.
    void run();

    // Parses, dispatches and catches; always returns a response body.
    std::string handle_request(const std::string& msg);

    nlohmann::json dispatch(const nlohmann::json& request);

    const MemoryManager& memory() const { return memory_; }

    // Signal handler sets this to trigger clean shutdown.
    static std::atomic<bool> shutdown_requested;

private:
    HostConfig config_;
    int in_fd_;
    int out_fd_;
    MemoryManager memory_;

    void load_memory_file();
    void save_memory_file() const;

    nlohmann::json handle_memory_add(const nlohmann::json& request);
    nlohmann::json handle_memory_remove(const nlohmann::json& request);
    nlohmann::json handle_memory_train();
    nlohmann::json handle_memory_search(const nlohmann::json& request);
    nlohmann::json handle_memory_find_similar(const nlohmann::json& request);
    nlohmann::json handle_memory_export();
    nlohmann::json handle_memory_import(const nlohmann::json& request);
    nlohmann::json handle_memory_clear();
    nlohmann::json handle_context_assemble(const nlohmann::json& request);
    nlohmann::json handle_context_outline(const nlohmann::json& request);
    nlohmann::json handle_semantic_filter(const nlohmann::json& request);
    nlohmann::json handle_pinned_notes(const nlohmann::json& request);

    nlohmann::json stats_response() const;
};

} // namespace ctxengine
