#include "host.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sys/select.h>

#include "document_structure.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "prompt_formatter.hpp"
#include "semantic_filter.hpp"

namespace ctxengine {

using nlohmann::json;

std::atomic<bool> Host::shutdown_requested{false};

namespace {

constexpr size_t DEFAULT_MAX_CONTEXT_CHARS = 3000;

void signal_handler(int) {
    Host::shutdown_requested.store(true);
}

// Reads exactly `len` bytes. Returns the count read before end of input.
size_t read_fully(int fd, void* buf, size_t len) {
    char* out = static_cast<char*>(buf);
    size_t total = 0;
    while (total < len) {
        ssize_t n = read(fd, out + total, len - total);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            throw std::runtime_error("Read failed: " + std::string(strerror(errno)));
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }
    return total;
}

void write_fully(int fd, const void* buf, size_t len) {
    const char* in = static_cast<const char*>(buf);
    size_t total = 0;
    while (total < len) {
        ssize_t n = write(fd, in + total, len - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw std::runtime_error("Write failed: " + std::string(strerror(errno)));
        }
        total += static_cast<size_t>(n);
    }
}

json error_response(const std::string& code, const std::string& message) {
    return {{"status", "error"}, {"code", code}, {"message", message}};
}

json ok_response() {
    return {{"status", "ok"}};
}

json options_field(const json& request, const char* key) {
    auto it = request.find(key);
    return it == request.end() ? json(nullptr) : *it;
}

std::vector<std::string> string_array(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) return {};
    if (!it->is_array()) {
        throw InvalidRequest(std::string("'") + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            throw InvalidRequest(std::string("'") + key + "' must be an array of strings");
        }
        out.push_back(v.get<std::string>());
    }
    return out;
}

} // namespace

bool read_message(int fd, std::string& payload) {
    // Read 4-byte length header (big-endian)
    uint8_t len_buf[4];
    size_t got = read_fully(fd, len_buf, 4);
    if (got == 0) {
        return false;
    }
    if (got < 4) {
        throw std::runtime_error("Failed to read message length");
    }

    uint32_t length = (static_cast<uint32_t>(len_buf[0]) << 24) |
                      (static_cast<uint32_t>(len_buf[1]) << 16) |
                      (static_cast<uint32_t>(len_buf[2]) << 8)  |
                      (static_cast<uint32_t>(len_buf[3]));

    if (length == 0 || length > MAX_MESSAGE_BYTES) {
        throw std::runtime_error("Invalid message length: " + std::to_string(length));
    }

    payload.assign(length, '\0');
    if (read_fully(fd, &payload[0], length) < length) {
        throw std::runtime_error("Failed to read message payload");
    }
    return true;
}

void write_message(int fd, const std::string& msg) {
    if (msg.size() > MAX_MESSAGE_BYTES) {
        throw std::runtime_error("Message too large: " + std::to_string(msg.size()));
    }
    uint32_t length = static_cast<uint32_t>(msg.size());
    uint8_t len_buf[4] = {
        static_cast<uint8_t>((length >> 24) & 0xFF),
        static_cast<uint8_t>((length >> 16) & 0xFF),
        static_cast<uint8_t>((length >> 8) & 0xFF),
        static_cast<uint8_t>(length & 0xFF)
    };

    write_fully(fd, len_buf, 4);
    write_fully(fd, msg.data(), msg.size());
}

Host::Host(HostConfig config, int in_fd, int out_fd)
    : config_(std::move(config)), in_fd_(in_fd), out_fd_(out_fd),
      memory_(config_.max_memories) {
    load_memory_file();
}

void Host::run() {
    // Install signal handler
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    std::cerr << "[ctxengine] Ready (" << memory_.stats().total_memories << " memories)" << std::endl;

    while (!shutdown_requested.load()) {
        // Use select with timeout so we can check shutdown flag
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(in_fd_, &fds);

        struct timeval tv;
        tv.tv_sec = 1;
        tv.tv_usec = 0;

        int ready = select(in_fd_ + 1, &fds, nullptr, nullptr, &tv);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[ctxengine] select failed: " << strerror(errno) << std::endl;
            break;
        }
        if (ready == 0) continue; // timeout, check shutdown flag

        // A broken frame leaves the stream unsynchronized, so it ends the session.
        try {
            std::string msg;
            if (!read_message(in_fd_, msg)) {
                break;
            }
            write_message(out_fd_, handle_request(msg));
        } catch (const std::exception& e) {
            std::cerr << "[ctxengine] Channel error: " << e.what() << std::endl;
            break;
        }
    }

    save_memory_file();
    std::cerr << "[ctxengine] Shutting down." << std::endl;
}

std::string Host::handle_request(const std::string& msg) {
    json response;
    try {
        response = dispatch(json::parse(msg));
    } catch (const json::parse_error& e) {
        response = error_response("parse_error", std::string("JSON parse error: ") + e.what());
    } catch (const NotFound& e) {
        response = error_response("not_found", e.what());
    } catch (const DimensionMismatch& e) {
        response = error_response("dimension_mismatch", e.what());
    } catch (const InvalidRequest& e) {
        response = error_response("invalid_request", e.what());
    } catch (const json::exception& e) {
        response = error_response("invalid_request", e.what());
    } catch (const std::exception& e) {
        std::cerr << "[ctxengine] Request failed: " << e.what() << std::endl;
        response = error_response("internal", e.what());
    }
    return response.dump();
}

json Host::dispatch(const json& request) {
    if (!request.is_object() || !request.contains("action") || !request["action"].is_string()) {
        return error_response("invalid_request", "Missing or invalid 'action' field");
    }

    const std::string& action = request["action"].get_ref<const std::string&>();

    if (action == "memory.add") {
        return handle_memory_add(request);
    } else if (action == "memory.remove") {
        return handle_memory_remove(request);
    } else if (action == "memory.train") {
        return handle_memory_train();
    } else if (action == "memory.search") {
        return handle_memory_search(request);
    } else if (action == "memory.find_similar") {
        return handle_memory_find_similar(request);
    } else if (action == "memory.export") {
        return handle_memory_export();
    } else if (action == "memory.import") {
        return handle_memory_import(request);
    } else if (action == "memory.stats") {
        return stats_response();
    } else if (action == "memory.clear") {
        return handle_memory_clear();
    } else if (action == "context.assemble") {
        return handle_context_assemble(request);
    } else if (action == "context.outline") {
        return handle_context_outline(request);
    } else if (action == "semantic_filter") {
        return handle_semantic_filter(request);
    } else if (action == "pinned_notes") {
        return handle_pinned_notes(request);
    } else {
        return error_response("invalid_request", "Unknown action: " + action);
    }
}

void Host::load_memory_file() {
    if (config_.memory_file.empty()) return;
    if (!std::filesystem::exists(config_.memory_file)) {
        std::cerr << "[ctxengine] No memory file at " << config_.memory_file << ", starting empty" << std::endl;
        return;
    }

    try {
        std::ifstream f(config_.memory_file);
        memory_.import_memories(json::parse(f).get<std::vector<MemoryItem>>());
        std::cerr << "[ctxengine] Loaded " << memory_.stats().total_memories
                  << " memories from " << config_.memory_file << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[ctxengine] Ignoring unreadable memory file " << config_.memory_file
                  << ": " << e.what() << std::endl;
        memory_.clear();
    }
}

void Host::save_memory_file() const {
    if (config_.memory_file.empty()) return;

    try {
        std::filesystem::path path(config_.memory_file);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream o(path);
        o << json(memory_.export_memories()).dump(2);
        if (!o) {
            throw std::runtime_error("write failed");
        }
    } catch (const std::exception& e) {
        std::cerr << "[ctxengine] Failed to save memory file " << config_.memory_file
                  << ": " << e.what() << std::endl;
    }
}

json Host::handle_memory_add(const json& request) {
    const std::string& id = require_string(request, "id");
    const std::string& text = require_string(request, "text");
    json metadata = request.value("metadata", json::object());
    if (!metadata.is_object() && !metadata.is_null()) {
        throw InvalidRequest("'metadata' must be an object");
    }

    memory_.add_memory(id, text, metadata);
    if (request.value("train", false)) {
        memory_.train();
    }
    save_memory_file();
    return stats_response();
}

json Host::handle_memory_remove(const json& request) {
    bool removed = memory_.remove_memory(require_string(request, "id"));
    if (removed) {
        save_memory_file();
    }
    json response = stats_response();
    response["removed"] = removed;
    return response;
}

json Host::handle_memory_train() {
    memory_.train();
    return stats_response();
}

json Host::handle_memory_search(const json& request) {
    const std::string& query = require_string(request, "query");
    auto options = options_field(request, "options").get<SearchOptions>();

    json response = ok_response();
    response["results"] = memory_.search(query, options);
    return response;
}

json Host::handle_memory_find_similar(const json& request) {
    const std::string& id = require_string(request, "id");
    auto options = options_field(request, "options").get<SearchOptions>();

    json response = ok_response();
    response["results"] = memory_.find_similar(id, options);
    return response;
}

json Host::handle_memory_export() {
    json response = ok_response();
    response["memories"] = memory_.export_memories();
    return response;
}

json Host::handle_memory_import(const json& request) {
    auto it = request.find("memories");
    if (it == request.end() || !it->is_array()) {
        throw InvalidRequest("'memories' is required and must be an array");
    }
    memory_.import_memories(it->get<std::vector<MemoryItem>>());
    save_memory_file();
    return stats_response();
}

json Host::handle_memory_clear() {
    memory_.clear();
    save_memory_file();
    return stats_response();
}

json Host::handle_context_assemble(const json& request) {
    const std::string& document = require_string(request, "document");

    AssembleOptions options = config_.assemble_defaults;
    from_json(options_field(request, "options"), options);
    auto format = options_field(request, "format").get<FormatOptions>();

    ContextBundle bundle;
    if (auto sel = request.find("selection"); sel != request.end()) {
        if (!sel->is_object()) {
            throw InvalidRequest("'selection' must be an object with start and end");
        }
        SelectionRange range{count_field(*sel, "start", 0), count_field(*sel, "end", 0)};
        bundle = assemble_context(document, range, options);
    } else {
        bundle = assemble_context(document, count_field(request, "cursor", document.size()), options);
    }

    // Pinned notes share what is left of the character budget.
    auto notes = string_array(request, "pinned_notes");
    std::vector<std::string> selected;
    if (!notes.empty()) {
        size_t max_chars = count_field(request, "max_context_chars", DEFAULT_MAX_CONTEXT_CHARS);
        size_t budget = max_chars > bundle.total_chars ? max_chars - bundle.total_chars : 0;
        std::string query = request.value("query", std::string()) + " " +
                            bundle.local_before + bundle.local_after;
        selected = select_pinned_notes(notes, query, pinned_note_options(), budget);
    }

    std::string prompt = format_pinned_notes(selected);
    if (!prompt.empty()) prompt += "\n";
    prompt += format_context_for_prompt(bundle, format);

    json response = ok_response();
    response["bundle"] = bundle;
    response["pinned_notes"] = selected;
    response["prompt"] = prompt;
    return response;
}

json Host::handle_context_outline(const json& request) {
    const std::string& document = require_string(request, "document");

    json response = ok_response();
    response["headings"] = extract_document_structure(document);
    return response;
}

json Host::handle_semantic_filter(const json& request) {
    const std::string& query = require_string(request, "query");
    SearchOptions options = semantic_filter_options();
    from_json(options_field(request, "options"), options);

    auto it = request.find("documents");
    if (it == request.end() || !it->is_array()) {
        throw InvalidRequest("'documents' is required and must be an array");
    }
    std::vector<FilterDocument> documents;
    for (const auto& doc : *it) {
        if (!doc.is_object()) {
            throw InvalidRequest("each document must be an object with id and text");
        }
        documents.push_back({require_string(doc, "id"), require_string(doc, "text"),
                             doc.value("metadata", json::object())});
    }

    json response = ok_response();
    response["results"] = semantic_filter(documents, query, options);
    return response;
}

json Host::handle_pinned_notes(const json& request) {
    const std::string& query = require_string(request, "query");
    SearchOptions options = pinned_note_options();
    from_json(options_field(request, "options"), options);
    size_t budget = count_field(request, "budget", std::numeric_limits<size_t>::max());

    json response = ok_response();
    response["notes"] = select_pinned_notes(string_array(request, "notes"), query, options, budget);
    return response;
}

json Host::stats_response() const {
    json response = ok_response();
    response["stats"] = memory_.stats();
    return response;
}

} // namespace ctxengine
