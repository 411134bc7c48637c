#pragma once

#include <nlohmann/json.hpp>

#include "context_assembler.hpp"
#include "memory_manager.hpp"
#include "prompt_formatter.hpp"

namespace ctxengine {

// Snapshots. from_json(MemoryItem) requires "id" and "text"; a missing
// "created_at" (epoch milliseconds) means now.
void to_json(nlohmann::json& j, const MemoryItem& item);
void from_json(const nlohmann::json& j, MemoryItem& item);

void to_json(nlohmann::json& j, const ScoredResult& result);
void to_json(nlohmann::json& j, const MemoryStats& stats);
void to_json(nlohmann::json& j, const RelatedSection& section);
void to_json(nlohmann::json& j, const ContextBundle& bundle);

// Options: absent keys (or a null object) leave the current values of
// `options` untouched, so callers can preload their own defaults.
// Wrong types throw InvalidRequest.
void from_json(const nlohmann::json& j, SearchOptions& options);
void from_json(const nlohmann::json& j, AssembleOptions& options);
void from_json(const nlohmann::json& j, FormatOptions& options);

// Non-negative integer field, signed or unsigned; `def` when absent.
size_t count_field(const nlohmann::json& j, const char* key, size_t def);

// Required string field of a request object.
const std::string& require_string(const nlohmann::json& j, const char* key);

} // namespace ctxengine
