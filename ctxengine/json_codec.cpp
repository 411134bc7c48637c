#include "json_codec.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

#include "errors.hpp"

namespace ctxengine {

using nlohmann::json;

namespace {

void require_object(const json& j, const char* what) {
    if (!j.is_object()) {
        throw InvalidRequest(std::string(what) + " must be a JSON object");
    }
}

float get_real(const json& j, const char* key, float def) {
    auto it = j.find(key);
    if (it == j.end()) return def;
    if (!it->is_number()) {
        throw InvalidRequest(std::string("'") + key + "' must be a number");
    }
    return it->get<float>();
}

bool get_flag(const json& j, const char* key, bool def) {
    auto it = j.find(key);
    if (it == j.end()) return def;
    if (!it->is_boolean()) {
        throw InvalidRequest(std::string("'") + key + "' must be a boolean");
    }
    return it->get<bool>();
}

json optional_string(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

} // namespace

size_t count_field(const json& j, const char* key, size_t def) {
    auto it = j.find(key);
    if (it == j.end()) return def;
    // Parsed text stores non-negative integers as unsigned, in-process
    // values as signed.
    if (!it->is_number_integer() ||
        (!it->is_number_unsigned() && it->get<int64_t>() < 0)) {
        throw InvalidRequest(std::string("'") + key + "' must be a non-negative integer");
    }
    return it->get<size_t>();
}

const std::string& require_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw InvalidRequest(std::string("'") + key + "' is required and must be a string");
    }
    return it->get_ref<const std::string&>();
}

void to_json(json& j, const MemoryItem& item) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        item.created_at.time_since_epoch()).count();
    j = {
        {"id", item.id},
        {"text", item.text},
        {"vector", item.vector},
        {"metadata", item.metadata},
        {"created_at", millis}
    };
}

void from_json(const json& j, MemoryItem& item) {
    require_object(j, "memory item");
    item.id = require_string(j, "id");
    item.text = require_string(j, "text");

    item.vector.clear();
    if (auto it = j.find("vector"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw InvalidRequest("'vector' must be an array of numbers");
        }
        for (const auto& v : *it) {
            if (!v.is_number()) {
                throw InvalidRequest("'vector' must be an array of numbers");
            }
            item.vector.push_back(v.get<float>());
        }
    }

    item.metadata = j.value("metadata", json::object());
    if (item.metadata.is_null()) {
        item.metadata = json::object();
    }

    if (auto it = j.find("created_at"); it != j.end()) {
        if (!it->is_number_integer()) {
            throw InvalidRequest("'created_at' must be an integer (epoch milliseconds)");
        }
        item.created_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(it->get<int64_t>()));
    } else {
        item.created_at = std::chrono::system_clock::now();
    }
}

void to_json(json& j, const ScoredResult& result) {
    j = {
        {"id", result.id},
        {"text", result.text},
        {"score", result.score},
        {"metadata", result.metadata}
    };
}

void to_json(json& j, const MemoryStats& stats) {
    j = {
        {"total_memories", stats.total_memories},
        {"vocabulary_size", stats.vocabulary_size}
    };
}

void to_json(json& j, const RelatedSection& section) {
    j = {
        {"text", section.text},
        {"score", section.score},
        {"start_offset", section.start_offset},
        {"end_offset", section.end_offset},
        {"heading", optional_string(section.heading)}
    };
}

void to_json(json& j, const ContextBundle& bundle) {
    j = {
        {"local_before", bundle.local_before},
        {"local_after", bundle.local_after},
        {"related_sections", bundle.related_sections},
        {"nearest_heading", optional_string(bundle.nearest_heading)},
        {"section_count", bundle.section_count},
        {"total_chars", bundle.total_chars}
    };
}

void from_json(const json& j, SearchOptions& options) {
    if (j.is_null()) return;
    require_object(j, "search options");

    options.top_k = count_field(j, "top_k", options.top_k);
    options.min_semantic_score = get_real(j, "min_semantic_score", options.min_semantic_score);
    options.enable_jaccard_filter = get_flag(j, "enable_jaccard_filter", options.enable_jaccard_filter);
    options.max_jaccard_score = get_real(j, "max_jaccard_score", options.max_jaccard_score);
}

void from_json(const json& j, AssembleOptions& options) {
    if (j.is_null()) return;
    require_object(j, "assemble options");

    options.local_window = count_field(j, "local_window", options.local_window);
    options.max_related_sections = count_field(j, "max_related_sections", options.max_related_sections);
    options.max_section_length = count_field(j, "max_section_length", options.max_section_length);
    options.enable_relevance_scoring = get_flag(j, "enable_relevance_scoring", options.enable_relevance_scoring);
    options.enable_deduplication = get_flag(j, "enable_deduplication", options.enable_deduplication);
    options.fingerprint_length = count_field(j, "fingerprint_length", options.fingerprint_length);
}

void from_json(const json& j, FormatOptions& options) {
    if (j.is_null()) return;
    require_object(j, "format options");

    options.include_related = get_flag(j, "include_related", options.include_related);
    options.include_heading = get_flag(j, "include_heading", options.include_heading);
}

} // namespace ctxengine
