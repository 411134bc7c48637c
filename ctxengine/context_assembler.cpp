#include "context_assembler.hpp"

#include <algorithm>
#include <cctype>

#include "document_structure.hpp"
#include "embedder.hpp"
#include "similarity.hpp"
#include "text_util.hpp"

namespace ctxengine {

namespace {

// Parts of `sections` outside [window_begin, window_end).
std::vector<Section> outside_window(const std::vector<Section>& sections,
                                    const std::string& document,
                                    size_t window_begin, size_t window_end) {
    std::vector<Section> out;
    auto add_piece = [&](const Section& s, size_t begin, size_t end) {
        std::string piece = document.substr(begin, end - begin);
        std::string text = trim(piece);
        if (text.empty()) return;
        size_t lead = piece.find(text);
        out.push_back({text, begin + lead, begin + lead + text.size(), s.nearest_heading});
    };

    for (const auto& s : sections) {
        if (s.end_offset <= window_begin || s.start_offset >= window_end) {
            out.push_back(s);
            continue;
        }
        if (s.start_offset < window_begin) {
            add_piece(s, s.start_offset, window_begin);
        }
        if (s.end_offset > window_end) {
            add_piece(s, window_end, s.end_offset);
        }
    }
    return out;
}

// Splits after runs of '.', '!' or '?' that are followed by whitespace or the end.
std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '.' || c == '!' || c == '?') {
            size_t j = i;
            while (j < text.size() && (text[j] == '.' || text[j] == '!' || text[j] == '?')) ++j;
            if (j == text.size() || std::isspace(static_cast<unsigned char>(text[j]))) {
                std::string sentence = trim(text.substr(start, j - start));
                if (!sentence.empty()) sentences.push_back(std::move(sentence));
                start = j;
            }
            i = j;
        } else {
            ++i;
        }
    }
    std::string tail = trim(text.substr(std::min(start, text.size())));
    if (!tail.empty()) sentences.push_back(std::move(tail));
    return sentences;
}

std::string hard_cut(const std::string& text, size_t max_length) {
    size_t cut = utf8_floor(text, max_length);
    size_t space = text.find_last_of(" \t\n", cut);
    if (space != std::string::npos && space > cut / 2) {
        cut = space;
    }
    return trim(text.substr(0, cut));
}

} // namespace

std::string compress_section(const std::string& text, size_t max_length) {
    if (text.size() <= max_length) {
        return text;
    }

    std::string compressed;
    for (const auto& sentence : split_sentences(text)) {
        size_t needed = compressed.empty() ? sentence.size() : compressed.size() + 1 + sentence.size();
        if (needed > max_length) break;
        if (!compressed.empty()) compressed += ' ';
        compressed += sentence;
    }

    if (compressed.empty()) {
        return hard_cut(text, max_length);
    }
    return compressed;
}

ContextBundle assemble_context(const std::string& document,
                               size_t cursor_offset,
                               const AssembleOptions& options) {
    return assemble_context(document, SelectionRange{cursor_offset, cursor_offset}, options);
}

ContextBundle assemble_context(const std::string& document,
                               SelectionRange selection,
                               const AssembleOptions& options) {
    ContextBundle bundle;

    // 1. Local window, measured outward from the selection edges
    size_t sel_start = std::min(selection.start, selection.end);
    size_t sel_end = std::max(selection.start, selection.end);
    const bool is_cursor = sel_start == sel_end;
    sel_start = utf8_floor(document, std::min(sel_start, document.size()));
    sel_end = is_cursor ? sel_start : utf8_ceil(document, std::min(sel_end, document.size()));

    const size_t half = options.local_window / 2;
    size_t window_begin = utf8_ceil(document, sel_start > half ? sel_start - half : 0);
    size_t window_end = utf8_floor(document, std::min(document.size(), sel_end + half));

    bundle.local_before = document.substr(window_begin, sel_start - window_begin);
    bundle.local_after = document.substr(sel_end, window_end - sel_end);
    bundle.nearest_heading = nearest_heading(document, sel_start);
    bundle.total_chars = bundle.local_before.size() + bundle.local_after.size();

    if (!options.enable_relevance_scoring || document.empty() || options.max_related_sections == 0) {
        return bundle;
    }

    // 2. Candidate sections from the rest of the document
    auto candidates = outside_window(split_into_sections(document), document,
                                     window_begin, window_end);
    bundle.section_count = candidates.size();
    if (candidates.empty()) {
        return bundle;
    }

    // 3. Score against the local window with a call-scoped vocabulary
    const std::string query = bundle.local_before + "\n" + bundle.local_after;
    std::vector<std::string> corpus;
    corpus.reserve(candidates.size() + 1);
    corpus.push_back(query);
    for (const auto& c : candidates) {
        corpus.push_back(c.text);
    }

    Embedder embedder;
    embedder.train(corpus);
    const Vector query_vec = embedder.embed(query);

    std::vector<std::pair<float, const Section*>> scored;
    for (const auto& c : candidates) {
        float score = cosine_similarity(query_vec, embedder.embed(c.text));
        if (score > 0.0f) {
            scored.emplace_back(score, &c);
        }
    }

    // 4. Rank; stable so earlier sections win ties
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    // 5. Drop sections whose prefix matches an already kept one.
    // Different sections sharing a long prefix are also dropped.
    std::vector<std::string> fingerprints;
    for (const auto& [score, section] : scored) {
        if (bundle.related_sections.size() >= options.max_related_sections) break;

        if (options.enable_deduplication) {
            std::string fp = section->text.substr(
                0, utf8_floor(section->text, options.fingerprint_length));
            if (std::find(fingerprints.begin(), fingerprints.end(), fp) != fingerprints.end()) {
                continue;
            }
            fingerprints.push_back(std::move(fp));
        }

        // 6. Compress
        bundle.related_sections.push_back({compress_section(section->text, options.max_section_length),
                                           score, section->start_offset, section->end_offset,
                                           section->nearest_heading});
        bundle.total_chars += bundle.related_sections.back().text.size();
    }

    return bundle;
}

} // namespace ctxengine
