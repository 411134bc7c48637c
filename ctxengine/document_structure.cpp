#include "document_structure.hpp"

#include <cctype>

#include "text_util.hpp"

namespace ctxengine {

namespace {

struct Line {
    size_t start;
    size_t end;  // excludes the '\n'
};

std::vector<Line> split_lines(const std::string& text) {
    std::vector<Line> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) {
            lines.push_back({pos, text.size()});
            break;
        }
        lines.push_back({pos, nl});
        pos = nl + 1;
    }
    return lines;
}

bool is_fence(const std::string& trimmed) {
    return starts_with(trimmed, "```") || starts_with(trimmed, "~~~");
}

std::optional<std::string> parse_subject(const std::string& trimmed) {
    static const std::string prefix = "subject:";
    if (trimmed.size() <= prefix.size()) return std::nullopt;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(trimmed[i])) != prefix[i]) {
            return std::nullopt;
        }
    }
    std::string subject = trim(trimmed.substr(prefix.size()));
    if (subject.empty()) return std::nullopt;
    return subject;
}

class SectionBuilder {
public:
    explicit SectionBuilder(const std::string& text) : text_(text) {}

    void extend(const Line& line) {
        if (!open_) {
            start_ = line.start;
            open_ = true;
        }
        end_ = line.end;
    }

    void close(const std::optional<std::string>& heading, bool splittable) {
        if (!open_) return;
        open_ = false;

        if (splittable && end_ - start_ > LONG_SECTION_CHARS) {
            for (const auto& line : split_lines(text_.substr(start_, end_ - start_))) {
                emit(start_ + line.start, start_ + line.end, heading);
            }
            return;
        }
        emit(start_, end_, heading);
    }

    std::vector<Section> take() { return std::move(sections_); }

private:
    const std::string& text_;
    std::vector<Section> sections_;
    bool open_ = false;
    size_t start_ = 0;
    size_t end_ = 0;

    void emit(size_t start, size_t end, const std::optional<std::string>& heading) {
        while (start < end && std::isspace(static_cast<unsigned char>(text_[start]))) ++start;
        while (end > start && std::isspace(static_cast<unsigned char>(text_[end - 1]))) --end;
        if (start == end) return;
        sections_.push_back({text_.substr(start, end - start), start, end, heading});
    }
};

} // namespace

std::optional<std::string> parse_heading(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) return std::nullopt;

    // Markdown: 1-6 '#', whitespace, then a title
    if (trimmed[0] == '#') {
        size_t level = 0;
        while (level < trimmed.size() && trimmed[level] == '#') ++level;
        if (level > 6 || level >= trimmed.size()) return std::nullopt;
        if (!std::isspace(static_cast<unsigned char>(trimmed[level]))) return std::nullopt;
        std::string title = trim(trimmed.substr(level));
        if (title.empty()) return std::nullopt;
        return title;
    }

    // ALL CAPS: an uppercase letter followed by 10+ uppercase letters or spaces
    if (trimmed.size() < 11 || !std::isupper(static_cast<unsigned char>(trimmed[0]))) {
        return std::nullopt;
    }
    for (char c : trimmed) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isupper(uc) && !std::isspace(uc)) return std::nullopt;
    }
    return trimmed;
}

std::vector<Section> split_into_sections(const std::string& text) {
    SectionBuilder builder(text);
    std::optional<std::string> heading;
    bool in_fence = false;

    for (const auto& line : split_lines(text)) {
        std::string trimmed = trim(text.substr(line.start, line.end - line.start));

        if (in_fence) {
            builder.extend(line);
            if (is_fence(trimmed)) {
                builder.close(heading, false);
                in_fence = false;
            }
            continue;
        }

        if (is_fence(trimmed)) {
            builder.close(heading, true);
            builder.extend(line);
            in_fence = true;
            continue;
        }

        if (trimmed.empty()) {
            builder.close(heading, true);
            continue;
        }

        if (auto title = parse_heading(trimmed)) {
            builder.close(heading, true);
            heading = std::move(title);
        }
        builder.extend(line);
    }

    // An unterminated fence runs to the end of the document
    builder.close(heading, !in_fence);
    return builder.take();
}

std::optional<std::string> nearest_heading(const std::string& text, size_t offset) {
    std::optional<std::string> heading;
    bool in_fence = false;

    for (const auto& line : split_lines(text)) {
        if (line.start >= offset) break;

        std::string trimmed = trim(text.substr(line.start, line.end - line.start));
        if (is_fence(trimmed)) {
            in_fence = !in_fence;
            continue;
        }
        if (in_fence) continue;

        if (auto title = parse_heading(trimmed)) {
            heading = std::move(title);
        }
    }
    return heading;
}

std::vector<std::string> extract_document_structure(const std::string& text) {
    std::vector<std::string> headings;
    bool in_fence = false;

    for (const auto& line : split_lines(text)) {
        std::string trimmed = trim(text.substr(line.start, line.end - line.start));
        if (is_fence(trimmed)) {
            in_fence = !in_fence;
            continue;
        }
        if (in_fence) continue;

        if (auto title = parse_heading(trimmed)) {
            headings.push_back(std::move(*title));
        } else if (auto subject = parse_subject(trimmed)) {
            headings.push_back(std::move(*subject));
        }
    }
    return headings;
}

} // namespace ctxengine
