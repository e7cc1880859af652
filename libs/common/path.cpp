/**
 * @file path.cpp
 * @brief Structured JSON paths: rendering, prefix tests and pattern parsing
 */

#include "qoeguard/path.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <ranges>
#include <system_error>

namespace qoeguard {

namespace {

constexpr std::string_view kLengthMarkerText = "__len__";

[[nodiscard]] bool is_plain_identifier(std::string_view name)
{
    if (name.empty() || name == kLengthMarkerText || name == "*") {
        return false;
    }
    return std::ranges::all_of(name, [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) != 0 || c == '_' || c == '-' || c == '$' || c == '@';
    });
}

void append_quoted(std::string& out, std::string_view name)
{
    out += "[\"";
    for (char c : name) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out += "\"]";
}

/**
 * @brief Cursor over a pattern string; every parse_* helper reports errors
 * with the byte offset where parsing stopped.
 */
class PatternParser
{
public:
    explicit PatternParser(std::string_view text)
        : m_text(text)
    {}

    [[nodiscard]] qoeguard::Result<std::vector<PathPattern::Step>> parse()
    {
        if (m_text.empty()) {
            return fail("pattern is empty");
        }
        if (m_text.front() != '$') {
            return fail("pattern must start with '$'");
        }
        m_pos = 1;
        std::vector<PathPattern::Step> steps;
        while (m_pos < m_text.size()) {
            const char c = m_text[m_pos];
            if (c != '.' && c != '[') {
                return fail(std::format("unexpected character '{}'", c));
            }
            auto step = c == '.' ? parse_dotted() : parse_bracketed();
            if (!step) {
                return std::unexpected(step.error());
            }
            steps.push_back(std::move(*step));
        }
        return steps;
    }

private:
    [[nodiscard]] std::unexpected<qoeguard::Error> fail(std::string_view reason) const
    {
        return std::unexpected(qoeguard::Error::make(
            "InvalidPathPattern",
            std::format("Invalid path pattern '{}' at offset {}: {}", m_text, m_pos, reason)));
    }

    [[nodiscard]] qoeguard::Result<PathPattern::Step> parse_dotted()
    {
        ++m_pos;  // '.'
        const std::size_t start = m_pos;
        while (m_pos < m_text.size() && m_text[m_pos] != '.' && m_text[m_pos] != '[') {
            if (m_text[m_pos] == ']' || m_text[m_pos] == '"') {
                return fail("unquoted field names cannot contain ']' or '\"'");
            }
            ++m_pos;
        }
        std::string_view name = m_text.substr(start, m_pos - start);
        if (name.empty()) {
            return fail("empty field name");
        }
        if (name == "*") {
            return PathPattern::Step{.kind = PathPattern::Step::Kind::kAnyField,
                                     .name = std::string{},
                                     .index = 0};
        }
        return PathPattern::Step{.kind = PathPattern::Step::Kind::kField,
                                 .name = std::string(name),
                                 .index = 0};
    }

    [[nodiscard]] qoeguard::Result<PathPattern::Step> parse_bracketed()
    {
        ++m_pos;  // '['
        if (m_pos >= m_text.size()) {
            return fail("unterminated '['");
        }
        if (m_text[m_pos] == '"') {
            return parse_quoted();
        }
        if (m_text[m_pos] == '*') {
            ++m_pos;
            if (auto closed = expect_close(); !closed) {
                return std::unexpected(closed.error());
            }
            return PathPattern::Step{.kind = PathPattern::Step::Kind::kAnyIndex,
                                     .name = std::string{},
                                     .index = 0};
        }
        const std::size_t start = m_pos;
        while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos])) != 0) {
            ++m_pos;
        }
        if (m_pos == start) {
            return fail("expected array index, '*' or quoted field name");
        }
        std::size_t index = 0;
        const char* first = m_text.data() + start;
        const char* last = m_text.data() + m_pos;
        auto [ptr, ec] = std::from_chars(first, last, index);
        if (ec != std::errc{} || ptr != last) {
            return fail("array index out of range");
        }
        if (auto closed = expect_close(); !closed) {
            return std::unexpected(closed.error());
        }
        return PathPattern::Step{.kind = PathPattern::Step::Kind::kIndex,
                                 .name = std::string{},
                                 .index = index};
    }

    [[nodiscard]] qoeguard::Result<PathPattern::Step> parse_quoted()
    {
        ++m_pos;  // opening quote
        std::string name;
        while (m_pos < m_text.size() && m_text[m_pos] != '"') {
            if (m_text[m_pos] == '\\') {
                ++m_pos;
                if (m_pos >= m_text.size()) {
                    return fail("dangling escape");
                }
            }
            name.push_back(m_text[m_pos]);
            ++m_pos;
        }
        if (m_pos >= m_text.size()) {
            return fail("unterminated quoted field name");
        }
        ++m_pos;  // closing quote
        if (auto closed = expect_close(); !closed) {
            return std::unexpected(closed.error());
        }
        return PathPattern::Step{.kind = PathPattern::Step::Kind::kField,
                                 .name = std::move(name),
                                 .index = 0};
    }

    [[nodiscard]] qoeguard::VoidResult expect_close()
    {
        if (m_pos >= m_text.size() || m_text[m_pos] != ']') {
            return fail("expected ']'");
        }
        ++m_pos;
        return {};
    }

    std::string_view m_text;
    std::size_t m_pos = 0;
};

[[nodiscard]] bool step_matches(const PathPattern::Step& step, const PathSegment& segment) noexcept
{
    using StepKind = PathPattern::Step::Kind;
    switch (step.kind) {
        case StepKind::kField:
            return segment.kind == PathSegment::Kind::kField && segment.name == step.name;
        case StepKind::kIndex:
            return segment.kind == PathSegment::Kind::kIndex && segment.index == step.index;
        case StepKind::kAnyField:
            return segment.kind == PathSegment::Kind::kField;
        case StepKind::kAnyIndex:
            return segment.kind == PathSegment::Kind::kIndex;
    }
    return false;
}

}  // namespace

Path Path::field(std::string name) const
{
    Path child = *this;
    child.m_segments.push_back(PathSegment::field(std::move(name)));
    return child;
}

Path Path::element(std::size_t index) const
{
    Path child = *this;
    child.m_segments.push_back(PathSegment::element(index));
    return child;
}

Path Path::length_marker() const
{
    Path child = *this;
    child.m_segments.push_back(PathSegment::length());
    return child;
}

bool Path::is_length_marker() const noexcept
{
    return !m_segments.empty() && m_segments.back().kind == PathSegment::Kind::kLength;
}

bool Path::starts_with(const Path& prefix) const noexcept
{
    if (prefix.m_segments.size() > m_segments.size()) {
        return false;
    }
    return std::ranges::equal(prefix.m_segments,
                              m_segments | std::views::take(prefix.m_segments.size()));
}

std::string Path::to_string() const
{
    std::string out = "$";
    for (const auto& segment : m_segments) {
        switch (segment.kind) {
            case PathSegment::Kind::kField:
                if (is_plain_identifier(segment.name)) {
                    out.push_back('.');
                    out += segment.name;
                } else {
                    append_quoted(out, segment.name);
                }
                break;
            case PathSegment::Kind::kIndex:
                out += std::format("[{}]", segment.index);
                break;
            case PathSegment::Kind::kLength:
                out.push_back('.');
                out += kLengthMarkerText;
                break;
        }
    }
    return out;
}

qoeguard::Result<PathPattern> PathPattern::parse(std::string_view text)
{
    PatternParser parser(text);
    auto steps = parser.parse();
    if (!steps) {
        return std::unexpected(steps.error());
    }
    return PathPattern(std::string(text), std::move(*steps));
}

bool PathPattern::matches_prefix_of(const Path& path) const noexcept
{
    const auto& segments = path.segments();
    if (m_steps.size() > segments.size()) {
        return false;
    }
    for (auto [i, step] : std::views::enumerate(m_steps)) {
        if (!step_matches(step, segments[static_cast<std::size_t>(i)])) {
            return false;
        }
    }
    return true;
}

}  // namespace qoeguard
