#pragma once

/**
 * @file path.hpp
 * @brief Structured JSON paths and path-prefix patterns
 *
 * A Path is the source of truth for where a change happened. Strings are
 * produced only for display (`$.playback.items[2].url`) and parsed only when
 * reading configuration patterns.
 */

#include "qoeguard/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qoeguard {

struct PathSegment
{
    enum class Kind : std::uint8_t {
        kField,   ///< Object member
        kIndex,   ///< Array element
        kLength   ///< Synthetic array cardinality marker
    };

    Kind kind = Kind::kField;
    std::string name;        ///< kField only
    std::size_t index = 0;  ///< kIndex only

    [[nodiscard]] static PathSegment field(std::string name)
    {
        return PathSegment{.kind = Kind::kField, .name = std::move(name), .index = 0};
    }

    [[nodiscard]] static PathSegment element(std::size_t index)
    {
        return PathSegment{.kind = Kind::kIndex, .name = std::string{}, .index = index};
    }

    [[nodiscard]] static PathSegment length()
    {
        return PathSegment{.kind = Kind::kLength, .name = std::string{}, .index = 0};
    }

    bool operator==(const PathSegment&) const = default;
};

class Path
{
public:
    /// Root path `$`
    Path() = default;

    explicit Path(std::vector<PathSegment> segments)
        : m_segments(std::move(segments))
    {}

    [[nodiscard]] Path field(std::string name) const;
    [[nodiscard]] Path element(std::size_t index) const;
    [[nodiscard]] Path length_marker() const;

    [[nodiscard]] const std::vector<PathSegment>& segments() const noexcept { return m_segments; }
    [[nodiscard]] std::size_t depth() const noexcept { return m_segments.size(); }
    [[nodiscard]] bool is_root() const noexcept { return m_segments.empty(); }

    /// True when the last segment is the array length marker
    [[nodiscard]] bool is_length_marker() const noexcept;

    /// Segment-wise prefix test (never a substring test)
    [[nodiscard]] bool starts_with(const Path& prefix) const noexcept;

    /**
     * Render for display. Plain identifiers render as `.name`; other keys as
     * `["key"]` with `"` and `\` escaped; the length marker as `.__len__`.
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Path&) const = default;

private:
    std::vector<PathSegment> m_segments;
};

/**
 * @brief Path-prefix pattern used by criticality and ignore lists
 *
 * Grammar: `$` followed by any of `.name`, `["quoted name"]`, `[N]`,
 * `.*` (any field) and `[*]` (any index).
 */
class PathPattern
{
public:
    struct Step
    {
        enum class Kind : std::uint8_t { kField, kIndex, kAnyField, kAnyIndex };

        Kind kind = Kind::kField;
        std::string name;
        std::size_t index = 0;

        bool operator==(const Step&) const = default;
    };

    [[nodiscard]] static qoeguard::Result<PathPattern> parse(std::string_view text);

    /// True when `path` begins with this pattern, segment by segment
    [[nodiscard]] bool matches_prefix_of(const Path& path) const noexcept;

    /// The pattern as written in configuration
    [[nodiscard]] const std::string& text() const noexcept { return m_text; }
    [[nodiscard]] const std::vector<Step>& steps() const noexcept { return m_steps; }

    bool operator==(const PathPattern& other) const noexcept { return m_steps == other.m_steps; }

private:
    PathPattern(std::string text, std::vector<Step> steps)
        : m_text(std::move(text))
        , m_steps(std::move(steps))
    {}

    std::string m_text;
    std::vector<Step> m_steps;
};

}  // namespace qoeguard
