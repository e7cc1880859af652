/**
 * @file diff.cpp
 * @brief Hierarchical JSON diff engine
 */

#include "qoeguard/diff.hpp"

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace qoeguard::diff {

namespace {

/**
 * @brief Depth-first diff over an explicit frame stack
 *
 * One frame per object/array pair being compared. The current location is a
 * single segment stack shared by all frames; a Path is materialized only when
 * a change is emitted, so nesting depth costs neither call stack nor copies.
 */
class DiffWalker
{
public:
    explicit DiffWalker(ChangeList& changes)
        : m_changes(changes)
    {}

    void run(const JsonValue& baseline, const JsonValue& candidate)
    {
        // An absent document is modeled as null: the whole value is added or removed.
        if (baseline.is_null() != candidate.is_null()) {
            if (baseline.is_null()) {
                emit_added(candidate, Path{});
            } else {
                emit_removed(baseline, Path{});
            }
            return;
        }

        if (!open(baseline, candidate)) {
            return;
        }
        while (!m_frames.empty()) {
            if (!step()) {
                close_frame();
            }
        }
    }

private:
    enum class Phase : std::uint8_t { kShared, kAdded };

    struct Frame
    {
        const JsonValue* before = nullptr;
        const JsonValue* after = nullptr;
        std::size_t depth = 0;  ///< Segment count when the frame was opened
        std::size_t cursor = 0;
        Phase phase = Phase::kShared;
        std::unordered_map<std::string_view, const JsonValue*> after_index;
        std::unordered_set<std::string_view> before_keys;
    };

    /**
     * Compare one pair at the current location.
     * @return true when a frame was pushed for a container pair
     */
    bool open(const JsonValue& before, const JsonValue& after)
    {
        if (before.kind() != after.kind()) {
            emit_type_changed(before, after, current_path());
            return false;
        }
        if (before.shares_storage_with(after)) {
            return false;
        }
        switch (before.kind()) {
            case JsonKind::kObject:
                open_object(before, after);
                return true;
            case JsonKind::kArray:
                open_array(before, after);
                return true;
            case JsonKind::kNull:
                return false;
            case JsonKind::kBool:
            case JsonKind::kNumber:
            case JsonKind::kString:
                compare_scalars(before, after);
                return false;
        }
        return false;
    }

    void open_object(const JsonValue& before, const JsonValue& after)
    {
        Frame frame{.before = &before, .after = &after, .depth = m_segments.size()};
        const auto& after_members = after.as_object();
        frame.after_index.reserve(after_members.size());
        for (const auto& [key, value] : after_members) {
            frame.after_index.emplace(key, &value);
        }
        frame.before_keys.reserve(before.size());
        m_frames.push_back(std::move(frame));
    }

    void open_array(const JsonValue& before, const JsonValue& after)
    {
        const std::size_t before_size = before.size();
        const std::size_t after_size = after.size();
        if (before_size != after_size) {
            const auto old_length = static_cast<double>(before_size);
            const auto new_length = static_cast<double>(after_size);
            m_changes.push_back(Change{
                .path = current_path().length_marker(),
                .kind = ChangeKind::kValueChanged,
                .old_value = JsonValue::number(old_length),
                .new_value = JsonValue::number(new_length),
                .numeric_delta = common::saturating_abs_delta(old_length, new_length),
            });
        }
        m_frames.push_back(Frame{.before = &before, .after = &after, .depth = m_segments.size()});
    }

    /// Descend into a child pair; the segment stays pushed while its frame is open
    void descend(const JsonValue& before, const JsonValue& after, PathSegment segment)
    {
        m_segments.push_back(std::move(segment));
        if (!open(before, after)) {
            m_segments.pop_back();
        }
    }

    void close_frame()
    {
        const std::size_t depth = m_frames.back().depth;
        m_frames.pop_back();
        m_segments.resize(depth == 0 ? 0 : depth - 1);
    }

    /**
     * Advance the top frame by at most one descent.
     * @return false once the frame is exhausted
     */
    bool step()
    {
        // descend() may grow m_frames, so `frame` is not used after it.
        Frame& frame = m_frames.back();
        if (frame.before->is_object()) {
            return step_object(frame);
        }
        return step_array(frame);
    }

    bool step_object(Frame& frame)
    {
        const auto& before_members = frame.before->as_object();
        if (frame.phase == Phase::kShared) {
            if (frame.cursor < before_members.size()) {
                const auto& [key, value] = before_members[frame.cursor++];
                frame.before_keys.insert(key);
                if (auto it = frame.after_index.find(key); it != frame.after_index.end()) {
                    descend(value, *it->second, PathSegment::field(key));
                } else {
                    emit_removed(value, child_path(PathSegment::field(key)));
                }
                return true;
            }
            frame.phase = Phase::kAdded;
        }
        for (const auto& [key, value] : frame.after->as_object()) {
            if (!frame.before_keys.contains(key)) {
                emit_added(value, child_path(PathSegment::field(key)));
            }
        }
        return false;
    }

    bool step_array(Frame& frame)
    {
        const auto& before_items = frame.before->as_array();
        const auto& after_items = frame.after->as_array();
        const std::size_t overlap = std::min(before_items.size(), after_items.size());
        if (frame.cursor < overlap) {
            const std::size_t i = frame.cursor++;
            descend(before_items[i], after_items[i], PathSegment::element(i));
            return true;
        }
        for (std::size_t i = overlap; i < before_items.size(); ++i) {
            emit_removed(before_items[i], child_path(PathSegment::element(i)));
        }
        for (std::size_t i = overlap; i < after_items.size(); ++i) {
            emit_added(after_items[i], child_path(PathSegment::element(i)));
        }
        return false;
    }

    [[nodiscard]] Path current_path() const { return Path(m_segments); }

    [[nodiscard]] Path child_path(PathSegment segment) const
    {
        std::vector<PathSegment> segments;
        segments.reserve(m_segments.size() + 1);
        segments.assign(m_segments.begin(), m_segments.end());
        segments.push_back(std::move(segment));
        return Path(std::move(segments));
    }

    void compare_scalars(const JsonValue& before, const JsonValue& after)
    {
        if (before == after) {
            return;
        }
        std::optional<double> delta;
        if (before.is_number()) {
            delta = common::saturating_abs_delta(before.as_number(), after.as_number());
        }
        m_changes.push_back(Change{
            .path = current_path(),
            .kind = ChangeKind::kValueChanged,
            .old_value = before,
            .new_value = after,
            .numeric_delta = delta,
        });
    }

    void emit_type_changed(const JsonValue& before, const JsonValue& after, Path path)
    {
        m_changes.push_back(Change{
            .path = std::move(path),
            .kind = ChangeKind::kTypeChanged,
            .old_value = before,
            .new_value = after,
            .numeric_delta = std::nullopt,
        });
    }

    void emit_added(const JsonValue& after, Path path)
    {
        m_changes.push_back(Change{
            .path = std::move(path),
            .kind = ChangeKind::kAdded,
            .old_value = std::nullopt,
            .new_value = after,
            .numeric_delta = std::nullopt,
        });
    }

    void emit_removed(const JsonValue& before, Path path)
    {
        m_changes.push_back(Change{
            .path = std::move(path),
            .kind = ChangeKind::kRemoved,
            .old_value = before,
            .new_value = std::nullopt,
            .numeric_delta = std::nullopt,
        });
    }

    ChangeList& m_changes;
    std::vector<Frame> m_frames;
    std::vector<PathSegment> m_segments;
};

}  // namespace

std::string_view change_kind_name(ChangeKind kind) noexcept
{
    switch (kind) {
        case ChangeKind::kAdded:
            return "added";
        case ChangeKind::kRemoved:
            return "removed";
        case ChangeKind::kTypeChanged:
            return "type_changed";
        case ChangeKind::kValueChanged:
            return "value_changed";
    }
    return "value_changed";
}

ChangeList diff(const JsonValue& baseline, const JsonValue& candidate)
{
    ChangeList changes;
    DiffWalker walker(changes);
    walker.run(baseline, candidate);
    return changes;
}

}  // namespace qoeguard::diff
