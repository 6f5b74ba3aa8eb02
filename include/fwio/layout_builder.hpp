#pragma once

#include <initializer_list>
#include <utility>
#include <vector>

#include "layout.hpp"

namespace fwio {

/**
 * Builder for fluent layout construction
 *
 * Usage:
 *   auto layout = LayoutBuilder()
 *       .fields({7, 4})
 *       .skip_start(2)
 *       .skip_lines(1)
 *       .comment('#')
 *       .line_ending(LineEnding::lf)
 *       .trim()
 *       .build();
 *
 * build() does not validate; check_layout() does that per record operation.
 */
class LayoutBuilder {
public:
    LayoutBuilder() = default;

    // Start from an existing layout
    explicit LayoutBuilder(Layout base) : layout_(std::move(base)) {}

    auto& fields(std::vector<int> lengths) {
        layout_.field_lengths = std::move(lengths);
        return *this;
    }

    auto& fields(std::initializer_list<int> lengths) {
        layout_.field_lengths.assign(lengths.begin(), lengths.end());
        return *this;
    }

    // Append one column
    auto& field(int length, Alignment align = Alignment::left) {
        layout_.materialize_alignment();
        layout_.field_lengths.push_back(length);
        layout_.field_align.push_back(align);
        return *this;
    }

    auto& align(std::vector<Alignment> alignment) {
        layout_.field_align = std::move(alignment);
        return *this;
    }

    auto& align(std::initializer_list<Alignment> alignment) {
        layout_.field_align.assign(alignment.begin(), alignment.end());
        return *this;
    }

    auto& skip_start(int bytes) noexcept {
        layout_.skip_start = bytes;
        return *this;
    }

    auto& skip_end(int bytes) noexcept {
        layout_.skip_end = bytes;
        return *this;
    }

    auto& skip_lines(int lines) noexcept {
        layout_.skip_lines = lines;
        return *this;
    }

    auto& line_ending(LineEnding mode) noexcept {
        layout_.line_ending = mode;
        return *this;
    }

    auto& comment(char marker) noexcept {
        layout_.comment = marker;
        return *this;
    }

    auto& no_comment() noexcept {
        layout_.comment.reset();
        return *this;
    }

    auto& trim(bool enabled = true) noexcept {
        layout_.trim_fields = enabled;
        return *this;
    }

    Layout build() const { return layout_; }

private:
    Layout layout_;
};

} // namespace fwio
