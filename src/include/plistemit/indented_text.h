#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file indented_text.h
 * \brief Line-oriented text accumulator that tracks a nesting depth.
 */

namespace plistemit {

/**
 * \brief Accumulates output lines, prefixing each with the current indent.
 *
 * Rules applied by \ref append:
 * - Every line of the fragment is prefixed with \ref indent_level copies of
 *   the indent unit, unless the fragment already starts with the indent
 *   unit (a pre-indented fragment is appended unchanged).
 * - A trailing newline is added only when the fragment does not end with
 *   one.
 * - An empty fragment is an empty line, indented like any other.
 *
 * One builder is owned by a single encoding call and is never shared.
 */
class IndentedText final {
public:
    IndentedText();
    explicit IndentedText(std::string_view indent_unit);

    /// Appends one fragment (one or more lines).
    void append(std::string_view fragment);
    /// Appends each fragment in order.
    void append(std::span<const std::string> fragments);
    /// Appends each fragment in order.
    void append(std::span<const std::string_view> fragments);

    /**
     * \brief Appends a single logical line whose text may embed newlines.
     *
     * Only the first line is indented; embedded continuation lines are
     * kept verbatim so element text content is not altered.
     */
    void append_text_line(std::string_view line);

    void raise_indent() noexcept;
    /// Lowers the depth by one; no-op at zero.
    void lower_indent() noexcept;
    uint32_t indent_level() const noexcept { return level_; }

    std::string_view indent_unit() const noexcept { return unit_; }
    std::string_view text() const noexcept { return contents_; }
    size_t size() const noexcept { return contents_.size(); }

    /// Moves the accumulated text out and resets the builder to depth 0.
    std::string take_text() noexcept;

private:
    void append_indent();

    std::string unit_;
    std::string contents_;
    uint32_t level_ = 0;
};

}  // namespace plistemit
