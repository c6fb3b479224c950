#include "plistemit/indented_text.h"

#include <utility>

namespace plistemit {

IndentedText::IndentedText()
    : unit_("\t")
{
}


IndentedText::IndentedText(std::string_view indent_unit)
    : unit_(indent_unit)
{
}


void
IndentedText::append_indent()
{
    for (uint32_t i = 0; i < level_; ++i) {
        contents_.append(unit_);
    }
}


void
IndentedText::append(std::string_view fragment)
{
    const bool pre_indented = !unit_.empty() && fragment.starts_with(unit_);
    if (pre_indented || level_ == 0U || unit_.empty()) {
        contents_.append(fragment);
    } else {
        // Prefix the start of every line, but not the position after a
        // final newline. An empty fragment is one empty line.
        if (fragment.empty()) {
            append_indent();
        }
        size_t line_start = 0;
        while (line_start < fragment.size()) {
            const size_t nl = fragment.find('\n', line_start);
            const size_t end = (nl == std::string_view::npos)
                                   ? fragment.size()
                                   : nl + 1;
            append_indent();
            contents_.append(fragment.substr(line_start, end - line_start));
            line_start = end;
        }
    }

    if (!fragment.ends_with('\n')) {
        contents_.push_back('\n');
    }
}


void
IndentedText::append(std::span<const std::string> fragments)
{
    for (size_t i = 0; i < fragments.size(); ++i) {
        append(std::string_view(fragments[i]));
    }
}


void
IndentedText::append(std::span<const std::string_view> fragments)
{
    for (size_t i = 0; i < fragments.size(); ++i) {
        append(fragments[i]);
    }
}


void
IndentedText::append_text_line(std::string_view line)
{
    append_indent();
    contents_.append(line);
    if (!line.ends_with('\n')) {
        contents_.push_back('\n');
    }
}


void
IndentedText::raise_indent() noexcept
{
    level_ += 1U;
}


void
IndentedText::lower_indent() noexcept
{
    if (level_ > 0U) {
        level_ -= 1U;
    }
}


std::string
IndentedText::take_text() noexcept
{
    std::string out = std::move(contents_);
    contents_.clear();
    level_ = 0;
    return out;
}

}  // namespace plistemit
