#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

/**
 * \file base64_wrap.h
 * \brief Base64 encoding and fixed-width line wrapping for `<data>` payloads.
 */

namespace plistemit {

/// Line width used by property list `<data>` payloads.
static constexpr uint32_t kPlistDataLineWidth = 68;

/// Appends standard base64 (RFC 4648 alphabet, `=` padding, no whitespace).
void
append_base64(std::span<const std::byte> bytes, std::string* out);

/**
 * \brief Appends base64 re-segmented into lines of at most \p line_width chars.
 *
 * Output layout: one leading `\n`, then each segment followed by `\n`.
 * Empty input produces exactly `"\n"`. A \p line_width of 0 is treated as
 * \ref kPlistDataLineWidth.
 */
void
append_wrapped_base64(std::span<const std::byte> bytes, uint32_t line_width,
                      std::string* out);

/// Returns the wrapped base64 text for \p bytes at \ref kPlistDataLineWidth.
std::string
wrap_base64(std::span<const std::byte> bytes);

}  // namespace plistemit
