#pragma once

#include "plistemit/file_io.h"
#include "plistemit/plist_value.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file plist_dump.h
 * \brief XML property list (plist 1.0) generation for a \ref PlistValue graph.
 */

namespace plistemit {

/// Plist dump result status.
enum class PlistDumpStatus : uint8_t {
    Ok,
    /// A scalar kind had no element name. Indicates a classification defect.
    UnclassifiableScalar,
    /// An opaque value was reached and no snapshot function was supplied.
    SnapshotUnavailable,
    /// The snapshot function reported failure.
    SnapshotFailed,
    /// A stream source could not be rewound or read (or was null).
    StreamReadFailed,
    /// Caller-specified limits prevented generating a complete dump.
    LimitExceeded,
    /// The output pointer was null.
    InvalidArgument,
};

/// Resource limits applied during dump.
struct PlistDumpLimits final {
    /// Maximum container nesting depth (the root is depth 0).
    uint32_t max_depth = 512;
    /// If non-zero, refuse to generate output larger than this many bytes.
    uint64_t max_output_bytes = 0;
};

/**
 * \brief Produces a binary snapshot of an opaque host object.
 *
 * Returns false on failure. The bytes are emitted base64-encoded and carry
 * no round-trip guarantee.
 */
using PlistSnapshotFn
    = std::function<bool(const PlistOpaque& value, std::vector<std::byte>* out)>;

/// Dump options for \ref dump_plist.
struct PlistDumpOptions final {
    /// Wrap the fragment in the XML declaration, DOCTYPE and `<plist>` root.
    bool envelope = true;
    /// Text prepended once per nesting level.
    std::string indent_unit = "\t";
    PlistDumpLimits limits;
    /// Snapshot capability for \ref PlistValueKind::Opaque values.
    PlistSnapshotFn snapshot;
};

/// Dump result (size stats + how many values were emitted).
struct PlistDumpResult final {
    PlistDumpStatus status = PlistDumpStatus::Ok;
    uint64_t written       = 0;
    uint32_t nodes         = 0;
};

/// Result of \ref save_plist.
struct PlistSaveResult final {
    PlistDumpResult dump;
    WriteFileStatus file = WriteFileStatus::Ok;

    bool ok() const noexcept
    {
        return dump.status == PlistDumpStatus::Ok
               && file == WriteFileStatus::Ok;
    }
};

/**
 * \brief Encodes \p value as plist XML into \p out (replacing its contents).
 *
 * Dictionary keys are emitted sorted by their bytes, so the output does not
 * depend on insertion order. On any failure \p out is left empty. A null
 * \p out yields \ref PlistDumpStatus::InvalidArgument.
 */
PlistDumpResult
dump_plist(const PlistValue& value, std::string* out,
           const PlistDumpOptions& options = PlistDumpOptions {});

/// Convenience form of \ref dump_plist; returns empty text on failure.
std::string
dump_plist_text(const PlistValue& value, bool envelope = true);

/**
 * \brief Writes the enveloped dump of \p value to \p path.
 *
 * The file is created or truncated. Nothing is written when encoding fails.
 * \ref PlistDumpOptions::envelope is ignored (always on).
 */
PlistSaveResult
save_plist(const PlistValue& value, const char* path,
           const PlistDumpOptions& options = PlistDumpOptions {});

/// Returns \p fragment wrapped in the plist 1.0 header and footer.
std::string
wrap_plist_envelope(std::string_view fragment);

/**
 * \brief Element name for a scalar kind (`string`, `integer`, `real`).
 *
 * Returns an empty view for any other kind.
 */
std::string_view
scalar_element_name(PlistValueKind kind) noexcept;

/**
 * \brief Appends \p text escaped for XML character data.
 *
 * `& < > " '` become entities and CR becomes `&#13;`. Well-formed UTF-8
 * is copied through. Control bytes that XML 1.0 forbids, and bytes that do
 * not form valid UTF-8, are emitted as the four ASCII characters `\xNN`.
 * This escape is lossy: the text does not mark it, so a reader cannot tell
 * it apart from input that already contained a backslash, `x` and two hex
 * digits. Backslashes themselves pass through unchanged.
 */
void
append_xml_escaped(std::string_view text, std::string* out);

/// Appends the shortest round-trip text for \p value (`nan`, `+infinity`, ...).
void
append_real_literal(double value, std::string* out);

const char*
plist_dump_status_name(PlistDumpStatus status) noexcept;

}  // namespace plistemit
