#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * \file plist_value.h
 * \brief Dynamically-typed value graph accepted by the plist emitter.
 */

namespace plistemit {

class PlistByteSource;
class PlistDict;
class PlistRecord;
struct PlistValue;
struct PlistDictEntry;

/// Value kind. The order matches the alternatives of \ref PlistValue::data.
enum class PlistValueKind : uint8_t {
    String,
    Symbol,
    Integer,
    Real,
    Bool,
    Date,
    Array,
    Dict,
    /// In-memory bytes, emitted as `<data>`.
    Data,
    /// A \ref PlistByteSource read from its start, emitted as `<data>`.
    Stream,
    /// An object exposing an attribute mapping, emitted as `<dict>`.
    Record,
    /// Any other host object, emitted through a snapshot function.
    Opaque,
};

/// A symbolic name; encoded exactly like a string.
struct PlistSymbol final {
    std::string name;
};

/**
 * \brief Arbitrary-precision integer kept in canonical decimal form.
 *
 * The magnitude has no leading zeros and zero is never negative, so two
 * equal values always print the same text.
 */
class PlistInteger final {
public:
    PlistInteger() = default;

    static PlistInteger from_i64(int64_t value);
    static PlistInteger from_u64(uint64_t value);

    /**
     * \brief Parses `[+-]?[0-9]+`.
     *
     * \return false (leaving \p out untouched) when \p text is not a decimal
     * integer.
     */
    static bool parse(std::string_view text, PlistInteger* out);

    bool negative() const noexcept { return negative_; }
    /// Decimal digits of the absolute value.
    std::string_view magnitude() const noexcept { return magnitude_; }

    /// Decimal text with a leading `-` for negative values.
    std::string to_string() const;

    friend bool operator==(const PlistInteger& a,
                           const PlistInteger& b) noexcept
    {
        return a.negative_ == b.negative_ && a.magnitude_ == b.magnitude_;
    }

private:
    bool negative_         = false;
    std::string magnitude_ = "0";
};

/// A UTC timestamp with one-second resolution.
struct PlistDate final {
    /// Seconds since 1970-01-01T00:00:00Z (may be negative).
    int64_t unix_seconds = 0;
};

/// Broken-down UTC calendar fields of a \ref PlistDate.
struct PlistCivilTime final {
    int64_t year    = 1970;
    uint32_t month  = 1;
    uint32_t day    = 1;
    uint32_t hour   = 0;
    uint32_t minute = 0;
    uint32_t second = 0;
};

/// Converts \p t to a date, truncating sub-second precision toward the past.
PlistDate
make_date(std::chrono::system_clock::time_point t) noexcept;

/**
 * \brief Builds a date from UTC calendar fields.
 *
 * \return false when a field is out of range (month 1..12, day valid for
 * the month, hour < 24, minute < 60, second < 60).
 */
bool
make_date(const PlistCivilTime& civil, PlistDate* out) noexcept;

/// Splits \p date into UTC calendar fields.
PlistCivilTime
civil_time(PlistDate date) noexcept;

/// Appends \p date as `YYYY-MM-DDTHH:MM:SSZ`.
void
append_date_literal(PlistDate date, std::string* out);

/**
 * \brief Parses `YYYY-MM-DDTHH:MM:SSZ` or a bare `YYYY-MM-DD` (midnight).
 *
 * \return false when the text does not match either form or names an
 * invalid calendar time.
 */
bool
parse_date_literal(std::string_view text, PlistDate* out) noexcept;


/**
 * \brief Attribute-mapping capability for record-like host objects.
 *
 * The emitter substitutes the returned dictionary for the object and
 * encodes it as `<dict>`.
 */
class PlistRecord {
public:
    virtual ~PlistRecord() = default;

    /// Returns the attributes to emit for this object.
    virtual PlistDict plist_attributes() const = 0;
};

/// Host object outside the native kinds.
struct PlistOpaque final {
    /// Short type description emitted in the explanatory comment.
    std::string type_name;
    std::shared_ptr<const void> object;
};


using PlistArray = std::vector<PlistValue>;

/**
 * \brief String-keyed mapping with unique keys.
 *
 * Entries keep insertion order; \ref set replaces the value of an existing
 * key in place. The emitter never uses this order: keys are emitted sorted
 * by their bytes.
 */
class PlistDict final {
public:
    PlistDict();
    ~PlistDict();
    PlistDict(const PlistDict& other);
    PlistDict(PlistDict&& other) noexcept;
    PlistDict& operator=(const PlistDict& other);
    PlistDict& operator=(PlistDict&& other) noexcept;

    /// Inserts or replaces the value stored under \p key.
    void set(std::string key, PlistValue value);
    /// Returns the value for \p key, or null when absent.
    const PlistValue* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;
    /// Removes \p key. Returns false when it was absent.
    bool erase(std::string_view key);

    bool empty() const noexcept;
    size_t size() const noexcept;
    void clear() noexcept;

    /// Entries in insertion order.
    std::span<const PlistDictEntry> entries() const noexcept;

    /// Entries ordered by key bytes (the emission order).
    std::vector<const PlistDictEntry*> sorted_entries() const;

private:
    std::vector<PlistDictEntry> entries_;
};


/**
 * \brief A node of the value graph.
 *
 * Values are built by the caller, read by a single dump call, and not
 * retained by the emitter. Stream sources are the only shared mutable
 * state: their read position is reset and consumed when encoded.
 */
struct PlistValue final {
    std::variant<std::string, PlistSymbol, PlistInteger, double, bool,
                 PlistDate, PlistArray, PlistDict, std::vector<std::byte>,
                 std::shared_ptr<PlistByteSource>,
                 std::shared_ptr<const PlistRecord>, PlistOpaque>
        data;

    PlistValueKind kind() const noexcept
    {
        return static_cast<PlistValueKind>(data.index());
    }
};

struct PlistDictEntry final {
    std::string key;
    PlistValue value;
};


/** \name Scalar constructors
 *  @{
 */
PlistValue
make_string(std::string_view text);
PlistValue
make_symbol(std::string_view name);
PlistValue
make_integer(int64_t value);
PlistValue
make_integer(PlistInteger value);
PlistValue
make_real(double value);
PlistValue
make_bool(bool value);
PlistValue
make_date_value(PlistDate date);
/** @} */

/** \name Container constructors
 *  @{
 */
PlistValue
make_array(PlistArray elements = {});
PlistValue
make_dict(PlistDict dict = {});
/** @} */

/** \name Binary and extension constructors
 *  @{
 */
PlistValue
make_data(std::span<const std::byte> bytes);
PlistValue
make_stream(std::shared_ptr<PlistByteSource> source);
PlistValue
make_record(std::shared_ptr<const PlistRecord> record);
PlistValue
make_opaque(std::string_view type_name, std::shared_ptr<const void> object);
/** @} */

/// Stable lowercase kind name (e.g. `"dict"`).
const char*
plist_value_kind_name(PlistValueKind kind) noexcept;

}  // namespace plistemit
