#include "plistemit/plist_value.h"

#include "plistemit/byte_source.h"

#include <algorithm>
#include <cstdio>

namespace plistemit {
namespace {

    static constexpr int64_t kSecondsPerDay = 86400;
    static constexpr int64_t kMaxAbsYear    = 999999999;

    static int64_t floor_div(int64_t a, int64_t b) noexcept
    {
        const int64_t q = a / b;
        return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
    }

    static bool is_leap_year(int64_t y) noexcept
    {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    static uint32_t days_in_month(int64_t y, uint32_t m) noexcept
    {
        static constexpr uint32_t kDays[12] = { 31, 28, 31, 30, 31, 30,
                                                31, 31, 30, 31, 30, 31 };
        if (m == 2U && is_leap_year(y)) {
            return 29U;
        }
        return kDays[m - 1U];
    }

    // Proleptic Gregorian day count relative to 1970-01-01.
    static int64_t days_from_civil(int64_t y, uint32_t m, uint32_t d) noexcept
    {
        y -= (m <= 2U) ? 1 : 0;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const int64_t yoe = y - era * 400;
        const int64_t mp  = (m > 2U) ? static_cast<int64_t>(m) - 3
                                     : static_cast<int64_t>(m) + 9;
        const int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(d) - 1;
        const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    static void civil_from_days(int64_t z, int64_t* y, uint32_t* m,
                                uint32_t* d) noexcept
    {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const int64_t doe = z - era * 146097;
        const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096)
                            / 365;
        const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const int64_t mp  = (5 * doy + 2) / 153;
        *d                = static_cast<uint32_t>(doy - (153 * mp + 2) / 5 + 1);
        *m = static_cast<uint32_t>(mp < 10 ? mp + 3 : mp - 9);
        *y = yoe + era * 400 + ((*m <= 2U) ? 1 : 0);
    }

    static bool parse_fixed_digits(std::string_view s, size_t pos, size_t n,
                                   uint32_t* out) noexcept
    {
        if (pos + n > s.size()) {
            return false;
        }
        uint32_t v = 0;
        for (size_t i = 0; i < n; ++i) {
            const char c = s[pos + i];
            if (c < '0' || c > '9') {
                return false;
            }
            v = v * 10U + static_cast<uint32_t>(c - '0');
        }
        *out = v;
        return true;
    }

}  // namespace


PlistInteger
PlistInteger::from_u64(uint64_t value)
{
    PlistInteger out;
    out.magnitude_ = std::to_string(value);
    return out;
}


PlistInteger
PlistInteger::from_i64(int64_t value)
{
    const uint64_t mag = (value < 0) ? (0U - static_cast<uint64_t>(value))
                                     : static_cast<uint64_t>(value);
    PlistInteger out = from_u64(mag);
    out.negative_    = value < 0;
    return out;
}


bool
PlistInteger::parse(std::string_view text, PlistInteger* out)
{
    if (!out) {
        return false;
    }
    bool negative = false;
    size_t i      = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        i        = 1;
    }
    if (i >= text.size()) {
        return false;
    }
    for (size_t j = i; j < text.size(); ++j) {
        if (text[j] < '0' || text[j] > '9') {
            return false;
        }
    }

    while (i + 1U < text.size() && text[i] == '0') {
        i += 1;
    }

    out->magnitude_.assign(text.substr(i));
    out->negative_ = negative && out->magnitude_ != "0";
    return true;
}


std::string
PlistInteger::to_string() const
{
    std::string s;
    s.reserve(magnitude_.size() + 1U);
    if (negative_) {
        s.push_back('-');
    }
    s.append(magnitude_);
    return s;
}


PlistDate
make_date(std::chrono::system_clock::time_point t) noexcept
{
    const auto secs = std::chrono::floor<std::chrono::seconds>(
        t.time_since_epoch());
    return PlistDate { static_cast<int64_t>(secs.count()) };
}


bool
make_date(const PlistCivilTime& civil, PlistDate* out) noexcept
{
    if (!out) {
        return false;
    }
    if (civil.year > kMaxAbsYear || civil.year < -kMaxAbsYear) {
        return false;
    }
    if (civil.month < 1U || civil.month > 12U) {
        return false;
    }
    if (civil.day < 1U || civil.day > days_in_month(civil.year, civil.month)) {
        return false;
    }
    if (civil.hour > 23U || civil.minute > 59U || civil.second > 59U) {
        return false;
    }

    const int64_t days = days_from_civil(civil.year, civil.month, civil.day);
    out->unix_seconds  = days * kSecondsPerDay
                        + static_cast<int64_t>(civil.hour) * 3600
                        + static_cast<int64_t>(civil.minute) * 60
                        + static_cast<int64_t>(civil.second);
    return true;
}


PlistCivilTime
civil_time(PlistDate date) noexcept
{
    const int64_t days = floor_div(date.unix_seconds, kSecondsPerDay);
    const int64_t rem  = date.unix_seconds - days * kSecondsPerDay;

    PlistCivilTime c;
    civil_from_days(days, &c.year, &c.month, &c.day);
    c.hour   = static_cast<uint32_t>(rem / 3600);
    c.minute = static_cast<uint32_t>((rem % 3600) / 60);
    c.second = static_cast<uint32_t>(rem % 60);
    return c;
}


void
append_date_literal(PlistDate date, std::string* out)
{
    if (!out) {
        return;
    }
    const PlistCivilTime c = civil_time(date);
    char buf[64];
    const int n = std::snprintf(buf, sizeof(buf),
                                "%04lld-%02u-%02uT%02u:%02u:%02uZ",
                                static_cast<long long>(c.year), c.month,
                                c.day, c.hour, c.minute, c.second);
    if (n > 0) {
        out->append(buf, static_cast<size_t>(n));
    }
}


bool
parse_date_literal(std::string_view text, PlistDate* out) noexcept
{
    if (text.size() != 10U && text.size() != 20U) {
        return false;
    }

    uint32_t year = 0;
    PlistCivilTime c;
    if (!parse_fixed_digits(text, 0, 4, &year) || text[4] != '-'
        || !parse_fixed_digits(text, 5, 2, &c.month) || text[7] != '-'
        || !parse_fixed_digits(text, 8, 2, &c.day)) {
        return false;
    }
    c.year = static_cast<int64_t>(year);

    if (text.size() == 20U) {
        if (text[10] != 'T' || text[13] != ':' || text[16] != ':'
            || text[19] != 'Z') {
            return false;
        }
        if (!parse_fixed_digits(text, 11, 2, &c.hour)
            || !parse_fixed_digits(text, 14, 2, &c.minute)
            || !parse_fixed_digits(text, 17, 2, &c.second)) {
            return false;
        }
    }
    return make_date(c, out);
}


PlistDict::PlistDict()                                = default;
PlistDict::~PlistDict()                               = default;
PlistDict::PlistDict(const PlistDict& other)          = default;
PlistDict::PlistDict(PlistDict&& other) noexcept      = default;
PlistDict& PlistDict::operator=(const PlistDict& other) = default;
PlistDict& PlistDict::operator=(PlistDict&& other) noexcept = default;


void
PlistDict::set(std::string key, PlistValue value)
{
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].key == key) {
            entries_[i].value = std::move(value);
            return;
        }
    }
    entries_.push_back(PlistDictEntry { std::move(key), std::move(value) });
}


const PlistValue*
PlistDict::find(std::string_view key) const noexcept
{
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].key == key) {
            return &entries_[i].value;
        }
    }
    return nullptr;
}


bool
PlistDict::contains(std::string_view key) const noexcept
{
    return find(key) != nullptr;
}


bool
PlistDict::erase(std::string_view key)
{
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].key == key) {
            entries_.erase(entries_.begin() + static_cast<ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}


bool
PlistDict::empty() const noexcept
{
    return entries_.empty();
}


size_t
PlistDict::size() const noexcept
{
    return entries_.size();
}


void
PlistDict::clear() noexcept
{
    entries_.clear();
}


std::span<const PlistDictEntry>
PlistDict::entries() const noexcept
{
    return std::span<const PlistDictEntry>(entries_.data(), entries_.size());
}


std::vector<const PlistDictEntry*>
PlistDict::sorted_entries() const
{
    std::vector<const PlistDictEntry*> out;
    out.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        out.push_back(&entries_[i]);
    }
    std::sort(out.begin(), out.end(),
              [](const PlistDictEntry* a, const PlistDictEntry* b) {
                  return a->key < b->key;
              });
    return out;
}


PlistValue
make_string(std::string_view text)
{
    PlistValue v;
    v.data.emplace<std::string>(text);
    return v;
}


PlistValue
make_symbol(std::string_view name)
{
    PlistValue v;
    v.data.emplace<PlistSymbol>(PlistSymbol { std::string(name) });
    return v;
}


PlistValue
make_integer(int64_t value)
{
    return make_integer(PlistInteger::from_i64(value));
}


PlistValue
make_integer(PlistInteger value)
{
    PlistValue v;
    v.data.emplace<PlistInteger>(std::move(value));
    return v;
}


PlistValue
make_real(double value)
{
    PlistValue v;
    v.data.emplace<double>(value);
    return v;
}


PlistValue
make_bool(bool value)
{
    PlistValue v;
    v.data.emplace<bool>(value);
    return v;
}


PlistValue
make_date_value(PlistDate date)
{
    PlistValue v;
    v.data.emplace<PlistDate>(date);
    return v;
}


PlistValue
make_array(PlistArray elements)
{
    PlistValue v;
    v.data.emplace<PlistArray>(std::move(elements));
    return v;
}


PlistValue
make_dict(PlistDict dict)
{
    PlistValue v;
    v.data.emplace<PlistDict>(std::move(dict));
    return v;
}


PlistValue
make_data(std::span<const std::byte> bytes)
{
    PlistValue v;
    v.data.emplace<std::vector<std::byte>>(bytes.begin(), bytes.end());
    return v;
}


PlistValue
make_stream(std::shared_ptr<PlistByteSource> source)
{
    PlistValue v;
    v.data.emplace<std::shared_ptr<PlistByteSource>>(std::move(source));
    return v;
}


PlistValue
make_record(std::shared_ptr<const PlistRecord> record)
{
    PlistValue v;
    v.data.emplace<std::shared_ptr<const PlistRecord>>(std::move(record));
    return v;
}


PlistValue
make_opaque(std::string_view type_name, std::shared_ptr<const void> object)
{
    PlistValue v;
    v.data.emplace<PlistOpaque>(
        PlistOpaque { std::string(type_name), std::move(object) });
    return v;
}


const char*
plist_value_kind_name(PlistValueKind kind) noexcept
{
    switch (kind) {
    case PlistValueKind::String: return "string";
    case PlistValueKind::Symbol: return "symbol";
    case PlistValueKind::Integer: return "integer";
    case PlistValueKind::Real: return "real";
    case PlistValueKind::Bool: return "bool";
    case PlistValueKind::Date: return "date";
    case PlistValueKind::Array: return "array";
    case PlistValueKind::Dict: return "dict";
    case PlistValueKind::Data: return "data";
    case PlistValueKind::Stream: return "stream";
    case PlistValueKind::Record: return "record";
    case PlistValueKind::Opaque: return "opaque";
    }
    return "unknown";
}

}  // namespace plistemit
