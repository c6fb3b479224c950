#include "plistemit/plist_dump.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

// Builds a value graph from the input: each byte selects a kind, and
// following bytes supply payloads.
struct ValueReader final {
    const uint8_t* p = nullptr;
    size_t n         = 0;

    bool take(uint8_t* out) noexcept
    {
        if (n == 0U) {
            return false;
        }
        *out = *p;
        p += 1;
        n -= 1U;
        return true;
    }

    std::string_view take_text() noexcept
    {
        uint8_t len = 0;
        if (!take(&len)) {
            return {};
        }
        const size_t k = (len < n) ? len : n;
        const std::string_view s(reinterpret_cast<const char*>(p), k);
        p += k;
        n -= k;
        return s;
    }

    plistemit::PlistValue read(uint32_t depth)
    {
        using namespace plistemit;

        uint8_t tag = 0;
        if (!take(&tag)) {
            return make_bool(false);
        }
        switch (tag % 9U) {
        case 0: return make_string(take_text());
        case 1: return make_symbol(take_text());
        case 2: {
            PlistInteger big;
            if (PlistInteger::parse(take_text(), &big)) {
                return make_integer(big);
            }
            return make_integer(static_cast<int64_t>(tag) - 128);
        }
        case 3: return make_real(static_cast<double>(tag) / 7.0);
        case 4: return make_bool((tag & 0x10U) != 0U);
        case 5: return make_date_value(PlistDate { static_cast<int64_t>(tag)
                                                   * 86399 });
        case 6: {
            const std::string_view s = take_text();
            return make_data(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(s.data()), s.size()));
        }
        case 7: {
            PlistArray a;
            uint8_t count = 0;
            (void)take(&count);
            for (uint8_t i = 0; i < (count % 8U) && n != 0U && depth < 64U;
                 ++i) {
                a.push_back(read(depth + 1U));
            }
            return make_array(std::move(a));
        }
        default: {
            PlistDict d;
            uint8_t count = 0;
            (void)take(&count);
            for (uint8_t i = 0; i < (count % 8U) && n != 0U && depth < 64U;
                 ++i) {
                const std::string key(take_text());
                d.set(key, read(depth + 1U));
            }
            return make_dict(std::move(d));
        }
        }
    }
};

}  // namespace

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace plistemit;

    ValueReader reader;
    reader.p               = data;
    reader.n               = size;
    const PlistValue value = reader.read(0);

    PlistDumpOptions options;
    options.limits.max_depth        = 32;
    options.limits.max_output_bytes = 4ULL * 1024ULL * 1024ULL;

    std::string out;
    (void)dump_plist(value, &out, options);
    return 0;
}
