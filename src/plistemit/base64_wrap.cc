#include "plistemit/base64_wrap.h"

namespace plistemit {
namespace {

    static constexpr char kEnc[]
        = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    // Streams base64 quads into a line-wrapped sink. A line width of 0
    // disables wrapping.
    struct Base64Encoder final {
        std::string* out  = nullptr;
        uint32_t width    = 0;
        uint32_t column   = 0;
        uint8_t buf[3]    = { 0, 0, 0 };
        uint32_t buffered = 0;

        Base64Encoder(std::string* sink, uint32_t line_width) noexcept
            : out(sink)
            , width(line_width)
        {
        }

        void put(char c)
        {
            if (width != 0U && column == width) {
                out->push_back('\n');
                column = 0;
            }
            out->push_back(c);
            column += 1U;
        }

        void emit_triplet(uint8_t a, uint8_t b, uint8_t c)
        {
            put(kEnc[(a >> 2) & 0x3F]);
            put(kEnc[((a & 0x03) << 4) | ((b >> 4) & 0x0F)]);
            put(kEnc[((b & 0x0F) << 2) | ((c >> 6) & 0x03)]);
            put(kEnc[c & 0x3F]);
        }

        void append_u8(uint8_t v)
        {
            buf[buffered] = v;
            buffered += 1;
            if (buffered == 3U) {
                emit_triplet(buf[0], buf[1], buf[2]);
                buffered = 0;
            }
        }

        void append(std::span<const std::byte> bytes)
        {
            for (size_t i = 0; i < bytes.size(); ++i) {
                append_u8(static_cast<uint8_t>(bytes[i]));
            }
        }

        void finish()
        {
            if (buffered == 1U) {
                const uint8_t a = buf[0];
                put(kEnc[(a >> 2) & 0x3F]);
                put(kEnc[(a & 0x03) << 4]);
                put('=');
                put('=');
            } else if (buffered == 2U) {
                const uint8_t a = buf[0];
                const uint8_t b = buf[1];
                put(kEnc[(a >> 2) & 0x3F]);
                put(kEnc[((a & 0x03) << 4) | ((b >> 4) & 0x0F)]);
                put(kEnc[(b & 0x0F) << 2]);
                put('=');
            }
            buffered = 0;
        }
    };

}  // namespace


void
append_base64(std::span<const std::byte> bytes, std::string* out)
{
    if (!out) {
        return;
    }
    out->reserve(out->size() + ((bytes.size() + 2U) / 3U) * 4U);

    Base64Encoder b64(out, 0);
    b64.append(bytes);
    b64.finish();
}


void
append_wrapped_base64(std::span<const std::byte> bytes, uint32_t line_width,
                      std::string* out)
{
    if (!out) {
        return;
    }
    if (line_width == 0U) {
        line_width = kPlistDataLineWidth;
    }

    const size_t encoded = ((bytes.size() + 2U) / 3U) * 4U;
    out->reserve(out->size() + encoded + encoded / line_width + 2U);

    out->push_back('\n');
    if (bytes.empty()) {
        return;
    }

    Base64Encoder b64(out, line_width);
    b64.append(bytes);
    b64.finish();
    out->push_back('\n');
}


std::string
wrap_base64(std::span<const std::byte> bytes)
{
    std::string out;
    append_wrapped_base64(bytes, kPlistDataLineWidth, &out);
    return out;
}

}  // namespace plistemit
