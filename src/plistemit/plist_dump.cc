#include "plistemit/plist_dump.h"

#include "plistemit/base64_wrap.h"
#include "plistemit/byte_source.h"
#include "plistemit/indented_text.h"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string_view>
#include <utility>

namespace plistemit {
namespace {

    static constexpr std::string_view kXmlDecl
        = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    static constexpr std::string_view kPlistDoctype
        = "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
          "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n";
    static constexpr std::string_view kPlistOpen  = "<plist version=\"1.0\">\n";
    static constexpr std::string_view kPlistClose = "</plist>\n";


    static void append_hex_escape(uint8_t c, std::string* out)
    {
        static constexpr char hex[] = "0123456789ABCDEF";
        out->push_back('\\');
        out->push_back('x');
        out->push_back(hex[(c >> 4) & 0x0F]);
        out->push_back(hex[(c >> 0) & 0x0F]);
    }

    // Returns the length of the well-formed UTF-8 sequence starting at
    // s[i] when it encodes an XML 1.0 Char, else 0.
    static size_t utf8_char_length(std::string_view s, size_t i) noexcept
    {
        const uint8_t c0 = static_cast<uint8_t>(s[i]);
        if ((c0 & 0x80U) == 0U) {
            return 1;
        }

        uint32_t needed = 0;
        uint32_t min_cp = 0;
        uint32_t cp     = 0;
        if ((c0 & 0xE0U) == 0xC0U) {
            needed = 1;
            min_cp = 0x80U;
            cp     = c0 & 0x1FU;
        } else if ((c0 & 0xF0U) == 0xE0U) {
            needed = 2;
            min_cp = 0x800U;
            cp     = c0 & 0x0FU;
        } else if ((c0 & 0xF8U) == 0xF0U) {
            needed = 3;
            min_cp = 0x10000U;
            cp     = c0 & 0x07U;
        } else {
            return 0;
        }

        if (i + needed >= s.size()) {
            return 0;
        }
        for (uint32_t j = 0; j < needed; ++j) {
            const uint8_t cx = static_cast<uint8_t>(s[i + 1U + j]);
            if ((cx & 0xC0U) != 0x80U) {
                return 0;
            }
            cp = (cp << 6) | static_cast<uint32_t>(cx & 0x3FU);
        }

        if (cp < min_cp || cp > 0x10FFFFU) {
            return 0;
        }
        if ((cp >= 0xD800U && cp <= 0xDFFFU) || cp == 0xFFFEU
            || cp == 0xFFFFU) {
            return 0;
        }
        return static_cast<size_t>(needed) + 1U;
    }

    // Copies a multi-byte sequence at s[*i], or escapes its lead byte when
    // it is not valid UTF-8. Advances *i past what was consumed.
    static void append_utf8_or_escape(std::string_view s, size_t* i,
                                      std::string* out)
    {
        const size_t n = utf8_char_length(s, *i);
        if (n == 0U) {
            append_hex_escape(static_cast<uint8_t>(s[*i]), out);
            *i += 1U;
            return;
        }
        out->append(s.substr(*i, n));
        *i += n;
    }

    // Comment bodies may not contain `--` or end with `-`.
    static void append_comment_safe(std::string_view s, std::string* out)
    {
        char prev = '\0';
        for (size_t i = 0; i < s.size();) {
            const uint8_t c = static_cast<uint8_t>(s[i]);
            if (c < 0x20U || c == 0x7FU) {
                append_hex_escape(c, out);
                prev = 'x';
                i += 1U;
                continue;
            }
            if (c >= 0x80U) {
                append_utf8_or_escape(s, &i, out);
                prev = 'x';
                continue;
            }
            if (c == static_cast<uint8_t>('-') && prev == '-') {
                out->push_back(' ');
            }
            out->push_back(static_cast<char>(c));
            prev = static_cast<char>(c);
            i += 1U;
        }
        if (prev == '-') {
            out->push_back(' ');
        }
    }


    struct Emitter final {
        IndentedText* text              = nullptr;
        const PlistDumpOptions* options = nullptr;
        PlistDumpStatus status          = PlistDumpStatus::Ok;
        uint32_t nodes                  = 0;
        std::string line;

        Emitter(IndentedText* out, const PlistDumpOptions* opts) noexcept
            : text(out)
            , options(opts)
        {
        }

        bool failed() const noexcept { return status != PlistDumpStatus::Ok; }

        void fail(PlistDumpStatus s) noexcept
        {
            if (status == PlistDumpStatus::Ok) {
                status = s;
            }
        }

        void check_output_limit() noexcept
        {
            const uint64_t cap = options->limits.max_output_bytes;
            if (cap != 0U && static_cast<uint64_t>(text->size()) > cap) {
                fail(PlistDumpStatus::LimitExceeded);
            }
        }

        void emit_line(std::string_view s)
        {
            text->append_text_line(s);
            check_output_limit();
        }

        void emit_element(std::string_view name, std::string_view content)
        {
            line.clear();
            line.append("<");
            line.append(name);
            line.append(">");
            append_xml_escaped(content, &line);
            line.append("</");
            line.append(name);
            line.append(">");
            emit_line(line);
        }

        void open_block(std::string_view name)
        {
            line.assign("<");
            line.append(name);
            line.append(">");
            emit_line(line);
            text->raise_indent();
        }

        void close_block(std::string_view name)
        {
            text->lower_indent();
            line.assign("</");
            line.append(name);
            line.append(">");
            emit_line(line);
        }

        void emit_scalar(PlistValueKind kind, std::string_view content)
        {
            const std::string_view name = scalar_element_name(kind);
            if (name.empty()) {
                fail(PlistDumpStatus::UnclassifiableScalar);
                return;
            }
            emit_element(name, content);
        }

        void emit_data(std::span<const std::byte> bytes)
        {
            // Payload lines share the element's indentation.
            std::string fragment = "<data>";
            append_wrapped_base64(bytes, kPlistDataLineWidth, &fragment);
            fragment.append("</data>\n");
            text->append(fragment);
            check_output_limit();
        }

        void emit_stream(const std::shared_ptr<PlistByteSource>& source)
        {
            if (!source || !source->rewind()) {
                fail(PlistDumpStatus::StreamReadFailed);
                return;
            }
            std::vector<std::byte> bytes;
            if (!source->read_all(&bytes)) {
                fail(PlistDumpStatus::StreamReadFailed);
                return;
            }
            emit_data(bytes);
        }

        void emit_opaque(const PlistOpaque& opaque)
        {
            if (!options->snapshot) {
                fail(PlistDumpStatus::SnapshotUnavailable);
                return;
            }
            std::vector<std::byte> bytes;
            if (!options->snapshot(opaque, &bytes)) {
                fail(PlistDumpStatus::SnapshotFailed);
                return;
            }

            line.assign("<!-- The <data> element below contains a host object (");
            append_comment_safe(opaque.type_name, &line);
            line.append(") serialized with the caller-supplied snapshot "
                        "function. -->");
            emit_line(line);
            emit_data(bytes);
        }

        void emit_array(const PlistArray& array, uint32_t depth)
        {
            if (array.empty()) {
                emit_line("<array/>");
                return;
            }
            open_block("array");
            for (size_t i = 0; i < array.size() && !failed(); ++i) {
                emit_node(array[i], depth + 1U);
            }
            close_block("array");
        }

        void emit_dict(const PlistDict& dict, uint32_t depth)
        {
            if (dict.empty()) {
                emit_line("<dict/>");
                return;
            }
            const std::vector<const PlistDictEntry*> sorted
                = dict.sorted_entries();
            open_block("dict");
            for (size_t i = 0; i < sorted.size() && !failed(); ++i) {
                emit_element("key", sorted[i]->key);
                emit_node(sorted[i]->value, depth + 1U);
            }
            close_block("dict");
        }

        void emit_node(const PlistValue& v, uint32_t depth)
        {
            if (failed()) {
                return;
            }
            if (depth > options->limits.max_depth) {
                fail(PlistDumpStatus::LimitExceeded);
                return;
            }
            nodes += 1U;

            switch (v.kind()) {
            case PlistValueKind::String:
                emit_scalar(v.kind(), std::get<std::string>(v.data));
                return;
            case PlistValueKind::Symbol:
                emit_scalar(v.kind(), std::get<PlistSymbol>(v.data).name);
                return;
            case PlistValueKind::Integer:
                emit_scalar(v.kind(),
                            std::get<PlistInteger>(v.data).to_string());
                return;
            case PlistValueKind::Real: {
                std::string s;
                append_real_literal(std::get<double>(v.data), &s);
                emit_scalar(v.kind(), s);
                return;
            }
            case PlistValueKind::Bool:
                emit_line(std::get<bool>(v.data) ? "<true/>" : "<false/>");
                return;
            case PlistValueKind::Date: {
                std::string s;
                append_date_literal(std::get<PlistDate>(v.data), &s);
                emit_element("date", s);
                return;
            }
            case PlistValueKind::Array:
                emit_array(std::get<PlistArray>(v.data), depth);
                return;
            case PlistValueKind::Dict:
                emit_dict(std::get<PlistDict>(v.data), depth);
                return;
            case PlistValueKind::Data: {
                const std::vector<std::byte>& b
                    = std::get<std::vector<std::byte>>(v.data);
                emit_data(std::span<const std::byte>(b.data(), b.size()));
                return;
            }
            case PlistValueKind::Stream:
                emit_stream(std::get<std::shared_ptr<PlistByteSource>>(v.data));
                return;
            case PlistValueKind::Record: {
                const std::shared_ptr<const PlistRecord>& r
                    = std::get<std::shared_ptr<const PlistRecord>>(v.data);
                if (!r) {
                    emit_line("<dict/>");
                    return;
                }
                emit_dict(r->plist_attributes(), depth);
                return;
            }
            case PlistValueKind::Opaque:
                emit_opaque(std::get<PlistOpaque>(v.data));
                return;
            }
            fail(PlistDumpStatus::UnclassifiableScalar);
        }
    };

}  // namespace


std::string_view
scalar_element_name(PlistValueKind kind) noexcept
{
    switch (kind) {
    case PlistValueKind::String:
    case PlistValueKind::Symbol: return "string";
    case PlistValueKind::Integer: return "integer";
    case PlistValueKind::Real: return "real";
    default: return {};
    }
}


void
append_xml_escaped(std::string_view text, std::string* out)
{
    if (!out) {
        return;
    }
    out->reserve(out->size() + text.size());
    for (size_t i = 0; i < text.size();) {
        const uint8_t c = static_cast<uint8_t>(text[i]);
        if (c >= 0x80U) {
            append_utf8_or_escape(text, &i, out);
            continue;
        }
        i += 1U;
        switch (c) {
        case '&': out->append("&amp;"); continue;
        case '<': out->append("&lt;"); continue;
        case '>': out->append("&gt;"); continue;
        case '"': out->append("&quot;"); continue;
        case '\'': out->append("&apos;"); continue;
        case '\r': out->append("&#13;"); continue;
        default: break;
        }

        // XML 1.0 allows TAB/LF and 0x20..; escape other control bytes.
        if (c == 0x09U || c == 0x0AU || (c >= 0x20U && c != 0x7FU)) {
            out->push_back(static_cast<char>(c));
            continue;
        }
        append_hex_escape(c, out);
    }
}


void
append_real_literal(double value, std::string* out)
{
    if (!out) {
        return;
    }
    if (std::isnan(value)) {
        out->append("nan");
        return;
    }
    if (std::isinf(value)) {
        out->append(value < 0.0 ? "-infinity" : "+infinity");
        return;
    }

    char buf[64];
    const std::to_chars_result r = std::to_chars(buf, buf + sizeof(buf),
                                                 value);
    if (r.ec != std::errc()) {
        char fallback[64];
        const int n = std::snprintf(fallback, sizeof(fallback), "%.17g",
                                    value);
        if (n > 0) {
            out->append(fallback, static_cast<size_t>(n));
        }
        return;
    }

    const std::string_view s(buf, static_cast<size_t>(r.ptr - buf));
    out->append(s);
    // Keep integral values recognizable as reals.
    if (s.find_first_of(".e") == std::string_view::npos) {
        out->append(".0");
    }
}


std::string
wrap_plist_envelope(std::string_view fragment)
{
    std::string out;
    out.reserve(kXmlDecl.size() + kPlistDoctype.size() + kPlistOpen.size()
                + fragment.size() + kPlistClose.size());
    out.append(kXmlDecl);
    out.append(kPlistDoctype);
    out.append(kPlistOpen);
    out.append(fragment);
    out.append(kPlistClose);
    return out;
}


PlistDumpResult
dump_plist(const PlistValue& value, std::string* out,
           const PlistDumpOptions& options)
{
    PlistDumpResult r;
    if (!out) {
        r.status = PlistDumpStatus::InvalidArgument;
        return r;
    }
    out->clear();

    IndentedText text(options.indent_unit);
    Emitter em(&text, &options);
    em.emit_node(value, 0);
    r.nodes = em.nodes;
    if (em.failed()) {
        r.status = em.status;
        return r;
    }

    if (options.envelope) {
        *out = wrap_plist_envelope(text.text());
    } else {
        *out = text.take_text();
    }

    const uint64_t cap = options.limits.max_output_bytes;
    if (cap != 0U && static_cast<uint64_t>(out->size()) > cap) {
        out->clear();
        r.status = PlistDumpStatus::LimitExceeded;
        return r;
    }

    r.written = static_cast<uint64_t>(out->size());
    return r;
}


std::string
dump_plist_text(const PlistValue& value, bool envelope)
{
    PlistDumpOptions options;
    options.envelope = envelope;
    std::string out;
    (void)dump_plist(value, &out, options);
    return out;
}


PlistSaveResult
save_plist(const PlistValue& value, const char* path,
           const PlistDumpOptions& options)
{
    PlistSaveResult r;

    PlistDumpOptions enveloped = options;
    enveloped.envelope         = true;

    std::string doc;
    r.dump = dump_plist(value, &doc, enveloped);
    if (r.dump.status != PlistDumpStatus::Ok) {
        return r;
    }

    r.file = write_file_bytes(
        path, std::span<const std::byte>(
                  reinterpret_cast<const std::byte*>(doc.data()), doc.size()));
    return r;
}


const char*
plist_dump_status_name(PlistDumpStatus status) noexcept
{
    switch (status) {
    case PlistDumpStatus::Ok: return "ok";
    case PlistDumpStatus::UnclassifiableScalar:
        return "unclassifiable_scalar";
    case PlistDumpStatus::SnapshotUnavailable: return "snapshot_unavailable";
    case PlistDumpStatus::SnapshotFailed: return "snapshot_failed";
    case PlistDumpStatus::StreamReadFailed: return "stream_read_failed";
    case PlistDumpStatus::LimitExceeded: return "limit_exceeded";
    case PlistDumpStatus::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

}  // namespace plistemit
