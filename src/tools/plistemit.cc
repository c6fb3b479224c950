#include "plistemit/build_info.h"
#include "plistemit/byte_source.h"
#include "plistemit/plist_dump.h"
#include "plistemit/plist_value.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace plistemit {
namespace {

    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        // strtoul/strtoull accept a sign and wrap negative values.
        if (!s || *s < '0' || *s > '9') {
            return false;
        }
        char* end       = nullptr;
        unsigned long v = std::strtoul(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        if (v > 0xFFFFFFFFUL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        // strtoul/strtoull accept a sign and wrap negative values.
        if (!s || *s < '0' || *s > '9') {
            return false;
        }
        char* end            = nullptr;
        errno                = 0;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (errno == ERANGE || !end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static bool parse_real_arg(std::string_view s, double* out)
    {
        const std::string tmp(s);
        if (tmp.empty()) {
            return false;
        }
        char* end      = nullptr;
        const double v = std::strtod(tmp.c_str(), &end);
        if (!end || *end != '\0') {
            return false;
        }
        *out = v;
        return true;
    }

    static bool parse_bool_arg(std::string_view s, bool* out)
    {
        if (s == "true" || s == "yes" || s == "1") {
            *out = true;
            return true;
        }
        if (s == "false" || s == "no" || s == "0") {
            *out = false;
            return true;
        }
        return false;
    }

    // Parses `key=type:value` into \p key and \p value.
    static bool parse_pair_arg(const char* arg, uint64_t max_file_bytes,
                               std::string* key, PlistValue* value)
    {
        const std::string_view s(arg);
        const size_t eq = s.find('=');
        if (eq == std::string_view::npos || eq == 0U) {
            return false;
        }
        const size_t colon = s.find(':', eq + 1U);
        if (colon == std::string_view::npos) {
            return false;
        }

        const std::string_view type = s.substr(eq + 1U, colon - eq - 1U);
        const std::string_view text = s.substr(colon + 1U);
        key->assign(s.substr(0, eq));

        if (type == "str") {
            *value = make_string(text);
            return true;
        }
        if (type == "sym") {
            *value = make_symbol(text);
            return true;
        }
        if (type == "int") {
            PlistInteger i;
            if (!PlistInteger::parse(text, &i)) {
                return false;
            }
            *value = make_integer(std::move(i));
            return true;
        }
        if (type == "real") {
            double d = 0.0;
            if (!parse_real_arg(text, &d)) {
                return false;
            }
            *value = make_real(d);
            return true;
        }
        if (type == "bool") {
            bool b = false;
            if (!parse_bool_arg(text, &b)) {
                return false;
            }
            *value = make_bool(b);
            return true;
        }
        if (type == "date") {
            PlistDate d;
            if (!parse_date_literal(text, &d)) {
                return false;
            }
            *value = make_date_value(d);
            return true;
        }
        if (type == "data") {
            *value = make_data(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(text.data()), text.size()));
            return true;
        }
        if (type == "file") {
            if (text.empty()) {
                return false;
            }
            *value = make_stream(std::make_shared<FileByteSource>(
                std::string(text), max_file_bytes));
            return true;
        }
        return false;
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] [key=type:value ...]\n", argv0);
        std::printf("types: str sym int real bool date data file\n");
        std::printf("options:\n");
        std::printf("  --version              print build info and exit\n");
        std::printf("  -o FILE                save the plist to FILE instead of stdout\n");
        std::printf("  --fragment             omit the XML/plist envelope\n");
        std::printf("  --indent N             indent with N spaces instead of a tab\n");
        std::printf(
            "  --max-depth N          max container nesting depth (default: 512)\n");
        std::printf(
            "  --max-output-bytes N   refuse output larger than N bytes (default: 0=unlimited)\n");
        std::printf(
            "  --max-file-bytes N     refuse to read file: values larger than N bytes (default: 536870912; 0=unlimited)\n");
    }

    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }

}  // namespace
}  // namespace plistemit

int
main(int argc, char** argv)
{
    using namespace plistemit;

    PlistDumpOptions options;
    const char* out_path    = nullptr;
    uint64_t max_file_bytes = 512ULL * 1024ULL * 1024ULL;

    int first_pair = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--fragment") == 0) {
            options.envelope = false;
            first_pair += 1;
            continue;
        }
        if (std::strcmp(arg, "-o") == 0 && i + 1 < argc) {
            out_path = argv[i + 1];
            i += 1;
            first_pair += 2;
            continue;
        }
        if (std::strcmp(arg, "--indent") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v) || v > 16U) {
                std::fprintf(stderr, "invalid --indent value\n");
                return 2;
            }
            options.indent_unit.assign(v, ' ');
            i += 1;
            first_pair += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-depth") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-depth value\n");
                return 2;
            }
            options.limits.max_depth = v;
            i += 1;
            first_pair += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-output-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-output-bytes value\n");
                return 2;
            }
            options.limits.max_output_bytes = v;
            i += 1;
            first_pair += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            max_file_bytes = v;
            i += 1;
            first_pair += 2;
            continue;
        }
        break;
    }

    PlistDict root;
    for (int argi = first_pair; argi < argc; ++argi) {
        const char* arg = argv[argi];
        if (!arg || !*arg) {
            continue;
        }
        std::string key;
        PlistValue value;
        if (!parse_pair_arg(arg, max_file_bytes, &key, &value)) {
            std::fprintf(stderr, "plistemit: invalid argument `%s`\n", arg);
            usage(argv[0]);
            return 2;
        }
        root.set(std::move(key), std::move(value));
    }
    const PlistValue doc = make_dict(std::move(root));

    if (out_path) {
        const PlistSaveResult r = save_plist(doc, out_path, options);
        if (r.dump.status != PlistDumpStatus::Ok) {
            std::fprintf(stderr, "plistemit: dump failed (%s)\n",
                         plist_dump_status_name(r.dump.status));
            return 1;
        }
        if (r.file != WriteFileStatus::Ok) {
            std::fprintf(stderr, "plistemit: failed to write `%s` (%s)\n",
                         out_path, write_file_status_name(r.file));
            return 1;
        }
        return 0;
    }

    std::string text;
    const PlistDumpResult r = dump_plist(doc, &text, options);
    if (r.status != PlistDumpStatus::Ok) {
        std::fprintf(stderr, "plistemit: dump failed (%s)\n",
                     plist_dump_status_name(r.status));
        return 1;
    }
    if (std::fwrite(text.data(), 1, text.size(), stdout) != text.size()) {
        std::fprintf(stderr, "plistemit: failed to write output\n");
        return 1;
    }
    return 0;
}
