#include "plistemit/build_info.h"

#include "plistemit/build_info_generated.h"

namespace plistemit {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(PLISTEMIT_BUILD_LINKAGE_STATIC) && PLISTEMIT_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(PLISTEMIT_BUILD_LINKAGE_SHARED) && PLISTEMIT_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/PLISTEMIT_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/PLISTEMIT_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/PLISTEMIT_BUILDINFO_BUILD_TYPE,
        /*system_name=*/PLISTEMIT_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/PLISTEMIT_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/PLISTEMIT_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/PLISTEMIT_BUILDINFO_CXX_COMPILER_VERSION,
        /*linkage_static=*/linkage_static(),
        /*linkage_shared=*/linkage_shared(),
    };

    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->clear();
        line1->append("PlistEmit v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type.empty() ? std::string_view("unknown")
                                            : bi.build_type);
        line1->append(" ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->append("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->append("-");
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->append("/");
        line2->append(bi.system_processor);
        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace plistemit
