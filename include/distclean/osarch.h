#ifndef DISTCLEAN_OSARCH_H
#define DISTCLEAN_OSARCH_H

#include <distclean/error.h>
#include <string>
#include <string_view>


namespace distclean {
    /// an operating system and architecture pair, written as "os-arch" (e.g. "linux-amd64")
    struct OSArch {
        std::string os, arch;

        /// split at the first '-', both parts must be non-empty
        static Result<OSArch> parse(std::string_view s);

        /// the os-arch this binary was compiled for
        static OSArch current();

        std::string str() const { return os + '-' + arch; }

        bool operator==(const OSArch &) const = default;
    };
} // namespace distclean

template <>
struct fmt::formatter<distclean::OSArch> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const distclean::OSArch &v, FormatContext &ctx) const {
        return fmt::formatter<std::string>::format(v.str(), ctx);
    }
};

#endif
