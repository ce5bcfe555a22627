#include <distclean/osarch.h>

using namespace distclean;


Result<OSArch> OSArch::parse(std::string_view s) {
    auto pos = s.find('-');
    if (pos == std::string_view::npos or pos == 0 or pos + 1 == s.size())
        return unexpected_errorf(errc::config, "invalid os-arch {:?}: expected the form \"os-arch\"", s);

    return OSArch{.os = std::string(s.substr(0, pos)), .arch = std::string(s.substr(pos + 1))};
}

OSArch OSArch::current() {
#if defined(__APPLE__)
    std::string os = "darwin";
#elif defined(_WIN32)
    std::string os = "windows";
#elif defined(__FreeBSD__)
    std::string os = "freebsd";
#else
    std::string os = "linux";
#endif

#if defined(__x86_64__) || defined(_M_X64)
    std::string arch = "amd64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    std::string arch = "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    std::string arch = "386";
#elif defined(__arm__)
    std::string arch = "arm";
#else
    std::string arch = "unknown";
#endif

    return OSArch{.os = std::move(os), .arch = std::move(arch)};
}
