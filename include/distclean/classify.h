#ifndef DISTCLEAN_CLASSIFY_H
#define DISTCLEAN_CLASSIFY_H

#include <distclean/error.h>
#include <distclean/osarch.h>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>


namespace distclean {
    /// product name -> os-archs it is built for
    using ProductTargets = std::map<std::string, std::vector<OSArch>>;

    /// Find the binaries of `products` laid out as `output_root/<tag>/<os-arch>/<product>`.
    /// The tag directory name is not checked. A missing or unreadable `output_root` yields an empty set,
    /// an unreadable directory below it is an error.
    Result<std::set<std::string>> classify_bin_output(const std::filesystem::path &output_root, const ProductTargets &products);
} // namespace distclean

#endif
