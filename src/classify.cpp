#include <spdlog/spdlog.h>
#include <distclean/classify.h>
#include <distclean/fs.h>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;
using namespace distclean;


Result<std::set<std::string>> distclean::classify_bin_output(const fs::path &output_root, const ProductTargets &products) {
    std::unordered_map<std::string, std::unordered_set<std::string>> os_arch_to_products;
    for (const auto &[product, os_archs] : products)
        for (const auto &os_arch : os_archs)
            os_arch_to_products[os_arch.str()].insert(product);

    std::set<std::string> result;

    auto top = read_dir(output_root);
    if (not top) {
        spdlog::debug("skipping bin output {:?}: {}", output_root.string(), top.error().what());
        return result;
    }

    for (const auto &tag_dir : *top) {
        if (not is_dir(tag_dir))
            continue;

        auto os_arch_dirs = read_dir(tag_dir.path());
        if (not os_arch_dirs)
            return unexpected_move(os_arch_dirs);

        for (const auto &os_arch_dir : *os_arch_dirs) {
            if (not is_dir(os_arch_dir))
                continue;

            auto it = os_arch_to_products.find(os_arch_dir.path().filename().string());
            if (it == os_arch_to_products.end())
                continue;

            auto binaries = read_dir(os_arch_dir.path());
            if (not binaries)
                return unexpected_move(binaries);

            for (const auto &bin : *binaries) {
                if (it->second.count(bin.path().filename().string()) == 0)
                    continue;

                spdlog::debug("found binary {:?}", bin.path().string());
                result.insert(bin.path().string());
            }
        }
    }

    return result;
}
