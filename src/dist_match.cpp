#include <spdlog/spdlog.h>
#include <distclean/dist_match.h>
#include <distclean/fs.h>
#include <algorithm>

namespace fs = std::filesystem;
using namespace distclean;


bool ArtifactPattern::matches(std::string_view name) const {
    switch (kind_) {
    case Kind::product_prefix:
        return name.size() > text_.size() and name.starts_with(text_);
    case Kind::exact:
        return name == text_;
    }
    return false;
}

std::vector<ArtifactPattern> distclean::dist_patterns(const std::string &product, const std::vector<std::string> &artifact_paths) {
    std::vector<ArtifactPattern> patterns = {ArtifactPattern::product_prefix(product)};
    for (const auto &p : artifact_paths)
        patterns.push_back(ArtifactPattern::exact(fs::path(p).filename().string()));
    return patterns;
}

std::vector<DistEntry> distclean::match_dist_output(const fs::path &dist_output_dir, const std::vector<ArtifactPattern> &patterns) {
    std::vector<DistEntry> result;

    auto entries = read_dir(dist_output_dir);
    if (not entries) {
        spdlog::debug("skipping dist output {:?}: {}", dist_output_dir.string(), entries.error().what());
        return result;
    }

    for (const auto &entry : *entries) {
        const std::string name = entry.path().filename().string();
        auto it = std::ranges::find_if(patterns, [&](const ArtifactPattern &p) { return p.matches(name); });
        if (it == patterns.end())
            continue;

        spdlog::debug("dist artifact {:?} matched {:?}", entry.path().string(), it->text());
        result.push_back(DistEntry{.path = entry.path().string(), .is_dir = is_dir(entry)});
    }

    std::ranges::sort(result, {}, &DistEntry::path);
    return result;
}

std::vector<DistEntry> distclean::match_dist_output(const fs::path &dist_output_dir,
                                                    const std::string &product,
                                                    const std::vector<std::string> &artifact_paths) {
    return match_dist_output(dist_output_dir, dist_patterns(product, artifact_paths));
}
