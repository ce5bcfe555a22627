#ifndef DISTCLEAN_DIST_MATCH_H
#define DISTCLEAN_DIST_MATCH_H

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>


namespace distclean {
    /// matches the file name of an entry in a distribution output directory
    class ArtifactPattern {
    public:
        enum class Kind { product_prefix, exact };

        /// "<product>-" followed by at least one character, whatever the version
        static ArtifactPattern product_prefix(std::string product) { return {Kind::product_prefix, std::move(product) + '-'}; }

        static ArtifactPattern exact(std::string name) { return {Kind::exact, std::move(name)}; }

        [[nodiscard]] bool matches(std::string_view name) const;

        Kind kind() const { return kind_; }
        const std::string &text() const { return text_; }

    private:
        ArtifactPattern(Kind kind, std::string text)
            : kind_(kind), text_(std::move(text)) {}

        Kind kind_;
        std::string text_;
    };

    struct DistEntry {
        std::string path;
        bool is_dir = false;

        bool operator==(const DistEntry &) const = default;
    };

    /// product prefix first, then the base name of every path in `artifact_paths`
    std::vector<ArtifactPattern> dist_patterns(const std::string &product, const std::vector<std::string> &artifact_paths);

    /// Entries of `dist_output_dir` matched by `patterns`, first match wins. Sorted by path.
    /// A missing or unreadable directory yields nothing.
    std::vector<DistEntry> match_dist_output(const std::filesystem::path &dist_output_dir,
                                             const std::vector<ArtifactPattern> &patterns);

    std::vector<DistEntry> match_dist_output(const std::filesystem::path &dist_output_dir,
                                             const std::string &product,
                                             const std::vector<std::string> &artifact_paths);
} // namespace distclean

#endif
