#ifndef DISTCLEAN_DISTER_H
#define DISTCLEAN_DISTER_H

#include <distclean/error.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace distclean {
    struct DistConfig {
        std::optional<std::string> type = std::nullopt;
        std::optional<std::string> output_dir = std::nullopt;
        std::optional<std::string> name_template = std::nullopt;
        /// manual dist only
        std::optional<std::string> extension = std::nullopt;
    };

    /// A distribution type. Its artifacts are named after the rendered name template of the dist.
    struct Dister {
        Dister() = default;
        virtual ~Dister() = default;

        virtual std::string type_name() const = 0;
        virtual std::vector<std::string> artifacts(const std::string &rendered_name) const = 0;
        virtual Result<void> run_dist(const std::filesystem::path &output_dir) const = 0;
        /// check the artifacts were produced in `output_dir`
        virtual Result<void> verify(const std::filesystem::path &output_dir, const std::string &rendered_name) const = 0;
    };

    /// The output is produced by an external dist script as "<rendered name>[.<extension>]".
    struct ManualDister : Dister {
        static constexpr const char *type = "manual";

        std::string extension;

        explicit ManualDister(std::string extension = "")
            : extension(std::move(extension)) {}

        std::string type_name() const override { return type; }
        std::vector<std::string> artifacts(const std::string &rendered_name) const override;
        Result<void> run_dist(const std::filesystem::path &output_dir) const override;
        Result<void> verify(const std::filesystem::path &output_dir, const std::string &rendered_name) const override;
    };

    Result<std::unique_ptr<Dister>> make_dister(const DistConfig &cfg);
} // namespace distclean

#endif
