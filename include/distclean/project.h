#ifndef DISTCLEAN_PROJECT_H
#define DISTCLEAN_PROJECT_H

#include <rfl.hpp>
#include <distclean/error.h>
#include <distclean/dister.h>
#include <distclean/osarch.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#define DISTCLEAN_DEFAULT_BIN_DIR       "out/build"
#define DISTCLEAN_DEFAULT_DIST_DIR      "out/dist"
#define DISTCLEAN_DEFAULT_NAME_TEMPLATE "{{Product}}-{{Version}}"


namespace distclean {
    struct ProductConfig {
        std::optional<std::string> output_dir = std::nullopt;
        std::optional<std::vector<std::string>> os_archs = std::nullopt;
        std::optional<std::vector<DistConfig>> dist = std::nullopt;
    };

    /// contents of distclean.toml or distclean.json
    struct Project {
        std::optional<std::string> version = std::nullopt;
        std::map<std::string, ProductConfig> product = {};

        /// directory of the config file, relative paths are resolved against it
        rfl::Skip<std::string> project_dir = {};

        static Result<Project> New(const std::string &root_dir = "");
        static Result<Project> parse(const std::string &content, bool toml, const std::string &project_dir);
    };

    struct DistSpec {
        std::string output_dir;
        std::string rendered_name;
        std::shared_ptr<const Dister> dister;
    };

    /// a product with every path made absolute
    struct ProductSpec {
        std::string name;
        std::string bin_output_dir;
        std::vector<OSArch> os_archs;
        std::vector<DistSpec> dists;
    };

    /// substitute {{Product}} and {{Version}}
    std::string render_name_template(const std::string &name_template, const std::string &product, const std::string &version);

    Result<ProductSpec> resolve_product(const Project &project, const std::string &name);
} // namespace distclean

#endif
