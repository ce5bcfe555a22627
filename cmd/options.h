#pragma once

#include <distclean/cli/options.h>
#include <distclean/error.h>
#include <optional>
#include <string>
#include <vector>


struct Base {
    Base() = default;
    virtual ~Base() = default;

    virtual distclean::Result<void> exec() = 0;
};

struct Clean : Base {
    std::optional<std::vector<std::string>> products;
    std::optional<std::string> root;
    bool dry_run = false;

    Clean(const std::string &name, int argc, char **argv) {
        const std::vector<distclean::cli::Option> options = {
            {
             .target = &products,
             .key_char = 'p',
             .key_str = "products",
             .help = "Products to clean, all products if none is given",
             .is_positional = true,
             },
            {
             .target = &root,
             .key_str = "root",
             .help = "Specify root dir containing distclean.toml",
             },
            {
             .target = &dry_run,
             .key_char = 'n',
             .key_str = "dry-run",
             .help = "Print the paths that would be removed without removing them",
             },
        };
        distclean::cli::parse(name, argc, argv, options);
    }

    distclean::Result<void> exec() override;
};

struct Verify : Base {
    std::string product;
    std::optional<std::string> root;

    Verify(const std::string &name, int argc, char **argv) {
        const std::vector<distclean::cli::Option> options = {
            {
             .target = &product,
             .key_char = 'p',
             .key_str = "product",
             .help = "Product whose dist outputs are checked",
             .is_positional = true,
             },
            {
             .target = &root,
             .key_str = "root",
             .help = "Specify root dir containing distclean.toml",
             },
        };
        distclean::cli::parse(name, argc, argv, options);
    }

    distclean::Result<void> exec() override;
};

struct Schema : Base {
    Schema(const std::string &name, int argc, char **argv) {
        const std::vector<distclean::cli::Option> options = {};
        distclean::cli::parse(name, argc, argv, options);
    }

    distclean::Result<void> exec() override;
};
