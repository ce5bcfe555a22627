#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/cfg/env.h>
#include <memory>
#include "options.h"


int main(int argc, char **argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("distclean"));
    spdlog::set_pattern("[%^%l%$] %v");
    spdlog::cfg::load_env_levels();

    enum struct Subcommand { clean, verify, schema };

    struct Opts {
        distclean::cli::Tag<"subcommand,positional", Subcommand> subcommand;
    } opts;

    if (argc < 2) {
        spdlog::error("missing subcommand, usage: {} <clean|verify|schema> [options]", argv[0]);
        return 1;
    }

    distclean::cli::parse_tagged("distclean", 2, argv, opts);

    auto argv0 = fmt::format("{} {}", argv[0], argv[1]);
    argv += 1;
    argv[0] = argv0.data();
    argc -= 1;

    std::unique_ptr<Base> cmd;
    switch (opts.subcommand()) {
    case Subcommand::clean:
        cmd = std::make_unique<Clean>("Remove the build and dist outputs of products", argc, argv);
        break;
    case Subcommand::verify:
        cmd = std::make_unique<Verify>("Check that the dist outputs of a product were produced", argc, argv);
        break;
    case Subcommand::schema:
        cmd = std::make_unique<Schema>("Generate json schema for distclean.json", argc, argv);
        break;
    }

    if (auto res = cmd->exec(); not res) {
        spdlog::error("{}", res.error().what());
        return 1;
    }
    return 0;
}
