#ifndef DISTCLEAN_ERROR_H
#define DISTCLEAN_ERROR_H

#include <fmt/format.h>
#include <stdexcept>
#include <expected>
#include <string>


namespace distclean {
    enum class errc { io, consistency, config };

    class error : public std::runtime_error {
    public:
        error(errc code, const std::string &what)
            : std::runtime_error(what), code_(code) {}

        [[nodiscard]] errc code() const noexcept { return code_; }

    private:
        errc code_;
    };

    template <typename T>
    using Result = std::expected<T, error>;

    template <typename T>
    [[nodiscard]] std::unexpected<error> unexpected_move(Result<T> &r) {
        return std::unexpected(std::move(r.error()));
    }

    template <typename... T>
    error errorf(errc code, fmt::format_string<T...> fmt, T &&...args) {
        return error(code, fmt::format(fmt, std::forward<T>(args)...));
    }

    template <typename... T>
    std::unexpected<error> unexpected_errorf(errc code, fmt::format_string<T...> fmt, T &&...args) {
        return std::unexpected(error(code, fmt::format(fmt, std::forward<T>(args)...)));
    }

    /// prefix the message of `err` with some context, keeping its code
    template <typename... T>
    std::unexpected<error> wrap(const error &err, fmt::format_string<T...> fmt, T &&...args) {
        return std::unexpected(error(err.code(), fmt::format("{}: {}", fmt::format(fmt, std::forward<T>(args)...), err.what())));
    }
} // namespace distclean

#endif
