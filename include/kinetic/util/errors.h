#ifndef KINETIC_UTIL_ERRORS
#define KINETIC_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kinetic {

    // Overload (I) - takes an error message and appends the source location of the caller
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] void throw_error(std::string_view msg,
                                  std::source_location loc = std::source_location::current()) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - direct formatting of the error message from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] void throw_error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Returns a human readable description of an in-flight exception, used when a failure is contained and
     * reported rather than propagated.
     */
    std::string describe_exception(std::exception_ptr ex);

} // namespace kinetic

#endif // KINETIC_UTIL_ERRORS
