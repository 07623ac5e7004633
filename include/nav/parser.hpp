#pragma once

#include "error.h"

#include <chrono>
#include <concepts>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace nav {
    struct parser_error : std::runtime_error {
        parser_error(const std::string& what) : runtime_error(what) {}
    };

    template <typename T>
    struct parser {};

    template <>
    struct parser<std::string_view> {
        static auto parse(std::string_view string) -> std::string_view {
            return string;
        }
    };

    template <>
    struct parser<std::string> {
        static auto parse(std::string_view string) -> std::string {
            return std::string(string);
        }
    };

    template <typename T>
    struct parser<std::optional<T>> {
        static auto parse(std::string_view string) -> std::optional<T> {
            return parser<T>::parse(string);
        }
    };

    template <>
    struct parser<bool> {
        static auto parse(std::string_view string) -> bool {
            if (string.size() == 1) {
                switch (string[0]) {
                    case 't':
                    case 'y':
                        return true;
                    case 'f':
                    case 'n':
                        return false;
                    default:
                        break;
                }
            }
            else if (string == "true" || string == "yes") return true;
            else if (string == "false" || string == "no") return false;

            throw parser_error("Expect (t)rue/(f)alse or (y)es/(n)o");
        }
    };

    template <std::integral T>
    class parser<T> {
        static constexpr auto min = std::numeric_limits<T>::min();
        static constexpr auto max = std::numeric_limits<T>::max();

        [[noreturn]]
        static auto out_of_range(std::string_view argument) {
            throw parser_error(fmt::format(
                "Argument '{}' is outside the range of {} and {}",
                argument,
                min,
                max
            ));
        }
    public:
        static auto parse(std::string_view argument) -> T {
            const auto string = parser<std::string>::parse(argument);
            auto pos = std::size_t();

            // strtoul negates a leading minus sign instead of rejecting it.
            if constexpr (std::is_unsigned_v<T>) {
                if (string.find('-') != std::string::npos) {
                    throw parser_error("Expect a non-negative integer");
                }
            }

            try {
                auto value = T();

                if constexpr (std::is_same_v<long long, T>) {
                    value = std::stoll(string, &pos);
                }
                else if constexpr (std::is_same_v<unsigned long long, T>) {
                    value = std::stoull(string, &pos);
                }
                else if constexpr (std::is_same_v<long, T>) {
                    value = std::stol(string, &pos);
                }
                else if constexpr (std::is_same_v<unsigned long, T>) {
                    value = std::stoul(string, &pos);
                }
                else if constexpr (std::is_signed_v<T>) {
                    const auto result = std::stoi(string, &pos);
                    if (result > max || result < min) out_of_range(argument);
                    value = static_cast<T>(result);
                }
                else {
                    const auto result = std::stoul(string, &pos);
                    if (result > max) out_of_range(argument);
                    value = static_cast<T>(result);
                }

                if (pos != string.size()) {
                    throw parser_error("Expect an integer");
                }

                return value;
            }
            catch (const std::invalid_argument& ex) {
                throw parser_error("Expect an integer");
            }
            catch (const std::out_of_range& ex) {
                out_of_range(argument);
            }

            __builtin_unreachable();
        }
    };

    template <typename Rep, typename Period>
    struct parser<std::chrono::duration<Rep, Period>> {
        static auto parse(
            std::string_view string
        ) -> std::chrono::duration<Rep, Period> {
            const auto value = parser<Rep>::parse(string);
            return std::chrono::duration<Rep, Period>(value);
        }
    };

    template <>
    struct parser<std::filesystem::path> {
        static auto parse(std::string_view string) -> std::filesystem::path {
            return string;
        }
    };
}
