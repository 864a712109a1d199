/**
 * @file string_utils.hpp
 * @brief Small string helpers shared by the engine and the CLI
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace capsule {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 */
class StringUtils {
public:
    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /// Split on @p delimiter, dropping empty tokens
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Cut @p str to @p max_length characters, appending @p suffix if cut
     *
     * Never splits a UTF-8 sequence.
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");

    static bool StartsWith(const std::string& str, const std::string& prefix);
};

} // namespace utils
} // namespace capsule
