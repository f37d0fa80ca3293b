/**
 * @file NameFilter.hpp
 * @brief Shell-style wildcard selection of files to restore.
 */

#pragma once

#include "PlannedAction.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace dosrestore
{
    /**
     * @brief Matches a name against a pattern with '*' (any run of
     * characters) and '?' (exactly one character).
     *
     * The whole name must match. Comparison ignores ASCII case, as DOS
     * file names do.
     */
    bool wildcardMatch(std::string_view pattern, std::string_view name);

    /**
     * @brief Keeps the actions whose destination file name (the last
     * path component) matches the pattern, preserving order.
     */
    std::vector<PlannedAction> filterActions(const std::vector<PlannedAction>& actions,
                                             std::string_view pattern);

} // namespace dosrestore
