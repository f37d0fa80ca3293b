/**
 * @file NameFilter.cpp
 * @brief Implementation of the wildcard filter.
 */

#include "dosrestore/NameFilter.hpp"
#include <cctype>

namespace dosrestore
{
    namespace
    {
        bool sameChar(char a, char b)
        {
            return std::toupper(static_cast<unsigned char>(a)) ==
                   std::toupper(static_cast<unsigned char>(b));
        }

        std::string_view lastComponent(std::string_view path)
        {
            const auto slash = path.find_last_of('/');
            return slash == std::string_view::npos ? path : path.substr(slash + 1);
        }
    }

    bool wildcardMatch(std::string_view pattern, std::string_view name)
    {
        // Greedy match with backtracking to the most recent '*'
        size_t p = 0, n = 0;
        size_t starP = std::string_view::npos, starN = 0;

        while (n < name.size())
        {
            if (p < pattern.size() && pattern[p] == '*')
            {
                starP = p++;
                starN = n;
            }
            else if (p < pattern.size() && (pattern[p] == '?' || sameChar(pattern[p], name[n])))
            {
                ++p;
                ++n;
            }
            else if (starP != std::string_view::npos)
            {
                p = starP + 1;
                n = ++starN;
            }
            else
            {
                return false;
            }
        }

        while (p < pattern.size() && pattern[p] == '*') ++p;
        return p == pattern.size();
    }

    std::vector<PlannedAction> filterActions(const std::vector<PlannedAction>& actions,
                                             std::string_view pattern)
    {
        std::vector<PlannedAction> kept;
        for (const auto& action : actions)
        {
            if (wildcardMatch(pattern, lastComponent(action.destination)))
            {
                kept.push_back(action);
            }
        }
        return kept;
    }

} // namespace dosrestore
