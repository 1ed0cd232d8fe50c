#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata::extraction::util {

// http:// and https:// URLs found in free text, in order of appearance, without duplicates.
std::vector<std::string> findUrls(std::string_view text);

// Shell-style environment references: ${VAR}, ${VAR:-default} and $VAR.
std::vector<std::string> findEnvVars(std::string_view text);

// Split text into lines without their terminators ("\r\n" and "\n").
std::vector<std::string_view> splitLines(std::string_view text);

std::string_view trim(std::string_view s);

bool isUpperSnakeCase(std::string_view s);

// True when a parsed JSON value nests containers more than maxDepth levels below the root.
// Iterative, so it is safe to run before anything that recurses (dump, copy, visitors).
template <typename Json> bool nestingExceeds(const Json& root, std::size_t maxDepth) {
    std::vector<std::pair<const Json*, std::size_t>> pending{{&root, 0}};
    while (!pending.empty()) {
        auto [node, depth] = pending.back();
        pending.pop_back();
        if (depth > maxDepth)
            return true;
        if (node->is_structured()) {
            for (const auto& child : *node)
                pending.emplace_back(&child, depth + 1);
        }
    }
    return false;
}

} // namespace strata::extraction::util
