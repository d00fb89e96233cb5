#pragma once

#include <concepts>
#include <cstddef>
#include <tagpack/core/tagpack_types.hpp>

namespace Tagpack {

/**
 * @brief Concept defining a decode configuration.
 *
 * Options are types carrying compile-time constants, passed to the decode
 * entry points as a template parameter.
 */
template <typename O>
concept DecodeOptions = requires {
    { O::duplicate_keys } -> std::convertible_to<DuplicateKeyPolicy>;
    { O::max_depth } -> std::convertible_to<std::size_t>;
};

/**
 * @brief Rejects repeated map keys and limits nesting to DefaultMaxDepth.
 */
struct DefaultDecodeOptions {
    static constexpr DuplicateKeyPolicy duplicate_keys =
        DuplicateKeyPolicy::Reject;
    static constexpr std::size_t max_depth = DefaultMaxDepth;
};

/**
 * @brief Accepts repeated map keys; the last occurrence of a tag binds.
 */
struct LastWinsDecodeOptions {
    static constexpr DuplicateKeyPolicy duplicate_keys =
        DuplicateKeyPolicy::LastWins;
    static constexpr std::size_t max_depth = DefaultMaxDepth;
};

}  // namespace Tagpack
