#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Tagpack {

/**
 * @brief Integer key identifying a struct field or an enum variant on the
 * wire.
 */
using Tag = uint32_t;

/**
 * @brief The MessagePack nil value as a schema type.
 */
struct Nil {
    [[nodiscard]] constexpr bool operator==(const Nil&) const noexcept =
        default;
};

/**
 * @brief How a tagged struct decode treats a map that repeats a key.
 */
enum class DuplicateKeyPolicy : uint8_t {
    Reject,    ///< Any repeated key fails the decode with InvalidInput.
    LastWins,  ///< Repeated keys are accepted, the last occurrence binds.
};

/**
 * @brief Default nesting limit for arrays, maps and schema levels on decode.
 */
static constexpr std::size_t DefaultMaxDepth = 256;

/**
 * @brief Error codes representing the failure conditions of a decode.
 */
enum class ErrorCode : uint8_t {
    UNKNOWN = 0,     ///< Unknown error.
    InvalidInput,    ///< Malformed bytes, duplicate keys or exceeded limits.
    UnexpectedType,  ///< Well-formed input whose shape does not match the
                     ///< target type.
};

/**
 * @brief Represents an error that occurred while decoding.
 *
 * Contains an error code, an optional tag related to the error, and a
 * descriptive message.
 */
struct Error {
    ErrorCode code;  ///< The error code.
    // cppcheck-suppress unusedStructMember
    Tag tag{0};  ///< Field tag associated with the error (0 if not
                 ///< applicable).
    // cppcheck-suppress unusedStructMember
    std::string_view message{};  ///< Static error message string.

    /**
     * @brief Creates an error representing malformed input.
     * @param msg Description of the failure.
     */
    [[nodiscard]] static constexpr Error invalid_input(
        std::string_view msg = "invalid input") noexcept {
        return {ErrorCode::InvalidInput, 0, msg};
    }

    /**
     * @brief Creates an error representing a shape mismatch.
     * @param msg Description of the mismatch.
     */
    [[nodiscard]] static constexpr Error unexpected_type(
        std::string_view msg = "unexpected type") noexcept {
        return {ErrorCode::UnexpectedType, 0, msg};
    }

    /**
     * @brief Creates an error for a required field absent from the input map.
     * @param tag The tag of the missing field.
     */
    [[nodiscard]] static constexpr Error missing_field(Tag tag) noexcept {
        return {ErrorCode::UnexpectedType, tag, "missing required field"};
    }

    /**
     * @brief Returns the same error reported as InvalidInput.
     */
    [[nodiscard]] constexpr Error as_invalid_input() const noexcept {
        return {ErrorCode::InvalidInput, tag, message};
    }

    [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept =
        default;

    /**
     * @brief Checks if the error matches a specific error code.
     */
    [[nodiscard]] constexpr bool operator==(ErrorCode c) const noexcept {
        return code == c;
    }
};

}  // namespace Tagpack
