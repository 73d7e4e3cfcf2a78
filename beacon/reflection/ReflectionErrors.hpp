#pragma once

#include <stdexcept>
#include <string>

namespace Beacon {

/**
 * @brief Exception thrown when a required argument is null or absent
 *
 * Always a caller bug. Raised before any registry interaction.
 */
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Exception thrown when a type reference was declared without a type argument
 */
class MissingTypeParameterError : public std::logic_error {
public:
    explicit MissingTypeParameterError(const std::string& foundType)
        : std::logic_error("Missing type parameter. Found: " + foundType)
        , m_foundType(foundType) {}

    /**
     * @brief The carrier type that was actually constructed
     */
    [[nodiscard]] const std::string& GetFoundType() const noexcept {
        return m_foundType;
    }

private:
    std::string m_foundType;
};

} // namespace Beacon
