#pragma once

#include "reflection/TypeDescriptor.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

namespace Beacon {
namespace Reflect {

/**
 * @brief Process-wide catalog of type descriptors
 *
 * Memoizes descriptors so that repeated lookups of the same type reuse the
 * demangled name and argument tree, and so that types can be found again by
 * type_index or by name.
 *
 * Thread Safety:
 * The catalog performs NO internal locking. Describe<T>() mutates shared state
 * on first use of a type. Concurrent callers must hold GetMutex():
 *
 * @code
 * std::scoped_lock lock(TypeCatalog::Instance().GetMutex());
 * auto descriptor = TypeCatalog::Instance().Describe<Settings>();
 * @endcode
 *
 * TypeReference and TypeDescriptor::Of<T>() never touch the catalog and are
 * safe to use from any thread.
 */
class TypeCatalog {
public:
    /**
     * @brief Get singleton instance
     */
    static TypeCatalog& Instance();

    // Non-copyable, non-movable
    TypeCatalog(const TypeCatalog&) = delete;
    TypeCatalog& operator=(const TypeCatalog&) = delete;
    TypeCatalog(TypeCatalog&&) = delete;
    TypeCatalog& operator=(TypeCatalog&&) = delete;

    // =========================================================================
    // Descriptor Queries
    // =========================================================================

    /**
     * @brief Describe T, interning it and its template arguments on first use
     * @warning Not thread-safe. See class documentation.
     */
    template<typename T>
    [[nodiscard]] TypeDescriptor Describe() {
        std::type_index key(typeid(std::remove_cvref_t<T>));
        auto it = m_byIndex.find(key);
        if (it != m_byIndex.end()) {
            return it->second;
        }
        return Intern(TypeDescriptor::Of<T>());
    }

    template<typename T>
    [[nodiscard]] bool Contains() const {
        return Find(typeid(std::remove_cvref_t<T>)) != nullptr;
    }

    /**
     * @return Pointer to the cataloged descriptor or nullptr
     */
    [[nodiscard]] const TypeDescriptor* Find(std::type_index type) const;

    /**
     * @brief Find a cataloged descriptor by its demangled name
     * @return Pointer to the cataloged descriptor or nullptr
     */
    [[nodiscard]] const TypeDescriptor* FindByName(std::string_view name) const;

    [[nodiscard]] size_t Size() const { return m_byIndex.size(); }

    /**
     * @brief Forget every cataloged descriptor
     *
     * Invalidates pointers returned by Find() and FindByName().
     */
    void Clear();

    /**
     * @brief Mutex callers hold to use the catalog from several threads
     */
    [[nodiscard]] std::mutex& GetMutex() { return m_mutex; }

private:
    TypeCatalog() = default;
    ~TypeCatalog() = default;

    TypeDescriptor Intern(const TypeDescriptor& descriptor);

    std::unordered_map<std::type_index, TypeDescriptor> m_byIndex;
    std::unordered_map<std::string, std::type_index> m_byName;
    std::mutex m_mutex;
};

} // namespace Reflect
} // namespace Beacon
