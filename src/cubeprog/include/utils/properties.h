#ifndef CUBEPROG_PROPERTIES_H
#define CUBEPROG_PROPERTIES_H

#include <any>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace cubeprog {

/**
 * @brief Thread-safe key-value property container
 *
 * Values are stored as std::any. Typed getters fall back to parsing string
 * values, so settings read from text (JSON, command line) and settings set
 * programmatically are interchangeable.
 *
 * Thread-safety: All methods are thread-safe using read-write locks.
 */
class Properties {
public:
    Properties();
    Properties(const Properties& other);
    Properties(Properties&& other) noexcept;
    Properties& operator=(const Properties& other);
    Properties& operator=(Properties&& other) noexcept;
    virtual ~Properties() = default;

    void set(const std::string& key, const std::any& value);

    /**
     * @return The stored value, or an empty std::any if not found
     */
    std::any get(const std::string& key) const;

    /**
     * @return Property as string, or defaultValue if missing or not text
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @return Property as int (int value or numeric text), or defaultValue
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @return Property as bool; text values "true", "1", "yes", "on" are true
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    bool remove(const std::string& key);

    std::vector<std::string> keys() const;

    size_t size() const;

    bool empty() const;

    void clear();

    /**
     * @brief Copy every entry of other into this, overwriting existing keys
     */
    void merge(const Properties& other);

    /**
     * @brief Get a value stored with exactly type T
     */
    template<typename T>
    std::optional<T> getAs(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = properties_.find(key);
        if (it == properties_.end()) {
            return std::nullopt;
        }

        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

private:
    std::map<std::string, std::any> properties_;
    mutable std::shared_mutex mutex_;

    // Text form of a string-like value, caller holds the lock
    std::optional<std::string> textOf(const std::string& key) const;
};

} // namespace cubeprog

#endif // CUBEPROG_PROPERTIES_H
