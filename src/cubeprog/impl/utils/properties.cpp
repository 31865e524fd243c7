#include "utils/properties.h"
#include <mutex>
#include <stdexcept>

namespace cubeprog {

Properties::Properties() = default;

Properties::Properties(const Properties& other) {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    properties_ = other.properties_;
}

Properties::Properties(Properties&& other) noexcept {
    std::unique_lock<std::shared_mutex> lock(other.mutex_);
    properties_ = std::move(other.properties_);
}

Properties& Properties::operator=(const Properties& other) {
    if (this != &other) {
        std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
        std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
        std::lock(lock1, lock2);
        properties_ = other.properties_;
    }
    return *this;
}

Properties& Properties::operator=(Properties&& other) noexcept {
    if (this != &other) {
        std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
        std::unique_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
        std::lock(lock1, lock2);
        properties_ = std::move(other.properties_);
    }
    return *this;
}

void Properties::set(const std::string& key, const std::any& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    properties_[key] = value;
}

std::any Properties::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it != properties_.end()) {
        return it->second;
    }
    return std::any();
}

std::optional<std::string> Properties::textOf(const std::string& key) const {
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return std::nullopt;
    }

    if (const auto* str = std::any_cast<std::string>(&it->second)) {
        return *str;
    }
    if (const auto* cstr = std::any_cast<const char*>(&it->second)) {
        return std::string(*cstr);
    }
    return std::nullopt;
}

std::string Properties::getString(const std::string& key, const std::string& defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return textOf(key).value_or(defaultValue);
}

int Properties::getInt(const std::string& key, int defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* value = std::any_cast<int>(&it->second)) {
        return *value;
    }

    auto text = textOf(key);
    if (!text) {
        return defaultValue;
    }

    try {
        size_t consumed = 0;
        int value = std::stoi(*text, &consumed, 0);
        return consumed == text->size() ? value : defaultValue;
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range
        return defaultValue;
    }
}

bool Properties::getBool(const std::string& key, bool defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* value = std::any_cast<bool>(&it->second)) {
        return *value;
    }

    auto text = textOf(key);
    if (!text) {
        return defaultValue;
    }
    return *text == "true" || *text == "1" || *text == "yes" || *text == "on";
}

bool Properties::has(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.find(key) != properties_.end();
}

bool Properties::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return properties_.erase(key) > 0;
}

std::vector<std::string> Properties::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(properties_.size());
    for (const auto& pair : properties_) {
        result.push_back(pair.first);
    }
    return result;
}

size_t Properties::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.size();
}

bool Properties::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.empty();
}

void Properties::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    properties_.clear();
}

void Properties::merge(const Properties& other) {
    if (this == &other) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
    std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
    std::lock(lock1, lock2);

    for (const auto& pair : other.properties_) {
        properties_[pair.first] = pair.second;
    }
}

} // namespace cubeprog
