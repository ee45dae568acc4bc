#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ssdp
{

/**
 * @brief String-keyed map that iterates in insertion order.
 *
 * Assigning to an existing key replaces the value in place, so the key keeps its original position.
 * Maps here hold a handful of entries, lookups are linear.
 */
template <typename Value>
class OrderedMap
{
public:
    using Entry          = std::pair<std::string, Value>;
    using const_iterator = typename std::vector<Entry>::const_iterator;
    using iterator       = typename std::vector<Entry>::iterator;

    OrderedMap() = default;

    OrderedMap(std::initializer_list<Entry> entries)
    {
        for (const auto& entry : entries)
        {
            set(entry.first, entry.second);
        }
    }

    void set(const std::string& key, Value value)
    {
        auto iter = find(key);
        if (iter == _entries.end())
        {
            _entries.emplace_back(key, std::move(value));
        }
        else
        {
            iter->second = std::move(value);
        }
    }

    iterator find(const std::string& key)
    {
        return std::find_if(_entries.begin(), _entries.end(), [&key](const Entry& entry) { return entry.first == key; });
    }

    const_iterator find(const std::string& key) const
    {
        return std::find_if(_entries.begin(), _entries.end(), [&key](const Entry& entry) { return entry.first == key; });
    }

    bool contains(const std::string& key) const { return find(key) != _entries.end(); }

    const Value& at(const std::string& key) const
    {
        auto iter = find(key);
        if (iter == _entries.end())
        {
            throw std::out_of_range("No entry named '" + key + "'");
        }
        return iter->second;
    }

    std::size_t size() const noexcept { return _entries.size(); }
    bool empty() const noexcept { return _entries.empty(); }

    iterator begin() noexcept { return _entries.begin(); }
    iterator end() noexcept { return _entries.end(); }
    const_iterator begin() const noexcept { return _entries.begin(); }
    const_iterator end() const noexcept { return _entries.end(); }

private:
    std::vector<Entry> _entries;
};

} // namespace ssdp
