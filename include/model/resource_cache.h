#pragma once

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

namespace avatarcli {
namespace model {

// Ordered snapshot of one resource kind as last fetched. T must expose
// id(), name() and setName().
template<typename T>
class ResourceCache {
public:
    void replace(std::vector<T> items) {
        items_ = std::move(items);
        loaded_ = true;
    }

    const std::vector<T>& items() const { return items_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    bool loaded() const { return loaded_; }

    const T* find(const std::string& id) const {
        auto it = std::find_if(items_.begin(), items_.end(),
                               [&](const T& item) { return item.id() == id; });
        return it == items_.end() ? nullptr : &*it;
    }

    bool rename(const std::string& id, const std::string& newName) {
        for (auto& item : items_) {
            if (item.id() == id) {
                item.setName(newName);
                return true;
            }
        }
        return false;
    }

    template<typename F>
    bool update(const std::string& id, F&& fn) {
        for (auto& item : items_) {
            if (item.id() == id) {
                fn(item);
                return true;
            }
        }
        return false;
    }

    bool removeById(const std::string& id) {
        size_t before = items_.size();
        items_.erase(std::remove_if(items_.begin(), items_.end(),
                                    [&](const T& item) { return item.id() == id; }),
                     items_.end());
        return items_.size() != before;
    }

    void add(const T& item) { items_.push_back(item); }

    std::vector<T> filter(const std::function<bool(const T&)>& pred) const {
        std::vector<T> out;
        for (const auto& item : items_) {
            if (pred(item)) out.push_back(item);
        }
        return out;
    }

    void clear() {
        items_.clear();
        loaded_ = false;
    }

private:
    std::vector<T> items_;
    bool loaded_ = false;
};

}
}
