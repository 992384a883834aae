#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

namespace lanscan::scanner {

// (address, service type) pairs already admitted during the current scan.
class SeenServiceSet {
public:
    // True when the pair was not present yet and has now been recorded.
    bool insert(const std::string& ip, const std::string& serviceType);
    bool contains(const std::string& ip, const std::string& serviceType) const;
    std::size_t size() const;
    void clear();

private:
    static std::string makeKey(const std::string& ip, const std::string& serviceType);

    mutable std::mutex mutex_;
    std::unordered_set<std::string> keys_;
};

}  // namespace lanscan::scanner
