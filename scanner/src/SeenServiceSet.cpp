#include "lanscan/scanner/SeenServiceSet.h"

#include <utility>

namespace lanscan::scanner {

bool SeenServiceSet::insert(const std::string& ip, const std::string& serviceType) {
    auto key = makeKey(ip, serviceType);
    std::lock_guard lock(mutex_);
    return keys_.insert(std::move(key)).second;
}

bool SeenServiceSet::contains(const std::string& ip, const std::string& serviceType) const {
    const auto key = makeKey(ip, serviceType);
    std::lock_guard lock(mutex_);
    return keys_.count(key) > 0;
}

std::size_t SeenServiceSet::size() const {
    std::lock_guard lock(mutex_);
    return keys_.size();
}

void SeenServiceSet::clear() {
    std::lock_guard lock(mutex_);
    keys_.clear();
}

std::string SeenServiceSet::makeKey(const std::string& ip, const std::string& serviceType) {
    return ip + "|" + serviceType;
}

}  // namespace lanscan::scanner
