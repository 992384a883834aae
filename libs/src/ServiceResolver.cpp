#include "lanscan/mdns/ServiceResolver.h"

#include <algorithm>

namespace lanscan::mdns {

void ServiceResolver::addBrowse(const std::string& serviceType) {
    browsed_.try_emplace(canonicalName(serviceType), serviceType);
}

bool ServiceResolver::browsing(const std::string& serviceType) const {
    return browsed_.count(canonicalName(serviceType)) > 0;
}

ServiceResolver::Outcome ServiceResolver::apply(const DnsMessage& message) {
    Outcome outcome;
    if (!message.isResponse()) {
        return outcome;
    }

    std::vector<std::string> dirty;
    auto markDirty = [&dirty](const std::string& instanceKey) {
        if (std::find(dirty.begin(), dirty.end(), instanceKey) == dirty.end()) {
            dirty.push_back(instanceKey);
        }
    };

    for (const auto& record : message.records) {
        if (record.rrClass != 1) {
            continue;
        }
        const auto key = canonicalName(record.name);

        if (record.is(RecordType::Ptr)) {
            if (browsed_.count(key) == 0) {
                continue;
            }
            const auto instanceKey = canonicalName(record.ptrTarget);
            if (record.ttl == 0) {
                forget(instanceKey, outcome);
                continue;
            }
            auto [it, inserted] = instances_.try_emplace(instanceKey);
            if (inserted) {
                it->second.displayName = record.ptrTarget;
                it->second.typeKey = key;
            }
            markDirty(instanceKey);
        } else if (record.is(RecordType::Srv)) {
            if (record.ttl == 0) {
                srv_.erase(key);
                continue;
            }
            srv_[key] = record.srv;
            markDirty(key);
        } else if (record.is(RecordType::Txt)) {
            txt_[key] = record.txt;
        } else if (record.is(RecordType::A) || record.is(RecordType::Aaaa)) {
            auto& addresses = hostAddresses_[key];
            auto existing = std::find(addresses.begin(), addresses.end(), record.address);
            if (record.ttl == 0) {
                if (existing != addresses.end()) {
                    addresses.erase(existing);
                }
                continue;
            }
            if (existing == addresses.end()) {
                addresses.push_back(record.address);
            }
            for (const auto& [instanceKey, srv] : srv_) {
                if (canonicalName(srv.target) == key) {
                    markDirty(instanceKey);
                }
            }
        }
    }

    for (const auto& instanceKey : dirty) {
        if (instances_.count(instanceKey) > 0) {
            evaluate(instanceKey, outcome);
        }
    }
    return outcome;
}

void ServiceResolver::clear() {
    browsed_.clear();
    instances_.clear();
    srv_.clear();
    txt_.clear();
    hostAddresses_.clear();
}

void ServiceResolver::evaluate(const std::string& instanceKey, Outcome& outcome) {
    auto& state = instances_.at(instanceKey);
    const auto& serviceType = browsed_.at(state.typeKey);

    if (!state.announced) {
        outcome.events.push_back(ServiceEvent::found(serviceType, state.displayName));
        state.announced = true;
    }

    auto srvIt = srv_.find(instanceKey);
    if (srvIt == srv_.end()) {
        outcome.followUps.push_back(Question{state.displayName, RecordType::Srv, false});
        return;
    }
    const SrvData& srv = srvIt->second;

    auto hostIt = hostAddresses_.find(canonicalName(srv.target));
    if (hostIt == hostAddresses_.end() || hostIt->second.empty()) {
        outcome.followUps.push_back(Question{srv.target, RecordType::A, false});
        return;
    }

    if (state.resolvedPort == srv.port && state.resolvedAddresses == hostIt->second) {
        return;
    }
    state.resolvedPort = srv.port;
    state.resolvedAddresses = hostIt->second;

    ResolvedService info;
    info.fullname = state.displayName;
    info.hostname = srv.target;
    info.port = srv.port;
    info.addresses = hostIt->second;
    if (auto txtIt = txt_.find(instanceKey); txtIt != txt_.end()) {
        info.txt = txtIt->second;
    }
    outcome.events.push_back(ServiceEvent::resolvedEvent(serviceType, std::move(info)));
}

void ServiceResolver::forget(const std::string& instanceKey, Outcome& outcome) {
    auto it = instances_.find(instanceKey);
    if (it == instances_.end()) {
        return;
    }
    if (it->second.announced) {
        outcome.events.push_back(
            ServiceEvent::removed(browsed_.at(it->second.typeKey), it->second.displayName));
    }
    instances_.erase(it);
}

}  // namespace lanscan::mdns
