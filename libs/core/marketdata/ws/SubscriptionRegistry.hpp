#pragma once
#include <algorithm>
#include <array>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../dispatch/Channels.hpp"

// Record of what is subscribed on each endpoint; replayed after a reconnect.
// Each endpoint owns its own bucket and lock, so Public and User traffic never contend.
class SubscriptionRegistry {
public:
    using ChannelSubscriptions = std::map<Channel, std::vector<std::string>>;

    /// Union `productIds` into (kind, channel). Creates the entry even for an empty list.
    void add(EndpointKind kind, Channel channel, const std::vector<std::string>& productIds) {
        auto& bucket = m_buckets[indexOf(kind)];
        std::lock_guard<std::mutex> lock(bucket.mx);
        auto& ids = bucket.channels[channel];
        for (const auto& id : productIds) {
            if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
                ids.push_back(id);
            }
        }
    }

    /// Remove only the listed ids. The channel entry itself is kept.
    void remove(EndpointKind kind, Channel channel, const std::vector<std::string>& productIds) {
        auto& bucket = m_buckets[indexOf(kind)];
        std::lock_guard<std::mutex> lock(bucket.mx);
        auto it = bucket.channels.find(channel);
        if (it == bucket.channels.end()) return;
        auto& ids = it->second;
        ids.erase(std::remove_if(ids.begin(), ids.end(), [&](const std::string& id) {
                      return std::find(productIds.begin(), productIds.end(), id) != productIds.end();
                  }),
                  ids.end());
    }

    [[nodiscard]] ChannelSubscriptions snapshot(EndpointKind kind) const {
        const auto& bucket = m_buckets[indexOf(kind)];
        std::lock_guard<std::mutex> lock(bucket.mx);
        return bucket.channels;
    }

private:
    struct Bucket {
        mutable std::mutex   mx;
        ChannelSubscriptions channels;
    };
    std::array<Bucket, kAllEndpoints.size()> m_buckets;
};
