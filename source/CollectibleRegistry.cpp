#include "CollectibleRegistry.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

CollectibleRegistry::CollectibleRegistry()
    : invBucketSize_(1.0f / BUCKET_SIZE)
{
}

std::pair<int, int> CollectibleRegistry::worldToBucket(float x, float y) const
{
    return {
        static_cast<int>(std::floor(x * invBucketSize_)),
        static_cast<int>(std::floor(y * invBucketSize_))};
}

TargetRef CollectibleRegistry::add(float x, float y, const std::string &material, float quantity)
{
    Collectible collectible;
    collectible.id = nextId_++;
    collectible.position = sf::Vector2f(x, y);
    collectible.material = material;
    collectible.quantity = quantity;

    auto [bucketX, bucketY] = worldToBucket(x, y);
    buckets_[hashBucket(bucketX, bucketY)].push_back(collectible.id);
    collectibles_.emplace(collectible.id, collectible);

    return TargetRef{collectible.id};
}

void CollectibleRegistry::unlinkFromBucket(const Collectible &collectible)
{
    auto [bucketX, bucketY] = worldToBucket(collectible.position.x, collectible.position.y);
    auto it = buckets_.find(hashBucket(bucketX, bucketY));
    if (it == buckets_.end())
    {
        return;
    }

    auto &ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), collectible.id), ids.end());
    if (ids.empty())
    {
        buckets_.erase(it);
    }
}

bool CollectibleRegistry::remove(const TargetRef &target)
{
    auto it = collectibles_.find(target.id);
    if (it == collectibles_.end())
    {
        return false;
    }

    unlinkFromBucket(it->second);
    collectibles_.erase(it);
    return true;
}

void CollectibleRegistry::clear()
{
    collectibles_.clear();
    buckets_.clear();
}

const Collectible *CollectibleRegistry::find(const TargetRef &target) const
{
    auto it = collectibles_.find(target.id);
    return it != collectibles_.end() ? &it->second : nullptr;
}

float CollectibleRegistry::totalQuantity() const
{
    float total = 0.0f;
    for (const auto &[id, collectible] : collectibles_)
    {
        total += collectible.quantity;
    }
    return total;
}

std::vector<TargetRef> CollectibleRegistry::getNearby(const sf::Vector2f &origin, float radius) const
{
    std::vector<TargetRef> nearby;
    if (radius < 0.0f)
    {
        return nearby;
    }

    // calculate bucket range to check
    int radiusInBuckets = static_cast<int>(std::ceil(radius * invBucketSize_));
    auto [centerX, centerY] = worldToBucket(origin.x, origin.y);
    float radiusSq = radius * radius;

    auto collectWithinRadius = [&](const std::vector<std::uint64_t> &ids)
    {
        for (std::uint64_t id : ids)
        {
            const Collectible &collectible = collectibles_.at(id);
            float ox = collectible.position.x - origin.x;
            float oy = collectible.position.y - origin.y;
            if (ox * ox + oy * oy <= radiusSq)
            {
                nearby.push_back(TargetRef{id});
            }
        }
    };

    // a radius spanning more buckets than exist is cheaper as a full scan
    long long span = 2LL * radiusInBuckets + 1;
    if (span * span > static_cast<long long>(buckets_.size()))
    {
        for (const auto &[hash, ids] : buckets_)
        {
            collectWithinRadius(ids);
        }
    }
    else
    {
        for (int dx = -radiusInBuckets; dx <= radiusInBuckets; ++dx)
        {
            for (int dy = -radiusInBuckets; dy <= radiusInBuckets; ++dy)
            {
                auto it = buckets_.find(hashBucket(centerX + dx, centerY + dy));
                if (it != buckets_.end())
                {
                    collectWithinRadius(it->second);
                }
            }
        }
    }

    // colliding bucket hashes can list the same id twice
    std::sort(nearby.begin(), nearby.end(),
              [](const TargetRef &a, const TargetRef &b) { return a.id < b.id; });
    nearby.erase(std::unique(nearby.begin(), nearby.end()), nearby.end());
    return nearby;
}

std::optional<TargetRef> CollectibleRegistry::findNearestEligible(const sf::Vector2f &origin, float radius) const
{
    std::optional<TargetRef> nearest;
    float bestDistSq = std::numeric_limits<float>::max();

    // getNearby is ordered by id, so equal distances resolve to the oldest collectible
    for (const TargetRef &ref : getNearby(origin, radius))
    {
        const Collectible &collectible = collectibles_.at(ref.id);
        if (collectible.isDepleted())
        {
            continue;
        }

        float ox = collectible.position.x - origin.x;
        float oy = collectible.position.y - origin.y;
        float distSq = ox * ox + oy * oy;
        if (distSq < bestDistSq)
        {
            bestDistSq = distSq;
            nearest = ref;
        }
    }

    return nearest;
}

bool CollectibleRegistry::isStillValid(const TargetRef &target) const
{
    const Collectible *collectible = find(target);
    return collectible != nullptr && !collectible->isDepleted();
}

std::optional<sf::Vector2f> CollectibleRegistry::targetPosition(const TargetRef &target) const
{
    const Collectible *collectible = find(target);
    if (collectible == nullptr)
    {
        return std::nullopt;
    }
    return collectible->position;
}

CollectResult CollectibleRegistry::collect(const TargetRef &target, float maxAmount)
{
    CollectResult result;

    auto it = collectibles_.find(target.id);
    if (it == collectibles_.end() || maxAmount <= 0.0f)
    {
        return result;
    }

    Collectible &collectible = it->second;
    result.material = collectible.material;
    result.amount = std::min(maxAmount, collectible.quantity);
    collectible.quantity -= result.amount;

    // fully collected piles disappear from the world
    if (collectible.isDepleted())
    {
        unlinkFromBucket(collectible);
        collectibles_.erase(it);
    }

    return result;
}

void CollectibleRegistry::printStatistics() const
{
    std::cout << "=== CollectibleRegistry Statistics ===" << std::endl;
    std::cout << "Collectibles: " << collectibles_.size() << std::endl;
    std::cout << "Total material: " << totalQuantity() << " kg" << std::endl;
    std::cout << "Active buckets: " << buckets_.size() << std::endl;
    std::cout << "Bucket size: " << BUCKET_SIZE << std::endl;
}
