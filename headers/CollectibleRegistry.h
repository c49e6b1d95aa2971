#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "TargetRegistry.h"

// a pile of material lying in the world waiting to be picked up
struct Collectible
{
    std::uint64_t id = 0;
    sf::Vector2f position;
    std::string material;
    float quantity = 0.0f; // kg left

    bool isDepleted() const { return quantity <= 0.0f; }
};

/**
 * registry of collectibles bucketed in a spatial hash so nearest-target queries
 * only look at the buckets the search radius overlaps.
 * depleted collectibles are removed immediately, which invalidates their handle
 */
class CollectibleRegistry : public TargetRegistry
{
public:
    // world pixels per hash bucket
    static constexpr float BUCKET_SIZE = 128.0f;

private:
    std::unordered_map<std::uint64_t, Collectible> collectibles_;
    std::unordered_map<std::uint64_t, std::vector<std::uint64_t>> buckets_;
    std::uint64_t nextId_ = 1;
    float invBucketSize_; // precomputed for faster division

    // hash combining two large primes
    static constexpr std::uint64_t hashBucket(int x, int y)
    {
        return ((static_cast<std::uint64_t>(x) * 92837111ULL) ^
                (static_cast<std::uint64_t>(y) * 689287499ULL)) *
               15485863ULL;
    }

    std::pair<int, int> worldToBucket(float x, float y) const;
    void unlinkFromBucket(const Collectible &collectible);

public:
    CollectibleRegistry();

    // collectible management
    TargetRef add(float x, float y, const std::string &material, float quantity);
    bool remove(const TargetRef &target);
    void clear();

    const Collectible *find(const TargetRef &target) const;
    size_t size() const { return collectibles_.size(); }
    bool empty() const { return collectibles_.empty(); }
    float totalQuantity() const;

    // every collectible within radius, ordered by id
    std::vector<TargetRef> getNearby(const sf::Vector2f &origin, float radius) const;

    // TargetRegistry
    std::optional<TargetRef> findNearestEligible(const sf::Vector2f &origin, float radius) const override;
    bool isStillValid(const TargetRef &target) const override;
    std::optional<sf::Vector2f> targetPosition(const TargetRef &target) const override;
    CollectResult collect(const TargetRef &target, float maxAmount) override;

    // statistics and debugging
    size_t getBucketCount() const { return buckets_.size(); }
    void printStatistics() const;
};
