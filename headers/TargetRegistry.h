#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstdint>
#include <optional>
#include <string>

// stable handle to something a robot can work on. ids are never reused,
// so a stale handle simply stops being valid
struct TargetRef
{
    std::uint64_t id = 0;

    bool operator==(const TargetRef &other) const { return id == other.id; }
    bool operator!=(const TargetRef &other) const { return id != other.id; }
};

// what a single collection handed over
struct CollectResult
{
    std::string material;
    float amount = 0.0f;
};

// lookup of targets that robots seek, owned by the entity layer of the host
class TargetRegistry
{
public:
    virtual ~TargetRegistry() = default;

    // nearest target within radius (world pixels) that is still worth visiting
    virtual std::optional<TargetRef> findNearestEligible(const sf::Vector2f &origin, float radius) const = 0;
    // false once the target was removed or used up
    virtual bool isStillValid(const TargetRef &target) const = 0;
    virtual std::optional<sf::Vector2f> targetPosition(const TargetRef &target) const = 0;

    // takes up to maxAmount kg from the target; an invalid target yields nothing
    virtual CollectResult collect(const TargetRef &target, float maxAmount) = 0;
};
