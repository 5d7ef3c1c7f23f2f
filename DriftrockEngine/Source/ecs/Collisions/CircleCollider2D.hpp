#ifndef CIRCLECOLLIDER2D_HPP
#define CIRCLECOLLIDER2D_HPP

#include "ecs/ecs_common.hpp"
#include "CollisionHelpers.hpp"
#include <cstdint>

// Collision layer for filtering
enum class CollisionLayer : uint32_t {
    DEFAULT = 1 << 0,
    PLAYER = 1 << 1,
    ROCK = 1 << 2,
    PROJECTILE = 1 << 3,
    ALL = 0xFFFFFFFFu
};

inline CollisionLayer operator|(CollisionLayer a, CollisionLayer b) {
    return static_cast<CollisionLayer>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

class CircleCollider2D : public IComponent {
public:
    CircleCollider2D(float radius = 1.0f, CollisionLayer layer = CollisionLayer::DEFAULT,
                     CollisionLayer collidesWith = CollisionLayer::ALL)
        : radius(radius)
        , layer(layer)
        , collidesWith(collidesWith)
    {}

    float radius;
    CollisionLayer layer;
    CollisionLayer collidesWith;
    bool isEnabled = true;

    bool CanCollideWith(CollisionLayer otherLayer) const {
        return (static_cast<uint32_t>(collidesWith) & static_cast<uint32_t>(otherLayer)) != 0;
    }

    bool Overlaps(const Transform2D& self, const CircleCollider2D& other, const Transform2D& otherTransform) const {
        if (!isEnabled || !other.isEnabled) return false;
        if (!CanCollideWith(other.layer) || !other.CanCollideWith(layer)) return false;
        return CollisionHelpers::CirclesOverlap(self.getPosition(), radius,
                                                otherTransform.getPosition(), other.radius);
    }
};

#endif // CIRCLECOLLIDER2D_HPP
