#include "Components.hpp"
#include "Utils/Geometry.hpp"

void Projectile::Update(Transform2D& transform, float deltaTime) {
    if (!alive) return;

    age += deltaTime;
    if (age > lifetime) {
        alive = false;
        return;
    }

    transform.setPosition(Geometry::Wrap(transform.getPosition() + velocity * deltaTime, playfieldSize));
}
