#pragma once

// Sound triggers the simulation fires. Implementations must never fail
// observably: a missing sound simply plays nothing.
class IGameAudio {
public:
    virtual ~IGameAudio() = default;
    virtual void PlayShootSound() = 0;
    virtual void PlayExplosionSound() = 0;
    virtual void PlayDeathSound() = 0;
};
