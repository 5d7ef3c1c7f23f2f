#pragma once

#include "GameAudio.hpp"
#include "OpenAL/SoundEffect.hpp"
#include <memory>

// IGameAudio on top of three sound effects. Missing effects are replaced
// by NullSoundEffect.
class SoundBank : public IGameAudio {
public:
    SoundBank(std::unique_ptr<ISoundEffect> shoot,
              std::unique_ptr<ISoundEffect> explosion,
              std::unique_ptr<ISoundEffect> death);

    void PlayShootSound() override;
    void PlayExplosionSound() override;
    void PlayDeathSound() override;

    void SetVolume(float volume);

private:
    std::unique_ptr<ISoundEffect> shoot;
    std::unique_ptr<ISoundEffect> explosion;
    std::unique_ptr<ISoundEffect> death;
};
