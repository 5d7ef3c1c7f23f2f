#include "SoundBank.hpp"

namespace {
    std::unique_ptr<ISoundEffect> OrSilence(std::unique_ptr<ISoundEffect> effect) {
        if (!effect) return std::make_unique<NullSoundEffect>();
        return effect;
    }
}

SoundBank::SoundBank(std::unique_ptr<ISoundEffect> shoot,
                     std::unique_ptr<ISoundEffect> explosion,
                     std::unique_ptr<ISoundEffect> death)
    : shoot(OrSilence(std::move(shoot)))
    , explosion(OrSilence(std::move(explosion)))
    , death(OrSilence(std::move(death)))
{}

void SoundBank::PlayShootSound() {
    shoot->Play();
}

void SoundBank::PlayExplosionSound() {
    explosion->Play();
}

void SoundBank::PlayDeathSound() {
    death->Play();
}

void SoundBank::SetVolume(float volume) {
    shoot->SetVolume(volume);
    explosion->SetVolume(volume);
    death->SetVolume(volume);
}
