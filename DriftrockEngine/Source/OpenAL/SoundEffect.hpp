#ifndef SOUND_EFFECT_HPP
#define SOUND_EFFECT_HPP

// Fire-and-forget sound. Play never fails observably.
class ISoundEffect {
public:
    virtual ~ISoundEffect() = default;
    virtual void Play() = 0;
    virtual void SetVolume(float volume) = 0;
    virtual float GetVolume() const = 0;
};

// Stand-in when the device or the file is unavailable.
class NullSoundEffect : public ISoundEffect {
public:
    void Play() override {}
    void SetVolume(float volume) override { this->volume = volume; }
    float GetVolume() const override { return volume; }

private:
    float volume = 1.0f;
};

#endif // SOUND_EFFECT_HPP
