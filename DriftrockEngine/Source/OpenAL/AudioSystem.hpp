#ifndef AUDIO_SYSTEM_HPP
#define AUDIO_SYSTEM_HPP

#include "AudioChannels.hpp"
#include "SoundEffect.hpp"

#include <AL/alc.h>
#include <AL/al.h>

#include <memory>
#include <string>

// Owns the OpenAL device and context, the looping music source and the WAV
// loader. When no device can be opened the system stays usable: every
// effect it hands out is a NullSoundEffect and music calls do nothing.
//
// Effects returned by LoadSoundEffect must be destroyed before the
// AudioSystem that created them.
class AudioSystem {
public:
    AudioSystem();
    ~AudioSystem();

    AudioSystem(const AudioSystem&) = delete;
    AudioSystem& operator=(const AudioSystem&) = delete;

    bool IsAvailable() const { return context != nullptr; }

    AudioChannelManager channels;

    std::unique_ptr<ISoundEffect> LoadSoundEffect(const std::string& file);

    /* --------------------------
        MUSIC CONTROL API
       -------------------------- */
    // Failures are logged and leave the game without music.
    void PlayMusic(const std::string& file, bool loop = true);
    void StopMusic();

    // Pushes the MUSIC channel volume to the music source.
    void ApplyMusicVolume();

private:
    ALCdevice* device = nullptr;
    ALCcontext* context = nullptr;

    ALuint musicSource = 0;
    ALuint musicBuffer = 0;

    bool initializeOpenAL();
    void shutdownOpenAL();
    void initMusicSource();
};

// Decodes a WAV file into a new OpenAL buffer with dr_wav.
bool LoadWavBuffer(const std::string& file, ALuint& buffer);

#endif
