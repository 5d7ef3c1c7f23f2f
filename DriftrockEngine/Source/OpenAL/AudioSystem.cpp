#include "AudioSystem.hpp"
#include "Utils/Debug/Debug.hpp"

#include <algorithm>
#include <array>

/* ===========================================================
   dr_wav WAV loader (header-only)
   =========================================================== */
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

namespace {

// A buffer played through a small ring of sources so rapid shots overlap.
class OpenALSoundEffect : public ISoundEffect {
public:
    explicit OpenALSoundEffect(ALuint buffer) : buffer(buffer) {
        alGenSources(static_cast<ALsizei>(sources.size()), sources.data());
        for (ALuint source : sources) {
            alSourcei(source, AL_BUFFER, static_cast<ALint>(buffer));
            alSourcei(source, AL_LOOPING, AL_FALSE);
        }
    }

    ~OpenALSoundEffect() override {
        for (ALuint source : sources) {
            alSourceStop(source);
        }
        alDeleteSources(static_cast<ALsizei>(sources.size()), sources.data());
        alDeleteBuffers(1, &buffer);
    }

    void Play() override {
        ALuint source = sources[next];
        next = (next + 1) % sources.size();

        alSourcef(source, AL_GAIN, volume);
        alSourceStop(source);
        alSourcePlay(source);
    }

    void SetVolume(float volume) override {
        this->volume = std::clamp(volume, 0.0f, 1.0f);
    }

    float GetVolume() const override { return volume; }

private:
    ALuint buffer;
    std::array<ALuint, 4> sources{};
    size_t next = 0;
    float volume = 1.0f;
};

}

AudioSystem::AudioSystem() {
    if (initializeOpenAL()) {
        initMusicSource();
    }
}

AudioSystem::~AudioSystem() {
    shutdownOpenAL();
}

std::unique_ptr<ISoundEffect> AudioSystem::LoadSoundEffect(const std::string& file) {
    if (!IsAvailable()) {
        Debug::Warning("AudioSystem") << "No audio device, " << file << " will be silent";
        return std::make_unique<NullSoundEffect>();
    }

    ALuint buffer = 0;
    if (!LoadWavBuffer(file, buffer)) {
        Debug::Warning("AudioSystem") << "Sound " << file << " unavailable, using silence";
        return std::make_unique<NullSoundEffect>();
    }

    std::unique_ptr<ISoundEffect> effect = std::make_unique<OpenALSoundEffect>(buffer);
    effect->SetVolume(channels.GetVolume(AudioChannel::SFX));
    return effect;
}

void AudioSystem::PlayMusic(const std::string& file, bool loop) {
    if (!IsAvailable()) return;

    if (musicBuffer != 0) {
        StopMusic();
        alSourcei(musicSource, AL_BUFFER, 0);
        alDeleteBuffers(1, &musicBuffer);
        musicBuffer = 0;
    }

    if (!LoadWavBuffer(file, musicBuffer)) {
        Debug::Warning("AudioSystem") << "Music " << file << " unavailable, playing without music";
        return;
    }

    alSourcei(musicSource, AL_BUFFER, static_cast<ALint>(musicBuffer));
    alSourcei(musicSource, AL_LOOPING, loop ? AL_TRUE : AL_FALSE);
    ApplyMusicVolume();

    alSourcePlay(musicSource);
    Debug::Info("AudioSystem") << "Music playing: " << file;
}

void AudioSystem::StopMusic() {
    if (musicSource) alSourceStop(musicSource);
}

void AudioSystem::ApplyMusicVolume() {
    if (musicSource) alSourcef(musicSource, AL_GAIN, channels.GetVolume(AudioChannel::MUSIC));
}

/* ===========================================================
   OPENAL CONTEXT
   =========================================================== */
bool AudioSystem::initializeOpenAL() {
    device = alcOpenDevice(nullptr);
    if (!device) {
        Debug::Warning("AudioSystem") << "Cannot open audio device, running silent";
        return false;
    }

    context = alcCreateContext(device, nullptr);
    if (!context || !alcMakeContextCurrent(context)) {
        Debug::Warning("AudioSystem") << "Failed to create OpenAL context, running silent";
        if (context) alcDestroyContext(context);
        context = nullptr;
        alcCloseDevice(device);
        device = nullptr;
        return false;
    }

    Debug::Info("AudioSystem") << "OpenAL initialized";
    return true;
}

void AudioSystem::shutdownOpenAL() {
    if (musicSource) {
        StopMusic();
        alDeleteSources(1, &musicSource);
    }
    if (musicBuffer) alDeleteBuffers(1, &musicBuffer);

    if (context) {
        alcMakeContextCurrent(nullptr);
        alcDestroyContext(context);
    }
    if (device) alcCloseDevice(device);

    Debug::Info("AudioSystem") << "OpenAL shutdown complete";
}

void AudioSystem::initMusicSource() {
    alGenSources(1, &musicSource);
    alSourcef(musicSource, AL_GAIN, 1.0f);
    alSourcei(musicSource, AL_LOOPING, AL_TRUE);
}

/* ===========================================================
   WAV LOADER (dr_wav)
   =========================================================== */
bool LoadWavBuffer(const std::string& file, ALuint& buffer) {
    unsigned int channelCount;
    unsigned int sampleRate;
    drwav_uint64 totalPCMFrames;

    drwav_int16* pcmData = drwav_open_file_and_read_pcm_frames_s16(
        file.c_str(), &channelCount, &sampleRate, &totalPCMFrames, nullptr);

    if (!pcmData) {
        Debug::Warning("AudioSystem") << "Failed to load WAV: " << file;
        return false;
    }

    ALenum format =
        (channelCount == 1) ? AL_FORMAT_MONO16 :
        (channelCount == 2) ? AL_FORMAT_STEREO16 :
        AL_NONE;

    if (format == AL_NONE) {
        Debug::Warning("AudioSystem") << "Unsupported WAV channel count: " << channelCount << " in " << file;
        drwav_free(pcmData, nullptr);
        return false;
    }

    alGenBuffers(1, &buffer);
    alBufferData(buffer, format,
        pcmData,
        static_cast<ALsizei>(totalPCMFrames * channelCount * sizeof(drwav_int16)),
        static_cast<ALsizei>(sampleRate));

    drwav_free(pcmData, nullptr);

    if (alGetError() != AL_NO_ERROR) {
        Debug::Warning("AudioSystem") << "OpenAL rejected the data of " << file;
        alDeleteBuffers(1, &buffer);
        buffer = 0;
        return false;
    }

    return true;
}
