#ifndef AUDIO_CHANNELS_HPP
#define AUDIO_CHANNELS_HPP

#include <algorithm>
#include <unordered_map>

enum class AudioChannel {
    MASTER,
    MUSIC,
    SFX
};

struct AudioChannelData {
    float volume = 1.0f;
};

// Per-channel volumes in [0, 1]. The effective volume of a channel is its
// own volume times MASTER.
class AudioChannelManager {
public:
    AudioChannelManager() {
        channels[AudioChannel::MASTER].volume = 1.0f;
        channels[AudioChannel::MUSIC].volume = 1.0f;
        channels[AudioChannel::SFX].volume = 1.0f;
    }

    float GetVolume(AudioChannel channel) const {
        return GetChannelVolume(channel) * GetChannelVolume(AudioChannel::MASTER);
    }

    float GetChannelVolume(AudioChannel channel) const {
        auto it = channels.find(channel);
        return it != channels.end() ? it->second.volume : 1.0f;
    }

    void SetVolume(AudioChannel channel, float vol) {
        channels[channel].volume = std::clamp(vol, 0.0f, 1.0f);
    }

private:
    std::unordered_map<AudioChannel, AudioChannelData> channels;
};

#endif
