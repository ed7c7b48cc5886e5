#include <stdlib.h>
#include <sstream>

#include "dht11.h"
#include "waveform.hpp"

static void addPulse(Waveform& wave, bool level, unsigned long duration)
{
    Segment seg;

    seg.level    = level;
    seg.duration = duration;
    wave.push_back(seg);
}

Waveform encodeFrame(const uint8_t* frame, int stall_after)
{
    Waveform wave;
    int bits = (stall_after >= 0 && stall_after < DHT11_FRAME_BITS) ? stall_after : DHT11_FRAME_BITS;

    addPulse(wave, true, DHT11_RESPONSE_WAIT_US);
    addPulse(wave, false, DHT11_ACK_LOW_US);
    addPulse(wave, true, DHT11_ACK_HIGH_US);

    // MSB first. The length of the high part carries the bit value
    for (int i = 0; i < bits; i++) {
        bool bit = frame[i / 8] & (0x80 >> (i % 8));

        addPulse(wave, false, DHT11_BIT_LOW_US);
        addPulse(wave, true, bit ? DHT11_BIT_1_HIGH_US : DHT11_BIT_0_HIGH_US);
    }

    // A stalled sensor just lets the line float up
    if (bits == DHT11_FRAME_BITS)
        addPulse(wave, false, DHT11_END_LOW_US);

    return wave;
}

std::string parseWaveform(const std::string& text, Waveform* out)
{
    std::istringstream in(text);
    std::string level, duration;
    Waveform wave;
    int pos = 0;

    while (in >> level) {
        if (level != "0" && level != "1") {
            std::ostringstream err;
            err << "Invalid level at position " << pos << ": " << text;
            return err.str();
        }
        if (!(in >> duration)) {
            std::ostringstream err;
            err << "Missing duration at position " << pos + 1 << ": " << text;
            return err.str();
        }

        char* endp;
        unsigned long d = strtoul(duration.c_str(), &endp, 10);

        if (duration[0] == '-' || *endp) {
            std::ostringstream err;
            err << "Invalid duration at position " << pos + 1 << ": " << text;
            return err.str();
        }

        addPulse(wave, level == "1", d);
        pos += 2;
    }

    if (wave.empty())
        return "Empty capture";

    *out = wave;
    return std::string();
}

std::ostream& operator<<(std::ostream& s, const Segment& seg)
{
    return s << (seg.level ? 1 : 0) << ' ' << seg.duration;
}

std::ostream& operator<<(std::ostream& s, const Waveform& wave)
{
    for (size_t i = 0; i < wave.size(); i++) {
        if (i)
            s << ' ';
        s << wave[i];
    }
    return s;
}

void WaveformPlayer::play(const Waveform& wave)
{
    wave_ = wave;
    pos_  = 0;
    skipEmpty();
}

void WaveformPlayer::stop()
{
    wave_.clear();
    pos_       = 0;
    remaining_ = 0;
}

void WaveformPlayer::tick()
{
    if (!isPlaying())
        return;

    if (--remaining_ == 0) {
        pos_++;
        skipEmpty();
    }
}

// Loads the current segment, skipping those shorter than one tick
void WaveformPlayer::skipEmpty()
{
    while (isPlaying()) {
        remaining_ = static_cast<unsigned long long>(wave_[pos_].duration) * ticks_per_us_;
        if (remaining_)
            break;
        pos_++;
    }
}
