#ifndef _DHT11_WAVEFORM_H
#define _DHT11_WAVEFORM_H

#include <stddef.h>
#include <stdint.h>
#include <ostream>
#include <string>
#include <vector>

struct Segment
{
    bool          level;
    unsigned long duration; // Microseconds
};

typedef std::vector<Segment> Waveform;

// Sensor response to a start pulse, from bus release to the final release.
// 'stall_after' < DHT11_FRAME_BITS cuts the frame after that many data bits
// and leaves the line released, like a sensor which stopped talking.
Waveform encodeFrame(const uint8_t* frame, int stall_after = -1);

// Parses a capture in the raw sampler format: "L D L D ...", L is 0 or 1,
// D is a duration in microseconds. Returns an empty string on success,
// otherwise an error message; 'out' is untouched on error.
std::string parseWaveform(const std::string& text, Waveform* out);

// Same format as parseWaveform() accepts
std::ostream& operator<<(std::ostream& s, const Segment& seg);
std::ostream& operator<<(std::ostream& s, const Waveform& wave);

// Plays a waveform at a given tick rate. Idles high (released) when done
class WaveformPlayer {
 public:
    explicit WaveformPlayer(unsigned int ticks_per_us) : ticks_per_us_(ticks_per_us) { stop(); }

    void setTicksPerUs(unsigned int ticks_per_us) { ticks_per_us_ = ticks_per_us; }

    void play(const Waveform& wave);
    void stop();

    // Level for the current tick
    bool level() const { return isPlaying() ? wave_[pos_].level : true; }
    bool isPlaying() const { return pos_ < wave_.size(); }

    void tick();

 private:
    void skipEmpty();

    Waveform           wave_;
    size_t             pos_;       // Current segment
    unsigned long long remaining_; // Ticks left in the current segment
    unsigned int       ticks_per_us_;
};

#endif
