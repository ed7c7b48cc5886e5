#ifndef _DHT11_SENSOR_H
#define _DHT11_SENSOR_H

#include <stdint.h>
#include <deque>

#include "dht11.h"
#include "waveform.hpp"

// Sensor side of the open-drain data line. Waits for the host start pulse
// (a low of at least min_start_us), and once the host releases the line
// plays back its response. Everything it does is in terms of ticks, so it
// runs in lock-step with the decoder.
class Sensor {
 public:
    Sensor(unsigned int ticks_per_us, unsigned int min_start_us);
    virtual ~Sensor() {}

    void setTicksPerUs(unsigned int ticks_per_us);
    void setMinStartUs(unsigned int min_start_us) { min_start_us_ = min_start_us; }

    virtual void reset();

    // What we put on the line. true means released, the pull-up makes it high
    bool drive() const { return player_.level(); }

    bool isResponding() const { return player_.isPlaying(); }
    unsigned int startPulses() const { return start_pulses_; }

    // 'bus' is the resolved line level during this tick
    void tick(bool bus);

 protected:
    // Called once per start pulse. Return false to stay silent
    virtual bool respond(Waveform& wave) = 0;

 private:
    WaveformPlayer     player_;
    unsigned int       ticks_per_us_;
    unsigned int       min_start_us_;
    unsigned long long low_ticks_;    // Length of the current low level
    unsigned int       start_pulses_; // Start pulses seen since reset
};

struct SensorConfig
{
    uint8_t      humidity           = 45;
    uint8_t      humidityDecimal    = 0;
    uint8_t      temperature        = 23;
    uint8_t      temperatureDecimal = 0;
    bool         respondsToStart    = true;
    int          stallAfterBits     = -1; // Stop talking after that many data bits, -1 = never
    bool         corruptChecksum    = false;
    unsigned int minStartUs         = DHT11_START_MIN_US;
};

// Answers with a synthesized frame carrying the configured values
class SimulatedSensor : public Sensor {
 public:
    SimulatedSensor(unsigned int ticks_per_us, const SensorConfig& config = SensorConfig());

    void setConfig(const SensorConfig& config);
    const SensorConfig& config() const { return config_; }

    // Frame sent in response to the next start pulse
    void buildFrame(uint8_t* frame) const;

 protected:
    bool respond(Waveform& wave) override;

 private:
    SensorConfig config_;
};

#define REPLAY_QUEUE_LEN 16

// Answers with captures recorded from a real sensor, oldest first.
// Silent when nothing is queued. reset() keeps the queue.
class ReplaySensor : public Sensor {
 public:
    ReplaySensor(unsigned int ticks_per_us, unsigned int min_start_us = DHT11_START_MIN_US)
        : Sensor(ticks_per_us, min_start_us) {}

    // false if the queue is full; the capture is dropped then
    bool enqueue(const Waveform& wave);
    size_t pending() const { return queue_.size(); }

 protected:
    bool respond(Waveform& wave) override;

 private:
    std::deque<Waveform> queue_;
};

#endif
