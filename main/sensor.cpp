#include "sensor.hpp"

Sensor::Sensor(unsigned int ticks_per_us, unsigned int min_start_us)
    : player_(ticks_per_us), ticks_per_us_(ticks_per_us), min_start_us_(min_start_us)
{
    reset();
}

void Sensor::setTicksPerUs(unsigned int ticks_per_us)
{
    ticks_per_us_ = ticks_per_us;
    player_.setTicksPerUs(ticks_per_us);
}

void Sensor::reset()
{
    player_.stop();
    low_ticks_    = 0;
    start_pulses_ = 0;
}

void Sensor::tick(bool bus)
{
    if (isResponding()) {
        // We're driving the line ourselves; the host is supposed to listen
        player_.tick();
        return;
    }

    if (!bus) {
        low_ticks_++;
        return;
    }

    // LOW => HIGH. Long enough to be the host asking for data?
    if (low_ticks_ >= static_cast<unsigned long long>(min_start_us_) * ticks_per_us_) {
        Waveform wave;

        start_pulses_++;
        if (respond(wave))
            player_.play(wave);
    }
    low_ticks_ = 0;
}

SimulatedSensor::SimulatedSensor(unsigned int ticks_per_us, const SensorConfig& config)
    : Sensor(ticks_per_us, config.minStartUs), config_(config)
{
}

void SimulatedSensor::setConfig(const SensorConfig& config)
{
    config_ = config;
    setMinStartUs(config.minStartUs);
}

void SimulatedSensor::buildFrame(uint8_t* frame) const
{
    frame[0] = config_.humidity;
    frame[1] = config_.humidityDecimal;
    frame[2] = config_.temperature;
    frame[3] = config_.temperatureDecimal;
    frame[DHT11_CRC_OFFSET] = dht11_checksum(frame);

    if (config_.corruptChecksum)
        frame[DHT11_CRC_OFFSET]++;
}

bool SimulatedSensor::respond(Waveform& wave)
{
    uint8_t frame[DHT11_FRAME_LEN];

    if (!config_.respondsToStart)
        return false;

    buildFrame(frame);
    wave = encodeFrame(frame, config_.stallAfterBits);
    return true;
}

bool ReplaySensor::enqueue(const Waveform& wave)
{
    if (queue_.size() >= REPLAY_QUEUE_LEN)
        return false;

    queue_.push_back(wave);
    return true;
}

bool ReplaySensor::respond(Waveform& wave)
{
    if (queue_.empty())
        return false;

    wave = queue_.front();
    queue_.pop_front();
    return true;
}
