#ifndef _DHT11_SIMULATION_H
#define _DHT11_SIMULATION_H

#include <functional>

#include "data_latch.hpp"
#include "dht11_ctrl.hpp"
#include "sensor.hpp"

// Decoder and sensor sharing one open-drain line with a pull-up.
// Either side pulling low wins.
class Simulation {
 public:
    typedef std::function<void(const Reading&)> ReadingHandler;
    typedef std::function<void()>               TimeoutHandler;

    // 'sensor' is not owned and may be nullptr (nothing on the line)
    Simulation(const Config& config, Sensor* sensor);

    // Rebuilds the decoder with new parameters and resets everything
    void setConfig(const Config& config);
    const Config& config() const { return controller_.config(); }

    // Swaps what's on the other end of the line. Resets the new sensor
    void setSensor(Sensor* sensor);

    void onReading(const ReadingHandler& handler) { reading_handler_ = handler; }
    void onTimeout(const TimeoutHandler& handler) { timeout_handler_ = handler; }

    void reset();

    // Resolved line level for the current tick
    bool line() const;

    void run(unsigned long long ticks);
    // Convenience: run for a number of simulated microseconds
    void runMicroseconds(unsigned long long us);

    const Controller& controller() const { return controller_; }
    const DataLatch& latch() const { return latch_; }

    unsigned long long ticks() const { return ticks_; }
    unsigned int acquisitions() const { return acquisitions_; }
    unsigned int timeouts() const { return timeouts_; }
    unsigned int checksumErrors() const { return checksum_errors_; }

 private:
    void tick();

    Controller         controller_;
    Sensor*            sensor_;
    DataLatch          latch_;
    ReadingHandler     reading_handler_;
    TimeoutHandler     timeout_handler_;
    unsigned long long ticks_;
    unsigned int       acquisitions_;
    unsigned int       timeouts_;
    unsigned int       checksum_errors_;
};

#endif
