#ifndef _DHT11_CTRL_H
#define _DHT11_CTRL_H

#include <ostream>
#include <string>

#include "bit_counter.hpp"
#include "edge_detector.hpp"
#include "reading.hpp"
#include "shift_register.hpp"
#include "timer.hpp"

// Decoder parameters. Fixed for the lifetime of a Controller.
// Defaults match a 125 MHz sampling clock.
struct Config
{
    unsigned int samplingFrequency = 125;     // Ticks per microsecond
    unsigned int start_us          = 20000;   // Start pulse length, also the Run watchdog
    unsigned int warm_us           = 1000000; // Delay between acquisitions
};

// Returns an empty string if the config is usable, otherwise what's wrong with it
std::string validateConfig(const Config& config);

std::ostream& operator<<(std::ostream& s, const Config& config);

enum class Phase { Idle, Start, Run };

std::ostream& operator<<(std::ostream& s, Phase phase);

// Everything the decoder remembers between two ticks
struct State
{
    explicit State(const Config& config)
        : phase(Phase::Idle), timer(config.samplingFrequency, config.warm_us) {}

    Phase         phase;
    Timer         timer;   // t
    BitCounter    counter; // c
    ShiftRegister reg;
    EdgeDetector  edges;   // Pulses seen during the current tick
};

// Control signals for one tick
struct Outputs
{
    bool driveLow;       // Force the data line low (start pulse)
    bool timerReset;     // tz
    bool counterReset;   // cz
    bool counterAdvance; // inc
    bool bitValue;       // din
    bool shiftEnable;    // shift
    bool dataReady;      // dso
};

// Combinational part: pure function of the current state
Outputs evaluate(const Config& config, const State& state);

// Next state after one tick with 'line' sampled at the data pin
State step(const Config& config, const State& state, bool line);

class Controller {
 public:
    explicit Controller(const Config& config = Config());

    // Synchronous reset: Idle, t = 0, c = 0, reg = 0
    void reset();

    Outputs outputs() const { return evaluate(config_, state_); }

    // Advances by one tick and returns the outputs that were in effect during it.
    // 'line' is the resolved bus level, including our own drive.
    Outputs tick(bool line);

    bool driveLow() const { return state_.phase == Phase::Start; }

    Reading reading() const { return extractReading(state_.reg.value()); }

    const State& state() const { return state_; }
    const Config& config() const { return config_; }

 private:
    Config config_;
    State  state_;
};

#endif
