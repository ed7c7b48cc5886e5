#include <sstream>

#include "dht11_ctrl.hpp"

std::string validateConfig(const Config& config)
{
    std::ostringstream err;

    if (config.samplingFrequency < 1) {
        err << "sampling frequency must be at least 1 tick per microsecond";
    } else if (config.start_us <= DHT11_THRESHOLD_US) {
        // Otherwise the watchdog fires before a 1 can ever be seen
        err << "start pulse (" << config.start_us << " us) must be longer than "
            << DHT11_THRESHOLD_US << " us";
    } else if (config.warm_us < config.start_us) {
        // The timer saturates at warm_us
        err << "warm-up (" << config.warm_us << " us) must not be shorter than the start pulse ("
            << config.start_us << " us)";
    }

    return err.str();
}

std::ostream& operator<<(std::ostream& s, const Config& config)
{
    return s << "frequency = " << config.samplingFrequency << " ticks/us"
             << " start = " << config.start_us << " us"
             << " warm = " << config.warm_us << " us";
}

std::ostream& operator<<(std::ostream& s, Phase phase)
{
    switch (phase) {
    case Phase::Idle:
        return s << "IDLE";
    case Phase::Start:
        return s << "START";
    case Phase::Run:
        return s << "RUN";
    }
    return s << "UNKNOWN[" << static_cast<int>(phase) << ']';
}

// Receive register load windows, in terms of the bit counter value.
// 0-9: two acknowledge bits and the humidity byte. The acknowledge bits are
// pushed out of the 24-bit register later, so they need no separate test.
// 18-25: temperature byte. 34 and up: checksum byte; nothing falls past 41.
static bool shiftWindow(unsigned int c)
{
    return c <= 9 || (c >= 18 && c <= 25) || c >= 34;
}

Outputs evaluate(const Config& config, const State& state)
{
    Outputs out;
    unsigned int t = state.timer.value();
    unsigned int c = state.counter.value();
    bool run = state.phase == Phase::Run;
    bool rising = state.edges.rising();
    bool falling = state.edges.falling();

    out.driveLow       = state.phase == Phase::Start;
    out.counterReset   = out.driveLow;
    out.counterAdvance = run && falling;
    out.bitValue       = t >= DHT11_THRESHOLD_US;
    out.shiftEnable    = out.counterAdvance && shiftWindow(c);
    out.dataReady      = run && rising && c == DHT11_MAX_BITS;
    out.timerReset     = (state.phase == Phase::Idle && t == config.warm_us) ||
                         (state.phase != Phase::Idle && t == config.start_us) ||
                         out.counterAdvance || out.dataReady;

    return out;
}

static Phase nextPhase(const Config& config, const State& state, const Outputs& out)
{
    unsigned int t = state.timer.value();

    switch (state.phase) {
    case Phase::Idle:
        return t == config.warm_us ? Phase::Start : Phase::Idle;
    case Phase::Start:
        return t == config.start_us ? Phase::Run : Phase::Start;
    case Phase::Run:
        // Either done, or the sensor went silent: the watchdog
        return (out.dataReady || t == config.start_us) ? Phase::Idle : Phase::Run;
    }
    return Phase::Idle;
}

// Clocks every register once, in place
static Outputs clock(const Config& config, State& state, bool line)
{
    Outputs out = evaluate(config, state);

    state.phase = nextPhase(config, state, out);
    state.timer.advance(out.timerReset);
    state.counter.clock(out.counterReset, out.counterAdvance);
    if (out.shiftEnable)
        state.reg.shiftIn(out.bitValue);
    state.edges.sample(line);

    return out;
}

State step(const Config& config, const State& state, bool line)
{
    State next = state;

    clock(config, next, line);
    return next;
}

Controller::Controller(const Config& config)
    : config_(config), state_(config)
{
}

void Controller::reset()
{
    state_ = State(config_);
}

Outputs Controller::tick(bool line)
{
    return clock(config_, state_, line);
}
