#include <iostream>

#include "simulation.hpp"

Simulation::Simulation(const Config& config, Sensor* sensor)
    : controller_(config), sensor_(sensor)
{
    reset();
}

void Simulation::setConfig(const Config& config)
{
    controller_ = Controller(config);
    reset();
}

void Simulation::setSensor(Sensor* sensor)
{
    sensor_ = sensor;
    if (sensor_) {
        sensor_->setTicksPerUs(controller_.config().samplingFrequency);
        sensor_->reset();
    }
}

void Simulation::reset()
{
    controller_.reset();
    latch_.reset();
    if (sensor_) {
        sensor_->setTicksPerUs(controller_.config().samplingFrequency);
        sensor_->reset();
    }
    ticks_           = 0;
    acquisitions_    = 0;
    timeouts_        = 0;
    checksum_errors_ = 0;
}

bool Simulation::line() const
{
    bool sensor_drive = sensor_ ? sensor_->drive() : true;

    return sensor_drive && !controller_.driveLow();
}

void Simulation::tick()
{
    bool level = line();
    Phase before = controller_.state().phase;
    // The register does not move on the data ready tick, but take it before
    // the clock anyway; that's the instant the reading is defined at.
    Reading reading = controller_.reading();

    Outputs out = controller_.tick(level);

    if (sensor_)
        sensor_->tick(level);
    ticks_++;

    if (out.dataReady) {
        latch_.latch(reading);
        acquisitions_++;
        if (!reading.checksumOk) {
            checksum_errors_++;
            std::cout << "Bad checksum: " << reading << std::endl;
        }
        if (reading_handler_)
            reading_handler_(reading);
    } else if (before == Phase::Run && controller_.state().phase == Phase::Idle) {
        timeouts_++;
        std::cout << "Sensor timeout after " << controller_.state().counter.value()
                  << " edges" << std::endl;
        if (timeout_handler_)
            timeout_handler_();
    }
}

void Simulation::run(unsigned long long ticks)
{
    for (unsigned long long i = 0; i < ticks; i++)
        tick();
}

void Simulation::runMicroseconds(unsigned long long us)
{
    run(us * controller_.config().samplingFrequency);
}
