#include <iostream>

#include "simulation.hpp"
#include "simulator.hpp"

// Some genius decided to omit this from Qt headers... Well...
inline std::ostream& operator<<(std::ostream& s, const QString& str)
{
    return s << str.toStdString();
}

// A helper class for dumping data
class Dump {
 public:
    Dump(const uint8_t* buf, int len) :buf_(buf), len_(len) {}

 private:
    const uint8_t *buf_;
    int len_;

    friend std::ostream& operator<<(std::ostream& s, const Dump& data) {
        for (int i = 0; i < data.len_ - 1; i++) {
            s << +data.buf_[i] << ' ';
        }
        return s << +data.buf_[data.len_ - 1];
    }
};

bool dump_all_packets = false;

// Buffer to read incoming serial data. A full capture is 83 segments
char rx_buffer[1024];
unsigned int rx_bytes = 0;

static Config          config;
static SimulatedSensor simulated_sensor(config.samplingFrequency);
static ReplaySensor    replay_sensor(config.samplingFrequency);
static Simulation      simulation(config, &simulated_sensor);

static void reportCounters()
{
    ui_UpdateCounters(simulation.acquisitions(), simulation.timeouts(),
                      simulation.checksumErrors(), replay_sensor.pending());
}

void initSimulator()
{
    std::cout << "Config: " << config << std::endl;

    simulation.onReading([](const Reading& r) {
        std::cout << "Rx: " << r << std::endl;
        ui_UpdateReading(r, simulation.latch().word());
        reportCounters();
    });
    simulation.onTimeout(reportCounters);
}

QString openSerial(QSerialPort* serial, const QString& port)
{
    serial->setPortName(port);
    serial->setBaudRate(QSerialPort::Baud115200);
    serial->setDataBits(QSerialPort::Data8);
    serial->setParity(QSerialPort::NoParity);
    serial->setStopBits(QSerialPort::OneStop);

    // Make sure our Rx buffer is clear
    rx_bytes = 0;

    if (!serial->open(QIODevice::ReadWrite)) {
        QString error = serial->errorString();

        std::cout << "Open failed: " << error << std::endl;
        return error;
    }

    return QString();
}

void closeSerial(QSerialPort* serial)
{
    serial->close();
}

// The raw sampler sends one capture per line, in the form:
// 1 28 0 82 1 86 0 52 1 24 0 51 1 71 ... 0 54
// that is level/duration pairs starting from the moment it released the line.
// Lines starting with '#' are its own comments ("# no response" etc).
static void handleCapture()
{
    if (rx_buffer[0] == '#') {
        std::cout << "Sampler: " << rx_buffer << std::endl;
        return;
    }

    Waveform wave;
    std::string err = parseWaveform(rx_buffer, &wave);

    if (!err.empty()) {
        std::cout << err << std::endl;
        return;
    }

    if (dump_all_packets) {
        std::cout << "Capture: " << wave << std::endl;
    }

    if (!replay_sensor.enqueue(wave)) {
        std::cout << "Replay queue full; capture dropped" << std::endl;
    }

    reportCounters();
}

void serialRead(QSerialPort* serial)
{
    char c;

    while (serial->read(&c, 1) == 1) {
        if (c == '\r' || c == '\n') {
            // Either one ends the line; empty lines are skipped
            if (rx_bytes) {
                rx_buffer[rx_bytes] = 0;
                handleCapture();
                rx_bytes = 0;
            }
        } else if (rx_bytes == sizeof(rx_buffer) - 1) {
            std::cout << "Garbage on serial port; buffer exceeded!" << std::endl;
            rx_bytes = 0;
        } else {
            rx_buffer[rx_bytes++] = c;
        }
    }
}

QString applyConfig(const Config& new_config)
{
    std::string err = validateConfig(new_config);

    if (!err.empty()) {
        std::cout << "Invalid configuration: " << err << std::endl;
        return QString::fromStdString(err);
    }

    config = new_config;
    simulation.setConfig(config);
    std::cout << "Config: " << config << std::endl;
    reportCounters();

    return QString();
}

void setSensorConfig(const SensorConfig& sensor_config)
{
    uint8_t frame[DHT11_FRAME_LEN];

    simulated_sensor.setConfig(sensor_config);
    simulated_sensor.buildFrame(frame);

    std::cout << "Sensor frame: " << std::hex << Dump(frame, DHT11_FRAME_LEN) << std::dec;
    if (!sensor_config.respondsToStart)
        std::cout << " (not responding)";
    else if (sensor_config.stallAfterBits >= 0)
        std::cout << " (stalls after " << sensor_config.stallAfterBits << " bits)";
    std::cout << std::endl;
}

void setReplaySource(bool on)
{
    std::cout << "Sensor source: " << (on ? "replay" : "simulated") << std::endl;
    simulation.setSensor(on ? static_cast<Sensor*>(&replay_sensor) : &simulated_sensor);
}

void setDumpAllPackets(bool on)
{
    dump_all_packets = on;
}

void runSimulation(unsigned int us)
{
    simulation.runMicroseconds(us);
}

void resetSimulation()
{
    std::cout << "Reset" << std::endl;
    simulation.reset();
    reportCounters();
}

uint8_t getLeds(bool sw0, bool sw1)
{
    return simulation.latch().leds(sw0, sw1);
}
