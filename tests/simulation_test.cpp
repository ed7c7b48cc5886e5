#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include "simulation.hpp"

#define WARM_US      1000
#define START_US     200
#define MIN_START_US 150

// Long enough for one acquisition but not two
#define ONE_CYCLE_US 6000

static Config testConfig(unsigned int frequency = 1)
{
    Config config;

    config.samplingFrequency = frequency;
    config.start_us          = START_US;
    config.warm_us           = WARM_US;
    return config;
}

static SensorConfig sensorConfig()
{
    SensorConfig config;

    config.humidity    = 45;
    config.temperature = 23;
    config.minStartUs  = MIN_START_US;
    return config;
}

TEST(DataLatchTest, EmptyAfterReset)
{
    DataLatch latch;

    EXPECT_FALSE(latch.isValid());
    EXPECT_EQ(0u, latch.word());
    EXPECT_EQ(0, latch.leds(false, false));
    EXPECT_EQ(0u, latch.readingCount());
}

TEST(DataLatchTest, PacksWord)
{
    DataLatch latch;

    latch.latch(extractReading(0x32184A));
    EXPECT_EQ(0x32184A03u, latch.word());

    latch.latch(extractReading(0x32184B));
    EXPECT_EQ(0x32184B02u, latch.word());
    EXPECT_EQ(2u, latch.readingCount());
    EXPECT_EQ(1u, latch.errorCount());

    latch.reset();
    EXPECT_EQ(0u, latch.word());
    EXPECT_EQ(0u, latch.errorCount());
}

TEST(DataLatchTest, LedsShowSelectedNibble)
{
    DataLatch latch;

    latch.latch(extractReading(0x2D1744));
    EXPECT_EQ(0xD, latch.leds(false, false));
    EXPECT_EQ(0x2, latch.leds(false, true));
    EXPECT_EQ(0x7, latch.leds(true, false));
    EXPECT_EQ(0x1, latch.leds(true, true));
}

TEST(DataLatchTest, LedsAllOnForBadChecksum)
{
    DataLatch latch;

    latch.latch(extractReading(0x2D1745));
    EXPECT_EQ(DHT11_LEDS_ERROR, latch.leds(false, false));
    EXPECT_EQ(DHT11_LEDS_ERROR, latch.leds(true, true));
}

TEST(SensorTest, BuildsFrameWithChecksum)
{
    SimulatedSensor sensor(1, sensorConfig());
    uint8_t frame[DHT11_FRAME_LEN];

    sensor.buildFrame(frame);
    EXPECT_EQ(45, frame[0]);
    EXPECT_EQ(0, frame[1]);
    EXPECT_EQ(23, frame[2]);
    EXPECT_EQ(0, frame[3]);
    EXPECT_EQ(68, frame[4]);

    SensorConfig bad = sensorConfig();
    bad.corruptChecksum = true;
    sensor.setConfig(bad);
    sensor.buildFrame(frame);
    EXPECT_EQ(69, frame[4]);
}

TEST(SensorTest, AnswersLongLowPulseOnly)
{
    SimulatedSensor sensor(1, sensorConfig());

    // Too short
    for (int i = 0; i < MIN_START_US - 1; i++)
        sensor.tick(false);
    sensor.tick(true);
    EXPECT_FALSE(sensor.isResponding());
    EXPECT_EQ(0u, sensor.startPulses());

    for (int i = 0; i < MIN_START_US; i++)
        sensor.tick(false);
    EXPECT_FALSE(sensor.isResponding()); // Waits for the release
    sensor.tick(true);
    EXPECT_TRUE(sensor.isResponding());
    EXPECT_EQ(1u, sensor.startPulses());
    EXPECT_TRUE(sensor.drive());

    // Wait time is over, acknowledge begins
    for (int i = 0; i < DHT11_RESPONSE_WAIT_US; i++)
        sensor.tick(true);
    EXPECT_FALSE(sensor.drive());
}

class SimulationTest : public ::testing::Test {
 protected:
    SimulationTest()
        : sensor(1, sensorConfig()), sim(testConfig(), &sensor), timeout_edges(-1)
    {
        sim.onReading([this](const Reading& r) { readings.push_back(r); });
        sim.onTimeout([this]() {
            timeout_edges = sim.controller().state().counter.value();
        });
    }

    SimulatedSensor      sensor;
    Simulation           sim;
    std::vector<Reading> readings;
    int                  timeout_edges;
};

TEST_F(SimulationTest, ReadsSensorValues)
{
    sim.runMicroseconds(ONE_CYCLE_US);

    ASSERT_EQ(1u, sim.acquisitions());
    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(45, readings[0].humidity);
    EXPECT_EQ(23, readings[0].temperature);
    EXPECT_EQ(68, readings[0].checksum);
    EXPECT_TRUE(readings[0].checksumOk);

    EXPECT_EQ(0u, sim.timeouts());
    EXPECT_EQ(0u, sim.checksumErrors());
    EXPECT_EQ(1u, sensor.startPulses());
    EXPECT_EQ(0x2D174403u, sim.latch().word());
}

TEST_F(SimulationTest, ReadsAgainAfterEveryWarmUp)
{
    sim.runMicroseconds(4 * ONE_CYCLE_US);

    EXPECT_GE(sim.acquisitions(), 3u);
    EXPECT_EQ(0u, sim.timeouts());
    EXPECT_EQ(sim.acquisitions(), sim.latch().readingCount());
}

TEST_F(SimulationTest, LineIdlesHigh)
{
    EXPECT_TRUE(sim.line());
    sim.runMicroseconds(WARM_US + 10);
    // Start pulse
    EXPECT_FALSE(sim.line());
    EXPECT_TRUE(sim.controller().driveLow());
}

TEST_F(SimulationTest, WorksAtHigherSamplingRates)
{
    sim.setConfig(testConfig(8));
    sim.runMicroseconds(ONE_CYCLE_US);

    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(45, readings[0].humidity);
    EXPECT_EQ(23, readings[0].temperature);
    EXPECT_TRUE(readings[0].checksumOk);
    EXPECT_EQ(8ull * ONE_CYCLE_US, sim.ticks());
}

TEST_F(SimulationTest, ExtremeValues)
{
    SensorConfig config = sensorConfig();

    config.humidity    = 0xFF;
    config.temperature = 0x00;
    sensor.setConfig(config);
    sim.runMicroseconds(ONE_CYCLE_US);

    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(0xFF, readings[0].humidity);
    EXPECT_EQ(0x00, readings[0].temperature);
    EXPECT_EQ(0xFF, readings[0].checksum);
    EXPECT_TRUE(readings[0].checksumOk);
}

TEST_F(SimulationTest, CorruptChecksum)
{
    SensorConfig config = sensorConfig();

    config.corruptChecksum = true;
    sensor.setConfig(config);
    sim.runMicroseconds(ONE_CYCLE_US);

    ASSERT_EQ(1u, readings.size());
    EXPECT_FALSE(readings[0].checksumOk);
    EXPECT_EQ(1u, sim.checksumErrors());
    EXPECT_EQ(DHT11_LEDS_ERROR, sim.latch().leds(false, false));
    EXPECT_EQ(0u, sim.latch().word() & DHT11_WORD_CHECKSUM_OK);
}

// The decoder checks humidity + temperature only, the sensor sums all four bytes
TEST_F(SimulationTest, DecimalBytesBreakTheChecksum)
{
    SensorConfig config = sensorConfig();

    config.humidityDecimal = 5;
    sensor.setConfig(config);
    sim.runMicroseconds(ONE_CYCLE_US);

    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(45, readings[0].humidity);
    EXPECT_EQ(23, readings[0].temperature);
    EXPECT_EQ(73, readings[0].checksum);
    EXPECT_FALSE(readings[0].checksumOk);
}

TEST_F(SimulationTest, StalledSensorTimesOutAndRecovers)
{
    SensorConfig config = sensorConfig();

    config.stallAfterBits = 10;
    sensor.setConfig(config);
    sim.runMicroseconds(ONE_CYCLE_US);

    EXPECT_EQ(0u, sim.acquisitions());
    EXPECT_GE(sim.timeouts(), 1u);
    EXPECT_TRUE(readings.empty());
    // Acknowledge plus 10 bits
    EXPECT_EQ(11, timeout_edges);
    EXPECT_FALSE(sim.latch().isValid());

    sensor.setConfig(sensorConfig());
    sim.runMicroseconds(2 * ONE_CYCLE_US);
    EXPECT_GE(sim.acquisitions(), 1u);
    ASSERT_FALSE(readings.empty());
    EXPECT_TRUE(readings.back().checksumOk);
}

TEST_F(SimulationTest, DeadSensorTimesOut)
{
    SensorConfig config = sensorConfig();

    config.respondsToStart = false;
    sensor.setConfig(config);
    sim.runMicroseconds(ONE_CYCLE_US);

    EXPECT_EQ(0u, sim.acquisitions());
    EXPECT_GE(sim.timeouts(), 1u);
    EXPECT_EQ(0, timeout_edges);
    EXPECT_GE(sensor.startPulses(), 1u);
}

TEST_F(SimulationTest, SensorIgnoresShortStartPulse)
{
    SensorConfig config = sensorConfig();

    config.minStartUs = START_US + 50;
    sensor.setConfig(config);
    sim.runMicroseconds(ONE_CYCLE_US);

    EXPECT_EQ(0u, sim.acquisitions());
    EXPECT_GE(sim.timeouts(), 1u);
    EXPECT_EQ(0u, sensor.startPulses());
}

TEST_F(SimulationTest, NothingOnTheLine)
{
    sim.setSensor(nullptr);
    sim.runMicroseconds(ONE_CYCLE_US);

    EXPECT_EQ(0u, sim.acquisitions());
    EXPECT_GE(sim.timeouts(), 1u);
}

TEST_F(SimulationTest, ResetClearsEverything)
{
    sim.runMicroseconds(ONE_CYCLE_US);
    ASSERT_EQ(1u, sim.acquisitions());

    sim.reset();
    EXPECT_EQ(0u, sim.acquisitions());
    EXPECT_EQ(0u, sim.timeouts());
    EXPECT_EQ(0ull, sim.ticks());
    EXPECT_FALSE(sim.latch().isValid());
    EXPECT_EQ(Phase::Idle, sim.controller().state().phase);
    EXPECT_EQ(0u, sensor.startPulses());
}

TEST_F(SimulationTest, Deterministic)
{
    SimulatedSensor other_sensor(1, sensorConfig());
    Simulation other(testConfig(), &other_sensor);

    sim.runMicroseconds(3 * ONE_CYCLE_US);
    other.runMicroseconds(3 * ONE_CYCLE_US);

    EXPECT_EQ(sim.acquisitions(), other.acquisitions());
    EXPECT_EQ(sim.latch().word(), other.latch().word());
    EXPECT_EQ(sim.controller().state().timer.value(), other.controller().state().timer.value());
    EXPECT_EQ(sim.controller().state().phase, other.controller().state().phase);
}

// Capture the way the raw sampler prints it, with some jitter on every pulse
static std::string captureText(const uint8_t* frame)
{
    std::ostringstream s;

    s << "1 28 0 82 1 86";
    for (int i = 0; i < DHT11_FRAME_BITS; i++) {
        bool bit = frame[i / 8] & (0x80 >> (i % 8));
        int jitter = (i % 3) - 1;

        s << " 0 " << 50 + 2 * jitter;
        s << " 1 " << (bit ? 70 : 26) + 3 * jitter;
    }
    s << " 0 54";
    return s.str();
}

TEST(ReplayTest, ReplaysCapturesInOrder)
{
    ReplaySensor sensor(1, MIN_START_US);
    Simulation sim(testConfig(), &sensor);
    const uint8_t first[] = {0x32, 0x00, 0x18, 0x00, 0x4A};
    const uint8_t second[] = {0x28, 0x00, 0x15, 0x00, 0x3D};
    Waveform wave;
    std::vector<Reading> readings;

    sim.onReading([&readings](const Reading& r) { readings.push_back(r); });

    ASSERT_EQ("", parseWaveform(captureText(first), &wave));
    EXPECT_TRUE(sensor.enqueue(wave));
    EXPECT_TRUE(sensor.enqueue(encodeFrame(second)));
    EXPECT_EQ(2u, sensor.pending());

    sim.runMicroseconds(2 * ONE_CYCLE_US);

    ASSERT_EQ(2u, readings.size());
    EXPECT_EQ(0x32, readings[0].humidity);
    EXPECT_EQ(0x18, readings[0].temperature);
    EXPECT_TRUE(readings[0].checksumOk);
    EXPECT_EQ(0x28, readings[1].humidity);
    EXPECT_EQ(0x15, readings[1].temperature);
    EXPECT_TRUE(readings[1].checksumOk);
    EXPECT_EQ(0u, sensor.pending());

    // Out of captures
    sim.runMicroseconds(ONE_CYCLE_US);
    EXPECT_EQ(2u, sim.acquisitions());
    EXPECT_GE(sim.timeouts(), 1u);
}

TEST(ReplayTest, QueueIsBounded)
{
    ReplaySensor sensor(1);
    const uint8_t frame[] = {0x32, 0x00, 0x18, 0x00, 0x4A};
    Waveform wave = encodeFrame(frame);

    for (int i = 0; i < REPLAY_QUEUE_LEN; i++)
        EXPECT_TRUE(sensor.enqueue(wave));
    EXPECT_FALSE(sensor.enqueue(wave));
    EXPECT_EQ((size_t)REPLAY_QUEUE_LEN, sensor.pending());
}

TEST(ReplayTest, SwitchingSensors)
{
    SimulatedSensor simulated(1, sensorConfig());
    ReplaySensor replay(1, MIN_START_US);
    Simulation sim(testConfig(), &replay);

    // Empty replay queue: nobody answers
    sim.runMicroseconds(ONE_CYCLE_US);
    EXPECT_EQ(0u, sim.acquisitions());

    sim.setSensor(&simulated);
    sim.runMicroseconds(2 * ONE_CYCLE_US);
    EXPECT_GE(sim.acquisitions(), 1u);
    EXPECT_EQ(45, sim.latch().reading().humidity);
}
