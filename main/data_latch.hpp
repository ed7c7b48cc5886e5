#ifndef _DHT11_DATA_LATCH_H
#define _DHT11_DATA_LATCH_H

#include <stdint.h>

#include "reading.hpp"

// Layout of the 32-bit status word read by the device layer
#define DHT11_WORD_HUMIDITY_SHIFT    24
#define DHT11_WORD_TEMPERATURE_SHIFT 16
#define DHT11_WORD_CHECKSUM_SHIFT    8
#define DHT11_WORD_VALID             0x02 // At least one reading latched
#define DHT11_WORD_CHECKSUM_OK       0x01

#define DHT11_LEDS_ERROR 0x0F

// Holds the reading captured on the last data ready pulse
class DataLatch {
 public:
    DataLatch() { reset(); }

    void reset();

    void latch(const Reading& r);

    bool isValid() const { return valid_; }
    const Reading& reading() const { return reading_; }

    uint32_t word() const;

    // Board LEDs: sw0 picks the byte (humidity/temperature), sw1 the nibble (low/high).
    // All lit if the last reading failed its checksum.
    uint8_t leds(bool sw0, bool sw1) const;

    unsigned int readingCount() const { return readings_; }
    unsigned int errorCount() const { return errors_; }

 private:
    Reading      reading_;
    bool         valid_;
    unsigned int readings_;
    unsigned int errors_; // Readings with a bad checksum
};

#endif
