#ifndef _DHT11_H
#define _DHT11_H

#include <stdint.h>

// Some common DHT11 definitions

// The bit counter stops here. 2 acknowledge bits plus 40 data bits
#define DHT11_MAX_BITS     42
// High time since the previous falling edge; at or above this it's a 1
#define DHT11_THRESHOLD_US 100

// The decoder keeps humidity, temperature and checksum bytes only
#define DHT11_REG_BITS 24
#define DHT11_REG_MASK 0xFFFFFFu

// Sensor frame: humidity, humidity decimal, temperature, temperature decimal, checksum
#define DHT11_FRAME_LEN   5
#define DHT11_CRC_OFFSET  (DHT11_FRAME_LEN - 1)
#define DHT11_FRAME_BITS  (DHT11_FRAME_LEN * 8)

// Sensor timings in microseconds, from the datasheet
#define DHT11_START_MIN_US     18000 // Shortest host start pulse the sensor accepts
#define DHT11_RESPONSE_WAIT_US 30    // Bus released by the host, sensor still silent
#define DHT11_ACK_LOW_US       80
#define DHT11_ACK_HIGH_US      80
#define DHT11_BIT_LOW_US       50
#define DHT11_BIT_0_HIGH_US    26
#define DHT11_BIT_1_HIGH_US    70
#define DHT11_END_LOW_US       50

// Checksum of a sensor frame. Covers the four data bytes
static inline uint8_t dht11_checksum(const uint8_t *frame)
{
    uint8_t c = 0;

    for (int i = 0; i < DHT11_CRC_OFFSET; i++)
        c += frame[i];

    return c;
}

#endif
