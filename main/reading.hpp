#ifndef _DHT11_READING_H
#define _DHT11_READING_H

#include <stdint.h>
#include <ostream>

// Decoded view of the receive register. Computed all the time, but only
// meaningful on the tick when the controller signals data ready.
struct Reading
{
    uint8_t humidity;    // reg[23:16]
    uint8_t temperature; // reg[15:8]
    uint8_t checksum;    // reg[7:0]
    bool    checksumOk;
};

// (humidity + temperature) mod 256 == checksum
bool checksumOk(uint32_t reg);

Reading extractReading(uint32_t reg);

std::ostream& operator<<(std::ostream& s, const Reading& r);

#endif
