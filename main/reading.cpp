#include "reading.hpp"

static inline uint8_t regByte(uint32_t reg, int n)
{
    return (reg >> (n * 8)) & 0xFF;
}

bool checksumOk(uint32_t reg)
{
    uint8_t sum = regByte(reg, 2) + regByte(reg, 1);

    return sum == regByte(reg, 0);
}

Reading extractReading(uint32_t reg)
{
    Reading r;

    r.humidity    = regByte(reg, 2);
    r.temperature = regByte(reg, 1);
    r.checksum    = regByte(reg, 0);
    r.checksumOk  = checksumOk(reg);

    return r;
}

std::ostream& operator<<(std::ostream& s, const Reading& r)
{
    s << "humidity = " << +r.humidity << "%"
      << " temperature = " << +r.temperature << "C"
      << " checksum " << std::hex << +r.checksum << std::dec;

    return s << (r.checksumOk ? " OK" : " BAD");
}
