#include "data_latch.hpp"

void DataLatch::reset()
{
    reading_ = Reading();
    valid_    = false;
    readings_ = 0;
    errors_   = 0;
}

void DataLatch::latch(const Reading& r)
{
    reading_ = r;
    valid_   = true;
    readings_++;
    if (!r.checksumOk)
        errors_++;
}

uint32_t DataLatch::word() const
{
    if (!valid_)
        return 0;

    return (static_cast<uint32_t>(reading_.humidity) << DHT11_WORD_HUMIDITY_SHIFT) |
           (static_cast<uint32_t>(reading_.temperature) << DHT11_WORD_TEMPERATURE_SHIFT) |
           (static_cast<uint32_t>(reading_.checksum) << DHT11_WORD_CHECKSUM_SHIFT) |
           DHT11_WORD_VALID |
           (reading_.checksumOk ? DHT11_WORD_CHECKSUM_OK : 0);
}

uint8_t DataLatch::leds(bool sw0, bool sw1) const
{
    if (valid_ && !reading_.checksumOk)
        return DHT11_LEDS_ERROR;

    uint8_t byte = sw0 ? reading_.temperature : reading_.humidity;

    return sw1 ? byte >> 4 : byte & 0x0F;
}
