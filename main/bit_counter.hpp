#ifndef _DHT11_BIT_COUNTER_H
#define _DHT11_BIT_COUNTER_H

#include "dht11.h"

// Received bits counter. Saturates at DHT11_MAX_BITS, never wraps
class BitCounter {
 public:
    BitCounter() : c_(0) {}

    void reset() { c_ = 0; }

    void advance()
    {
        if (c_ < DHT11_MAX_BITS)
            c_++;
    }

    // One tick of the counter; reset has priority over advance
    void clock(bool cz, bool inc)
    {
        if (cz)
            reset();
        else if (inc)
            advance();
    }

    unsigned int value() const { return c_; }

 private:
    unsigned int c_;
};

#endif
