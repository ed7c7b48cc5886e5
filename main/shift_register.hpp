#ifndef _DHT11_SHIFT_REGISTER_H
#define _DHT11_SHIFT_REGISTER_H

#include <stdint.h>

#include "dht11.h"

// 24-bit receive register. New bits enter at bit 0; whatever is shifted out
// of bit 23 is lost. This is what drops the two acknowledge bits.
class ShiftRegister {
 public:
    ShiftRegister() : reg_(0) {}

    void reset() { reg_ = 0; }

    void shiftIn(bool bit)
    {
        reg_ = ((reg_ << 1) | (bit ? 1 : 0)) & DHT11_REG_MASK;
    }

    uint32_t value() const { return reg_; }

 private:
    uint32_t reg_;
};

#endif
