#ifndef _DHT11_EDGE_DETECTOR_H
#define _DHT11_EDGE_DETECTOR_H

// Turns the raw line into single-tick rising/falling pulses.
// The line goes through two sampling stages before being compared with its
// previous value, so a level caught mid-transition never makes a double pulse.
// Pulses are valid from the tick after sample() until the next sample().
class EdgeDetector {
 public:
    EdgeDetector() { reset(); }

    void reset()
    {
        sync_    = false;
        stable_  = false;
        prev_    = false;
        rising_  = false;
        falling_ = false;
    }

    void sample(bool line);

    bool rising() const { return rising_; }
    bool falling() const { return falling_; }

 private:
    bool sync_;   // First sampling stage, may be metastable in hardware
    bool stable_; // Second sampling stage
    bool prev_;   // Previous value of stable_
    bool rising_;
    bool falling_;
};

#endif
