#ifndef _DHT11_TIMER_H
#define _DHT11_TIMER_H

// Microseconds elapsed since the last reset, saturating at 'max_us'.
// Advanced once per sampling tick; 'ticks_per_us' ticks make one microsecond.
class Timer {
 public:
    Timer(unsigned int ticks_per_us, unsigned int max_us)
        : ticks_per_us_(ticks_per_us), max_us_(max_us), divider_(0), t_(0) {}

    void reset()
    {
        divider_ = 0;
        t_       = 0;
    }

    // One tick. 'tz' is the synchronous reset request and wins over counting
    unsigned int advance(bool tz);

    unsigned int value() const { return t_; }

 private:
    unsigned int ticks_per_us_;
    unsigned int max_us_;
    unsigned int divider_; // Ticks into the current microsecond
    unsigned int t_;
};

#endif
