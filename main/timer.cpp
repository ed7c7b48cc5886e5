#include "timer.hpp"

unsigned int Timer::advance(bool tz)
{
    if (tz) {
        reset();
    } else if (divider_ + 1 >= ticks_per_us_) {
        // A whole microsecond has elapsed
        divider_ = 0;
        if (t_ < max_us_)
            t_++;
    } else {
        divider_++;
    }

    return t_;
}
