#include "edge_detector.hpp"

void EdgeDetector::sample(bool line)
{
    prev_   = stable_;
    stable_ = sync_;
    sync_   = line;

    rising_  = stable_ && !prev_;
    falling_ = !stable_ && prev_;
}
