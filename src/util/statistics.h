#ifndef SENTIBATCH_STATISTICS_H
#define SENTIBATCH_STATISTICS_H

#include <string>

// Running mean, updated one observation at a time.
class OnlineAvg {
public:
    OnlineAvg() : avg_(0), n_(0) {}

    void Update(double x) {
        n_++;
        avg_ = (avg_ * (n_ - 1) + x) / n_;
    }

    double Avg() const { return avg_; }

    size_t N() const { return n_; }

    std::string ToString() const { return std::to_string(avg_); }

private:
    double avg_;
    size_t n_;
};

#endif //SENTIBATCH_STATISTICS_H
