#include "SensorHistory.hpp"
#include "MixerErrors.hpp"

#include <string>

void SensorHistory::append(const InertialSample& sample) {
    newest_ = (count_ == 0) ? 0 : (newest_ + 1) % CAPACITY;
    samples_[newest_] = sample;
    if (count_ < CAPACITY) ++count_;
}

const InertialSample& SensorHistory::latest() const {
    if (count_ == 0) {
        throw NoDataError("SensorHistory: no sample has been appended");
    }
    return samples_[newest_];
}

bool SensorHistory::tryLatest(InertialSample& out) const {
    if (count_ == 0) return false;
    out = samples_[newest_];
    return true;
}

const InertialSample& SensorHistory::sampleAgo(std::size_t k) const {
    if (k >= count_) {
        throw NoDataError("SensorHistory: requested sample " + std::to_string(k) +
                          " but only " + std::to_string(count_) + " held");
    }
    return samples_[(newest_ + CAPACITY - k) % CAPACITY];
}
