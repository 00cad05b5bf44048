#include "fusionml/sample_buffer.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace fusionml {

SampleBuffer::SampleBuffer(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("SampleBuffer capacity must be positive");
    }
}

void SampleBuffer::append(FeatureVector sample) {
    samples_.push_back(std::move(sample));
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }
}

void SampleBuffer::clear() {
    samples_.clear();
}

std::vector<FeatureVector> SampleBuffer::snapshot() const {
    return std::vector<FeatureVector>(samples_.begin(), samples_.end());
}

std::vector<FeatureVector> SampleBuffer::history() const {
    if (samples_.empty()) {
        return {};
    }
    return std::vector<FeatureVector>(samples_.begin(), std::prev(samples_.end()));
}

const FeatureVector& SampleBuffer::latest() const {
    if (samples_.empty()) {
        throw std::out_of_range("SampleBuffer is empty");
    }
    return samples_.back();
}

std::size_t SampleBuffer::size() const {
    return samples_.size();
}

std::size_t SampleBuffer::capacity() const {
    return capacity_;
}

bool SampleBuffer::empty() const {
    return samples_.empty();
}

bool SampleBuffer::full() const {
    return samples_.size() >= capacity_;
}

}  // namespace fusionml
