#ifndef FUSIONML_SAMPLE_BUFFER_HPP
#define FUSIONML_SAMPLE_BUFFER_HPP

#include <cstddef>
#include <deque>
#include <vector>

namespace fusionml {

using FeatureVector = std::vector<double>;

class SampleBuffer {
public:
    explicit SampleBuffer(std::size_t capacity);

    void append(FeatureVector sample);
    void clear();

    std::vector<FeatureVector> snapshot() const;
    // Every entry except the most recent one.
    std::vector<FeatureVector> history() const;
    const FeatureVector& latest() const;

    std::size_t size() const;
    std::size_t capacity() const;
    bool empty() const;
    bool full() const;

private:
    std::size_t capacity_ = 0;
    std::deque<FeatureVector> samples_;
};

}  // namespace fusionml

#endif  // FUSIONML_SAMPLE_BUFFER_HPP
