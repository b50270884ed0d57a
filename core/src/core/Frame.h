#pragma once

#include <array>
#include <cstddef>

namespace stepgrid {

// Fixed-size group of samples, one per channel.
template <std::size_t N>
class Frame {
 public:
  constexpr Frame() = default;

  constexpr explicit Frame(const float value)
  {
    samples_.fill(value);
  }

  constexpr Frame(const std::array<float, N>& samples) : samples_(samples) {}

  [[nodiscard]] static constexpr std::size_t channels() { return N; }

  [[nodiscard]] constexpr float operator[](const std::size_t channel) const
  {
    return samples_[channel];
  }

  constexpr float& operator[](const std::size_t channel)
  {
    return samples_[channel];
  }

  constexpr Frame& operator+=(const Frame& other)
  {
    for (std::size_t c = 0; c < N; ++c) {
      samples_[c] += other.samples_[c];
    }
    return *this;
  }

  constexpr Frame& operator-=(const Frame& other)
  {
    for (std::size_t c = 0; c < N; ++c) {
      samples_[c] -= other.samples_[c];
    }
    return *this;
  }

  constexpr Frame& operator*=(const Frame& other)
  {
    for (std::size_t c = 0; c < N; ++c) {
      samples_[c] *= other.samples_[c];
    }
    return *this;
  }

  constexpr Frame& operator*=(const float gain)
  {
    for (auto& sample : samples_) {
      sample *= gain;
    }
    return *this;
  }

  constexpr Frame& operator/=(const float divisor)
  {
    for (auto& sample : samples_) {
      sample /= divisor;
    }
    return *this;
  }

  constexpr bool operator==(const Frame& other) const = default;

 private:
  std::array<float, N> samples_{};
};

template <std::size_t N>
constexpr Frame<N> operator+(Frame<N> lhs, const Frame<N>& rhs)
{
  return lhs += rhs;
}

template <std::size_t N>
constexpr Frame<N> operator-(Frame<N> lhs, const Frame<N>& rhs)
{
  return lhs -= rhs;
}

template <std::size_t N>
constexpr Frame<N> operator*(Frame<N> lhs, const Frame<N>& rhs)
{
  return lhs *= rhs;
}

template <std::size_t N>
constexpr Frame<N> operator*(Frame<N> lhs, const float gain)
{
  return lhs *= gain;
}

template <std::size_t N>
constexpr Frame<N> operator/(Frame<N> lhs, const float divisor)
{
  return lhs /= divisor;
}

using Stereo = Frame<2>;

}  // namespace stepgrid
