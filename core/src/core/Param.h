#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace stepgrid {

struct ParamInfo {
  std::string name;
  std::string unit;
  float min{0.0F};
  float max{1.0F};
  float default_value{0.0F};
};

// One tunable value. Written by the control thread, read by the audio
// thread.
class Param {
 public:
  explicit Param(ParamInfo info);

  Param(const Param&) = delete;
  Param& operator=(const Param&) = delete;
  Param(Param&&) = delete;
  Param& operator=(Param&&) = delete;

  [[nodiscard]] const ParamInfo& info() const { return info_; }
  [[nodiscard]] float value() const noexcept
  {
    return value_.load(std::memory_order_relaxed);
  }

  // Rejects values outside [min, max] and leaves the current value
  // untouched in that case.
  bool Set(float value, std::string* error = nullptr);

 private:
  ParamInfo info_;
  std::atomic<float> value_;
};

// Ordered set of parameters exposed by a device. Devices and the
// control surface share it, so it outlives the device's move to the
// audio thread.
class Params {
 public:
  Params() = default;

  Params(const Params&) = delete;
  Params& operator=(const Params&) = delete;

  Param& Add(ParamInfo info);

  [[nodiscard]] std::size_t size() const { return params_.size(); }
  [[nodiscard]] Param* at(std::size_t index) const;
  [[nodiscard]] Param* Find(const std::string& name) const;

  bool Set(const std::string& name, float value, std::string* error = nullptr);

 private:
  std::vector<std::unique_ptr<Param>> params_;
};

// One-pole smoother that settles on its target after roughly
// `num_samples` samples.
class ExpSmoothing {
 public:
  explicit ExpSmoothing(float initial = 0.0F, std::size_t num_samples = 2048);

  void set_target(float target) noexcept { target_ = target; }
  void Reset(float value) noexcept;

  [[nodiscard]] float target() const { return target_; }
  [[nodiscard]] float current() const { return current_; }

  float Next() noexcept;

 private:
  float rate_;
  float current_;
  float target_;
};

[[nodiscard]] float DbToGain(float db);
[[nodiscard]] float VelocityToGain(int velocity);

}  // namespace stepgrid
