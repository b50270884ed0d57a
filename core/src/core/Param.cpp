#include "core/Param.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "core/Constants.h"

namespace stepgrid {

namespace {

constexpr float kSmoothingSnap = 1e-4F;
constexpr float kMinVelocityDb = -60.0F;

}  // namespace

Param::Param(ParamInfo info)
    : info_(std::move(info)), value_(info_.default_value) {}

bool Param::Set(const float value, std::string* error)
{
  if (!std::isfinite(value) || value < info_.min || value > info_.max) {
    if (error != nullptr) {
      std::ostringstream message;
      message << "value " << value << " out of range for '" << info_.name
              << "' [" << info_.min << ", " << info_.max << "]";
      *error = message.str();
    }
    return false;
  }
  value_.store(value, std::memory_order_relaxed);
  return true;
}

Param& Params::Add(ParamInfo info)
{
  params_.push_back(std::make_unique<Param>(std::move(info)));
  return *params_.back();
}

Param* Params::at(const std::size_t index) const
{
  if (index >= params_.size()) {
    return nullptr;
  }
  return params_[index].get();
}

Param* Params::Find(const std::string& name) const
{
  const auto it = std::find_if(
      params_.begin(), params_.end(),
      [&name](const auto& param) { return param->info().name == name; });
  return it != params_.end() ? it->get() : nullptr;
}

bool Params::Set(const std::string& name, const float value,
                 std::string* error)
{
  Param* param = Find(name);
  if (param == nullptr) {
    if (error != nullptr) {
      *error = "unknown parameter '" + name + "'";
    }
    return false;
  }
  return param->Set(value, error);
}

ExpSmoothing::ExpSmoothing(const float initial, const std::size_t num_samples)
    : rate_(std::pow(0.0001F,
                     1.0F / static_cast<float>(std::max<std::size_t>(
                                num_samples, 1)))),
      current_(initial),
      target_(initial) {}

void ExpSmoothing::Reset(const float value) noexcept
{
  current_ = value;
  target_ = value;
}

float ExpSmoothing::Next() noexcept
{
  if (std::fabs(target_ - current_) < kSmoothingSnap) {
    current_ = target_;
  } else {
    current_ = target_ + (current_ - target_) * rate_;
  }
  return current_;
}

float DbToGain(const float db)
{
  return std::pow(10.0F, db / 20.0F);
}

float VelocityToGain(const int velocity)
{
  const int clamped = std::clamp(velocity, 0, kMaxVelocity);
  const float db = kMinVelocityDb * (1.0F - static_cast<float>(clamped) /
                                                static_cast<float>(kMaxVelocity));
  return DbToGain(db);
}

}  // namespace stepgrid
