#pragma once

#include <string>
#include <iosfwd>
#include "data.hpp"

enum Curve
{
  LINEAR=0, EXPONENTIAL=1
};

inline std::string get_curve_string(Curve curve)
{
  switch (curve)
  {
  case Curve::LINEAR:
    return "lin";
  case Curve::EXPONENTIAL:
    return "exp";
  default:
    return "UNKNOWN";
  }
}

Curve parse_curve(const std::string& name);


// Start and end bounds of a time-varying training parameter
struct ScheduleSpec
{
  Float start;
  Float end;
  Curve curve;
};


// A training parameter that moves from `start` (progress 0) to `end`
// (progress 1) along a linear or exponential curve
class Schedule
{
public:
  // Throws ConfigError, naming `parameter`, if the bounds are not usable
  Schedule(const std::string& parameter, const ScheduleSpec& spec);
  Schedule(const std::string& parameter, Float start, Float end, Curve curve);

  Float interpolate(Float progress) const;

  // Throws ConfigError unless both bounds lie in [lower, upper]
  void require_bounds(Float lower, Float upper) const;

  inline const ScheduleSpec& get_spec() const { return this->spec; }
  inline const std::string& get_parameter() const { return this->parameter; }

private:
  std::string parameter;
  ScheduleSpec spec;
  Float log_ratio;
};

std::ostream& operator<<(std::ostream& os, const ScheduleSpec& spec);
