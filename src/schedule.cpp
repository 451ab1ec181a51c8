#include <cmath>
#include <sstream>
#include <ostream>
#include "schedule.hpp"
#include "errors.hpp"


Curve parse_curve(const std::string& name)
{
  if (name == "lin" || name == "linear")
    return Curve::LINEAR;
  if (name == "exp" || name == "exponential")
    return Curve::EXPONENTIAL;
  throw ConfigError("curve", "'" + name + "' is not one of (lin|exp)");
}


Schedule::Schedule(const std::string& parameter, const ScheduleSpec& spec) :
  parameter(parameter),
  spec(spec),
  log_ratio(0.)
{
  if (!std::isfinite(spec.start) || !std::isfinite(spec.end))
    throw ConfigError(parameter, "start and end must be finite numbers");

  switch (spec.curve)
  {
  case Curve::LINEAR:
    break;
  case Curve::EXPONENTIAL:
    if (spec.start <= 0. || spec.end <= 0.)
      throw ConfigError(parameter, "an exponential schedule requires start and end greater than 0");
    this->log_ratio = std::log(spec.end / spec.start);
    break;
  default:
    throw ConfigError(parameter, "unknown curve");
  }
}


Schedule::Schedule(const std::string& parameter, Float start, Float end, Curve curve) :
  Schedule(parameter, ScheduleSpec{start, end, curve})
{}


Float Schedule::interpolate(Float progress) const
{
  if (!(progress >= 0. && progress <= 1.))
    std::__throw_out_of_range("Schedule progress must be in [0, 1]");

  // Exact endpoints, independent of rounding in the curve
  if (progress == 0. || this->spec.start == this->spec.end)
    return this->spec.start;
  if (progress == 1.)
    return this->spec.end;

  if (this->spec.curve == Curve::EXPONENTIAL)
    return this->spec.start * std::exp(this->log_ratio * progress);
  return this->spec.start + (this->spec.end - this->spec.start) * progress;
}


void Schedule::require_bounds(Float lower, Float upper) const
{
  if (this->spec.start < lower || this->spec.start > upper || this->spec.end < lower || this->spec.end > upper)
  {
    std::ostringstream message;
    message << "start and end must lie in [" << lower << ", " << upper << "]";
    throw ConfigError(this->parameter, message.str());
  }
}


std::ostream& operator<<(std::ostream& os, const ScheduleSpec& spec)
{
  os << spec.start << " -> " << spec.end << " (" << get_curve_string(spec.curve) << ")";
  return os;
}
