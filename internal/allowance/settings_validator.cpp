#include "settings_validator.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/parse.hpp"

namespace renter::allowance {

using renter::util::InputValidationError;
using renter::util::ValidationCode;

namespace {

bool Supplied(const std::optional<std::string>& field) {
  return field.has_value() && !field->empty();
}

} // namespace

SettingsValidator::SettingsValidator(renter::model::Profile profile)
    : constants_(renter::model::ConstantsFor(profile)) {}

SettingsValidator::SettingsValidator(const renter::model::ProfileConstants& constants)
    : constants_(constants) {}

renter::model::Allowance SettingsValidator::Resolve(const RawAllowance& raw) const {
  renter::model::Allowance allowance;

  auto funds = renter::model::Currency::Parse(raw.funds);
  if (!funds) {
    throw InputValidationError(ValidationCode::kInvalidAmount, "couldn't parse funds: '" + raw.funds + "'");
  }
  allowance.funds = *funds;

  if (Supplied(raw.hosts)) {
    auto hosts = renter::util::ParseUint64(*raw.hosts);
    if (!hosts) {
      throw InputValidationError(ValidationCode::kInvalidCount, "couldn't parse hosts: '" + *raw.hosts + "'");
    }
    if (*hosts < constants_.required_hosts) {
      throw InputValidationError(ValidationCode::kBelowMinimum,
                                 "insufficient number of hosts, need at least " +
                                     std::to_string(constants_.required_hosts) + " but have " +
                                     std::to_string(*hosts));
    }
    allowance.hosts = *hosts;
  } else {
    allowance.hosts = constants_.recommended_hosts;
  }

  auto period = renter::util::ParseUint64(raw.period);
  if (!period) {
    throw InputValidationError(ValidationCode::kInvalidPeriod, "couldn't parse period: '" + raw.period + "'");
  }
  allowance.period = *period;

  if (Supplied(raw.renew_window)) {
    auto window = renter::util::ParseUint64(*raw.renew_window);
    if (!window) {
      throw InputValidationError(ValidationCode::kInvalidRenewWindow,
                                 "couldn't parse renew window: '" + *raw.renew_window + "'");
    }
    if (*window < constants_.required_renew_window) {
      throw InputValidationError(ValidationCode::kBelowMinimum,
                                 "renew window is too small, must be at least " +
                                     std::to_string(constants_.required_renew_window) + " blocks but have " +
                                     std::to_string(*window) + " blocks");
    }
    allowance.renew_window = *window;
  } else {
    allowance.renew_window = allowance.period / 2;
  }

  return allowance;
}

} // namespace renter::allowance
