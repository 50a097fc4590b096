#pragma once

#include <optional>
#include <string>

#include "internal/model/allowance.hpp"
#include "internal/model/profile.hpp"

namespace renter::allowance {

/*
  Raw operator input for a settings replacement. Absent and empty optional
  fields are treated the same.
*/
struct RawAllowance {
  std::string                funds;
  std::optional<std::string> hosts;
  std::string                period;
  std::optional<std::string> renew_window;
};

/*
  Resolves a partial settings request into a complete allowance.

  Pure: parses, defaults and checks profile minimums, throwing
  util::InputValidationError on the first violation. Never touches the
  engine.
*/
class SettingsValidator {
public:
  explicit SettingsValidator(renter::model::Profile profile);
  explicit SettingsValidator(const renter::model::ProfileConstants& constants);

  renter::model::Allowance Resolve(const RawAllowance& raw) const;

  const renter::model::ProfileConstants& constants() const {
    return constants_;
  }

private:
  renter::model::ProfileConstants constants_;
};

}
