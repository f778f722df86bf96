// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <relnmr/core/enums.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace relnmr {

MagneticBalance magnetic_balance_from_string(const std::string& label) {
  std::string upper(label);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "RMB") return MagneticBalance::RestrictedMagneticBalance;
  if (upper == "RKB") return MagneticBalance::RestrictedKineticBalance;
  throw std::invalid_argument("unknown magnetic balance: " + label);
}

}  // namespace relnmr
