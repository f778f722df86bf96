// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <fmt/format.h>
#include <relnmr/core/integral_oracle.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace relnmr {

namespace {
bool is_index_label(char c) { return c == 'i' || c == 'j' || c == 'k' || c == 'l'; }
}  // namespace

ContractionPattern ContractionPattern::parse(std::string_view descriptor) {
  // "ji->s2kl": two density labels, arrow, storage tag, two output labels
  if (descriptor.size() != 8 || descriptor.substr(2, 2) != "->" ||
      descriptor[4] != 's' || (descriptor[5] != '1' && descriptor[5] != '2')) {
    throw std::invalid_argument(
        fmt::format("malformed contraction pattern '{}'", descriptor));
  }
  ContractionPattern p;
  p.density = {descriptor[0], descriptor[1]};
  p.output = {descriptor[6], descriptor[7]};
  p.storage = descriptor[5] == '2' ? OutputStorage::S2 : OutputStorage::S1;

  std::array<char, 4> labels = {p.density[0], p.density[1], p.output[0],
                                p.output[1]};
  if (!std::all_of(labels.begin(), labels.end(), is_index_label)) {
    throw std::invalid_argument(
        fmt::format("contraction pattern '{}' uses labels outside ijkl",
                    descriptor));
  }
  std::sort(labels.begin(), labels.end());
  if (std::adjacent_find(labels.begin(), labels.end()) != labels.end()) {
    throw std::invalid_argument(fmt::format(
        "contraction pattern '{}' repeats an index label", descriptor));
  }
  return p;
}

std::string ContractionPattern::to_string() const {
  return fmt::format("{}{}->s{}{}{}", density[0], density[1],
                     storage == OutputStorage::S2 ? 2 : 1, output[0],
                     output[1]);
}

}  // namespace relnmr
