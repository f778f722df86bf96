// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <relnmr/util/json_config.h>

#include <fstream>
#include <stdexcept>

namespace relnmr {

void to_json(nlohmann::json& j, const CPHFInput& input) {
  j = nlohmann::json{{"coupled", input.coupled},
                     {"max_iteration", input.max_iteration},
                     {"tolerance", input.tolerance}};
}

void from_json(const nlohmann::json& j, CPHFInput& input) {
  input.coupled = j.value("coupled", input.coupled);
  input.max_iteration = j.value("max_iteration", input.max_iteration);
  input.tolerance = j.value("tolerance", input.tolerance);
  if (input.max_iteration < 1)
    throw std::invalid_argument("cphf.max_iteration must be positive");
}

void to_json(nlohmann::json& j, const ShieldingConfig& cfg) {
  j = nlohmann::json::object();
  j["balance"] = to_string(cfg.balance);
  j["gauge_origin"] = nullptr;
  if (cfg.gauge_origin) j["gauge_origin"] = *cfg.gauge_origin;
  j["shielding_nuclei"] = nullptr;
  if (cfg.shielding_nuclei) j["shielding_nuclei"] = *cfg.shielding_nuclei;
  j["with_gaunt"] = cfg.with_gaunt;
  j["ppm_light_speed"] = cfg.ppm_light_speed;
  j["checkpoint_file"] = cfg.checkpoint_file;
  j["imaginary_tolerance"] = cfg.imaginary_tolerance;
  j["cphf"] = cfg.cphf;
  j["verbose"] = cfg.verbose;
}

void from_json(const nlohmann::json& j, ShieldingConfig& cfg) {
  if (j.contains("balance"))
    cfg.balance = magnetic_balance_from_string(j["balance"].get<std::string>());

  if (j.contains("gauge_origin")) {
    const auto& o = j["gauge_origin"];
    if (o.is_null()) {
      cfg.gauge_origin.reset();
    } else if (o.is_array() && o.size() == 3) {
      cfg.gauge_origin = o.get<Vector3>();
    } else {
      throw std::invalid_argument("gauge_origin must be null or [x, y, z]");
    }
  }

  if (j.contains("shielding_nuclei")) {
    const auto& n = j["shielding_nuclei"];
    if (n.is_null()) {
      cfg.shielding_nuclei.reset();
    } else {
      cfg.shielding_nuclei = n.get<std::vector<size_t>>();
    }
  }

  cfg.with_gaunt = j.value("with_gaunt", cfg.with_gaunt);
  cfg.ppm_light_speed = j.value("ppm_light_speed", cfg.ppm_light_speed);
  cfg.checkpoint_file = j.value("checkpoint_file", cfg.checkpoint_file);
  cfg.imaginary_tolerance =
      j.value("imaginary_tolerance", cfg.imaginary_tolerance);
  if (j.contains("cphf")) j["cphf"].get_to(cfg.cphf);
  cfg.verbose = j.value("verbose", cfg.verbose);
}

ShieldingConfig load_shielding_config(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Unable to open shielding configuration '" +
                             filename + "'");
  }
  try {
    nlohmann::json j;
    file >> j;
    return j.get<ShieldingConfig>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("JSON parsing error in " + filename + ": " +
                             std::string(e.what()));
  }
}

void save_shielding_config(const std::string& filename,
                           const ShieldingConfig& cfg) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }
  nlohmann::json j = cfg;
  file << j.dump(2);
  if (file.fail()) {
    throw std::runtime_error("Error writing to file: " + filename);
  }
}

}  // namespace relnmr
