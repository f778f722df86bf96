// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

/**
 * @file he_shielding.cpp
 * @brief Four-component DHF NMR shielding from a stored integral dump
 *
 * The dump is a single HDF5 file holding the molecule and the magnetic
 * integrals (groups molecule, int1e, int2e), the converged reference
 * (group reference) and the four-component ERI (dataset scf/eri_4c).
 *
 * RELNMR_LOG_LEVEL selects the spdlog level (default info).
 *
 * Usage:
 *   ./he_shielding he_dhf_rmb.h5               # RMB, GIAO, all atoms
 *   ./he_shielding he_dhf_rmb.h5 config.json   # Settings from JSON
 *
 * The program prints the shielding tensor of every requested nucleus in ppm
 * together with its diamagnetic and paramagnetic parts.
 */

#include <relnmr/core/incore_oracle.h>
#include <relnmr/core/incore_potential.h>
#include <relnmr/core/molecule.h>
#include <relnmr/nmr/shielding_solver.h>
#include <relnmr/util/env_helper.h>
#include <relnmr/util/json_config.h>
#include <relnmr/util/reference_io.h>

#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>

namespace {
void print_tensor(const char* label, const Eigen::Matrix3d& t) {
  std::cout << label << "\n";
  for (int i = 0; i < 3; ++i) {
    std::cout << "  " << std::setw(15) << t(i, 0) << std::setw(15) << t(i, 1)
              << std::setw(15) << t(i, 2) << "\n";
  }
}
}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: " << argv[0] << " <dump.h5> [config.json]"
              << std::endl;
    return 1;
  }
  const std::string dump = argv[1];
  spdlog::set_level(
      relnmr::env::log_level("RELNMR_LOG_LEVEL", spdlog::level::info));

  try {
    relnmr::ShieldingConfig cfg;
    if (argc > 2) cfg = relnmr::load_shielding_config(argv[2]);

    std::shared_ptr<relnmr::IncoreIntegralOracle> oracle =
        relnmr::IncoreIntegralOracle::load(dump);
    auto reference = std::make_shared<relnmr::ReferenceState>(
        relnmr::load_reference_state(dump));
    std::shared_ptr<relnmr::IncoreCoulombPotential> scf =
        relnmr::IncoreCoulombPotential::load(dump);

    auto nmr =
        relnmr::Shielding::make_dhf_shielding(oracle, reference, scf, cfg);
    const auto& res = nmr->run().result;

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "CPHF: " << relnmr::to_string(res.cphf_status) << " after "
              << res.cphf_iterations << " iteration(s)\n\n";
    for (const auto& s : res.nuclei) {
      std::cout << "Atom " << s.atom_index << " "
                << relnmr::element_symbol(s.atomic_number)
                << "  isotropic shielding " << s.isotropic() << " ppm\n";
      print_tensor("total", s.total);
      print_tensor("diamagnetic", s.diamagnetic);
      print_tensor("paramagnetic", s.paramagnetic.total);
      std::cout << "\n";
    }
    if (!res.numerically_consistent) {
      std::cout << "warning: diamagnetic term has an imaginary part of "
                << std::scientific << res.max_imaginary_residual << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "he_shielding: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
