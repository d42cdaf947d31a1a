/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/miner_client.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vigil::network, MinerClientError, e) {
  using E = vigil::network::MinerClientError;
  switch (e) {
    case E::TIMEOUT:
      return "Miner did not respond in time";
    case E::UNREACHABLE:
      return "Miner is unreachable";
    case E::INVALID_RESPONSE:
      return "Miner sent an invalid response";
  }
  return "Unknown MinerClientError";
}
