/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <qtils/bytes.hpp>

#include "primitives/data_label.hpp"
#include "primitives/data_source.hpp"
#include "primitives/time_bucket.hpp"

namespace vigil::primitives {

  /**
   * Single scraped item as served by a miner. `uri` is the primary key;
   * `content_size_bytes` is what the miner claims, `content` is what it sent.
   */
  struct DataEntity {
    std::string uri;
    TimePoint datetime;
    DataSource source = DataSource::UNKNOWN;
    OptionalLabel label;
    qtils::Bytes content;
    uint64_t content_size_bytes = 0;

    bool operator==(const DataEntity &) const = default;
  };

}  // namespace vigil::primitives
