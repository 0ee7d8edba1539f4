/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/byte_sink.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sss::common, SinkError, e) {
  using E = sss::common::SinkError;
  switch (e) {
    case E::WRITE_FAILED:
      return "Byte sink failed to write";
  }
  return "Unknown SinkError";
}
