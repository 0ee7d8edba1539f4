/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include "codec/codec_config.hpp"
#include "codec/sss_decoder_stream.hpp"
#include "codec/sss_encoder_stream.hpp"
#include "codec/sss_error.hpp"
#include "codec/type_descriptor.hpp"
#include "codec/value.hpp"
#include "common/byte_sink.hpp"
#include "common/byte_source.hpp"
#include "outcome/outcome.hpp"

namespace sss::codec {

  /**
   * Value decoded from the front of a buffer, with the number of bytes it
   * took
   */
  struct DecodeResult {
    Value value;
    size_t consumed;
  };

  /**
   * @brief sss-encodes value as a value of type
   * @return encoded bytes, EncodeError on a value that doesn't conform
   */
  outcome::result<ByteArray> encode(const TypeDescriptor &type,
                                    const Value &value);

  /**
   * @brief sss-encodes value straight into sink. On failure the sink may
   * already hold a prefix of the encoding
   */
  outcome::result<void> encodeTo(const TypeDescriptor &type,
                                 const Value &value,
                                 common::ByteSink &sink);

  /**
   * @brief number of bytes encode() would produce, nothing is stored
   */
  outcome::result<size_t> encodedSize(const TypeDescriptor &type,
                                      const Value &value);

  /**
   * @brief decodes one value of type from the front of bytes. Bytes past
   * the value are left alone, see consumed
   */
  outcome::result<DecodeResult> decode(const TypeDescriptor &type,
                                       std::span<const uint8_t> bytes,
                                       const CodecConfig &config = {});

  /**
   * @brief decodes one value of type pulling bytes from source
   */
  outcome::result<Value> decode(const TypeDescriptor &type,
                                common::ByteSource &source,
                                const CodecConfig &config = {});

  /**
   * @brief decodes a value that must take all of bytes
   * @return DecodeError::TRAILING_DATA if anything is left after the value
   */
  outcome::result<Value> decodeExact(const TypeDescriptor &type,
                                     std::span<const uint8_t> bytes,
                                     const CodecConfig &config = {});

}  // namespace sss::codec
