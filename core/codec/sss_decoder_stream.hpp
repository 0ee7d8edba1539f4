/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <span>

#include "codec/codec_config.hpp"
#include "codec/sss_error.hpp"
#include "codec/type_descriptor.hpp"
#include "codec/types.hpp"
#include "codec/value.hpp"
#include "common/byte_source.hpp"

namespace sss::codec {
  /**
   * @class SssDecoderStream pulls bytes strictly forward from a ByteSource
   * and rebuilds values by recursive descent over a type descriptor.
   * Decoding errors are raised as std::system_error with DecodeError codes
   * and a message saying where they happened
   */
  class SssDecoderStream {
   public:
    /// unbounded sources are read at most this many bytes at a time
    static constexpr size_t kReadChunkSize = 64 * 1024;

    /// no collection reserves more elements than this up front
    static constexpr size_t kMaxReserve = 1024;

    explicit SssDecoderStream(std::span<const uint8_t> span,
                              CodecConfig config = {});

    /**
     * @param source bytes to decode, must outlive the stream
     */
    explicit SssDecoderStream(common::ByteSource &source,
                              CodecConfig config = {});

    SssDecoderStream(const SssDecoderStream &) = delete;
    SssDecoderStream &operator=(const SssDecoderStream &) = delete;

    /**
     * @brief decodes one value of given type starting at the current
     * position, bytes after it are left in the source
     */
    Value decode(const TypeDescriptor &type);

    /**
     * @brief takes next byte, raises DecodeError::TRUNCATED_INPUT if there
     * is none
     */
    uint8_t nextByte();

    /**
     * @return false only if the source is bounded and holds fewer than n
     * bytes
     */
    bool hasMore(uint64_t n) const;

    /**
     * @return number of bytes consumed so far
     */
    size_t currentIndex() const;

   private:
    bool decodeBit(const TypeDescriptor &type);
    Integer decodeScalar(const TypeDescriptor &type, size_t bit_size);
    Integer decodeLength(const TypeDescriptor &type);
    ByteArray decodeRaw(const TypeDescriptor &type,
                        size_t length,
                        DecodeError on_short);
    ValueList decodeElements(const TypeDescriptor &element, size_t length);

    std::unique_ptr<common::ByteSource> owned_source_;
    common::ByteSource *source_;
    CodecConfig config_;
  };

}  // namespace sss::codec
