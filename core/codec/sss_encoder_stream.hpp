/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include "codec/type_descriptor.hpp"
#include "codec/types.hpp"
#include "codec/value.hpp"
#include "common/byte_sink.hpp"

namespace sss::codec {
  /**
   * @class SssEncoderStream designed to sss-encode values against their type
   * descriptors. Encoding is a single forward walk: no backpatching, no
   * second pass. Contract violations are raised as std::system_error with
   * EncodeError codes
   */
  class SssEncoderStream {
   public:
    /// bytes are buffered before they are passed to a sink
    static constexpr size_t kSinkChunkSize = 4096;

    SssEncoderStream();

    /**
     * @param drop_data when true, only the number of bytes is counted,
     * data() stays empty
     */
    explicit SssEncoderStream(bool drop_data);

    /**
     * @param sink destination of the bytes, must outlive the stream;
     * call flush() when done
     */
    explicit SssEncoderStream(common::ByteSink &sink);

    SssEncoderStream(const SssEncoderStream &) = delete;
    SssEncoderStream &operator=(const SssEncoderStream &) = delete;

    /**
     * @brief sss-encodes value as a value of type
     * @return reference to stream
     */
    SssEncoderStream &encode(const TypeDescriptor &type, const Value &value);

    /**
     * @brief appends byte to the stream
     * @param v byte value
     * @return reference to stream
     */
    SssEncoderStream &putByte(uint8_t v);

    /**
     * @brief appends raw bytes to the stream
     * @return reference to stream
     */
    SssEncoderStream &putBytes(std::span<const uint8_t> v);

    /**
     * @brief passes buffered bytes to the sink, no-op without a sink
     */
    void flush();

    /**
     * @return bytes encoded so far and not yet passed to a sink
     */
    ByteArray data() const;

    /**
     * @return number of bytes encoded so far, including dropped and
     * flushed ones
     */
    size_t size() const;

   private:
    void encodeInteger(const TypeDescriptor &type,
                       const Value &value,
                       size_t bit_size,
                       bool as_scalar);
    void encodeBytes(const TypeDescriptor &type,
                     const TypeDescriptor::Bytes &bytes,
                     const Value &value);
    void encodeLength(size_t length, const TypeDescriptor &type);
    void encodeElements(const TypeDescriptor &element, const ValueList &list);

    bool drop_data_;
    size_t bytes_written_;
    ByteArray stream_;
    common::ByteSink *sink_;
  };

}  // namespace sss::codec
