/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/sss.hpp"

#include <system_error>
#include <type_traits>

#include "common/hexutil.hpp"
#include "log/logger.hpp"

namespace sss::codec {
  namespace {
    log::Logger &logger() {
      static auto instance = log::createLogger("Codec", "codec");
      return instance;
    }

    /**
     * Runs a stream operation, turning what it raises into an error result
     */
    template <typename F>
    auto guarded(const char *what, const TypeDescriptor &type, F &&f)
        -> outcome::result<decltype(f())> {
      try {
        if constexpr (std::is_void_v<decltype(f())>) {
          f();
          return outcome::success();
        } else {
          return f();
        }
      } catch (const std::system_error &e) {
        SL_DEBUG(logger(), "Can't {} {}: {}", what, type.toString(), e.what());
        return e.code();
      }
    }
  }  // namespace

  outcome::result<ByteArray> encode(const TypeDescriptor &type,
                                    const Value &value) {
    return guarded("encode", type, [&] {
      SssEncoderStream s{};
      s.encode(type, value);
      auto data = s.data();
      SL_TRACE(logger(),
               "Encoded {} into {}",
               type.toString(),
               common::hex_lower_0x(data));
      return data;
    });
  }

  outcome::result<void> encodeTo(const TypeDescriptor &type,
                                 const Value &value,
                                 common::ByteSink &sink) {
    return guarded("encode", type, [&] {
      SssEncoderStream s{sink};
      s.encode(type, value);
      s.flush();
      SL_TRACE(logger(),
               "Encoded {} into sink, {} bytes",
               type.toString(),
               s.size());
    });
  }

  outcome::result<size_t> encodedSize(const TypeDescriptor &type,
                                      const Value &value) {
    return guarded("measure", type, [&] {
      SssEncoderStream s{true};
      s.encode(type, value);
      return s.size();
    });
  }

  outcome::result<DecodeResult> decode(const TypeDescriptor &type,
                                       std::span<const uint8_t> bytes,
                                       const CodecConfig &config) {
    return guarded("decode", type, [&] {
      SssDecoderStream s{bytes, config};
      auto value = s.decode(type);
      SL_TRACE(logger(),
               "Decoded {} from {} of {} bytes",
               type.toString(),
               s.currentIndex(),
               bytes.size());
      return DecodeResult{std::move(value), s.currentIndex()};
    });
  }

  outcome::result<Value> decode(const TypeDescriptor &type,
                                common::ByteSource &source,
                                const CodecConfig &config) {
    return guarded("decode", type, [&] {
      SssDecoderStream s{source, config};
      auto value = s.decode(type);
      SL_TRACE(logger(),
               "Decoded {} from {} bytes of stream",
               type.toString(),
               s.currentIndex());
      return value;
    });
  }

  outcome::result<Value> decodeExact(const TypeDescriptor &type,
                                     std::span<const uint8_t> bytes,
                                     const CodecConfig &config) {
    OUTCOME_TRY(decoded, decode(type, bytes, config));
    if (decoded.consumed != bytes.size()) {
      SL_DEBUG(logger(),
               "Can't decode {}: {} of {} bytes left over",
               type.toString(),
               bytes.size() - decoded.consumed,
               bytes.size());
      return DecodeError::TRAILING_DATA;
    }
    return std::move(decoded.value);
  }

}  // namespace sss::codec
