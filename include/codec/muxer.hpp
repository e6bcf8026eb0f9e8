#pragma once

#include <memory>
#include <optional>

#include "format/rkpi2_format.hpp"
#include "io/byte_stream.hpp"

namespace rkpi2 {

// Write the 2-byte RKPI2 header to sink and return the stream the samples must go to.
//
// - level empty: payload is raw, the same sink is handed back.
// - level set:   payload is zstd at that level (1..21); the returned ZstdSink owns
//                sink and must be finish()ed before the underlying output is closed.
//
// Throws Error(Rate), Error(Channels) or Error(IO). Validation happens before any
// byte is written, so a rejected header leaves the sink untouched. Rate and
// channel errors take precedence over a bad level. Any exception thrown by the
// sink while writing the header surfaces as Error(IO).
std::unique_ptr<ByteSink> mux(std::unique_ptr<ByteSink> sink,
                              const Header& header,
                              const std::optional<int>& level = std::nullopt);

} // namespace rkpi2
