/**
 * @file transcode_engine.cpp
 * @brief Engine result helpers
 */

#include "hls_variants/transcode_engine.hpp"

#include <fmt/core.h>

namespace hls_variants {

VariantError engine_error(const EngineResult &result, const std::string &step) {
  VariantError error;
  error.kind = result.timed_out ? ErrorKind::Timeout : ErrorKind::Encode;
  error.step = step;
  if (result.diagnostics.empty()) {
    error.detail = fmt::format("engine failed ({})", describe_failure(result));
  } else {
    error.detail = result.diagnostics;
  }
  return error;
}

} // namespace hls_variants
