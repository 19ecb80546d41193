#pragma once

namespace esrdecoder::version {

constexpr auto name = ESRDECODER_VERSION;
constexpr auto major = ESRDECODER_VERSION_MAJOR;
constexpr auto minor = ESRDECODER_VERSION_MINOR;
constexpr auto patch = ESRDECODER_VERSION_PATCH;

} // namespace esrdecoder::version
