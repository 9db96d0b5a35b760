#pragma once

#include <string>

#include "internal/codec/frame_codec.hpp"
#include "internal/codec/media_decoder.hpp"

namespace ledcast::codec {

struct FfmpegOptions {
  std::string ffmpeg_path  = "ffmpeg";
  std::string ffprobe_path = "ffprobe";
  CodecOptions codec;
};

/*
  Decodes media by driving the ffprobe / ffmpeg executables.

    ffprobe -of json   → dimensions, frame rate, per-frame GIF/WEBP timing
    ffmpeg  rawvideo   → RGB24 frames over a pipe

  The container is sniffed first, so junk uploads never reach ffmpeg.
  Videos are sampled at codec.video_fps. Frames are decoded with the
  longest side bounded by codec.max_decode_dimension and capped at
  codec.max_frames.
*/
class FfmpegDecoder final : public MediaDecoder {
 public:
  explicit FfmpegDecoder(FfmpegOptions options);

  DecodedMedia Decode(const std::filesystem::path& path) override;

 private:
  FfmpegOptions options_;
};

} // namespace ledcast::codec
