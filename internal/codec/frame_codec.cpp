#include "frame_codec.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "internal/util/errors.hpp"

namespace ledcast::codec {
namespace {

struct Tap {
  uint32_t index  = 0;
  double   weight = 0.0;
};

// Area coverage of each destination sample over the source axis.
std::vector<std::vector<Tap>> BuildTaps(uint32_t source, uint32_t target) {
  std::vector<std::vector<Tap>> taps(target);
  const double                  scale = static_cast<double>(source) / target;

  for (uint32_t d = 0; d < target; ++d) {
    const double begin = d * scale;
    const double end   = (d + 1) * scale;

    const auto first = static_cast<uint32_t>(std::floor(begin));
    const auto last  = std::min<uint32_t>(source, static_cast<uint32_t>(std::ceil(end)));
    for (uint32_t s = first; s < last; ++s) {
      const double overlap = std::min(end, s + 1.0) - std::max(begin, static_cast<double>(s));
      if (overlap > 0.0) {
        taps[d].push_back({s, overlap / scale});
      }
    }
  }
  return taps;
}

uint8_t ToByte(double value) {
  return static_cast<uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

class BoxResampler {
 public:
  BoxResampler(uint32_t source_width, uint32_t source_height, const Layout& layout)
      : source_width_(source_width),
        source_height_(source_height),
        layout_(layout),
        horizontal_(BuildTaps(source_width, layout.scaled_width)),
        vertical_(BuildTaps(source_height, layout.scaled_height)),
        rows_(static_cast<std::size_t>(source_height) * layout.scaled_width * 3) {
  }

  void Resample(const std::vector<uint8_t>& source, const model::TargetGeometry& geometry, std::vector<uint8_t>& out) {
    const std::size_t scaled_width = layout_.scaled_width;

    for (uint32_t y = 0; y < source_height_; ++y) {
      const uint8_t* src_row = source.data() + static_cast<std::size_t>(y) * source_width_ * 3;
      double*        dst_row = rows_.data() + y * scaled_width * 3;
      for (std::size_t x = 0; x < scaled_width; ++x) {
        double r = 0, g = 0, b = 0;
        for (const auto& tap : horizontal_[x]) {
          const uint8_t* px = src_row + static_cast<std::size_t>(tap.index) * 3;
          r += px[0] * tap.weight;
          g += px[1] * tap.weight;
          b += px[2] * tap.weight;
        }
        dst_row[x * 3]     = r;
        dst_row[x * 3 + 1] = g;
        dst_row[x * 3 + 2] = b;
      }
    }

    out.assign(geometry.FrameBytes(), 0);
    for (uint32_t y = 0; y < layout_.scaled_height; ++y) {
      uint8_t* dst = out.data() + ((static_cast<std::size_t>(y) + layout_.offset_y) * geometry.width + layout_.offset_x) * 3;
      for (std::size_t x = 0; x < scaled_width; ++x) {
        double r = 0, g = 0, b = 0;
        for (const auto& tap : vertical_[y]) {
          const double* px = rows_.data() + (static_cast<std::size_t>(tap.index) * scaled_width + x) * 3;
          r += px[0] * tap.weight;
          g += px[1] * tap.weight;
          b += px[2] * tap.weight;
        }
        dst[x * 3]     = ToByte(r);
        dst[x * 3 + 1] = ToByte(g);
        dst[x * 3 + 2] = ToByte(b);
      }
    }
  }

 private:
  uint32_t                      source_width_;
  uint32_t                      source_height_;
  Layout                        layout_;
  std::vector<std::vector<Tap>> horizontal_;
  std::vector<std::vector<Tap>> vertical_;
  std::vector<double>           rows_;
};

uint32_t FrameDuration(const DecodedMedia& media, std::size_t index, const CodecOptions& options) {
  if (media.durations_ms.size() != media.frames.size()) {
    return options.default_frame_ms;
  }
  const uint32_t native = media.durations_ms[index];
  return native < options.min_frame_ms ? options.default_frame_ms : native;
}

} // namespace

Layout ComputeLayout(uint32_t source_width, uint32_t source_height, const model::TargetGeometry& geometry) {
  const double scale = std::min(static_cast<double>(geometry.width) / source_width, static_cast<double>(geometry.height) / source_height);

  Layout layout;
  layout.scaled_width  = std::min<uint32_t>(geometry.width, static_cast<uint32_t>(std::lround(source_width * scale)));
  layout.scaled_height = std::min<uint32_t>(geometry.height, static_cast<uint32_t>(std::lround(source_height * scale)));
  if (layout.scaled_width == 0 || layout.scaled_height == 0) {
    throw util::DecodeError("unsupported aspect: " + std::to_string(source_width) + "x" + std::to_string(source_height) + " collapses at " +
                            geometry.Tag());
  }

  layout.offset_x = (geometry.width - layout.scaled_width) / 2;
  layout.offset_y = (geometry.height - layout.scaled_height) / 2;
  return layout;
}

model::FrameSequence EncodeFrames(const DecodedMedia& media, const model::TargetGeometry& geometry, const CodecOptions& options) {
  if (geometry.width == 0 || geometry.height == 0) {
    throw util::ConfigurationError("geometry " + geometry.Tag() + " has an empty side");
  }
  if (media.width == 0 || media.height == 0) {
    throw util::DecodeError("decoded media has no dimensions");
  }
  if (media.frames.empty()) {
    throw util::DecodeError("decoded media has no frames");
  }

  const std::size_t expected = static_cast<std::size_t>(media.width) * media.height * 3;
  const bool        still    = media.kind == ledcast::v1::MEDIA_KIND_STATIC_IMAGE;
  const std::size_t count    = still ? 1 : media.frames.size();
  for (std::size_t i = 0; i < count; ++i) {
    if (media.frames[i].size() != expected) {
      throw util::DecodeError("frame " + std::to_string(i) + " has " + std::to_string(media.frames[i].size()) + " bytes, expected " +
                              std::to_string(expected));
    }
  }

  const Layout layout = ComputeLayout(media.width, media.height, geometry);
  BoxResampler resampler(media.width, media.height, layout);

  model::FrameSequence sequence;
  sequence.geometry = geometry;
  sequence.loop     = still ? true : media.loop;
  sequence.frames.resize(count);
  sequence.durations_ms.reserve(count);

  for (std::size_t i = 0; i < count; ++i) {
    resampler.Resample(media.frames[i], geometry, sequence.frames[i]);
    sequence.durations_ms.push_back(still ? options.default_frame_ms : FrameDuration(media, i, options));
  }
  return sequence;
}

std::string EncoderVersion(const CodecOptions& options) {
  return "box-r" + std::to_string(kCodecRevision) + ";d=" + std::to_string(options.default_frame_ms) + ";m=" + std::to_string(options.min_frame_ms) +
         ";fps=" + std::to_string(options.video_fps) + ";n=" + std::to_string(options.max_frames) + ";px=" + std::to_string(options.max_decode_dimension);
}

} // namespace ledcast::codec
